/**
 * @file TimingTests.cpp
 * @brief Unit tests for tick and deadline utilities
 */

#include <gtest/gtest.h>
#include "Utils/Timing.h"

namespace
{
    uint32_t fakeNow = 0;

    uint32_t fakeClock()
    {
        return fakeNow;
    }
}

// Test basic delay functionality
TEST(TimingTests, DelayMilliseconds)
{
    uint32_t start = utils::get_tick_ms();

    utils::delay_ms(50);

    uint32_t elapsed = utils::elapsed_ms(start, utils::get_tick_ms());

    // Allow some tolerance due to OS scheduling
    EXPECT_GE(elapsed, 45u);
    EXPECT_LE(elapsed, 150u);
}

// Test tick counter
TEST(TimingTests, GetTickMs)
{
    uint32_t tick1 = utils::get_tick_ms();
    utils::delay_ms(20);
    uint32_t tick2 = utils::get_tick_ms();

    EXPECT_GT(tick2, tick1);
}

// Test elapsed time with wraparound
TEST(TimingTests, ElapsedMsWraparound)
{
    uint32_t start = 0xFFFFFFF0;
    uint32_t end = 0x00000010;

    EXPECT_EQ(utils::elapsed_ms(start, end), 32u);
}

// Test tick comparison across wraparound
TEST(TimingTests, TickReached)
{
    EXPECT_TRUE(utils::tick_reached(100, 100));
    EXPECT_TRUE(utils::tick_reached(101, 100));
    EXPECT_FALSE(utils::tick_reached(99, 100));
    EXPECT_TRUE(utils::tick_reached(0x00000005, 0xFFFFFFF0));
    EXPECT_FALSE(utils::tick_reached(0xFFFFFFF0, 0x00000005));
}

// Test deadline against a hand driven clock
TEST(TimingTests, DeadlineExpires)
{
    fakeNow = 1000;
    utils::Deadline deadline(fakeClock, 250);

    EXPECT_EQ(deadline.at(), 1250u);
    EXPECT_FALSE(deadline.expired());
    EXPECT_EQ(deadline.remaining_ms(), 250u);

    fakeNow = 1249;
    EXPECT_FALSE(deadline.expired());
    EXPECT_EQ(deadline.remaining_ms(), 1u);

    fakeNow = 1250;
    EXPECT_TRUE(deadline.expired());
    EXPECT_EQ(deadline.remaining_ms(), 0u);
}

// Test zero timeout expires immediately
TEST(TimingTests, DeadlineZero)
{
    fakeNow = 42;
    utils::Deadline deadline(fakeClock, 0);

    EXPECT_TRUE(deadline.expired());
}

// Test deadline across the tick wrap
TEST(TimingTests, DeadlineWraparound)
{
    fakeNow = 0xFFFFFF00;
    utils::Deadline deadline(fakeClock, 0x200);

    fakeNow = 0x00000050;
    EXPECT_FALSE(deadline.expired());
    EXPECT_EQ(deadline.remaining_ms(), 0xB0u);

    fakeNow = 0x00000100;
    EXPECT_TRUE(deadline.expired());
}
