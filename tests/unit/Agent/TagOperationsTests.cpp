/**
 * @file TagOperationsTests.cpp
 * @brief Unit tests for whole-tag read and write with key fallback
 */

#include <gtest/gtest.h>
#include "Agent/BridgeAgent.h"
#include "Agent/MifareClassicCard.h"
#include "Agent/TagOperations.h"
#include "Mocks/SimulatedTag.h"
#include "Spool/KeyDerivation.h"

#include <atomic>

using namespace agent;
using namespace error;

class TagOperationsTest : public ::testing::Test {
protected:
    TagOperationsTest()
        : card(tag)
        , kdf(spool::KdfParameters::bambuDefaults())
        , operations(card, AgentOptions::wellKnownKeys()) {}

    void SetUp() override {
        derived = kdf.derive(tag.uid).value();
        derivedList.assign(derived.begin(), derived.end());

        for (size_t b = 1; b < spool::geometry::BLOCK_COUNT; ++b) {
            if (!spool::geometry::isTrailer(b)) {
                tag.image.block(b).fill(static_cast<uint8_t>(b));
            }
        }
    }

    SimulatedTag tag;
    MifareClassicCard card;
    spool::KeyDerivation kdf;
    TagOperations operations;
    spool::KeySet derived;
    spool::KeyList derivedList;
};

// Test: Every sector opens with the derived keys
TEST_F(TagOperationsTest, ReadAllWithDerivedKeys) {
    tag.useKeys(derived);

    auto outcome = operations.readAll(tag.uid, derivedList);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->readable.allSet());
    EXPECT_TRUE(outcome->image == tag.image);
}

// Test: Sectors no key opens are zero-filled and cleared in the mask
TEST_F(TagOperationsTest, LockedSectorsAreZeroed) {
    tag.useKeys(derived);
    tag.lockedSectors = {2, 5};

    auto outcome = operations.readAll(tag.uid, derivedList);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->readable.value(), 0xFFDB);
    EXPECT_TRUE(outcome->image.isSectorZero(2));
    EXPECT_TRUE(outcome->image.isSectorZero(5));
    EXPECT_EQ(outcome->image.block(4)[0], 4);
    EXPECT_EQ(outcome->image.block(24)[0], 24);
}

// Test: Sectors still on a well-known key are read via the fallback list
TEST_F(TagOperationsTest, FallsBackToDefaultKeys) {
    tag.useKeys(derived);
    spool::SectorKey transport = {{0xA0, 0xA1, 0xA2, 0xA3, 0xA4, 0xA5}};
    tag.setKey(7, transport);

    auto outcome = operations.readAll(tag.uid, derivedList);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->readable.allSet());
    EXPECT_EQ(outcome->image.block(28)[0], 28);
}

// Test: Without supplied keys the default list is used for every sector
TEST_F(TagOperationsTest, ReadWithoutKeys) {
    auto outcome = operations.readAll(tag.uid, spool::KeyList());
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->readable.allSet());
}

// Test: A block that cannot be read zeroes its whole sector
TEST_F(TagOperationsTest, UnreadableBlockZeroesSector) {
    tag.unreadableBlocks = {13};

    auto outcome = operations.readAll(tag.uid, spool::KeyList());
    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome->readable.test(3));
    EXPECT_TRUE(outcome->image.isSectorZero(3));
    EXPECT_EQ(outcome->readable.count(), 15u);
}

TEST_F(TagOperationsTest, TagRemovedAbortsRead) {
    tag.present = false;

    auto outcome = operations.readAll(tag.uid, spool::KeyList());
    ASSERT_FALSE(outcome.has_value());
    EXPECT_TRUE(outcome.error().isCode(LinkError::CardDisappeared));
}

TEST_F(TagOperationsTest, CancelledRead) {
    std::atomic<bool> cancel(true);

    auto outcome = operations.readAll(tag.uid, spool::KeyList(), &cancel);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_TRUE(outcome.error().isCode(AgentError::Cancelled));
    EXPECT_EQ(tag.authAttempts, 0);
}

// Test: Writes skip block 0 and trailers, 47 payload blocks in total
TEST_F(TagOperationsTest, WriteAllMasksProtectedBlocks) {
    tag.useKeys(derived);
    spool::TagImage source;
    for (size_t b = 0; b < spool::geometry::BLOCK_COUNT; ++b) {
        source.block(b).fill(0xEE);
    }

    auto written = operations.writeAll(tag.uid, source, derivedList);
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(written.value(), 47u);
    EXPECT_EQ(tag.writtenBlocks.count(0), 0u);
    for (size_t s = 0; s < spool::geometry::SECTOR_COUNT; ++s) {
        EXPECT_EQ(tag.writtenBlocks.count(spool::geometry::trailerOf(s)), 0u);
    }
    EXPECT_EQ(tag.image.block(0)[0], 0xDE);
    EXPECT_EQ(tag.image.block(3)[0], 0xFF);
    EXPECT_EQ(tag.image.block(1)[0], 0xEE);
}

// Test: Failed sectors reduce the count instead of failing the write
TEST_F(TagOperationsTest, PartialWriteCount) {
    tag.useKeys(derived);
    tag.lockedSectors = {4};
    tag.readOnlyBlocks = {9};

    auto written = operations.writeAll(tag.uid, tag.image, derivedList);
    ASSERT_TRUE(written.has_value());
    // 47 writable, minus sector 4 (3 blocks), minus blocks 9 and 10 of sector 2
    EXPECT_EQ(written.value(), 42u);
    EXPECT_EQ(tag.writtenBlocks.count(8), 1u);
    EXPECT_EQ(tag.writtenBlocks.count(10), 0u);
}

// Test: Sectors past the key list are left alone
TEST_F(TagOperationsTest, WriteLimitedToSuppliedKeys) {
    tag.useKeys(derived);
    spool::KeyList firstTwo;
    firstTwo.push_back(derived[0]);
    firstTwo.push_back(derived[1]);

    auto written = operations.writeAll(tag.uid, tag.image, firstTwo);
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(written.value(), 5u);
}
