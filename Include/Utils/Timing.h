/**
 * @file Timing.h
 * @brief Monotonic tick and deadline utilities
 * @details Every component that has a timeout takes a TickSource so tests
 *          can drive time by hand instead of sleeping.
 *
 * Usage:
 *   #include "Utils/Timing.h"
 *
 *   utils::Deadline deadline(utils::get_tick_ms, 30000);
 *   while (!deadline.expired()) {
 *       // ... poll ...
 *   }
 */

#ifndef UTILS_TIMING_H
#define UTILS_TIMING_H

#include <stdint.h>
#include <time.h>
#include <unistd.h>

namespace utils {

/**
 * @brief Source of the current tick in milliseconds
 */
using TickSource = uint32_t (*)();

/**
 * @brief Delay execution for the specified number of milliseconds
 * @param milliseconds Number of milliseconds to delay
 */
inline void delay_ms(uint32_t milliseconds)
{
    usleep(milliseconds * 1000);
}

/**
 * @brief Get current monotonic tick count in milliseconds
 * @return Current tick count in milliseconds
 * @note The tick count wraps around after ~49 days
 */
inline uint32_t get_tick_ms()
{
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint32_t>((ts.tv_sec * 1000) + (ts.tv_nsec / 1000000));
}

/**
 * @brief Calculate elapsed time between two ticks, handling wraparound
 * @param start_tick Start tick count
 * @param current_tick Current tick count
 * @return Elapsed time in milliseconds
 */
inline uint32_t elapsed_ms(uint32_t start_tick, uint32_t current_tick)
{
    return current_tick - start_tick;
}

/**
 * @brief Check whether a tick has been reached, handling wraparound
 * @param now Current tick
 * @param target Tick to compare against
 * @return true if now is at or past target
 */
inline bool tick_reached(uint32_t now, uint32_t target)
{
    return static_cast<int32_t>(now - target) >= 0;
}

/**
 * @brief A point in time after which an operation counts as expired
 */
class Deadline
{
public:
    Deadline(TickSource clock, uint32_t timeout_ms)
        : clock(clock)
        , expiresAt(clock() + timeout_ms)
    {
    }

    bool expired() const
    {
        return tick_reached(clock(), expiresAt);
    }

    /**
     * @brief Milliseconds left before expiry, 0 once expired
     */
    uint32_t remaining_ms() const
    {
        uint32_t now = clock();
        return tick_reached(now, expiresAt) ? 0 : expiresAt - now;
    }

    uint32_t at() const
    {
        return expiresAt;
    }

private:
    TickSource clock;
    uint32_t expiresAt;
};

} // namespace utils

#endif // UTILS_TIMING_H
