/**
 * @file ReconnectTimer.h
 * @brief Fixed-delay reconnect schedule with at most one pending attempt
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdint>

namespace bridge
{
    /**
     * @brief One-shot reconnect timer
     *
     * schedule() while an attempt is already pending is a no-op, so any
     * number of disconnect notifications produce a single reconnect.
     */
    class ReconnectTimer
    {
    public:
        explicit ReconnectTimer(uint32_t delayMs);

        /**
         * @brief Arm the timer for now + delay
         *
         * @param now Current tick
         * @return true The timer was armed
         * @return false A reconnect was already pending, nothing changed
         */
        bool schedule(uint32_t now);

        /**
         * @brief Check whether the pending attempt is due, disarming it if so
         *
         * @param now Current tick
         * @return true Caller must attempt to reconnect now
         */
        bool fire(uint32_t now);

        void cancel();

        bool isPending() const
        {
            return pending;
        }

        uint32_t dueAt() const
        {
            return due;
        }

        uint32_t getDelayMs() const
        {
            return delayMs;
        }

    private:
        uint32_t delayMs;
        uint32_t due;
        bool pending;
    };

} // namespace bridge
