/**
 * @file ReconnectTimer.cpp
 * @brief Fixed-delay reconnect schedule with at most one pending attempt
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Bridge/ReconnectTimer.h"
#include "Utils/Logging.h"
#include "Utils/Timing.h"

namespace bridge
{
    ReconnectTimer::ReconnectTimer(uint32_t delayMs)
        : delayMs(delayMs)
        , due(0)
        , pending(false)
    {
    }

    bool ReconnectTimer::schedule(uint32_t now)
    {
        if (pending)
        {
            LOG_DEBUG("Reconnect already scheduled");
            return false;
        }

        due = now + delayMs;
        pending = true;
        LOG_INFO("Reconnecting in %u ms", static_cast<unsigned>(delayMs));
        return true;
    }

    bool ReconnectTimer::fire(uint32_t now)
    {
        if (!pending || !utils::tick_reached(now, due))
        {
            return false;
        }
        pending = false;
        return true;
    }

    void ReconnectTimer::cancel()
    {
        pending = false;
    }

} // namespace bridge
