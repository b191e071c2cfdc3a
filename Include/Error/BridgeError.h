/**
 * @file BridgeError.h
 * @brief Defines bridge session error codes
 * @version 0.1
 * @date 2026-10-19
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    /**
     * @brief Bridge session error codes
     * 
     * Session-level failures are returned to the caller as-is and are never
     * retried by the session.
     */
    enum class BridgeError : uint8_t {
        Ok = 0,
        NoBridgeConnected,
        RequestInProgress,
        Timeout,
        ProtocolViolation,
        UnsupportedOperation,
        AgentReported
    };

} // namespace error
