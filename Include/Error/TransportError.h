/**
 * @file TransportError.h
 * @brief Defines bridge transport error codes
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
     * @brief Transport (message channel) error codes
     * 
     */
    enum class TransportError : uint8_t {
        Ok = 0,
        NotOpen,
        ResolveFailed,
        ConnectFailed,
        ConnectionClosed,
        SendFailed,
        ReceiveFailed,
        FrameTooLarge
    };

} // namespace error
