/**
 * @file HardwareError.h
 * @brief Defines reader hardware error codes
 * @version 0.2
 * @date 2026-10-19
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    /**
     * @brief Reader hardware error codes
     * 
     * Reported by the reader chip behind a tag transceiver, before any RF
     * exchange with the tag is attempted.
     */
    enum class HardwareError : uint8_t {
        Ok = 0,
        Timeout,
        DeviceNotFound,
        WriteFailed,
        ReadFailed,
        BufferOverflow,
        NotSupported,
        InvalidFrame,
        Unknown
    };

} // namespace error
