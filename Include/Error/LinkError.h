/**
 * @file LinkError.h
 * @brief Defines RF link error codes for MIFARE Classic exchanges
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
     * @brief RF link error codes
     * 
     * Values match the PN532 InDataExchange status byte where one exists.
     */
    enum class LinkError : uint8_t {
        Ok = 0x00,
        Timeout = 0x01,
        CrcError = 0x02,
        ParityError = 0x03,
        AuthenticationError = 0x14,
        NakReceived = 0x20,
        CardDisappeared = 0x2B
    };

} // namespace error
