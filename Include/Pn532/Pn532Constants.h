/**
 * @file Pn532Constants.h
 * @brief PN532 frame markers, command codes and buffer sizes
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace pn532 {
namespace protocol {

    // Frame markers
    constexpr uint8_t PREAMBLE = 0x00;
    constexpr uint8_t START_CODE_1 = 0x00;
    constexpr uint8_t START_CODE_2 = 0xFF;
    constexpr uint8_t POSTAMBLE = 0x00;

    // Direction bytes (TFI)
    constexpr uint8_t TFI_HOST_TO_DEVICE = 0xD4;
    constexpr uint8_t TFI_DEVICE_TO_HOST = 0xD5;

    constexpr uint8_t RESPONSE_CODE_OFFSET = 0x01;

    /**
     * @brief Preamble(1) + Start(2) + LEN(1) + LCS(1) + 254 data + DCS(1) + Postamble(1)
     */
    constexpr size_t FRAME_MAX = 261;

    /**
     * @brief TFI + command code + parameters
     */
    constexpr size_t DATA_MAX = 254;

    constexpr size_t PARAMS_MAX = DATA_MAX - 2;

    constexpr size_t ACK_SIZE = 6;

} // namespace protocol

namespace command {

    constexpr uint8_t GET_FIRMWARE_VERSION = 0x02;
    constexpr uint8_t SAM_CONFIGURATION = 0x14;
    constexpr uint8_t RF_CONFIGURATION = 0x32;
    constexpr uint8_t IN_DATA_EXCHANGE = 0x40;
    constexpr uint8_t IN_LIST_PASSIVE_TARGET = 0x4A;

} // namespace command
} // namespace pn532
