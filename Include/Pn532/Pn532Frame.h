/**
 * @file Pn532Frame.h
 * @brief PN532 host frame construction and device frame validation
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdint>

#include <etl/expected.h>
#include <etl/vector.h>

#include "Error/Error.h"
#include "Pn532Constants.h"

namespace pn532
{
    using FrameBuffer = etl::vector<uint8_t, protocol::FRAME_MAX>;
    using CommandParams = etl::vector<uint8_t, protocol::PARAMS_MAX>;

    /**
     * @brief A command as handed to the driver
     */
    struct CommandRequest
    {
        uint8_t commandCode = 0;
        CommandParams params;
        uint32_t timeoutMs = 1000;
    };

    /**
     * @brief Payload of a validated device-to-host frame, TFI and response code stripped
     */
    struct Pn532ResponseFrame
    {
        uint8_t commandCode = 0;
        etl::vector<uint8_t, protocol::DATA_MAX> payload;
    };

    class Pn532Frame
    {
    public:
        /**
         * @brief Build a normal information frame for a request
         *
         * @return etl::expected<FrameBuffer, error::Error> Frame bytes, HardwareError::BufferOverflow if too long
         */
        static etl::expected<FrameBuffer, error::Error> build(const CommandRequest& request);

        /**
         * @brief Check for 00 00 FF 00 FF 00 at the start of a buffer
         */
        static bool isAck(const etl::ivector<uint8_t>& buffer);

        /**
         * @brief Locate and validate a response frame
         *
         * Leading garbage before the start code is skipped. Length checksum,
         * data checksum, TFI and the response code for sentCommandCode are
         * verified.
         *
         * @param buffer Received bytes
         * @param sentCommandCode Code of the command this frame answers
         * @return etl::expected<Pn532ResponseFrame, error::Error> Payload or HardwareError::InvalidFrame
         */
        static etl::expected<Pn532ResponseFrame, error::Error> parse(const etl::ivector<uint8_t>& buffer,
                                                                     uint8_t sentCommandCode);

        /**
         * @brief Two's complement of the byte sum
         */
        static uint8_t checksum(const uint8_t* data, size_t length);
    };

} // namespace pn532
