/**
 * @file ITagTransceiver.h
 * @brief Interface for raw command exchange with the selected tag
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/expected.h>
#include <etl/vector.h>

#include "Error/Error.h"

namespace agent
{
    /**
     * @brief Largest tag response handled by the agent
     */
    constexpr size_t TAG_FRAME_MAX = 64;

    using TagFrame = etl::vector<uint8_t, TAG_FRAME_MAX>;

    /**
     * @brief Sends a command to the tag selected by the last detectCard()
     *
     * Implementations handle CRC and parity; an authentication rejected by
     * the tag is reported as LinkError::AuthenticationError.
     */
    class ITagTransceiver
    {
    public:
        virtual ~ITagTransceiver() = default;

        /**
         * @brief Transmits a command and returns the tag's response
         *
         * @param command Command bytes
         * @return etl::expected<TagFrame, error::Error> Response data (may be empty) or Error
         */
        virtual etl::expected<TagFrame, error::Error> transceive(const etl::ivector<uint8_t>& command) = 0;
    };

} // namespace agent
