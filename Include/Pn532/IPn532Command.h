/**
 * @file IPn532Command.h
 * @brief Interface for PN532 commands
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/string_view.h>
#include <etl/expected.h>

#include "Pn532/Pn532Frame.h"
#include "Error/Error.h"

namespace pn532
{

    /**
     * @brief Interface for PN532 commands
     *
     * A command builds its request, and after the driver has exchanged the
     * frames it parses and caches the typed result.
     */
    class IPn532Command
    {
    public:
        virtual ~IPn532Command() = default;

        virtual etl::string_view name() const = 0;

        virtual CommandRequest buildRequest() = 0;

        /**
         * @brief Parse the validated response frame
         *
         * @param frame Response payload
         * @return etl::expected<void, error::Error> HardwareError::InvalidFrame if the payload is malformed
         */
        virtual etl::expected<void, error::Error> parseResponse(const Pn532ResponseFrame& frame) = 0;

    protected:
        static CommandRequest createCommandRequest(uint8_t cmd, const etl::ivector<uint8_t>& params, uint32_t timeout = 1000)
        {
            CommandRequest request;
            request.commandCode = cmd;
            request.params.assign(params.begin(), params.end());
            request.timeoutMs = timeout;
            return request;
        }
    };

} // namespace pn532
