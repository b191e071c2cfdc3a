/**
 * @file SAMConfiguration.cpp
 * @brief SAMConfiguration command
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Pn532/Commands/SAMConfiguration.h"

using namespace error;

namespace pn532
{
    SAMConfiguration::SAMConfiguration(const SAMConfigurationOptions& opts)
        : options(opts)
    {
    }

    etl::string_view SAMConfiguration::name() const
    {
        return "SAMConfiguration";
    }

    CommandRequest SAMConfiguration::buildRequest()
    {
        // [Mode] [Timeout] [IRQ]
        etl::vector<uint8_t, 3> params;
        params.push_back(static_cast<uint8_t>(options.mode));
        params.push_back(options.timeout);
        params.push_back(options.useIRQ ? 0x01 : 0x00);
        return createCommandRequest(command::SAM_CONFIGURATION, params);
    }

    etl::expected<void, Error> SAMConfiguration::parseResponse(const Pn532ResponseFrame& frame)
    {
        if (!frame.payload.empty())
        {
            return etl::unexpected<Error>(Error::fromHardware(HardwareError::InvalidFrame));
        }
        return {};
    }

} // namespace pn532
