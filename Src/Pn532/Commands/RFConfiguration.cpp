/**
 * @file RFConfiguration.cpp
 * @brief RFConfiguration command implementation
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Pn532/Commands/RFConfiguration.h"

using namespace error;

namespace pn532
{
    namespace
    {
        constexpr uint8_t MAX_RETRY_ATR_DEFAULT = 0xFF;
        constexpr uint8_t MAX_RETRY_PSL_DEFAULT = 0x01;
    }

    RFConfiguration::RFConfiguration(const RFConfigurationOptions& opts)
        : options(opts)
    {
    }

    RFConfigurationOptions RFConfiguration::maxRetries(uint8_t passiveActivation)
    {
        RFConfigurationOptions opts;
        opts.item = RFConfigItem::MaxRetries;
        opts.configData.push_back(MAX_RETRY_ATR_DEFAULT);
        opts.configData.push_back(MAX_RETRY_PSL_DEFAULT);
        opts.configData.push_back(passiveActivation);
        return opts;
    }

    etl::string_view RFConfiguration::name() const
    {
        return "RFConfiguration";
    }

    CommandRequest RFConfiguration::buildRequest()
    {
        // [CfgItem] [ConfigurationData...]
        etl::vector<uint8_t, 4> params;
        params.push_back(static_cast<uint8_t>(options.item));
        params.insert(params.end(), options.configData.begin(), options.configData.end());
        return createCommandRequest(command::RF_CONFIGURATION, params);
    }

    etl::expected<void, Error> RFConfiguration::parseResponse(const Pn532ResponseFrame& frame)
    {
        if (!frame.payload.empty())
        {
            return etl::unexpected<Error>(Error::fromHardware(HardwareError::InvalidFrame));
        }
        return {};
    }

} // namespace pn532
