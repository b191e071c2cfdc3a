/**
 * @file RFConfiguration.h
 * @brief RFConfiguration command, limits how long the PN532 keeps polling for a target
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "Pn532/IPn532Command.h"
#include <cstdint>

namespace pn532
{
    enum class RFConfigItem : uint8_t
    {
        RFField = 0x01,
        VariousTimings = 0x02,
        MaxRetries = 0x05
    };

    struct RFConfigurationOptions
    {
        RFConfigItem item = RFConfigItem::MaxRetries;
        etl::vector<uint8_t, 3> configData;
    };

    /**
     * @brief Sets one RF configuration item
     *
     * With MaxRetries the data is [MxRtyATR] [MxRtyPSL] [MxRtyPassiveActivation].
     * 0xFF for passive activation makes InListPassiveTarget wait for a tag forever.
     */
    class RFConfiguration : public IPn532Command
    {
    public:
        explicit RFConfiguration(const RFConfigurationOptions& opts);

        /**
         * @brief MaxRetries item with the given passive activation retry count
         */
        static RFConfigurationOptions maxRetries(uint8_t passiveActivation);

        etl::string_view name() const override;
        CommandRequest buildRequest() override;
        etl::expected<void, error::Error> parseResponse(const Pn532ResponseFrame& frame) override;

    private:
        RFConfigurationOptions options;
    };

} // namespace pn532
