/**
 * @file SAMConfiguration.h
 * @brief SAMConfiguration command
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
    enum class SamMode : uint8_t
    {
        Normal = 0x01,           // SAM not used
        VirtualCard = 0x02,
        WiredCard = 0x03,
        DualCard = 0x04
    };

    struct SAMConfigurationOptions
    {
        SamMode mode = SamMode::Normal;
        uint8_t timeout = 0x00;      // Virtual Card mode only
        bool useIRQ = false;
    };

    /**
     * @brief Puts the PN532 in a mode where it answers InListPassiveTarget
     *
     * Must be sent once after power-up; Normal mode is the one a reader uses.
     */
    class SAMConfiguration : public IPn532Command
    {
    public:
        explicit SAMConfiguration(const SAMConfigurationOptions& opts = SAMConfigurationOptions());

        etl::string_view name() const override;
        CommandRequest buildRequest() override;
        etl::expected<void, error::Error> parseResponse(const Pn532ResponseFrame& frame) override;

    private:
        SAMConfigurationOptions options;
    };

} // namespace pn532
