/**
 * @file GetFirmwareVersion.h
 * @brief GetFirmwareVersion command, used to probe the reader
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "Pn532/IPn532Command.h"
#include <etl/string.h>
#include <cstdint>

namespace pn532
{
    struct FirmwareInfo
    {
        uint8_t ic = 0;
        uint8_t ver = 0;
        uint8_t rev = 0;
        uint8_t support = 0;

        etl::string<64> toString() const;
    };

    class GetFirmwareVersion : public IPn532Command
    {
    public:
        GetFirmwareVersion() = default;

        etl::string_view name() const override;
        CommandRequest buildRequest() override;
        etl::expected<void, error::Error> parseResponse(const Pn532ResponseFrame& frame) override;

        const FirmwareInfo& getFirmwareInfo() const;

    private:
        FirmwareInfo cachedInfo;
    };

} // namespace pn532
