/**
 * @file GetFirmwareVersion.cpp
 * @brief GetFirmwareVersion command, used to probe the reader
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Pn532/Commands/GetFirmwareVersion.h"
#include <cstdio>

using namespace error;

namespace pn532
{
    etl::string<64> FirmwareInfo::toString() const
    {
        char buffer[64];
        std::snprintf(buffer, sizeof(buffer), "PN5%02X v%u.%u (support 0x%02X)", ic, ver, rev, support);
        return etl::string<64>(buffer);
    }

    etl::string_view GetFirmwareVersion::name() const
    {
        return "GetFirmwareVersion";
    }

    CommandRequest GetFirmwareVersion::buildRequest()
    {
        etl::vector<uint8_t, 1> params;
        return createCommandRequest(command::GET_FIRMWARE_VERSION, params);
    }

    etl::expected<void, Error> GetFirmwareVersion::parseResponse(const Pn532ResponseFrame& frame)
    {
        // [IC] [Ver] [Rev] [Support]
        const auto& data = frame.payload;
        if (data.size() != 4)
        {
            return etl::unexpected<Error>(Error::fromHardware(HardwareError::InvalidFrame));
        }

        cachedInfo.ic = data[0];
        cachedInfo.ver = data[1];
        cachedInfo.rev = data[2];
        cachedInfo.support = data[3];
        return {};
    }

    const FirmwareInfo& GetFirmwareVersion::getFirmwareInfo() const
    {
        return cachedInfo;
    }

} // namespace pn532
