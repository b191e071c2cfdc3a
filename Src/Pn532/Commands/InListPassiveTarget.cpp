/**
 * @file InListPassiveTarget.cpp
 * @brief InListPassiveTarget command for ISO14443A tag detection
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Pn532/Commands/InListPassiveTarget.h"

using namespace error;

namespace pn532
{
    namespace
    {
        constexpr uint8_t BRTY_TYPE_A_106 = 0x00;
        constexpr uint8_t SAK_ATS_FOLLOWS = 0x20;
    }

    InListPassiveTarget::InListPassiveTarget(const InListPassiveTargetOptions& opts)
        : options(opts)
    {
    }

    etl::string_view InListPassiveTarget::name() const
    {
        return "InListPassiveTarget";
    }

    CommandRequest InListPassiveTarget::buildRequest()
    {
        etl::vector<uint8_t, 2> params;
        params.push_back(options.maxTargets);
        params.push_back(BRTY_TYPE_A_106);
        return createCommandRequest(command::IN_LIST_PASSIVE_TARGET, params, options.responseTimeoutMs);
    }

    etl::expected<void, Error> InListPassiveTarget::parseResponse(const Pn532ResponseFrame& frame)
    {
        detectedTargets.clear();

        const auto& data = frame.payload;
        if (data.empty())
        {
            return etl::unexpected<Error>(Error::fromHardware(HardwareError::InvalidFrame));
        }

        const uint8_t count = data[0];
        size_t index = 1;
        for (uint8_t i = 0; i < count; ++i)
        {
            TargetInfo target;
            if (detectedTargets.full() || !parseTypeATarget(data, index, target))
            {
                detectedTargets.clear();
                return etl::unexpected<Error>(Error::fromHardware(HardwareError::InvalidFrame));
            }
            detectedTargets.push_back(target);
        }
        return {};
    }

    const etl::ivector<TargetInfo>& InListPassiveTarget::getDetectedTargets() const
    {
        return detectedTargets;
    }

    bool InListPassiveTarget::parseTypeATarget(const etl::ivector<uint8_t>& data, size_t& index, TargetInfo& target)
    {
        // [Tg] [SENS_RES x2] [SEL_RES] [NFCIDLength] [NFCID...] ([ATS...])
        if (index + 5 > data.size())
        {
            return false;
        }

        target.targetNumber = data[index++];
        target.atqa = static_cast<uint16_t>(data[index] | (data[index + 1] << 8));
        index += 2;
        target.sak = data[index++];

        const uint8_t uidLength = data[index++];
        if (uidLength > target.uid.max_size() || index + uidLength > data.size())
        {
            return false;
        }
        target.uid.assign(data.begin() + index, data.begin() + index + uidLength);
        index += uidLength;

        if ((target.sak & SAK_ATS_FOLLOWS) != 0 && index < data.size())
        {
            const uint8_t atsLength = data[index];
            index += (atsLength == 0) ? 1 : atsLength;
        }
        return index <= data.size();
    }

} // namespace pn532
