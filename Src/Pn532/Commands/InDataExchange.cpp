/**
 * @file InDataExchange.cpp
 * @brief InDataExchange command, relays a frame to the selected target
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Pn532/Commands/InDataExchange.h"

using namespace error;

namespace pn532
{
    namespace
    {
        constexpr uint8_t STATUS_MASK = 0x3F;
    }

    InDataExchange::InDataExchange(const InDataExchangeOptions& opts)
        : options(opts)
        , cachedStatusByte(0xFF)
    {
    }

    etl::string_view InDataExchange::name() const
    {
        return "InDataExchange";
    }

    CommandRequest InDataExchange::buildRequest()
    {
        etl::vector<uint8_t, 65> params;
        params.push_back(options.targetNumber);
        params.insert(params.end(), options.payload.begin(), options.payload.end());
        return createCommandRequest(command::IN_DATA_EXCHANGE, params, options.responseTimeoutMs);
    }

    etl::expected<void, Error> InDataExchange::parseResponse(const Pn532ResponseFrame& frame)
    {
        const auto& data = frame.payload;
        if (data.empty() || data.size() - 1 > cachedResponse.max_size())
        {
            return etl::unexpected<Error>(Error::fromHardware(HardwareError::InvalidFrame));
        }

        cachedStatusByte = static_cast<uint8_t>(data[0] & STATUS_MASK);
        cachedResponse.assign(data.begin() + 1, data.end());
        return {};
    }

    InDataExchangeStatus InDataExchange::getStatus() const
    {
        return static_cast<InDataExchangeStatus>(cachedStatusByte);
    }

    etl::optional<Error> InDataExchange::getStatusError() const
    {
        switch (getStatus())
        {
            case InDataExchangeStatus::Success:
                return etl::nullopt;
            case InDataExchangeStatus::Timeout:
                return Error::fromLink(LinkError::Timeout);
            case InDataExchangeStatus::CrcError:
                return Error::fromLink(LinkError::CrcError);
            case InDataExchangeStatus::ParityError:
                return Error::fromLink(LinkError::ParityError);
            case InDataExchangeStatus::AuthenticationError:
                return Error::fromLink(LinkError::AuthenticationError);
            case InDataExchangeStatus::TargetReleased:
            case InDataExchangeStatus::CardIdMismatch:
            case InDataExchangeStatus::CardDisappeared:
                return Error::fromLink(LinkError::CardDisappeared);
            case InDataExchangeStatus::ErroneousBitCount:
            case InDataExchangeStatus::MifareFramingError:
            case InDataExchangeStatus::BitCollisionError:
            case InDataExchangeStatus::RfProtocolError:
                return Error::fromLink(LinkError::NakReceived);
            case InDataExchangeStatus::BufferSizeInsufficient:
            case InDataExchangeStatus::RfBufferOverflow:
                return Error::fromHardware(HardwareError::BufferOverflow);
            default:
                return Error::fromHardware(HardwareError::Unknown);
        }
    }

    const etl::ivector<uint8_t>& InDataExchange::getResponseData() const
    {
        return cachedResponse;
    }

} // namespace pn532
