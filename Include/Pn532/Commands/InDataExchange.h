/**
 * @file InDataExchange.h
 * @brief InDataExchange command, relays a frame to the selected target
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "Pn532/IPn532Command.h"

#include <etl/optional.h>
#include <etl/vector.h>
#include <cstdint>

namespace pn532
{
    /**
     * @brief Status byte of an InDataExchange response (low six bits)
     */
    enum class InDataExchangeStatus : uint8_t
    {
        Success = 0x00,
        Timeout = 0x01,
        CrcError = 0x02,
        ParityError = 0x03,
        ErroneousBitCount = 0x04,
        MifareFramingError = 0x05,
        BitCollisionError = 0x06,
        BufferSizeInsufficient = 0x07,
        RfBufferOverflow = 0x09,
        RfProtocolError = 0x0B,
        InvalidParameter = 0x10,
        AuthenticationError = 0x14,
        InvalidDeviceState = 0x25,
        OperationNotAllowed = 0x26,
        CommandNotAcceptable = 0x27,
        TargetReleased = 0x29,
        CardIdMismatch = 0x2A,
        CardDisappeared = 0x2B
    };

    struct InDataExchangeOptions
    {
        uint8_t targetNumber = 1;
        etl::vector<uint8_t, 64> payload;
        uint32_t responseTimeoutMs = 1000;
    };

    class InDataExchange : public IPn532Command
    {
    public:
        explicit InDataExchange(const InDataExchangeOptions& opts);

        etl::string_view name() const override;
        CommandRequest buildRequest() override;
        etl::expected<void, error::Error> parseResponse(const Pn532ResponseFrame& frame) override;

        InDataExchangeStatus getStatus() const;

        /**
         * @brief Status mapped onto the error layers, nullopt on success
         */
        etl::optional<error::Error> getStatusError() const;

        const etl::ivector<uint8_t>& getResponseData() const;

    private:
        InDataExchangeOptions options;
        uint8_t cachedStatusByte;
        etl::vector<uint8_t, 64> cachedResponse;
    };

} // namespace pn532
