/**
 * @file Pn532Frame.cpp
 * @brief PN532 host frame construction and device frame validation
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Pn532/Pn532Frame.h"
#include "Utils/Logging.h"

using namespace error;

namespace pn532
{
    namespace
    {
        constexpr uint8_t ACK_FRAME[protocol::ACK_SIZE] = {0x00, 0x00, 0xFF, 0x00, 0xFF, 0x00};

        etl::unexpected<Error> invalidFrame()
        {
            return etl::unexpected<Error>(Error::fromHardware(HardwareError::InvalidFrame));
        }
    }

    uint8_t Pn532Frame::checksum(const uint8_t* data, size_t length)
    {
        uint8_t sum = 0;
        for (size_t i = 0; i < length; ++i)
        {
            sum = static_cast<uint8_t>(sum + data[i]);
        }
        return static_cast<uint8_t>(~sum + 1);
    }

    etl::expected<FrameBuffer, Error> Pn532Frame::build(const CommandRequest& request)
    {
        const size_t length = 2 + request.params.size();
        if (length > protocol::DATA_MAX)
        {
            return etl::unexpected<Error>(Error::fromHardware(HardwareError::BufferOverflow));
        }

        FrameBuffer frame;
        frame.push_back(protocol::PREAMBLE);
        frame.push_back(protocol::START_CODE_1);
        frame.push_back(protocol::START_CODE_2);
        frame.push_back(static_cast<uint8_t>(length));
        frame.push_back(static_cast<uint8_t>(~length + 1));

        const size_t dataStart = frame.size();
        frame.push_back(protocol::TFI_HOST_TO_DEVICE);
        frame.push_back(request.commandCode);
        frame.insert(frame.end(), request.params.begin(), request.params.end());

        frame.push_back(checksum(frame.data() + dataStart, length));
        frame.push_back(protocol::POSTAMBLE);
        return frame;
    }

    bool Pn532Frame::isAck(const etl::ivector<uint8_t>& buffer)
    {
        if (buffer.size() < protocol::ACK_SIZE)
        {
            return false;
        }
        for (size_t i = 0; i < protocol::ACK_SIZE; ++i)
        {
            if (buffer[i] != ACK_FRAME[i])
            {
                return false;
            }
        }
        return true;
    }

    etl::expected<Pn532ResponseFrame, Error> Pn532Frame::parse(const etl::ivector<uint8_t>& buffer,
                                                               uint8_t sentCommandCode)
    {
        size_t index = 0;
        bool found = false;
        for (size_t i = 0; i + 2 < buffer.size(); ++i)
        {
            if (buffer[i] == 0x00 && buffer[i + 1] == 0x00 && buffer[i + 2] == 0xFF)
            {
                index = i + 3;
                found = true;
                break;
            }
        }
        if (!found || index + 2 > buffer.size())
        {
            LOG_ERROR("PN532 response without start code");
            return invalidFrame();
        }

        const uint8_t length = buffer[index];
        const uint8_t lengthChecksum = buffer[index + 1];
        index += 2;
        if (length < 2 || static_cast<uint8_t>(length + lengthChecksum) != 0x00)
        {
            LOG_ERROR("PN532 response length %u fails its checksum", length);
            return invalidFrame();
        }
        if (index + length + 1 > buffer.size())
        {
            LOG_ERROR("PN532 response truncated");
            return invalidFrame();
        }

        const uint8_t* data = buffer.data() + index;
        if (checksum(data, length) != buffer[index + length])
        {
            LOG_ERROR("PN532 response data checksum mismatch");
            return invalidFrame();
        }
        if (data[0] != protocol::TFI_DEVICE_TO_HOST)
        {
            LOG_ERROR("PN532 response TFI 0x%02X", data[0]);
            return invalidFrame();
        }

        const uint8_t expected = static_cast<uint8_t>(sentCommandCode + protocol::RESPONSE_CODE_OFFSET);
        if (data[1] != expected)
        {
            LOG_ERROR("PN532 answered 0x%02X, expected 0x%02X", data[1], expected);
            return invalidFrame();
        }

        Pn532ResponseFrame response;
        response.commandCode = data[1];
        response.payload.assign(data + 2, data + length);
        return response;
    }

} // namespace pn532
