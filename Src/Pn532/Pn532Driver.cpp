/**
 * @file Pn532Driver.cpp
 * @brief PN532 host-side protocol: frames, ACK and command execution
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Pn532/Pn532Driver.h"
#include "Utils/Logging.h"

using namespace error;

namespace pn532
{
    namespace
    {
        // Preamble, start code, LEN, LCS
        constexpr size_t HEADER_SIZE = 5;
    }

    Pn532Driver::Pn532Driver(comms::IHardwareBus& bus, const Pn532DriverOptions& options)
        : bus(bus)
        , options(options)
    {
    }

    etl::expected<void, Error> Pn532Driver::executeCommand(IPn532Command& command)
    {
        LOG_DEBUG("Executing command: %.*s", static_cast<int>(command.name().size()), command.name().data());

        const CommandRequest request = command.buildRequest();
        auto frame = transceive(request);
        if (!frame)
        {
            LOG_ERROR("%.*s failed: %s", static_cast<int>(command.name().size()), command.name().data(),
                      frame.error().toString().c_str());
            return etl::unexpected<Error>(frame.error());
        }

        auto parsed = command.parseResponse(frame.value());
        if (!parsed)
        {
            LOG_ERROR("Failed to parse %.*s response", static_cast<int>(command.name().size()), command.name().data());
            return parsed;
        }
        return {};
    }

    etl::expected<FirmwareInfo, Error> Pn532Driver::getFirmwareVersion()
    {
        GetFirmwareVersion cmd;
        auto result = executeCommand(cmd);
        if (!result)
        {
            return etl::unexpected<Error>(result.error());
        }
        return cmd.getFirmwareInfo();
    }

    etl::expected<void, Error> Pn532Driver::setSamConfiguration(SamMode mode)
    {
        SAMConfigurationOptions opts;
        opts.mode = mode;
        SAMConfiguration cmd(opts);
        return executeCommand(cmd);
    }

    etl::expected<void, Error> Pn532Driver::setPassiveActivationRetries(uint8_t retries)
    {
        RFConfiguration cmd(RFConfiguration::maxRetries(retries));
        return executeCommand(cmd);
    }

    etl::expected<Pn532ResponseFrame, Error> Pn532Driver::transceive(const CommandRequest& request)
    {
        auto frame = Pn532Frame::build(request);
        if (!frame)
        {
            return etl::unexpected<Error>(frame.error());
        }

        // Drop whatever a previous, abandoned exchange left behind
        auto flushed = bus.flush();
        if (!flushed)
        {
            return etl::unexpected<Error>(flushed.error());
        }

        auto woken = wakeUp();
        if (!woken)
        {
            return etl::unexpected<Error>(woken.error());
        }

        auto written = bus.write(frame.value());
        if (!written)
        {
            return etl::unexpected<Error>(written.error());
        }

        FrameBuffer ack;
        utils::Deadline ackDeadline(options.clock, options.ackTimeoutMs);
        auto ackRead = readAtLeast(ack, protocol::ACK_SIZE, ackDeadline);
        if (!ackRead)
        {
            LOG_ERROR("No ACK for command 0x%02X", request.commandCode);
            return etl::unexpected<Error>(ackRead.error());
        }
        if (!Pn532Frame::isAck(ack))
        {
            LOG_ERROR("Invalid ACK frame for command 0x%02X", request.commandCode);
            return etl::unexpected<Error>(Error::fromHardware(HardwareError::InvalidFrame));
        }

        utils::Deadline responseDeadline(options.clock, request.timeoutMs);
        auto response = readResponseFrame(responseDeadline);
        if (!response)
        {
            return etl::unexpected<Error>(response.error());
        }
        return Pn532Frame::parse(response.value(), request.commandCode);
    }

    etl::expected<void, Error> Pn532Driver::wakeUp()
    {
        etl::vector<uint8_t, 10> wakeupBytes = {0x55, 0x55, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
        return bus.write(wakeupBytes);
    }

    etl::expected<void, Error> Pn532Driver::readAtLeast(FrameBuffer& buffer, size_t count, const utils::Deadline& deadline)
    {
        FrameBuffer chunk;
        while (buffer.size() < count)
        {
            if (bus.available() == 0)
            {
                if (deadline.expired())
                {
                    return etl::unexpected<Error>(Error::fromHardware(HardwareError::Timeout));
                }
                utils::delay_ms(options.pollIntervalMs);
                continue;
            }

            if (count > buffer.capacity())
            {
                return etl::unexpected<Error>(Error::fromHardware(HardwareError::BufferOverflow));
            }

            // Never read past the wanted count, the rest belongs to the next frame
            auto read = bus.read(chunk, count - buffer.size());
            if (!read)
            {
                return etl::unexpected<Error>(read.error());
            }
            buffer.insert(buffer.end(), chunk.begin(), chunk.end());
        }
        return {};
    }

    etl::expected<FrameBuffer, Error> Pn532Driver::readResponseFrame(const utils::Deadline& deadline)
    {
        FrameBuffer buffer;
        auto header = readAtLeast(buffer, HEADER_SIZE, deadline);
        if (!header)
        {
            return etl::unexpected<Error>(header.error());
        }

        // Skip leading noise so LEN sits at a known offset
        size_t start = 0;
        while (start + 2 < buffer.size() &&
               !(buffer[start] == 0x00 && buffer[start + 1] == 0x00 && buffer[start + 2] == 0xFF))
        {
            ++start;
        }
        auto lengthKnown = readAtLeast(buffer, start + HEADER_SIZE, deadline);
        if (!lengthKnown)
        {
            return etl::unexpected<Error>(lengthKnown.error());
        }

        const size_t length = buffer[start + 3];
        auto complete = readAtLeast(buffer, start + HEADER_SIZE + length + 1, deadline);
        if (!complete)
        {
            return etl::unexpected<Error>(complete.error());
        }
        return buffer;
    }

} // namespace pn532
