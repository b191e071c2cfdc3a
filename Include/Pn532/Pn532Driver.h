/**
 * @file Pn532Driver.h
 * @brief PN532 host-side protocol: frames, ACK and command execution
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdint>

#include <etl/expected.h>

#include "IPn532Command.h"
#include "Pn532Frame.h"
#include "Commands/GetFirmwareVersion.h"
#include "Commands/SAMConfiguration.h"
#include "Commands/RFConfiguration.h"

#include "Error/Error.h"
#include "Comms/IHardwareBus.hpp"
#include "Utils/Timing.h"

namespace pn532
{
    struct Pn532DriverOptions
    {
        uint32_t ackTimeoutMs = 50;
        uint32_t pollIntervalMs = 2;
        utils::TickSource clock = utils::get_tick_ms;
    };

    class Pn532Driver
    {
    public:
        explicit Pn532Driver(comms::IHardwareBus& bus, const Pn532DriverOptions& options = Pn532DriverOptions());

        /**
         * @brief Send a command, wait for ACK and response, let the command parse it
         *
         * @return etl::expected<void, error::Error> HardwareError::Timeout when the chip stays silent,
         *         HardwareError::InvalidFrame on a corrupt ACK or response
         */
        etl::expected<void, error::Error> executeCommand(IPn532Command& command);

        etl::expected<FirmwareInfo, error::Error> getFirmwareVersion();
        etl::expected<void, error::Error> setSamConfiguration(SamMode mode);

        /**
         * @brief Bound the number of activation attempts of InListPassiveTarget
         *
         * @param retries Attempts before the chip reports zero targets, 0xFF for no limit
         */
        etl::expected<void, error::Error> setPassiveActivationRetries(uint8_t retries);

    private:
        etl::expected<Pn532ResponseFrame, error::Error> transceive(const CommandRequest& request);
        etl::expected<void, error::Error> wakeUp();
        etl::expected<void, error::Error> readAtLeast(FrameBuffer& buffer, size_t count, const utils::Deadline& deadline);
        etl::expected<FrameBuffer, error::Error> readResponseFrame(const utils::Deadline& deadline);

        comms::IHardwareBus& bus;
        Pn532DriverOptions options;
    };

} // namespace pn532
