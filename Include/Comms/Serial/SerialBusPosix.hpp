/**
 * @file SerialBusPosix.hpp
 * @brief Raw 8N1 serial port on a POSIX tty
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <stdint.h>

#include <string>

#include <etl/expected.h>

#include "Comms/IHardwareBus.hpp"

namespace comms
{
    namespace serial
    {
        struct SerialOptions
        {
            std::string device = "/dev/ttyUSB0";
            uint32_t baudRate = 115200;
        };

        class SerialBusPosix : public IHardwareBus
        {
        public:
            explicit SerialBusPosix(const SerialOptions& options);
            ~SerialBusPosix() override;

            SerialBusPosix(const SerialBusPosix&) = delete;
            SerialBusPosix& operator=(const SerialBusPosix&) = delete;

            // ==============================================================================
            // Open and Close
            // ==============================================================================

            /**
             * @brief Open the tty non-blocking in raw mode at the configured baud rate
             *
             * @return etl::expected<void, error::Error> DeviceNotFound if the tty cannot be opened,
             *         NotSupported for a baud rate termios does not know
             */
            etl::expected<void, error::Error> open() override;
            void close() override;

            // ==============================================================================
            // Read and Write
            // ==============================================================================

            etl::expected<void, error::Error> write(const etl::ivector<uint8_t>& data) override;
            etl::expected<size_t, error::Error> read(etl::ivector<uint8_t>& buffer, size_t length) override;
            etl::expected<void, error::Error> flush() override;
            size_t available() const override;

        private:
            SerialOptions options;
            int fd;
        };

    } // namespace serial
} // namespace comms
