/**
 * @file SerialBusPosix.cpp
 * @brief Raw 8N1 serial port on a POSIX tty
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Comms/Serial/SerialBusPosix.hpp"
#include "Utils/Logging.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace comms
{
    namespace serial
    {
        using namespace error;

        namespace
        {
            constexpr int WRITE_POLL_MS = 100;

            bool toSpeed(uint32_t baudRate, speed_t& speed)
            {
                switch (baudRate)
                {
                    case 9600: speed = B9600; return true;
                    case 19200: speed = B19200; return true;
                    case 38400: speed = B38400; return true;
                    case 57600: speed = B57600; return true;
                    case 115200: speed = B115200; return true;
                    case 230400: speed = B230400; return true;
                    default: return false;
                }
            }
        }

        SerialBusPosix::SerialBusPosix(const SerialOptions& options)
            : options(options)
            , fd(-1)
        {
        }

        SerialBusPosix::~SerialBusPosix()
        {
            this->close();
        }

        // ==============================================================================
        // Open and Close
        // ==============================================================================

        etl::expected<void, Error> SerialBusPosix::open()
        {
            if (this->isOpen())
            {
                return {};
            }

            speed_t speed;
            if (!toSpeed(options.baudRate, speed))
            {
                LOG_ERROR("Unsupported baud rate %u", options.baudRate);
                return etl::unexpected<Error>(Error::fromHardware(HardwareError::NotSupported));
            }

            fd = ::open(options.device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
            if (fd < 0)
            {
                LOG_ERROR("Error opening serial port %s: %s", options.device.c_str(), std::strerror(errno));
                return etl::unexpected<Error>(Error::fromHardware(HardwareError::DeviceNotFound));
            }

            struct termios tty;
            if (tcgetattr(fd, &tty) != 0)
            {
                LOG_ERROR("tcgetattr on %s failed: %s", options.device.c_str(), std::strerror(errno));
                ::close(fd);
                fd = -1;
                return etl::unexpected<Error>(Error::fromHardware(HardwareError::DeviceNotFound));
            }

            cfmakeraw(&tty);
            tty.c_cflag |= (CLOCAL | CREAD);
            tty.c_cflag &= ~(PARENB | CSTOPB | CRTSCTS);
            tty.c_cc[VMIN] = 0;
            tty.c_cc[VTIME] = 0;
            cfsetispeed(&tty, speed);
            cfsetospeed(&tty, speed);

            if (tcsetattr(fd, TCSANOW, &tty) != 0)
            {
                LOG_ERROR("tcsetattr on %s failed: %s", options.device.c_str(), std::strerror(errno));
                ::close(fd);
                fd = -1;
                return etl::unexpected<Error>(Error::fromHardware(HardwareError::NotSupported));
            }

            tcflush(fd, TCIOFLUSH);
            this->setIsOpen(true);
            LOG_INFO("Serial port %s opened at %u baud", options.device.c_str(), options.baudRate);
            return {};
        }

        void SerialBusPosix::close()
        {
            if (fd >= 0)
            {
                ::close(fd);
                fd = -1;
                LOG_INFO("Serial port %s closed", options.device.c_str());
            }
            this->setIsOpen(false);
        }

        // ==============================================================================
        // Read and Write
        // ==============================================================================

        etl::expected<void, Error> SerialBusPosix::write(const etl::ivector<uint8_t>& data)
        {
            if (!this->isOpen())
            {
                return etl::unexpected<Error>(Error::fromHardware(HardwareError::DeviceNotFound));
            }

            size_t offset = 0;
            while (offset < data.size())
            {
                ssize_t n = ::write(fd, data.data() + offset, data.size() - offset);
                if (n > 0)
                {
                    offset += static_cast<size_t>(n);
                    continue;
                }
                if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
                {
                    struct pollfd pfd = {fd, POLLOUT, 0};
                    ::poll(&pfd, 1, WRITE_POLL_MS);
                    continue;
                }
                LOG_ERROR("Error writing to serial port %s: %s", options.device.c_str(), std::strerror(errno));
                return etl::unexpected<Error>(Error::fromHardware(HardwareError::WriteFailed));
            }

            tcdrain(fd);
            return {};
        }

        etl::expected<size_t, Error> SerialBusPosix::read(etl::ivector<uint8_t>& buffer, size_t length)
        {
            if (buffer.capacity() < length)
            {
                LOG_ERROR("Read buffer too small for requested length on %s", options.device.c_str());
                return etl::unexpected<Error>(Error::fromHardware(HardwareError::BufferOverflow));
            }
            if (!this->isOpen())
            {
                return etl::unexpected<Error>(Error::fromHardware(HardwareError::DeviceNotFound));
            }

            buffer.uninitialized_resize(length);
            ssize_t n = ::read(fd, buffer.data(), length);
            if (n < 0)
            {
                buffer.clear();
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                {
                    return static_cast<size_t>(0);
                }
                LOG_ERROR("Error reading from serial port %s: %s", options.device.c_str(), std::strerror(errno));
                return etl::unexpected<Error>(Error::fromHardware(HardwareError::ReadFailed));
            }

            buffer.uninitialized_resize(static_cast<size_t>(n));
            return static_cast<size_t>(n);
        }

        etl::expected<void, Error> SerialBusPosix::flush()
        {
            if (!this->isOpen())
            {
                return etl::unexpected<Error>(Error::fromHardware(HardwareError::DeviceNotFound));
            }
            if (tcflush(fd, TCIFLUSH) != 0)
            {
                LOG_ERROR("Error flushing serial port %s", options.device.c_str());
                return etl::unexpected<Error>(Error::fromHardware(HardwareError::Unknown));
            }
            return {};
        }

        size_t SerialBusPosix::available() const
        {
            if (fd < 0)
            {
                return 0;
            }
            int count = 0;
            if (ioctl(fd, FIONREAD, &count) != 0 || count < 0)
            {
                return 0;
            }
            return static_cast<size_t>(count);
        }

    } // namespace serial
} // namespace comms
