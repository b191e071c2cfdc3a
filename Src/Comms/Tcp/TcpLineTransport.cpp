/**
 * @file TcpLineTransport.cpp
 * @brief Newline-delimited message transport over TCP (POSIX sockets)
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Comms/Tcp/TcpLineTransport.hpp"
#include "Utils/Logging.h"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace error;

namespace comms
{
    namespace tcp
    {
        namespace
        {
            constexpr char FRAME_DELIMITER = '\n';
            constexpr size_t RECEIVE_CHUNK = 4096;

            bool setNonBlocking(int fd)
            {
                int flags = fcntl(fd, F_GETFL, 0);
                return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
            }

            // Non-blocking connect bounded by poll()
            int connectWithTimeout(const struct addrinfo& address, uint32_t timeoutMs)
            {
                int fd = ::socket(address.ai_family, address.ai_socktype, address.ai_protocol);
                if (fd < 0)
                {
                    return -1;
                }

                if (!setNonBlocking(fd))
                {
                    ::close(fd);
                    return -1;
                }

                int ret = ::connect(fd, address.ai_addr, address.ai_addrlen);
                if (ret < 0 && errno != EINPROGRESS)
                {
                    ::close(fd);
                    return -1;
                }

                if (ret < 0)
                {
                    struct pollfd pfd;
                    pfd.fd = fd;
                    pfd.events = POLLOUT;
                    pfd.revents = 0;
                    ret = ::poll(&pfd, 1, static_cast<int>(timeoutMs));
                    if (ret <= 0)
                    {
                        ::close(fd);
                        return -1;
                    }

                    int socketError = 0;
                    socklen_t len = sizeof(socketError);
                    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &socketError, &len) != 0 || socketError != 0)
                    {
                        ::close(fd);
                        return -1;
                    }
                }

                int flag = 1;
                setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
                setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag));
                return fd;
            }
        }

        // ==============================================================================
        // TcpLineTransport
        // ==============================================================================

        TcpLineTransport::TcpLineTransport(const TcpLineTransportOptions& options)
            : options(options)
            , socketFd(-1)
            , linkUp(false)
            , adopted(false)
        {
        }

        TcpLineTransport::TcpLineTransport(int fd, size_t maxFrameSize)
            : socketFd(fd)
            , linkUp(fd >= 0)
            , adopted(true)
        {
            options.maxFrameSize = maxFrameSize;
            setIsOpen(fd >= 0);
        }

        std::unique_ptr<TcpLineTransport> TcpLineTransport::fromConnectedSocket(int fd, size_t maxFrameSize)
        {
            if (fd >= 0 && !setNonBlocking(fd))
            {
                LOG_WARN("Could not make accepted socket non-blocking: %s", std::strerror(errno));
            }
            return std::unique_ptr<TcpLineTransport>(new TcpLineTransport(fd, maxFrameSize));
        }

        TcpLineTransport::~TcpLineTransport()
        {
            close();
        }

        etl::expected<void, Error> TcpLineTransport::open()
        {
            if (socketFd >= 0 && linkUp)
            {
                return {};
            }
            if (adopted)
            {
                return etl::unexpected(Error::fromTransport(TransportError::ConnectionClosed));
            }

            // Release the descriptor of a connection that was lost
            close();

            struct addrinfo hints;
            std::memset(&hints, 0, sizeof(hints));
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;

            const std::string port = std::to_string(options.port);
            struct addrinfo* result = nullptr;
            int err = getaddrinfo(options.host.c_str(), port.c_str(), &hints, &result);
            if (err != 0 || result == nullptr)
            {
                LOG_ERROR("Failed to resolve %s: %s", options.host.c_str(), gai_strerror(err));
                return etl::unexpected(Error::fromTransport(TransportError::ResolveFailed));
            }

            for (struct addrinfo* address = result; address != nullptr; address = address->ai_next)
            {
                socketFd = connectWithTimeout(*address, options.connectTimeoutMs);
                if (socketFd >= 0)
                {
                    break;
                }
            }
            freeaddrinfo(result);

            if (socketFd < 0)
            {
                LOG_WARN("Failed to connect to %s:%u", options.host.c_str(), static_cast<unsigned>(options.port));
                return etl::unexpected(Error::fromTransport(TransportError::ConnectFailed));
            }

            rxBuffer.clear();
            linkUp = true;
            setIsOpen(true);
            LOG_INFO("Connected to %s:%u", options.host.c_str(), static_cast<unsigned>(options.port));
            return {};
        }

        void TcpLineTransport::close()
        {
            linkUp = false;
            if (socketFd >= 0)
            {
                shutdown(socketFd, SHUT_RDWR);
                ::close(socketFd);
                socketFd = -1;
            }
            rxBuffer.clear();
            setIsOpen(false);
        }

        Error TcpLineTransport::connectionLost(TransportError reason)
        {
            // The other direction may still be using socketFd
            if (linkUp.exchange(false))
            {
                shutdown(socketFd, SHUT_RDWR);
            }
            setIsOpen(false);
            return Error::fromTransport(reason);
        }

        etl::expected<void, Error> TcpLineTransport::send(const std::string& message)
        {
            if (socketFd < 0 || !linkUp)
            {
                return etl::unexpected(Error::fromTransport(TransportError::NotOpen));
            }
            if (message.size() >= options.maxFrameSize || message.find(FRAME_DELIMITER) != std::string::npos)
            {
                return etl::unexpected(Error::fromTransport(TransportError::FrameTooLarge));
            }

            std::string frame = message;
            frame.push_back(FRAME_DELIMITER);

            size_t totalSent = 0;
            while (totalSent < frame.size())
            {
                ssize_t sent = ::send(socketFd, frame.data() + totalSent, frame.size() - totalSent, MSG_NOSIGNAL);
                if (sent < 0)
                {
                    if (errno == EAGAIN || errno == EWOULDBLOCK)
                    {
                        struct pollfd pfd;
                        pfd.fd = socketFd;
                        pfd.events = POLLOUT;
                        pfd.revents = 0;
                        if (::poll(&pfd, 1, static_cast<int>(options.connectTimeoutMs)) <= 0)
                        {
                            LOG_ERROR("Send timed out");
                            return etl::unexpected(Error::fromTransport(TransportError::SendFailed));
                        }
                        continue;
                    }
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    LOG_WARN("Send failed: %s", std::strerror(errno));
                    return etl::unexpected(connectionLost(TransportError::ConnectionClosed));
                }
                totalSent += static_cast<size_t>(sent);
            }
            return {};
        }

        etl::optional<std::string> TcpLineTransport::takeLine()
        {
            size_t end = rxBuffer.find(FRAME_DELIMITER);
            if (end == std::string::npos)
            {
                return etl::nullopt;
            }

            std::string line = rxBuffer.substr(0, end);
            rxBuffer.erase(0, end + 1);
            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }
            return line;
        }

        etl::expected<etl::optional<std::string>, Error> TcpLineTransport::receive(uint32_t timeoutMs)
        {
            auto buffered = takeLine();
            if (buffered)
            {
                return buffered;
            }
            if (socketFd < 0 || !linkUp)
            {
                return etl::unexpected(Error::fromTransport(TransportError::NotOpen));
            }

            struct pollfd pfd;
            pfd.fd = socketFd;
            pfd.events = POLLIN;
            pfd.revents = 0;
            int ret = ::poll(&pfd, 1, static_cast<int>(timeoutMs));
            if (ret < 0)
            {
                if (errno == EINTR)
                {
                    return etl::optional<std::string>();
                }
                return etl::unexpected(Error::fromTransport(TransportError::ReceiveFailed));
            }
            if (ret == 0)
            {
                return etl::optional<std::string>();
            }

            char chunk[RECEIVE_CHUNK];
            ssize_t received = ::recv(socketFd, chunk, sizeof(chunk), 0);
            if (received < 0)
            {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                {
                    return etl::optional<std::string>();
                }
                LOG_WARN("Receive failed: %s", std::strerror(errno));
                return etl::unexpected(connectionLost(TransportError::ConnectionClosed));
            }
            if (received == 0)
            {
                LOG_INFO("Peer closed the connection");
                return etl::unexpected(connectionLost(TransportError::ConnectionClosed));
            }

            rxBuffer.append(chunk, static_cast<size_t>(received));

            auto line = takeLine();
            if (!line && rxBuffer.size() > options.maxFrameSize)
            {
                LOG_ERROR("Incoming frame exceeds %u bytes", static_cast<unsigned>(options.maxFrameSize));
                rxBuffer.clear();
                return etl::unexpected(Error::fromTransport(TransportError::FrameTooLarge));
            }
            return line;
        }

        // ==============================================================================
        // TcpLineServer
        // ==============================================================================

        TcpLineServer::TcpLineServer(const TcpLineTransportOptions& options)
            : options(options)
            , listenFd(-1)
        {
        }

        TcpLineServer::~TcpLineServer()
        {
            close();
        }

        etl::expected<void, Error> TcpLineServer::open()
        {
            if (listenFd >= 0)
            {
                return {};
            }

            struct addrinfo hints;
            std::memset(&hints, 0, sizeof(hints));
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;
            hints.ai_flags = AI_PASSIVE;

            const std::string port = std::to_string(options.port);
            struct addrinfo* result = nullptr;
            const char* host = options.host.empty() ? nullptr : options.host.c_str();
            int err = getaddrinfo(host, port.c_str(), &hints, &result);
            if (err != 0 || result == nullptr)
            {
                LOG_ERROR("Failed to resolve listen address: %s", gai_strerror(err));
                return etl::unexpected(Error::fromTransport(TransportError::ResolveFailed));
            }

            for (struct addrinfo* address = result; address != nullptr; address = address->ai_next)
            {
                int fd = ::socket(address->ai_family, address->ai_socktype, address->ai_protocol);
                if (fd < 0)
                {
                    continue;
                }

                int flag = 1;
                setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &flag, sizeof(flag));
                if (::bind(fd, address->ai_addr, address->ai_addrlen) == 0 && ::listen(fd, 1) == 0)
                {
                    listenFd = fd;
                    break;
                }
                ::close(fd);
            }
            freeaddrinfo(result);

            if (listenFd < 0)
            {
                LOG_ERROR("Failed to listen on port %u: %s", static_cast<unsigned>(options.port), std::strerror(errno));
                return etl::unexpected(Error::fromTransport(TransportError::ConnectFailed));
            }

            LOG_INFO("Listening on port %u", static_cast<unsigned>(boundPort()));
            return {};
        }

        void TcpLineServer::close()
        {
            if (listenFd >= 0)
            {
                ::close(listenFd);
                listenFd = -1;
            }
        }

        etl::expected<std::unique_ptr<TcpLineTransport>, Error> TcpLineServer::accept(uint32_t timeoutMs)
        {
            if (listenFd < 0)
            {
                return etl::unexpected(Error::fromTransport(TransportError::NotOpen));
            }

            struct pollfd pfd;
            pfd.fd = listenFd;
            pfd.events = POLLIN;
            pfd.revents = 0;
            int ret = ::poll(&pfd, 1, static_cast<int>(timeoutMs));
            if (ret <= 0)
            {
                return std::unique_ptr<TcpLineTransport>();
            }

            int fd = ::accept(listenFd, nullptr, nullptr);
            if (fd < 0)
            {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                {
                    return std::unique_ptr<TcpLineTransport>();
                }
                LOG_ERROR("Accept failed: %s", std::strerror(errno));
                return etl::unexpected(Error::fromTransport(TransportError::ReceiveFailed));
            }

            int flag = 1;
            setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
            LOG_INFO("Accepted bridge connection");
            return TcpLineTransport::fromConnectedSocket(fd, options.maxFrameSize);
        }

        uint16_t TcpLineServer::boundPort() const
        {
            if (listenFd < 0)
            {
                return 0;
            }

            struct sockaddr_storage address;
            socklen_t len = sizeof(address);
            if (getsockname(listenFd, reinterpret_cast<struct sockaddr*>(&address), &len) != 0)
            {
                return 0;
            }
            if (address.ss_family == AF_INET)
            {
                return ntohs(reinterpret_cast<struct sockaddr_in*>(&address)->sin_port);
            }
            if (address.ss_family == AF_INET6)
            {
                return ntohs(reinterpret_cast<struct sockaddr_in6*>(&address)->sin6_port);
            }
            return 0;
        }

    } // namespace tcp

} // namespace comms
