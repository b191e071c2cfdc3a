/**
 * @file TcpLineTransport.hpp
 * @brief Newline-delimited message transport over TCP (POSIX sockets)
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <stdint.h>

#include <atomic>
#include <memory>
#include <string>

#include <etl/expected.h>

#include "../ITransport.hpp"


namespace comms
{
    namespace tcp
    {
        /**
         * @brief Options for TCP line transports and servers
         */
        struct TcpLineTransportOptions
        {
            std::string host = "127.0.0.1";
            uint16_t port = 8765;
            uint32_t connectTimeoutMs = 5000;
            size_t maxFrameSize = 64 * 1024;
        };

        /**
         * @brief TCP stream carrying one message per '\n'-terminated line
         *
         * The socket stays non-blocking once connected; receive() waits with
         * poll() and buffers partial lines between calls.
         *
         * send() and receive() may run on different threads. A lost connection
         * only shuts the socket down, the descriptor is released by close(),
         * which must not overlap either call.
         */
        class TcpLineTransport : public ITransport
        {
        public:
            /**
             * @brief Client transport, connects to options.host:options.port on open()
             */
            explicit TcpLineTransport(const TcpLineTransportOptions& options);

            /**
             * @brief Wrap an already connected socket (server side)
             *
             * The transport takes ownership of the descriptor. It cannot be
             * reopened after close().
             */
            static std::unique_ptr<TcpLineTransport> fromConnectedSocket(int fd, size_t maxFrameSize);

            ~TcpLineTransport() override;

            TcpLineTransport(const TcpLineTransport&) = delete;
            TcpLineTransport& operator=(const TcpLineTransport&) = delete;

            etl::expected<void, error::Error> open() override;

            void close() override;

            etl::expected<void, error::Error> send(const std::string& message) override;

            etl::expected<etl::optional<std::string>, error::Error> receive(uint32_t timeoutMs) override;

        private:
            TcpLineTransport(int fd, size_t maxFrameSize);

            etl::optional<std::string> takeLine();
            error::Error connectionLost(error::TransportError reason);

            TcpLineTransportOptions options;
            int socketFd;
            std::atomic<bool> linkUp;
            bool adopted;
            std::string rxBuffer;
        };

        /**
         * @brief Listening socket handing out TcpLineTransport connections
         */
        class TcpLineServer
        {
        public:
            explicit TcpLineServer(const TcpLineTransportOptions& options);
            ~TcpLineServer();

            TcpLineServer(const TcpLineServer&) = delete;
            TcpLineServer& operator=(const TcpLineServer&) = delete;

            /**
             * @brief Bind and listen on options.host:options.port
             *
             * @return etl::expected<void, Error> void on success, Error of type TransportError on failure
             */
            etl::expected<void, error::Error> open();

            void close();

            /**
             * @brief Wait for one incoming connection
             *
             * @param timeoutMs Maximum wait
             * @return Connected transport, nullptr if nobody connected in time, or Error
             */
            etl::expected<std::unique_ptr<TcpLineTransport>, error::Error> accept(uint32_t timeoutMs);

            /**
             * @brief Port actually bound, useful when options.port is 0
             */
            uint16_t boundPort() const;

            bool isOpen() const
            {
                return listenFd >= 0;
            }

        private:
            TcpLineTransportOptions options;
            int listenFd;
        };

    } // namespace tcp

} // namespace comms
