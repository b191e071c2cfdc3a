/**
 * @file TcpLineTransportTests.cpp
 * @brief Loopback tests for the newline framed TCP transport
 */

#include <gtest/gtest.h>
#include "Comms/Tcp/TcpLineTransport.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace comms::tcp;

namespace
{
    // Polls until a full line arrives or the attempts run out
    etl::optional<std::string> receiveLine(TcpLineTransport& transport, int attempts = 20)
    {
        for (int i = 0; i < attempts; ++i)
        {
            auto result = transport.receive(100);
            if (!result)
            {
                return etl::nullopt;
            }
            if (result.value())
            {
                return result.value();
            }
        }
        return etl::nullopt;
    }
}

class TcpLineTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        TcpLineTransportOptions serverOptions;
        serverOptions.host = "127.0.0.1";
        serverOptions.port = 0;
        server = std::make_unique<TcpLineServer>(serverOptions);
        ASSERT_TRUE(server->open().has_value());
        ASSERT_NE(server->boundPort(), 0);

        TcpLineTransportOptions clientOptions;
        clientOptions.host = "127.0.0.1";
        clientOptions.port = server->boundPort();
        clientOptions.connectTimeoutMs = 1000;
        clientOptions.maxFrameSize = 256;
        client = std::make_unique<TcpLineTransport>(clientOptions);
        ASSERT_TRUE(client->open().has_value());

        auto accepted = server->accept(1000);
        ASSERT_TRUE(accepted.has_value());
        ASSERT_TRUE(accepted.value() != nullptr);
        peer = std::move(accepted.value());
    }

    void TearDown() override {
        if (client) client->close();
        if (peer) peer->close();
        if (server) server->close();
    }

    std::unique_ptr<TcpLineServer> server;
    std::unique_ptr<TcpLineTransport> client;
    std::unique_ptr<TcpLineTransport> peer;
};

// Test: Messages arrive whole and in order
TEST_F(TcpLineTransportTest, SendAndReceive) {
    EXPECT_TRUE(client->isOpen());
    EXPECT_TRUE(peer->isOpen());

    ASSERT_TRUE(client->send("{\"type\":\"STATUS\"}").has_value());
    ASSERT_TRUE(client->send("second").has_value());

    auto first = receiveLine(*peer);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, "{\"type\":\"STATUS\"}");

    auto second = receiveLine(*peer);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, "second");

    ASSERT_TRUE(peer->send("reply").has_value());
    auto reply = receiveLine(*client);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(*reply, "reply");
}

// Test: Receive with nothing pending returns an empty optional
TEST_F(TcpLineTransportTest, ReceiveTimesOutEmpty) {
    auto result = peer->receive(20);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result.value().has_value());
}

// Test: Frames containing the delimiter or over the limit are refused
TEST_F(TcpLineTransportTest, RejectsBadFrames) {
    auto embedded = client->send("a\nb");
    ASSERT_FALSE(embedded.has_value());
    EXPECT_TRUE(embedded.error().isCode(error::TransportError::FrameTooLarge));

    auto large = client->send(std::string(300, 'x'));
    ASSERT_FALSE(large.has_value());
    EXPECT_TRUE(large.error().isCode(error::TransportError::FrameTooLarge));
}

// Test: Closing one side is reported to the other
TEST_F(TcpLineTransportTest, PeerCloseIsReported) {
    client->close();
    EXPECT_FALSE(client->isOpen());

    bool closed = false;
    for (int i = 0; i < 20 && !closed; ++i) {
        auto result = peer->receive(100);
        if (!result) {
            EXPECT_TRUE(result.error().isCode(error::TransportError::ConnectionClosed));
            closed = true;
        }
    }
    EXPECT_TRUE(closed);
    EXPECT_FALSE(peer->isOpen());

    auto send = client->send("late");
    ASSERT_FALSE(send.has_value());
    EXPECT_TRUE(send.error().isCode(error::TransportError::NotOpen));
}

// Test: A reply in flight on one thread while the reader sees the peer leave
TEST_F(TcpLineTransportTest, PeerCloseDuringConcurrentSend) {
    std::atomic<bool> sendFailed(false);
    bool sendErrorExpected = false;

    std::thread replier([&]() {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while (std::chrono::steady_clock::now() < deadline) {
            auto sent = peer->send("{\"action\":\"TAG_DATA\"}");
            if (!sent) {
                sendErrorExpected = sent.error().isCode(error::TransportError::NotOpen) ||
                                    sent.error().isCode(error::TransportError::ConnectionClosed);
                sendFailed = true;
                return;
            }
        }
    });

    client->close();

    bool closed = false;
    for (int i = 0; i < 30 && !closed; ++i) {
        auto result = peer->receive(100);
        if (!result) {
            EXPECT_TRUE(result.error().isCode(error::TransportError::ConnectionClosed));
            closed = true;
        }
    }
    replier.join();

    EXPECT_TRUE(closed);
    EXPECT_TRUE(sendFailed);
    EXPECT_TRUE(sendErrorExpected);
    EXPECT_FALSE(peer->isOpen());

    auto late = peer->send("late");
    ASSERT_FALSE(late.has_value());
    EXPECT_TRUE(late.error().isCode(error::TransportError::NotOpen));

    auto again = peer->receive(10);
    ASSERT_FALSE(again.has_value());
    EXPECT_TRUE(again.error().isCode(error::TransportError::NotOpen));
}

// Test: A client whose connection was lost reconnects on open()
TEST_F(TcpLineTransportTest, ReopenAfterLostConnection) {
    peer->close();

    bool closed = false;
    for (int i = 0; i < 20 && !closed; ++i) {
        closed = !client->receive(100).has_value();
    }
    ASSERT_TRUE(closed);
    EXPECT_FALSE(client->isOpen());

    ASSERT_TRUE(client->open().has_value());
    EXPECT_TRUE(client->isOpen());

    auto accepted = server->accept(1000);
    ASSERT_TRUE(accepted.has_value());
    ASSERT_TRUE(accepted.value() != nullptr);
    peer = std::move(accepted.value());

    ASSERT_TRUE(client->send("hello again").has_value());
    auto line = receiveLine(*peer);
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "hello again");
}

// Test: Connecting to a port nobody listens on fails cleanly
TEST(TcpLineTransportStandaloneTest, ConnectRefused) {
    TcpLineTransportOptions serverOptions;
    serverOptions.host = "127.0.0.1";
    serverOptions.port = 0;
    TcpLineServer server(serverOptions);
    ASSERT_TRUE(server.open().has_value());
    uint16_t port = server.boundPort();
    server.close();

    TcpLineTransportOptions options;
    options.host = "127.0.0.1";
    options.port = port;
    options.connectTimeoutMs = 500;
    TcpLineTransport transport(options);

    auto result = transport.open();
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().isCode(error::TransportError::ConnectFailed));
    EXPECT_FALSE(transport.isOpen());
}
