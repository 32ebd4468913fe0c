/**
 * @file test_transport.cpp
 * @brief Unit tests for TcpTransport, TcpBlockChannel and the heartbeat probe.
 */

#include "health/heartbeat_probe.hpp"
#include "network/transport.hpp"
#include "telemetry/json_sink.hpp"
#include "transfer/block_channel.hpp"
#include "transfer/wire_codec.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <thread>

using namespace model_mesh;

namespace {

Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

std::string to_text(const Bytes& b) {
    return std::string(b.begin(), b.end());
}

}  // namespace

// ═══════════════════════════════════════════════
// TcpTransport Tests
// ═══════════════════════════════════════════════

TEST(TcpTransportTest, DefaultState) {
    TcpTransport transport;
    EXPECT_FALSE(transport.is_connected());
    EXPECT_FALSE(transport.is_listening());
}

TEST(TcpTransportTest, SendWithoutConnect) {
    TcpTransport transport;
    auto result = transport.send({0x01, 0x02, 0x03});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::TransientTransport);
}

TEST(TcpTransportTest, ConnectToNowhereIsTransient) {
    TcpTransport transport;
    auto result = transport.connect("127.0.0.1", 59999, 500);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::TransientTransport);
    EXPECT_FALSE(transport.is_connected());
}

TEST(TcpTransportTest, EphemeralPort) {
    TcpTransport server;
    auto listen_result = server.listen(0);
    if (!listen_result.has_value()) {
        GTEST_SKIP() << "Could not bind: " << listen_result.error().message;
    }
    EXPECT_TRUE(server.is_listening());
    EXPECT_NE(server.bound_port(), 0);
    server.stop_serving();
}

TEST(TcpTransportTest, RequestResponse) {
    TcpTransport server;
    if (!server.listen(0).has_value()) {
        GTEST_SKIP() << "Could not bind a loopback port";
    }
    server.serve([](const Bytes& request) {
        auto reply = to_bytes("ECHO:");
        reply.insert(reply.end(), request.begin(), request.end());
        return reply;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto reply = TcpTransport::request("127.0.0.1", server.bound_port(), to_bytes("HELLO"), 2000);
    ASSERT_TRUE(reply.has_value()) << reply.error().message;
    EXPECT_EQ(to_text(*reply), "ECHO:HELLO");

    // A persistent connection carries several exchanges
    TcpTransport client;
    ASSERT_TRUE(client.connect("127.0.0.1", server.bound_port(), 2000).has_value());
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(client.send(to_bytes(std::to_string(i))).has_value());
        auto r = client.receive(2000);
        ASSERT_TRUE(r.has_value());
        EXPECT_EQ(to_text(*r), "ECHO:" + std::to_string(i));
    }
    client.disconnect();
    server.stop_serving();
}

TEST(TcpTransportTest, LargeMessage) {
    TcpTransport server;
    if (!server.listen(0).has_value()) {
        GTEST_SKIP() << "Could not bind a loopback port";
    }
    server.serve([](const Bytes& request) { return request; });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    Bytes big(512 * 1024);
    for (size_t i = 0; i < big.size(); ++i) big[i] = static_cast<uint8_t>(i * 31);
    auto reply = TcpTransport::request("127.0.0.1", server.bound_port(), big, 5000);
    ASSERT_TRUE(reply.has_value()) << reply.error().message;
    EXPECT_EQ(*reply, big);
    server.stop_serving();
}

// ═══════════════════════════════════════════════
// TcpBlockChannel Tests
// ═══════════════════════════════════════════════

TEST(TcpBlockChannelTest, ExchangeOverSocket) {
    TcpTransport server;
    if (!server.listen(0).has_value()) {
        GTEST_SKIP() << "Could not bind a loopback port";
    }
    server.serve([](const Bytes&) { return to_bytes(encode_ack(TransferAck::ok())); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    TcpBlockChannel channel("127.0.0.1", server.bound_port());
    EXPECT_EQ(channel.method(), TransferMethod::DirectStream);
    auto reply = channel.exchange("{}", std::chrono::milliseconds{2000});
    ASSERT_TRUE(reply.has_value()) << reply.error().message;
    auto ack = decode_ack(*reply);
    ASSERT_TRUE(ack.has_value());
    EXPECT_TRUE(ack->success);
    server.stop_serving();
}

TEST(TcpBlockChannelTest, UnreachablePeerIsTransient) {
    TcpBlockChannel channel("127.0.0.1", 59998);
    auto reply = channel.exchange("{}", std::chrono::milliseconds{300});
    ASSERT_FALSE(reply.has_value());
    EXPECT_EQ(reply.error().kind, ErrorKind::TransientTransport);
}

// ═══════════════════════════════════════════════
// Heartbeat Tests
// ═══════════════════════════════════════════════

TEST(HeartbeatTest, MessageShapes) {
    EXPECT_TRUE(is_heartbeat(encode_heartbeat("worker-1")));
    EXPECT_FALSE(is_heartbeat(encode_heartbeat_ack("worker-1")));
    EXPECT_FALSE(is_heartbeat("garbage"));
}

TEST(HeartbeatTest, ProbeAgainstResponder) {
    TcpTransport server;
    if (!server.listen(0).has_value()) {
        GTEST_SKIP() << "Could not bind a loopback port";
    }
    server.serve([](const Bytes& request) {
        return is_heartbeat(to_text(request)) ? to_bytes(encode_heartbeat_ack("w1"))
                                              : to_bytes("{}");
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    TcpHeartbeatProbe probe;
    auto result = probe.probe("w1", "127.0.0.1", server.bound_port(), Duration{2000});
    EXPECT_TRUE(result.success) << result.error;
    server.stop_serving();
}

TEST(HeartbeatTest, ProbeRejectsWrongReply) {
    TcpTransport server;
    if (!server.listen(0).has_value()) {
        GTEST_SKIP() << "Could not bind a loopback port";
    }
    server.serve([](const Bytes&) { return to_bytes(R"({"type":"pong"})"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    TcpHeartbeatProbe probe;
    auto result = probe.probe("w1", "127.0.0.1", server.bound_port(), Duration{2000});
    EXPECT_FALSE(result.success);
    server.stop_serving();
}

TEST(HeartbeatTest, ProbeUnreachable) {
    TcpHeartbeatProbe probe;
    auto result = probe.probe("w1", "127.0.0.1", 59997, Duration{300});
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.empty());
}

TEST(HeartbeatTest, MockProbeScripts) {
    MockHealthProbe probe;
    probe.push_result("w1", ProbeResult{.success = false, .response_time = Duration{0},
                                        .error = "down"});
    EXPECT_FALSE(probe.probe("w1", "", 0, Duration{1}).success);
    EXPECT_TRUE(probe.probe("w1", "", 0, Duration{1}).success);
    probe.set_alive("w1", false);
    EXPECT_FALSE(probe.probe("w1", "", 0, Duration{1}).success);
    EXPECT_EQ(probe.probe_count("w1"), 3u);
}
