#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "lifx_network/connection.hpp"
#include "lifx_protocol/error.hpp"
#include "lifx_protocol/protocol.hpp"
#include "../utils/fake_device.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <set>
#include <thread>

using namespace lifx_network;
using namespace std::chrono_literals;
using lifx_protocol::Packet;
using lifx_protocol::PacketKind;
using lifx_protocol::Serial;
namespace packet_type = lifx_protocol::protocol::packet_type;

namespace {

constexpr uint16_t LIGHT_GET = 101;
constexpr uint16_t LIGHT_SET_POWER = 117;
constexpr uint16_t LIGHT_STATE = 107;
constexpr uint16_t ZONES_GET = 502;
constexpr uint16_t ZONES_STATE = 503;

std::vector<uint8_t> payloadOf(const Reply& reply) {
    return std::get<Response>(reply).payload;
}

} // namespace

class ConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry.registerType(LIGHT_GET, "LightGet", PacketKind::GET);
        registry.registerType(LIGHT_STATE, "LightState", PacketKind::STATE);
        registry.registerType(LIGHT_SET_POWER, "LightSetPower", PacketKind::SET);
        registry.registerType(ZONES_STATE, "StateMultiZone", PacketKind::STATE);

        device = std::make_unique<test_utils::FakeDevice>(serial);
        device->start();

        config.serial = serial;
        config.ip = "127.0.0.1";
        config.port = device->port();
        config.retry.timeout = 500ms;
        config.retry.maxRetries = 3;
        config.retry.backoffBase = 50ms;
        config.retry.jitterRatio = 0.0;
    }

    void TearDown() override {
        device->stop();
    }

    std::unique_ptr<Connection> makeConnection() {
        return std::make_unique<Connection>(config, registry);
    }

    Serial serial = Serial::fromString("d073d5aabbcc");
    lifx_protocol::PacketRegistry registry;
    std::unique_ptr<test_utils::FakeDevice> device;
    Connection::Config config;
};

TEST_F(ConnectionTest, StartsClosedAndOpensLazily) {
    auto connection = makeConnection();
    EXPECT_EQ(connection->state(), ConnectionState::CLOSED);

    auto reply = connection->request(lifx_protocol::packets::echoRequest({1, 2, 3}));
    EXPECT_EQ(connection->state(), ConnectionState::OPEN);
    EXPECT_EQ(payloadOf(reply), (std::vector<uint8_t>{1, 2, 3}));
}

TEST_F(ConnectionTest, SequenceWrapsAfter256Allocations) {
    auto connection = makeConnection();
    for (int i = 0; i < 256; ++i) {
        EXPECT_EQ(connection->nextSequence(), static_cast<uint8_t>(i));
    }
    EXPECT_EQ(connection->nextSequence(), 0);
}

TEST_F(ConnectionTest, ConcurrentOpenBindsOnce) {
    auto connection = makeConnection();
    std::vector<std::thread> openers;
    for (int i = 0; i < 8; ++i) {
        openers.emplace_back([&connection] { connection->open(); });
    }
    for (auto& opener : openers) {
        opener.join();
    }
    EXPECT_TRUE(connection->isOpen());
    uint16_t port = connection->localEndpoint().port();
    connection->open();
    EXPECT_EQ(connection->localEndpoint().port(), port);
}

TEST_F(ConnectionTest, GetReturnsDeclaredState) {
    device->setStateReply(LIGHT_GET, LIGHT_STATE, {9, 8, 7});
    auto connection = makeConnection();

    auto reply = connection->request(Packet(LIGHT_GET, PacketKind::GET, {}, LIGHT_STATE));
    const auto& response = std::get<Response>(reply);
    EXPECT_EQ(response.header.pktType, LIGHT_STATE);
    EXPECT_EQ(response.header.targetSerial(), serial);
    EXPECT_EQ(response.payload, (std::vector<uint8_t>{9, 8, 7}));

    auto headers = device->received();
    ASSERT_EQ(headers.size(), 1u);
    EXPECT_TRUE(headers[0].resRequired);
    EXPECT_FALSE(headers[0].ackRequired);
    EXPECT_EQ(headers[0].source, connection->source());
}

TEST_F(ConnectionTest, SetReturnsTrueOnAcknowledgement) {
    auto connection = makeConnection();
    auto reply = connection->request(Packet(LIGHT_SET_POWER, PacketKind::SET, {0xFF, 0xFF}));
    ASSERT_TRUE(std::holds_alternative<bool>(reply));
    EXPECT_TRUE(std::get<bool>(reply));

    auto headers = device->received();
    ASSERT_EQ(headers.size(), 1u);
    EXPECT_TRUE(headers[0].ackRequired);
    EXPECT_FALSE(headers[0].resRequired);
}

TEST_F(ConnectionTest, SetReturnsFalseOnStateUnhandled) {
    device->rejectType(LIGHT_SET_POWER);
    auto connection = makeConnection();
    auto reply = connection->request(Packet(LIGHT_SET_POWER, PacketKind::SET));
    ASSERT_TRUE(std::holds_alternative<bool>(reply));
    EXPECT_FALSE(std::get<bool>(reply));
}

TEST_F(ConnectionTest, GetAnsweredWithStateUnhandledThrows) {
    device->rejectType(LIGHT_GET);
    auto connection = makeConnection();
    EXPECT_THROW(connection->request(Packet(LIGHT_GET, PacketKind::GET, {}, LIGHT_STATE)),
                 lifx_protocol::UnsupportedCommandError);
    EXPECT_EQ(connection->pendingCount(), 0u);
}

TEST_F(ConnectionTest, UnknownReplyTypeIsProtocolError) {
    device->setStateReply(LIGHT_GET, 999);
    auto connection = makeConnection();
    EXPECT_THROW(connection->request(Packet(LIGHT_GET, PacketKind::GET, {}, LIGHT_STATE)),
                 lifx_protocol::ProtocolError);
}

TEST_F(ConnectionTest, UnexpectedReplyToSetIsProtocolError) {
    device->setHandler([this](const lifx_protocol::ParsedMessage& request) {
        return std::vector<std::vector<uint8_t>>{device->reply(request.header, LIGHT_STATE)};
    });
    auto connection = makeConnection();
    EXPECT_THROW(connection->request(Packet(LIGHT_SET_POWER, PacketKind::SET)),
                 lifx_protocol::ProtocolError);
}

TEST_F(ConnectionTest, PacketWithoutReplyTypeIsRejected) {
    auto connection = makeConnection();
    EXPECT_THROW(connection->request(Packet(300, PacketKind::OTHER)),
                 lifx_protocol::UnsupportedCommandError);
    EXPECT_EQ(device->receivedCount(), 0u);
}

TEST_F(ConnectionTest, SendIsFireAndForget) {
    auto connection = makeConnection();
    connection->send(Packet(LIGHT_SET_POWER, PacketKind::SET, {1, 0}));

    for (int i = 0; i < 50 && device->receivedCount() == 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    auto headers = device->received();
    ASSERT_EQ(headers.size(), 1u);
    EXPECT_FALSE(headers[0].ackRequired);
    EXPECT_FALSE(headers[0].resRequired);
    EXPECT_EQ(connection->pendingCount(), 0u);
}

TEST_F(ConnectionTest, InterleavedRepliesReachTheirOwnRequests) {
    std::mutex mutex;
    std::optional<lifx_protocol::Header> held;

    device->setHandler([&](const lifx_protocol::ParsedMessage& request) {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<std::vector<uint8_t>> replies;
        if (!held) {
            held = request.header;
            return replies;
        }

        // Noise: right sequence, wrong source
        lifx_protocol::Header foreign = *held;
        foreign.source ^= 0x5A5A5A5A;
        replies.push_back(device->reply(foreign, packet_type::ECHO_RESPONSE, {0xEE}));

        // Newest first, then the held one
        replies.push_back(device->reply(request.header, packet_type::ECHO_RESPONSE, request.payload));
        replies.push_back(device->reply(*held, packet_type::ECHO_RESPONSE, {0xA1}));
        held.reset();
        return replies;
    });

    auto connection = makeConnection();
    connection->open();

    auto first = std::async(std::launch::async, [&] {
        return payloadOf(connection->request(lifx_protocol::packets::echoRequest({0xA1})));
    });
    std::this_thread::sleep_for(50ms);
    auto second = std::async(std::launch::async, [&] {
        return payloadOf(connection->request(lifx_protocol::packets::echoRequest({0xB2})));
    });

    EXPECT_EQ(first.get(), (std::vector<uint8_t>{0xA1}));
    EXPECT_EQ(second.get(), (std::vector<uint8_t>{0xB2}));

    auto headers = device->received();
    ASSERT_GE(headers.size(), 2u);
    EXPECT_NE(headers[0].sequence, headers[1].sequence);
}

TEST_F(ConnectionTest, RetryExhaustionSendsExactlyMaxRetries) {
    device->dropType(packet_type::ECHO_REQUEST);
    config.retry.timeout = 100ms;
    config.retry.maxRetries = 3;
    config.retry.backoffBase = 50ms;
    config.retry.backoffMultiplier = 2.0;
    auto connection = makeConnection();

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(connection->request(lifx_protocol::packets::echoRequest()), lifx_protocol::TimeoutError);
    auto elapsed = std::chrono::steady_clock::now() - start;

    // 3 x 100ms attempts plus 50ms and 100ms of backoff
    EXPECT_GE(elapsed, 440ms);
    EXPECT_LT(elapsed, 900ms);

    std::this_thread::sleep_for(50ms);
    auto headers = device->received();
    ASSERT_EQ(headers.size(), 3u);
    EXPECT_EQ(headers[0].sequence, headers[1].sequence);
    EXPECT_EQ(headers[1].sequence, headers[2].sequence);
    EXPECT_EQ(connection->pendingCount(), 0u);
}

TEST_F(ConnectionTest, TimeoutMessageNamesDestination) {
    device->dropType(packet_type::ECHO_REQUEST);
    config.retry.timeout = 50ms;
    config.retry.maxRetries = 1;
    auto connection = makeConnection();

    try {
        connection->request(lifx_protocol::packets::echoRequest());
        FAIL() << "expected TimeoutError";
    } catch (const lifx_protocol::TimeoutError& e) {
        EXPECT_THAT(e.what(), ::testing::HasSubstr("127.0.0.1:" + std::to_string(device->port())));
        EXPECT_THAT(e.what(), ::testing::HasSubstr("1 attempts"));
    }
}

TEST_F(ConnectionTest, RetrySucceedsWhenFirstAttemptIsLost) {
    std::atomic<int> seen{0};
    device->setHandler([&](const lifx_protocol::ParsedMessage& request) {
        std::vector<std::vector<uint8_t>> replies;
        if (seen++ > 0) {
            replies.push_back(device->reply(request.header, packet_type::ECHO_RESPONSE, request.payload));
        }
        return replies;
    });
    config.retry.timeout = 100ms;
    auto connection = makeConnection();

    auto reply = connection->request(lifx_protocol::packets::echoRequest({5}));
    EXPECT_EQ(payloadOf(reply), (std::vector<uint8_t>{5}));
    EXPECT_EQ(device->receivedCount(), 2u);
}

TEST_F(ConnectionTest, DuplicateRepliesDeliverFirstOnly) {
    device->setHandler([this](const lifx_protocol::ParsedMessage& request) {
        return std::vector<std::vector<uint8_t>>{
            device->reply(request.header, packet_type::ECHO_RESPONSE, {1}),
            device->reply(request.header, packet_type::ECHO_RESPONSE, {2})
        };
    });
    auto connection = makeConnection();

    auto stream = connection->requestStream(lifx_protocol::packets::echoRequest({1}));
    auto response = stream.next();
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->payload, (std::vector<uint8_t>{1}));
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_TRUE(stream.finished());
}

TEST_F(ConnectionTest, MultiResponseStreamEndsAfterIdleGap) {
    device->setHandler([this](const lifx_protocol::ParsedMessage& request) {
        std::vector<std::vector<uint8_t>> replies;
        for (uint8_t zone = 0; zone < 3; ++zone) {
            replies.push_back(device->reply(request.header, ZONES_STATE, {zone}));
        }
        return replies;
    });
    config.multiResponseIdle = 100ms;
    auto connection = makeConnection();

    auto stream = connection->requestStream(Packet(ZONES_GET, PacketKind::GET, {}, ZONES_STATE, true));
    std::vector<uint8_t> zones;
    while (auto response = stream.next()) {
        zones.push_back(response->payload.at(0));
    }
    EXPECT_EQ(zones, (std::vector<uint8_t>{0, 1, 2}));
    EXPECT_EQ(connection->pendingCount(), 0u);
}

TEST_F(ConnectionTest, ClosingStreamReleasesRequest) {
    device->dropType(packet_type::ECHO_REQUEST);
    auto connection = makeConnection();
    {
        auto stream = connection->requestStream(lifx_protocol::packets::echoRequest());
        EXPECT_EQ(connection->pendingCount(), 1u);
    }
    EXPECT_EQ(connection->pendingCount(), 0u);

    auto stream = connection->requestStream(lifx_protocol::packets::echoRequest());
    auto moved = std::move(stream);
    EXPECT_TRUE(stream.finished());
    moved.close();
    EXPECT_EQ(connection->pendingCount(), 0u);
    EXPECT_FALSE(moved.next().has_value());
}

TEST_F(ConnectionTest, ZeroSerialConnectionAcceptsDeviceSerial) {
    config.serial = Serial();
    auto connection = makeConnection();
    auto reply = connection->request(lifx_protocol::packets::echoRequest({4, 2}));
    const auto& response = std::get<Response>(reply);
    EXPECT_EQ(response.payload, (std::vector<uint8_t>{4, 2}));
    EXPECT_EQ(response.header.targetSerial(), serial);
}

TEST_F(ConnectionTest, ZeroSerialConnectionAdoptsReplySerial) {
    config.serial = Serial();
    auto connection = makeConnection();
    EXPECT_TRUE(connection->serial().isZero());

    connection->request(lifx_protocol::packets::echoRequest({1}));
    EXPECT_EQ(connection->serial(), serial);
    EXPECT_EQ(connection->describe().substr(0, 12), serial.toString());

    connection->request(lifx_protocol::packets::echoRequest({2}));
    auto received = device->received();
    ASSERT_EQ(received.size(), 2u);
    EXPECT_TRUE(received[0].targetSerial().isZero());
    EXPECT_EQ(received[1].targetSerial(), serial);
}

TEST(ConnectionStateTest, NamesEachState) {
    EXPECT_EQ(stateToString(ConnectionState::CLOSED), "CLOSED");
    EXPECT_EQ(stateToString(ConnectionState::OPENING), "OPENING");
    EXPECT_EQ(stateToString(ConnectionState::OPEN), "OPEN");
}

TEST_F(ConnectionTest, CloseTwiceIsSafe) {
    auto connection = makeConnection();
    connection->open();
    connection->close();
    EXPECT_EQ(connection->state(), ConnectionState::CLOSED);
    EXPECT_NO_THROW(connection->close());

    auto never = makeConnection();
    EXPECT_NO_THROW(never->close());
}

TEST_F(ConnectionTest, ClosingFailsPendingRequests) {
    device->dropType(packet_type::ECHO_REQUEST);
    config.retry.timeout = 5000ms;
    auto connection = makeConnection();
    connection->open();

    auto pending = std::async(std::launch::async, [&] {
        connection->request(lifx_protocol::packets::echoRequest());
    });
    for (int i = 0; i < 100 && connection->pendingCount() == 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_EQ(connection->pendingCount(), 1u);

    auto start = std::chrono::steady_clock::now();
    connection->close();
    EXPECT_THROW(pending.get(), lifx_protocol::ConnectionClosedError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3000ms);
    EXPECT_EQ(connection->pendingCount(), 0u);
}

TEST_F(ConnectionTest, ReopensAfterClose) {
    auto connection = makeConnection();
    connection->request(lifx_protocol::packets::echoRequest());
    connection->close();

    auto reply = connection->request(lifx_protocol::packets::echoRequest({3}));
    EXPECT_EQ(payloadOf(reply), (std::vector<uint8_t>{3}));
    EXPECT_TRUE(connection->isOpen());
}
