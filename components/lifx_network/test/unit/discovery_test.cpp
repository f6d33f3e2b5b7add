#include <gtest/gtest.h>

#include "lifx_network/discovery.hpp"
#include "lifx_protocol/protocol.hpp"
#include "../utils/fake_device.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace lifx_network;
using namespace std::chrono_literals;
using lifx_protocol::Header;
using lifx_protocol::Serial;
namespace protocol = lifx_protocol::protocol;

namespace {

std::vector<uint8_t> stateService(const Header& request, const Serial& serial,
                                  std::vector<uint8_t> payload,
                                  uint16_t type = protocol::packet_type::STATE_SERVICE) {
    Header header = Header::create(type, request.source, serial, payload.size(), request.sequence);
    auto packed = header.pack();
    std::vector<uint8_t> bytes(packed.begin(), packed.end());
    bytes.insert(bytes.end(), payload.begin(), payload.end());
    return bytes;
}

} // namespace

class DiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        device = std::make_unique<test_utils::FakeDevice>(serial);
        device->start();

        options.broadcastAddress = "127.0.0.1";
        options.port = device->port();
        options.timeout = 2000ms;
        options.maxResponseTime = 100ms;
        options.idleTimeoutMultiplier = 2.0;
    }

    void TearDown() override {
        device->stop();
    }

    Serial serial = Serial::fromString("d073d5010203");
    std::unique_ptr<test_utils::FakeDevice> device;
    DiscoveryOptions options;
};

TEST_F(DiscoveryTest, DefaultOptions) {
    DiscoveryOptions defaults;
    EXPECT_EQ(defaults.timeout, 15000ms);
    EXPECT_EQ(defaults.broadcastAddress, "255.255.255.255");
    EXPECT_EQ(defaults.port, 56700);
    EXPECT_EQ(defaults.maxResponseTime, 1000ms);
    EXPECT_DOUBLE_EQ(defaults.idleTimeoutMultiplier, 4.0);
    EXPECT_EQ(defaults.idleTimeout(), 4000ms);
}

TEST_F(DiscoveryTest, FindsDevice) {
    auto devices = discoverAll(options);
    ASSERT_EQ(devices.size(), 1u);

    const auto& found = devices[0];
    EXPECT_EQ(found.serial, serial);
    EXPECT_EQ(found.ip, "127.0.0.1");
    EXPECT_EQ(found.port, device->port());
    EXPECT_LT(found.responseTime, 200ms);
    EXPECT_LE(found.firstSeen, std::chrono::system_clock::now());

    auto headers = device->received();
    ASSERT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers[0].pktType, protocol::packet_type::GET_SERVICE);
    EXPECT_TRUE(headers[0].tagged);
    EXPECT_TRUE(headers[0].targetSerial().isZero());
}

TEST_F(DiscoveryTest, DeduplicatesBySerial) {
    test_utils::FakeDevice twin(serial);
    twin.start();

    device->setHandler([&](const lifx_protocol::ParsedMessage& request) {
        // The twin answers first from its own port
        twin.sendTo(stateService(request.header, serial,
                                 lifx_protocol::encodeStateService({protocol::service::UDP, twin.port()})),
                    device->lastSender());
        return std::vector<std::vector<uint8_t>>{
            stateService(request.header, serial,
                         lifx_protocol::encodeStateService({protocol::service::UDP, device->port()}))
        };
    });

    auto devices = discoverAll(options);
    twin.stop();

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].port, twin.port());
}

TEST_F(DiscoveryTest, SkipsInvalidReplies) {
    device->setHandler([&](const lifx_protocol::ParsedMessage& request) {
        Header foreign = request.header;
        foreign.source ^= 0xFFFF;
        const auto udp = lifx_protocol::encodeStateService({protocol::service::UDP, 56700});

        return std::vector<std::vector<uint8_t>>{
            stateService(foreign, Serial::fromString("d073d5000001"), udp),
            stateService(request.header, Serial::fromString("d073d5000002"), udp,
                         protocol::packet_type::ECHO_RESPONSE),
            stateService(request.header, Serial::fromString("ffffffffffff"), udp),
            stateService(request.header, Serial::fromString("d073d5000003"), {1, 2}),
            stateService(request.header, Serial::fromString("d073d5000004"),
                         lifx_protocol::encodeStateService({5, 56700})),
            std::vector<uint8_t>(40, 0x00),
            stateService(request.header, serial, udp)
        };
    });

    auto devices = discoverAll(options);
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].serial, serial);
    EXPECT_EQ(devices[0].port, 56700);
}

TEST_F(DiscoveryTest, ZeroAdvertisedPortFallsBackToSenderPort) {
    device->setAdvertisedService(protocol::service::UDP, 0);
    auto devices = discoverAll(options);
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].port, device->port());
}

TEST_F(DiscoveryTest, IdleTimeoutEndsQuietScan) {
    options.timeout = 5000ms;
    options.maxResponseTime = 250ms;
    options.idleTimeoutMultiplier = 2.0;

    auto start = std::chrono::steady_clock::now();
    auto devices = discoverAll(options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(devices.size(), 1u);
    EXPECT_GE(elapsed, 450ms);
    EXPECT_LT(elapsed, 1500ms);
}

TEST_F(DiscoveryTest, OverallTimeoutCapsBusyScan) {
    options.timeout = 1000ms;
    options.maxResponseTime = 150ms;
    options.idleTimeoutMultiplier = 2.0;

    std::atomic<bool> requested{false};
    Header request;
    device->setHandler([&](const lifx_protocol::ParsedMessage& message) {
        request = message.header;
        requested = true;
        return std::vector<std::vector<uint8_t>>{};
    });

    std::atomic<bool> done{false};
    std::thread chatter([&] {
        while (!requested && !done) {
            std::this_thread::sleep_for(5ms);
        }
        const auto udp = lifx_protocol::encodeStateService({protocol::service::UDP, 56700});
        const auto target = device->lastSender();
        while (!done) {
            device->sendTo(stateService(request, serial, udp), target);
            std::this_thread::sleep_for(100ms);
        }
    });

    auto start = std::chrono::steady_clock::now();
    auto devices = discoverAll(options);
    auto elapsed = std::chrono::steady_clock::now() - start;
    done = true;
    chatter.join();

    EXPECT_EQ(devices.size(), 1u);
    EXPECT_GE(elapsed, 950ms);
    EXPECT_LT(elapsed, 1500ms);
}

TEST_F(DiscoveryTest, StreamYieldsAndCanBeAbandoned) {
    options.timeout = 5000ms;
    options.maxResponseTime = 1000ms;

    auto start = std::chrono::steady_clock::now();
    auto stream = discover(options);
    auto found = stream.next();
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->serial, serial);
    EXPECT_EQ(stream.deviceCount(), 1u);

    stream.close();
    EXPECT_TRUE(stream.finished());
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);
}

TEST_F(DiscoveryTest, BoundedWaitReturnsWhileScanContinues) {
    options.timeout = 5000ms;
    options.maxResponseTime = 1000ms;

    auto stream = discover(options);
    auto found = stream.next(1000ms);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->serial, serial);

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(stream.next(100ms).has_value());
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_FALSE(stream.finished());
    EXPECT_GE(elapsed, 90ms);
    EXPECT_LT(elapsed, 1000ms);

    stream.close();
    EXPECT_TRUE(stream.finished());
}

TEST_F(DiscoveryTest, EachScanUsesNewSource) {
    options.timeout = 100ms;
    auto first = discover(options);
    auto second = discover(options);
    EXPECT_NE(first.source(), second.source());
}

TEST_F(DiscoveryTest, DeviceHandsOffConnectionConfig) {
    options.deviceRetry.timeout = 750ms;
    options.deviceRetry.maxRetries = 4;

    auto devices = discoverAll(options);
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].timeout, 750ms);
    EXPECT_EQ(devices[0].maxRetries, 4u);

    auto config = devices[0].connectionConfig();
    EXPECT_EQ(config.serial, serial);
    EXPECT_EQ(config.ip, "127.0.0.1");
    EXPECT_EQ(config.port, device->port());
    EXPECT_EQ(config.retry.timeout, 750ms);
    EXPECT_EQ(config.retry.maxRetries, 4u);
}
