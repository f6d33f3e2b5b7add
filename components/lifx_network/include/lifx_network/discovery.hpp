#pragma once

#include "lifx_network/connection.hpp"
#include "lifx_network/retry.hpp"
#include "lifx_network/transport.hpp"
#include "lifx_protocol/protocol.hpp"
#include "lifx_protocol/serial.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace lifx_network {

/**
 * @brief Parameters of one discovery scan
 */
struct DiscoveryOptions {
    std::chrono::milliseconds timeout{15000};                 ///< Hard cap on the scan
    std::string broadcastAddress = lifx_protocol::protocol::BROADCAST_ADDRESS;
    uint16_t port = lifx_protocol::protocol::LIFX_UDP_PORT;
    std::chrono::milliseconds maxResponseTime{1000};
    double idleTimeoutMultiplier = 4.0;
    RetryPolicy deviceRetry;                                  ///< Handed to discovered devices

    /**
     * @brief Quiet period after which the scan ends early
     */
    std::chrono::milliseconds idleTimeout() const {
        return std::chrono::milliseconds(static_cast<long long>(
            static_cast<double>(maxResponseTime.count()) * idleTimeoutMultiplier));
    }
};

/**
 * @brief A device that answered a discovery broadcast
 */
struct DiscoveredDevice {
    lifx_protocol::Serial serial;
    std::string ip;
    uint16_t port = lifx_protocol::protocol::LIFX_UDP_PORT;
    std::chrono::system_clock::time_point firstSeen;
    std::chrono::milliseconds responseTime{0};   ///< Broadcast to first reply
    std::chrono::milliseconds timeout{1000};     ///< Per-attempt timeout for this device
    size_t maxRetries = 8;

    /**
     * @brief Connection settings for talking to this device
     */
    Connection::Config connectionConfig() const;
};

/**
 * @class DiscoveryStream
 * @brief One broadcast scan, yielding each new device as its reply arrives
 *
 * Constructing the stream binds a broadcast socket and sends a single
 * GetService. next() returns devices until either the overall or the idle
 * deadline passes. Each stream uses its own session source, and replies
 * carrying another source are ignored.
 */
class DiscoveryStream {
public:
    /**
     * @throws ConnectionError if the socket cannot be bound or the broadcast fails
     */
    explicit DiscoveryStream(const DiscoveryOptions& options = DiscoveryOptions{});
    ~DiscoveryStream();

    DiscoveryStream(DiscoveryStream&&) = default;
    DiscoveryStream& operator=(DiscoveryStream&&) = default;

    /**
     * @brief Wait for the next previously unseen device
     * @return The device, or nullopt once the scan has ended
     */
    std::optional<DiscoveredDevice> next();

    /**
     * @brief Wait at most maxWait for the next unseen device
     * @return nullopt when maxWait passes first; finished() tells the two apart
     */
    std::optional<DiscoveredDevice> next(std::chrono::milliseconds maxWait);

    /**
     * @brief End the scan and release the socket
     */
    void close();

    bool finished() const { return finished_; }
    uint32_t source() const { return source_; }
    size_t deviceCount() const { return seen_.size(); }

private:
    std::optional<DiscoveredDevice> nextBefore(std::chrono::steady_clock::time_point limit);
    std::optional<DiscoveredDevice> handleDatagram(const Datagram& datagram);

    DiscoveryOptions options_;
    uint32_t source_;
    std::unique_ptr<UdpTransport> transport_;
    std::unordered_set<lifx_protocol::Serial> seen_;
    std::chrono::steady_clock::time_point sentAt_;
    std::chrono::steady_clock::time_point deadline_;
    std::chrono::steady_clock::time_point idleDeadline_;
    bool finished_ = false;
};

/**
 * @brief Start a discovery scan
 */
DiscoveryStream discover(const DiscoveryOptions& options = DiscoveryOptions{});

/**
 * @brief Run a scan to completion and collect every device found
 */
std::vector<DiscoveredDevice> discoverAll(const DiscoveryOptions& options = DiscoveryOptions{});

} // namespace lifx_network
