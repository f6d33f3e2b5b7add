#pragma once

#include "lifx_network/connection.hpp"
#include "lifx_network/discovery.hpp"
#include "lifx_protocol/registry.hpp"
#include "lifx_protocol/serial.hpp"

#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace lifx_network {

/**
 * @brief Cache effectiveness counters of a ConnectionPool
 */
struct PoolMetrics {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t totalRequests = 0;
    std::chrono::microseconds totalEvictionTime{0};

    double hitRate() const {
        return totalRequests == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(totalRequests);
    }

    /**
     * @brief Mean time spent closing an evicted connection, in milliseconds
     */
    double avgEvictionTimeMs() const {
        return evictions == 0 ? 0.0
                              : static_cast<double>(totalEvictionTime.count()) / 1000.0 /
                                    static_cast<double>(evictions);
    }
};

/**
 * @class ConnectionPool
 * @brief LRU cache of open connections keyed by device serial
 *
 * When full, the least recently used connection is closed to make room.
 * Callers share ownership, so a connection evicted while in use stays valid
 * as an object but is closed.
 */
class ConnectionPool {
public:
    struct Config {
        size_t maxConnections = 30;
    };

    ConnectionPool();
    explicit ConnectionPool(const Config& config,
                            const lifx_protocol::PacketRegistry& registry = lifx_protocol::PacketRegistry::global());

    /**
     * @brief Destructor - closes every cached connection
     */
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Get the open connection for a device, creating it on a miss
     * @throws ConnectionError if a new connection cannot be opened
     */
    std::shared_ptr<Connection> getConnection(const Connection::Config& config);

    std::shared_ptr<Connection> getConnection(const DiscoveredDevice& device) {
        return getConnection(device.connectionConfig());
    }

    /**
     * @brief Close and forget every connection
     */
    void closeAll();

    bool contains(const lifx_protocol::Serial& serial) const;
    size_t size() const;
    size_t capacity() const { return config_.maxConnections; }

    PoolMetrics getMetrics() const;
    void resetMetrics();

private:
    struct Entry {
        std::shared_ptr<Connection> connection;
        std::list<lifx_protocol::Serial>::iterator position;
    };

    Config config_;
    const lifx_protocol::PacketRegistry& registry_;

    mutable std::mutex poolMutex_;
    std::list<lifx_protocol::Serial> lruOrder_;   // front is most recently used
    std::unordered_map<lifx_protocol::Serial, Entry> connections_;
    PoolMetrics metrics_;
};

} // namespace lifx_network
