#include "lifx_network/connection_pool.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace lifx_network {

ConnectionPool::ConnectionPool()
    : ConnectionPool(Config{}) {
}

ConnectionPool::ConnectionPool(const Config& config, const lifx_protocol::PacketRegistry& registry)
    : config_(config),
      registry_(registry) {
    if (config_.maxConnections == 0) {
        config_.maxConnections = 1;
    }
    spdlog::debug("ConnectionPool created with capacity {}", config_.maxConnections);
}

ConnectionPool::~ConnectionPool() {
    closeAll();
}

std::shared_ptr<Connection> ConnectionPool::getConnection(const Connection::Config& config) {
    std::vector<std::shared_ptr<Connection>> evicted;
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(poolMutex_);
        metrics_.totalRequests++;

        auto it = connections_.find(config.serial);
        if (it != connections_.end()) {
            if (it->second.connection->isOpen()) {
                lruOrder_.splice(lruOrder_.begin(), lruOrder_, it->second.position);
                metrics_.hits++;
                return it->second.connection;
            }
            // Closed behind our back; replace it
            lruOrder_.erase(it->second.position);
            connections_.erase(it);
        }

        metrics_.misses++;

        while (connections_.size() >= config_.maxConnections && !lruOrder_.empty()) {
            const lifx_protocol::Serial victim = lruOrder_.back();
            lruOrder_.pop_back();
            auto victimIt = connections_.find(victim);
            if (victimIt != connections_.end()) {
                evicted.push_back(std::move(victimIt->second.connection));
                connections_.erase(victimIt);
            }
        }

        connection = std::make_shared<Connection>(config, registry_);
        connection->open();

        lruOrder_.push_front(config.serial);
        connections_[config.serial] = Entry{connection, lruOrder_.begin()};
    }

    for (auto& victim : evicted) {
        const auto start = std::chrono::steady_clock::now();
        victim->close();
        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start);

        spdlog::debug("Evicted connection {} after {}us", victim->describe(), elapsed.count());

        std::lock_guard<std::mutex> lock(poolMutex_);
        metrics_.evictions++;
        metrics_.totalEvictionTime += elapsed;
    }

    return connection;
}

void ConnectionPool::closeAll() {
    std::unordered_map<lifx_protocol::Serial, Entry> drained;
    {
        std::lock_guard<std::mutex> lock(poolMutex_);
        drained.swap(connections_);
        lruOrder_.clear();
    }
    for (auto& entry : drained) {
        entry.second.connection->close();
    }
    if (!drained.empty()) {
        spdlog::debug("ConnectionPool closed {} connection(s)", drained.size());
    }
}

bool ConnectionPool::contains(const lifx_protocol::Serial& serial) const {
    std::lock_guard<std::mutex> lock(poolMutex_);
    return connections_.find(serial) != connections_.end();
}

size_t ConnectionPool::size() const {
    std::lock_guard<std::mutex> lock(poolMutex_);
    return connections_.size();
}

PoolMetrics ConnectionPool::getMetrics() const {
    std::lock_guard<std::mutex> lock(poolMutex_);
    return metrics_;
}

void ConnectionPool::resetMetrics() {
    std::lock_guard<std::mutex> lock(poolMutex_);
    metrics_ = PoolMetrics{};
}

} // namespace lifx_network
