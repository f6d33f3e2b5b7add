/**
 * @file config.cpp
 * @brief Implementation of the configuration utilities
 */

#include "lifx_network/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

namespace lifx_network {

namespace {

std::chrono::milliseconds readMillis(const nlohmann::json& section, const char* key,
                                     std::chrono::milliseconds fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    return std::chrono::milliseconds(section[key].get<int64_t>());
}

void checkPositive(std::chrono::milliseconds value, const char* key) {
    if (value.count() <= 0) {
        throw std::runtime_error(std::string("Configuration value '") + key + "' must be positive");
    }
}

} // namespace

Connection::Config Config::loadConnectionConfig(const std::string& filepath) {
    return parseConnectionConfig(loadJsonFromFile(filepath));
}

DiscoveryOptions Config::loadDiscoveryOptions(const std::string& filepath) {
    return parseDiscoveryOptions(loadJsonFromFile(filepath));
}

ConnectionPool::Config Config::loadPoolConfig(const std::string& filepath) {
    return parsePoolConfig(loadJsonFromFile(filepath));
}

Connection::Config Config::parseConnectionConfig(const nlohmann::json& json) {
    Connection::Config config;

    if (!json.contains("connection")) {
        return config;
    }

    try {
        const auto& connectionJson = json["connection"];

        if (connectionJson.contains("port")) {
            config.port = connectionJson["port"].get<uint16_t>();
        }
        if (connectionJson.contains("source")) {
            config.source = connectionJson["source"].get<uint32_t>();
        }
        if (connectionJson.contains("maxRetries")) {
            config.retry.maxRetries = connectionJson["maxRetries"].get<size_t>();
        }
        if (connectionJson.contains("backoffMultiplier")) {
            config.retry.backoffMultiplier = connectionJson["backoffMultiplier"].get<double>();
        }
        if (connectionJson.contains("jitterRatio")) {
            config.retry.jitterRatio = connectionJson["jitterRatio"].get<double>();
        }

        config.retry.timeout = readMillis(connectionJson, "timeoutMs", config.retry.timeout);
        config.retry.backoffBase = readMillis(connectionJson, "backoffBaseMs", config.retry.backoffBase);
        config.retry.maxBackoff = readMillis(connectionJson, "maxBackoffMs", config.retry.maxBackoff);
        config.pollInterval = readMillis(connectionJson, "pollIntervalMs", config.pollInterval);
        config.shutdownGrace = readMillis(connectionJson, "shutdownGraceMs", config.shutdownGrace);
        config.multiResponseIdle = readMillis(connectionJson, "multiResponseIdleMs", config.multiResponseIdle);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid connection configuration: " + std::string(e.what()));
    }

    checkPositive(config.retry.timeout, "timeoutMs");
    checkPositive(config.pollInterval, "pollIntervalMs");
    if (config.retry.maxRetries == 0) {
        throw std::runtime_error("Configuration value 'maxRetries' must be at least 1");
    }

    return config;
}

DiscoveryOptions Config::parseDiscoveryOptions(const nlohmann::json& json) {
    DiscoveryOptions options;

    if (json.contains("discovery")) {
        try {
            const auto& discoveryJson = json["discovery"];

            if (discoveryJson.contains("broadcastAddress")) {
                options.broadcastAddress = discoveryJson["broadcastAddress"].get<std::string>();
            }
            if (discoveryJson.contains("port")) {
                options.port = discoveryJson["port"].get<uint16_t>();
            }
            if (discoveryJson.contains("idleTimeoutMultiplier")) {
                options.idleTimeoutMultiplier = discoveryJson["idleTimeoutMultiplier"].get<double>();
            }

            options.timeout = readMillis(discoveryJson, "timeoutMs", options.timeout);
            options.maxResponseTime = readMillis(discoveryJson, "maxResponseTimeMs", options.maxResponseTime);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid discovery configuration: " + std::string(e.what()));
        }
    }

    checkPositive(options.timeout, "timeoutMs");
    if (options.idleTimeoutMultiplier <= 0.0) {
        throw std::runtime_error("Configuration value 'idleTimeoutMultiplier' must be positive");
    }

    // Devices found by a scan inherit the connection retry settings
    if (json.contains("connection")) {
        options.deviceRetry = parseConnectionConfig(json).retry;
    }

    return options;
}

ConnectionPool::Config Config::parsePoolConfig(const nlohmann::json& json) {
    ConnectionPool::Config config;

    if (json.contains("pool")) {
        try {
            const auto& poolJson = json["pool"];
            if (poolJson.contains("maxConnections")) {
                config.maxConnections = poolJson["maxConnections"].get<size_t>();
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid pool configuration: " + std::string(e.what()));
        }
    }

    if (config.maxConnections == 0) {
        throw std::runtime_error("Configuration value 'maxConnections' must be at least 1");
    }

    return config;
}

nlohmann::json Config::loadJsonFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open configuration file: " + filepath);
    }

    try {
        nlohmann::json json;
        file >> json;
        return json;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse configuration file: " + std::string(e.what()));
    }
}

} // namespace lifx_network
