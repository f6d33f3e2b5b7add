/**
 * @file config.hpp
 * @brief Loading of connection, discovery and pool settings from JSON files
 */

#pragma once

#include "lifx_network/connection.hpp"
#include "lifx_network/connection_pool.hpp"
#include "lifx_network/discovery.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace lifx_network {

/**
 * @brief Configuration utilities
 *
 * Keys missing from the document keep their defaults. Device addressing
 * (serial and IP) is never read from configuration.
 */
class Config {
public:
    /**
     * @brief Load connection settings from the "connection" section
     * @param filepath Path to JSON configuration file
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static Connection::Config loadConnectionConfig(const std::string& filepath);

    /**
     * @brief Load discovery settings from the "discovery" section
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static DiscoveryOptions loadDiscoveryOptions(const std::string& filepath);

    /**
     * @brief Load pool settings from the "pool" section
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static ConnectionPool::Config loadPoolConfig(const std::string& filepath);

    static Connection::Config parseConnectionConfig(const nlohmann::json& json);
    static DiscoveryOptions parseDiscoveryOptions(const nlohmann::json& json);
    static ConnectionPool::Config parsePoolConfig(const nlohmann::json& json);

private:
    static nlohmann::json loadJsonFromFile(const std::string& filepath);
};

} // namespace lifx_network
