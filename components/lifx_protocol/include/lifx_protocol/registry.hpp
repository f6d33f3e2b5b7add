#pragma once

#include "lifx_protocol/packet.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace lifx_protocol {

/**
 * @brief Registry of packet type ids known to the client
 *
 * The communication layer registers the handful of types it handles itself.
 * The payload codec registers the rest so replies of those types are accepted.
 */
class PacketRegistry {
public:
    struct Entry {
        std::string name;
        PacketKind kind;
    };

    /**
     * @brief Create a registry with the core types already registered
     */
    PacketRegistry();

    /**
     * @brief Register or replace a packet type
     */
    void registerType(uint16_t type, const std::string& name, PacketKind kind);

    bool isKnown(uint16_t type) const;

    std::optional<Entry> lookup(uint16_t type) const;

    /**
     * @brief Readable name of a type, "Unknown(<id>)" when not registered
     */
    std::string name(uint16_t type) const;

    size_t size() const;

    /**
     * @brief Process-wide registry used when none is supplied explicitly
     */
    static PacketRegistry& global();

private:
    mutable std::mutex mutex_;
    std::unordered_map<uint16_t, Entry> entries_;
};

} // namespace lifx_protocol
