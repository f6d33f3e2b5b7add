#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lifx_protocol {

/**
 * @brief Classification of a packet, deciding what reply to expect
 */
enum class PacketKind {
    GET,    ///< Query, answered by a STATE reply
    SET,    ///< Command, answered by Acknowledgement or StateUnhandled
    STATE,  ///< Reply or acknowledgement
    OTHER   ///< Anything else (echo and friends)
};

/**
 * @brief Convert PacketKind to string
 */
inline std::string kindToString(PacketKind kind) {
    switch (kind) {
        case PacketKind::GET:   return "GET";
        case PacketKind::SET:   return "SET";
        case PacketKind::STATE: return "STATE";
        case PacketKind::OTHER: return "OTHER";
        default:                return "UNKNOWN";
    }
}

/**
 * @brief Encoded payload plus the metadata the communication layer needs
 *
 * Payload bytes are produced and consumed by the payload codec; this layer
 * only looks at their length.
 */
struct Packet {
    uint16_t type = 0;
    PacketKind kind = PacketKind::OTHER;
    std::vector<uint8_t> payload;
    std::optional<uint16_t> stateType;  ///< Expected reply type for GET packets
    bool multiResponse = false;         ///< GET answered by several STATE replies

    Packet() = default;

    Packet(uint16_t type,
           PacketKind kind,
           std::vector<uint8_t> payload = {},
           std::optional<uint16_t> stateType = std::nullopt,
           bool multiResponse = false)
        : type(type),
          kind(kind),
          payload(std::move(payload)),
          stateType(stateType),
          multiResponse(multiResponse) {}
};

namespace packets {

/**
 * @brief Discovery broadcast, answered by StateService
 */
Packet getService();

/**
 * @brief Echo request carrying an arbitrary payload, answered by EchoResponse
 */
Packet echoRequest(std::vector<uint8_t> payload = {});

} // namespace packets

} // namespace lifx_protocol
