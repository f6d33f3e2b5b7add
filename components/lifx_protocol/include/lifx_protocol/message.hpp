#pragma once

#include "lifx_protocol/header.hpp"
#include "lifx_protocol/packet.hpp"
#include "lifx_protocol/serial.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <vector>

namespace lifx_protocol {

/**
 * @brief Header and payload of a received datagram
 */
struct ParsedMessage {
    Header header;
    std::vector<uint8_t> payload;
};

/**
 * @brief Split a datagram into header and payload
 *
 * The payload length comes from the header's size field; trailing bytes
 * beyond it are ignored.
 *
 * @throws ParseError on an invalid header or a size field that is smaller
 *         than the header or larger than the datagram
 */
ParsedMessage parseMessage(const uint8_t* data, size_t length);

inline ParsedMessage parseMessage(const std::vector<uint8_t>& data) {
    return parseMessage(data.data(), data.size());
}

/**
 * @brief Frames packets into complete messages for one client session
 */
class MessageBuilder {
public:
    /**
     * @brief Create a builder
     * @param source Session id; a random one is generated when not given
     */
    explicit MessageBuilder(std::optional<uint32_t> source = std::nullopt);

    uint32_t source() const { return source_; }

    /**
     * @brief Next sequence number, wrapping from 255 to 0
     */
    uint8_t nextSequence();

    /**
     * @brief Build header plus payload
     * @param packet Packet to frame
     * @param target Destination serial, zero for broadcast
     * @param sequence Explicit sequence; the internal counter is used otherwise
     */
    std::vector<uint8_t> createMessage(const Packet& packet,
                                       const Serial& target,
                                       bool ackRequired = false,
                                       bool resRequired = false,
                                       std::optional<uint8_t> sequence = std::nullopt,
                                       bool tagged = false);

    /**
     * @brief Random session id outside the reserved values 0 and 1
     */
    static uint32_t generateSource();

private:
    uint32_t source_;
    std::atomic<uint32_t> sequence_{0};
};

/**
 * @brief Service advertisement carried by StateService
 */
struct StateService {
    uint8_t service = 0;
    uint32_t port = 0;
};

/**
 * @brief Decode a StateService payload
 * @throws ParseError if the payload is shorter than 5 bytes
 */
StateService decodeStateService(const std::vector<uint8_t>& payload);

/**
 * @brief Encode a StateService payload
 */
std::vector<uint8_t> encodeStateService(const StateService& state);

} // namespace lifx_protocol
