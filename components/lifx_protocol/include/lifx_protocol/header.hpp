#pragma once

#include "lifx_protocol/protocol.hpp"
#include "lifx_protocol/serial.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace lifx_protocol {

/**
 * @brief Fixed 36-byte header preceding every message
 *
 * +--------------------+------------------------------+----------------------+
 * | Frame (8B)         | Frame Address (16B)          | Protocol Header (12B)|
 * +--------------------+------------------------------+----------------------+
 * | size        (2B)   | target       (8B)            | reserved   (8B)      |
 * | flags+proto (2B)   | reserved     (6B)            | pkt_type   (2B)      |
 * | source      (4B)   | res/ack      (1B)            | reserved   (2B)      |
 * |                    | sequence     (1B)            |                      |
 * +--------------------+------------------------------+----------------------+
 *
 * All integers are little endian.
 */
struct Header {
    uint16_t size = protocol::HEADER_SIZE;       ///< Header plus payload length
    uint16_t protocol = protocol::PROTOCOL_NUMBER;
    uint32_t source = 0;                         ///< Client session id
    Serial::Target target{};                     ///< Padded device serial
    bool tagged = false;                         ///< Broadcast to all devices
    bool ackRequired = false;
    bool resRequired = false;
    uint8_t sequence = 0;
    uint16_t pktType = 0;

    using Bytes = std::array<uint8_t, protocol::HEADER_SIZE>;

    /**
     * @brief Build a header for a payload of the given length
     * @param pktType Packet type id
     * @param source Client session id
     * @param target Destination serial (padded to 8 bytes)
     * @param payloadLength Length of the payload that follows the header
     */
    static Header create(uint16_t pktType,
                         uint32_t source,
                         const Serial& target,
                         size_t payloadLength = 0,
                         uint8_t sequence = 0,
                         bool tagged = false,
                         bool ackRequired = false,
                         bool resRequired = false);

    /**
     * @brief Encode into the 36-byte wire form
     */
    Bytes pack() const;

    /**
     * @brief Decode the first 36 bytes of a buffer
     * @param data Pointer to the datagram
     * @param length Number of readable bytes (must be >= 36)
     * @return Decoded header
     * @throws ParseError on a short buffer, a cleared addressable bit, an
     *         unexpected origin or protocol number
     */
    static Header unpack(const uint8_t* data, size_t length);

    static Header unpack(const std::vector<uint8_t>& data) {
        return unpack(data.data(), data.size());
    }

    /**
     * @brief Target truncated back to the 6-byte serial
     */
    Serial targetSerial() const { return Serial::fromProtocol(target); }

    size_t payloadLength() const {
        return size > protocol::HEADER_SIZE ? size - protocol::HEADER_SIZE : 0;
    }

    bool operator==(const Header& other) const;
    bool operator!=(const Header& other) const { return !(*this == other); }
};

} // namespace lifx_protocol
