/**
 * @file protocol.hpp
 * @brief Wire-level constants of the LIFX LAN protocol
 *
 * This file defines the fixed values the framing and transport layers
 * depend on. Field-level payload layouts live with the external codec.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace lifx_protocol {

namespace protocol {

/**
 * @brief Size of the frame + frame address + protocol header in bytes
 */
constexpr size_t HEADER_SIZE = 36;

/**
 * @brief Protocol number carried in the low 12 bits of bytes 2-3
 */
constexpr uint16_t PROTOCOL_NUMBER = 1024;

/**
 * @brief Message origin indicator, always zero
 */
constexpr uint8_t ORIGIN = 0;

/**
 * @brief Smallest datagram accepted from the network (header only)
 */
constexpr size_t MIN_PACKET_SIZE = HEADER_SIZE;

/**
 * @brief Largest datagram accepted from the network
 */
constexpr size_t MAX_PACKET_SIZE = 1024;

/**
 * @brief Well-known UDP control port
 */
constexpr uint16_t LIFX_UDP_PORT = 56700;

/**
 * @brief Limited broadcast address used for discovery
 */
constexpr const char* BROADCAST_ADDRESS = "255.255.255.255";

/**
 * @brief Size of a serial number and of the padded target field
 */
constexpr size_t SERIAL_SIZE = 6;
constexpr size_t TARGET_SIZE = 8;

/**
 * @brief Packet type ids the communication layer itself understands
 */
namespace packet_type {
    constexpr uint16_t GET_SERVICE     = 2;
    constexpr uint16_t STATE_SERVICE   = 3;
    constexpr uint16_t ACKNOWLEDGEMENT = 45;
    constexpr uint16_t ECHO_REQUEST    = 58;
    constexpr uint16_t ECHO_RESPONSE   = 59;
    constexpr uint16_t STATE_UNHANDLED = 223;
}

/**
 * @brief Service identifiers advertised in StateService
 */
namespace service {
    constexpr uint8_t UDP = 1;
}

/**
 * @brief Bit layout of header bytes 2-3
 *
 * +-----------+-------------+--------+----------------+
 * | origin(2) | tagged(1)   | addr(1)| protocol (12)  |
 * +-----------+-------------+--------+----------------+
 *   bits 14-15   bit 13       bit 12   bits 0-11
 */
namespace frame_bits {
    constexpr uint16_t PROTOCOL_MASK   = 0x0FFF;
    constexpr uint16_t ADDRESSABLE     = 0x1000;
    constexpr uint16_t TAGGED          = 0x2000;
    constexpr uint16_t ORIGIN_SHIFT    = 14;
    constexpr uint16_t ORIGIN_MASK     = 0x03;
}

/**
 * @brief Bit layout of header byte 22
 */
namespace address_flags {
    constexpr uint8_t RES_REQUIRED = 0x01;
    constexpr uint8_t ACK_REQUIRED = 0x02;
}

} // namespace protocol

} // namespace lifx_protocol
