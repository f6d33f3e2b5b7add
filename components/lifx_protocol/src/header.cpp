#include "lifx_protocol/header.hpp"
#include "lifx_protocol/error.hpp"

#include <algorithm>

namespace lifx_protocol {

namespace {

void writeU16(uint8_t* out, uint16_t value) {
    out[0] = static_cast<uint8_t>(value & 0xFF);
    out[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

void writeU32(uint8_t* out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
}

uint16_t readU16(const uint8_t* in) {
    return static_cast<uint16_t>(in[0] | (in[1] << 8));
}

uint32_t readU32(const uint8_t* in) {
    return static_cast<uint32_t>(in[0]) |
           (static_cast<uint32_t>(in[1]) << 8) |
           (static_cast<uint32_t>(in[2]) << 16) |
           (static_cast<uint32_t>(in[3]) << 24);
}

// Byte offsets within the header
constexpr size_t SIZE_OFFSET = 0;
constexpr size_t FRAME_FLAGS_OFFSET = 2;
constexpr size_t SOURCE_OFFSET = 4;
constexpr size_t TARGET_OFFSET = 8;
constexpr size_t ADDRESS_FLAGS_OFFSET = 22;
constexpr size_t SEQUENCE_OFFSET = 23;
constexpr size_t PKT_TYPE_OFFSET = 32;

} // namespace

Header Header::create(uint16_t pktType,
                      uint32_t source,
                      const Serial& target,
                      size_t payloadLength,
                      uint8_t sequence,
                      bool tagged,
                      bool ackRequired,
                      bool resRequired) {
    if (payloadLength > 0xFFFF - protocol::HEADER_SIZE) {
        throw ProtocolError("Payload of " + std::to_string(payloadLength) + " bytes does not fit in a message");
    }

    Header header;
    header.size = static_cast<uint16_t>(protocol::HEADER_SIZE + payloadLength);
    header.source = source;
    header.target = target.toProtocol();
    header.tagged = tagged;
    header.ackRequired = ackRequired;
    header.resRequired = resRequired;
    header.sequence = sequence;
    header.pktType = pktType;
    return header;
}

Header::Bytes Header::pack() const {
    Bytes out{};

    // Frame
    writeU16(out.data() + SIZE_OFFSET, size);
    uint16_t frameFlags = static_cast<uint16_t>(protocol & protocol::frame_bits::PROTOCOL_MASK);
    frameFlags |= protocol::frame_bits::ADDRESSABLE;
    if (tagged) {
        frameFlags |= protocol::frame_bits::TAGGED;
    }
    frameFlags |= static_cast<uint16_t>(
        (protocol::ORIGIN & protocol::frame_bits::ORIGIN_MASK) << protocol::frame_bits::ORIGIN_SHIFT);
    writeU16(out.data() + FRAME_FLAGS_OFFSET, frameFlags);
    writeU32(out.data() + SOURCE_OFFSET, source);

    // Frame address
    std::copy(target.begin(), target.end(), out.begin() + TARGET_OFFSET);
    uint8_t addressFlags = 0;
    if (resRequired) {
        addressFlags |= protocol::address_flags::RES_REQUIRED;
    }
    if (ackRequired) {
        addressFlags |= protocol::address_flags::ACK_REQUIRED;
    }
    out[ADDRESS_FLAGS_OFFSET] = addressFlags;
    out[SEQUENCE_OFFSET] = sequence;

    // Protocol header
    writeU16(out.data() + PKT_TYPE_OFFSET, pktType);

    return out;
}

Header Header::unpack(const uint8_t* data, size_t length) {
    if (data == nullptr || length < protocol::HEADER_SIZE) {
        throw ParseError("Header requires " + std::to_string(protocol::HEADER_SIZE) +
                         " bytes, got " + std::to_string(length));
    }

    const uint16_t frameFlags = readU16(data + FRAME_FLAGS_OFFSET);

    if ((frameFlags & protocol::frame_bits::ADDRESSABLE) == 0) {
        throw ParseError("Addressable bit not set");
    }

    const uint8_t origin = static_cast<uint8_t>(
        (frameFlags >> protocol::frame_bits::ORIGIN_SHIFT) & protocol::frame_bits::ORIGIN_MASK);
    if (origin != protocol::ORIGIN) {
        throw ParseError("Invalid origin " + std::to_string(origin));
    }

    const uint16_t protocolNumber = frameFlags & protocol::frame_bits::PROTOCOL_MASK;
    if (protocolNumber != protocol::PROTOCOL_NUMBER) {
        throw ParseError("Unsupported protocol number " + std::to_string(protocolNumber));
    }

    Header header;
    header.size = readU16(data + SIZE_OFFSET);
    header.protocol = protocolNumber;
    header.tagged = (frameFlags & protocol::frame_bits::TAGGED) != 0;
    header.source = readU32(data + SOURCE_OFFSET);
    std::copy(data + TARGET_OFFSET, data + TARGET_OFFSET + protocol::TARGET_SIZE, header.target.begin());

    const uint8_t addressFlags = data[ADDRESS_FLAGS_OFFSET];
    header.resRequired = (addressFlags & protocol::address_flags::RES_REQUIRED) != 0;
    header.ackRequired = (addressFlags & protocol::address_flags::ACK_REQUIRED) != 0;
    header.sequence = data[SEQUENCE_OFFSET];
    header.pktType = readU16(data + PKT_TYPE_OFFSET);

    return header;
}

bool Header::operator==(const Header& other) const {
    return size == other.size &&
           protocol == other.protocol &&
           source == other.source &&
           target == other.target &&
           tagged == other.tagged &&
           ackRequired == other.ackRequired &&
           resRequired == other.resRequired &&
           sequence == other.sequence &&
           pktType == other.pktType;
}

} // namespace lifx_protocol
