#pragma once

#include "lifx_protocol/protocol.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <string>

namespace lifx_protocol {

/**
 * @brief Six byte device identifier
 *
 * Serials travel on the wire as an 8-byte target field (zero padded) and are
 * shown to people as 12 hex digits. Equality and hashing use the raw bytes.
 */
class Serial {
public:
    using Bytes = std::array<uint8_t, protocol::SERIAL_SIZE>;
    using Target = std::array<uint8_t, protocol::TARGET_SIZE>;

    /**
     * @brief Construct the all-zero serial (unknown device)
     */
    Serial() : bytes_{} {}

    explicit Serial(const Bytes& bytes) : bytes_(bytes) {}

    /**
     * @brief Parse a serial from its hex representation
     * @param text 12 hex digits, optionally separated by ':', '-', '.' or spaces
     * @return Parsed serial
     * @throws ParseError if the text is not exactly 12 hex digits
     */
    static Serial fromString(const std::string& text);

    /**
     * @brief Build a serial from a protocol target field
     * @param target Pointer to at least 6 bytes; bytes past the sixth are ignored
     */
    static Serial fromProtocol(const uint8_t* target);

    static Serial fromProtocol(const Target& target) { return fromProtocol(target.data()); }

    /**
     * @brief Lowercase 12-digit hex form, e.g. "d073d5123456"
     */
    std::string toString() const;

    /**
     * @brief Eight byte, zero padded target field
     */
    Target toProtocol() const;

    const Bytes& bytes() const { return bytes_; }

    /**
     * @brief True for group addresses, including ff:ff:ff:ff:ff:ff
     */
    bool isMulticast() const { return (bytes_[0] & 0x01) != 0; }

    /**
     * @brief True for the placeholder serial 000000000000
     */
    bool isZero() const;

    bool operator==(const Serial& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Serial& other) const { return !(*this == other); }
    bool operator<(const Serial& other) const { return bytes_ < other.bytes_; }

private:
    Bytes bytes_;
};

} // namespace lifx_protocol

namespace std {

template<>
struct hash<lifx_protocol::Serial> {
    size_t operator()(const lifx_protocol::Serial& serial) const noexcept {
        uint64_t value = 0;
        for (uint8_t byte : serial.bytes()) {
            value = (value << 8) | byte;
        }
        return std::hash<uint64_t>{}(value);
    }
};

} // namespace std
