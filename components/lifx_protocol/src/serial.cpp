#include "lifx_protocol/serial.hpp"
#include "lifx_protocol/error.hpp"

#include <algorithm>
#include <cctype>

namespace lifx_protocol {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool isSeparator(char c) {
    return c == ':' || c == '-' || c == '.' || c == ' ';
}

} // namespace

Serial Serial::fromString(const std::string& text) {
    std::string digits;
    digits.reserve(text.size());

    for (char c : text) {
        if (isSeparator(c)) {
            continue;
        }
        if (hexValue(c) < 0) {
            throw ParseError("Invalid character in serial '" + text + "'");
        }
        digits.push_back(c);
    }

    if (digits.size() != protocol::SERIAL_SIZE * 2) {
        throw ParseError("Serial must have 12 hex digits, got " +
                         std::to_string(digits.size()) + " in '" + text + "'");
    }

    Bytes bytes{};
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<uint8_t>((hexValue(digits[2 * i]) << 4) | hexValue(digits[2 * i + 1]));
    }
    return Serial(bytes);
}

Serial Serial::fromProtocol(const uint8_t* target) {
    Bytes bytes{};
    std::copy(target, target + protocol::SERIAL_SIZE, bytes.begin());
    return Serial(bytes);
}

std::string Serial::toString() const {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(protocol::SERIAL_SIZE * 2);
    for (uint8_t byte : bytes_) {
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0F]);
    }
    return out;
}

Serial::Target Serial::toProtocol() const {
    Target target{};
    std::copy(bytes_.begin(), bytes_.end(), target.begin());
    return target;
}

bool Serial::isZero() const {
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

} // namespace lifx_protocol
