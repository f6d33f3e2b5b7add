#include "lifx_protocol/message.hpp"
#include "lifx_protocol/error.hpp"
#include "lifx_protocol/protocol.hpp"

#include <random>

namespace lifx_protocol {

ParsedMessage parseMessage(const uint8_t* data, size_t length) {
    ParsedMessage message;
    message.header = Header::unpack(data, length);

    const size_t declared = message.header.size;
    if (declared < protocol::HEADER_SIZE) {
        throw ParseError("Size field " + std::to_string(declared) + " smaller than header");
    }
    if (declared > length) {
        throw ParseError("Size field " + std::to_string(declared) +
                         " exceeds datagram length " + std::to_string(length));
    }

    message.payload.assign(data + protocol::HEADER_SIZE, data + declared);
    return message;
}

MessageBuilder::MessageBuilder(std::optional<uint32_t> source)
    : source_(source ? *source : generateSource()) {
}

uint8_t MessageBuilder::nextSequence() {
    return static_cast<uint8_t>(sequence_.fetch_add(1) & 0xFF);
}

std::vector<uint8_t> MessageBuilder::createMessage(const Packet& packet,
                                                   const Serial& target,
                                                   bool ackRequired,
                                                   bool resRequired,
                                                   std::optional<uint8_t> sequence,
                                                   bool tagged) {
    const uint8_t seq = sequence ? *sequence : nextSequence();
    Header header = Header::create(packet.type, source_, target, packet.payload.size(),
                                   seq, tagged, ackRequired, resRequired);

    auto packed = header.pack();
    std::vector<uint8_t> message;
    message.reserve(packed.size() + packet.payload.size());
    message.insert(message.end(), packed.begin(), packed.end());
    message.insert(message.end(), packet.payload.begin(), packet.payload.end());
    return message;
}

uint32_t MessageBuilder::generateSource() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist(2, 0xFFFFFFFFu);
    return dist(rng);
}

StateService decodeStateService(const std::vector<uint8_t>& payload) {
    if (payload.size() < 5) {
        throw ParseError("StateService payload requires 5 bytes, got " + std::to_string(payload.size()));
    }

    StateService state;
    state.service = payload[0];
    state.port = static_cast<uint32_t>(payload[1]) |
                 (static_cast<uint32_t>(payload[2]) << 8) |
                 (static_cast<uint32_t>(payload[3]) << 16) |
                 (static_cast<uint32_t>(payload[4]) << 24);
    return state;
}

std::vector<uint8_t> encodeStateService(const StateService& state) {
    return {
        state.service,
        static_cast<uint8_t>(state.port & 0xFF),
        static_cast<uint8_t>((state.port >> 8) & 0xFF),
        static_cast<uint8_t>((state.port >> 16) & 0xFF),
        static_cast<uint8_t>((state.port >> 24) & 0xFF)
    };
}

} // namespace lifx_protocol
