#include "lifx_protocol/registry.hpp"
#include "lifx_protocol/protocol.hpp"

namespace lifx_protocol {

namespace packets {

Packet getService() {
    return Packet(protocol::packet_type::GET_SERVICE, PacketKind::GET, {},
                  protocol::packet_type::STATE_SERVICE);
}

Packet echoRequest(std::vector<uint8_t> payload) {
    return Packet(protocol::packet_type::ECHO_REQUEST, PacketKind::OTHER, std::move(payload),
                  protocol::packet_type::ECHO_RESPONSE);
}

} // namespace packets

PacketRegistry::PacketRegistry() {
    using namespace protocol::packet_type;
    entries_[GET_SERVICE]     = {"GetService", PacketKind::GET};
    entries_[STATE_SERVICE]   = {"StateService", PacketKind::STATE};
    entries_[ACKNOWLEDGEMENT] = {"Acknowledgement", PacketKind::STATE};
    entries_[ECHO_REQUEST]    = {"EchoRequest", PacketKind::OTHER};
    entries_[ECHO_RESPONSE]   = {"EchoResponse", PacketKind::STATE};
    entries_[STATE_UNHANDLED] = {"StateUnhandled", PacketKind::STATE};
}

void PacketRegistry::registerType(uint16_t type, const std::string& name, PacketKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[type] = {name, kind};
}

bool PacketRegistry::isKnown(uint16_t type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(type) != entries_.end();
}

std::optional<PacketRegistry::Entry> PacketRegistry::lookup(uint16_t type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(type);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string PacketRegistry::name(uint16_t type) const {
    auto entry = lookup(type);
    if (!entry) {
        return "Unknown(" + std::to_string(type) + ")";
    }
    return entry->name;
}

size_t PacketRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

PacketRegistry& PacketRegistry::global() {
    static PacketRegistry instance;
    return instance;
}

} // namespace lifx_protocol
