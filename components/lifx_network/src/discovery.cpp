#include "lifx_network/discovery.hpp"
#include "lifx_protocol/error.hpp"
#include "lifx_protocol/message.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace lifx_network {

namespace protocol = lifx_protocol::protocol;

Connection::Config DiscoveredDevice::connectionConfig() const {
    Connection::Config config;
    config.serial = serial;
    config.ip = ip;
    config.port = port;
    config.retry.timeout = timeout;
    config.retry.maxRetries = maxRetries;
    return config;
}

DiscoveryStream::DiscoveryStream(const DiscoveryOptions& options)
    : options_(options),
      source_(lifx_protocol::MessageBuilder::generateSource()) {
    UdpTransport::Config transportConfig;
    transportConfig.broadcast = true;
    transport_ = std::make_unique<UdpTransport>(transportConfig);
    transport_->open();

    lifx_protocol::MessageBuilder builder(source_);
    auto message = builder.createMessage(lifx_protocol::packets::getService(),
                                         lifx_protocol::Serial(), false, true, 0, true);
    transport_->send(message, options_.broadcastAddress, options_.port);

    sentAt_ = std::chrono::steady_clock::now();
    deadline_ = sentAt_ + options_.timeout;
    idleDeadline_ = sentAt_ + options_.idleTimeout();

    spdlog::debug("Discovery started: source {}, broadcast {}:{}, timeout {}ms, idle {}ms",
                  source_, options_.broadcastAddress, options_.port,
                  options_.timeout.count(), options_.idleTimeout().count());
}

DiscoveryStream::~DiscoveryStream() {
    close();
}

void DiscoveryStream::close() {
    if (!transport_) {
        return;
    }
    if (!finished_) {
        spdlog::debug("Discovery {} ended with {} device(s)", source_, seen_.size());
    }
    finished_ = true;
    transport_->close();
    transport_.reset();
}

std::optional<DiscoveredDevice> DiscoveryStream::next() {
    return nextBefore(std::chrono::steady_clock::time_point::max());
}

std::optional<DiscoveredDevice> DiscoveryStream::next(std::chrono::milliseconds maxWait) {
    return nextBefore(std::chrono::steady_clock::now() + maxWait);
}

std::optional<DiscoveredDevice> DiscoveryStream::nextBefore(std::chrono::steady_clock::time_point limit) {
    while (!finished_ && transport_) {
        const auto now = std::chrono::steady_clock::now();
        const auto scanDeadline = std::min(deadline_, idleDeadline_);
        const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(scanDeadline - now);
        if (wait.count() <= 0) {
            spdlog::debug("Discovery {} {} timeout reached", source_,
                          deadline_ <= idleDeadline_ ? "overall" : "idle");
            close();
            break;
        }
        if (limit <= now) {
            break;
        }

        Datagram datagram;
        try {
            datagram = transport_->receive(
                std::min(wait, std::chrono::ceil<std::chrono::milliseconds>(limit - now)));
        } catch (const lifx_protocol::TimeoutError&) {
            continue;
        } catch (const lifx_protocol::ProtocolError& e) {
            spdlog::debug("Discovery dropping datagram: {}", e.what());
            continue;
        }

        auto device = handleDatagram(datagram);
        if (device) {
            return device;
        }
    }
    return std::nullopt;
}

std::optional<DiscoveredDevice> DiscoveryStream::handleDatagram(const Datagram& datagram) {
    const std::string senderIp = datagram.sender.address().to_string();

    lifx_protocol::ParsedMessage message;
    try {
        message = lifx_protocol::parseMessage(datagram.data);
    } catch (const lifx_protocol::ParseError& e) {
        spdlog::debug("Discovery dropping malformed datagram from {}: {}", senderIp, e.what());
        return std::nullopt;
    }

    if (message.header.source != source_) {
        spdlog::trace("Discovery ignoring source {} from {}", message.header.source, senderIp);
        return std::nullopt;
    }
    if (message.header.pktType != protocol::packet_type::STATE_SERVICE) {
        spdlog::trace("Discovery ignoring packet type {} from {}", message.header.pktType, senderIp);
        return std::nullopt;
    }

    const lifx_protocol::Serial serial = message.header.targetSerial();
    if (serial.isMulticast()) {
        spdlog::warn("Discovery ignoring reply from {} with group serial {}", senderIp, serial.toString());
        return std::nullopt;
    }

    lifx_protocol::StateService service;
    try {
        service = lifx_protocol::decodeStateService(message.payload);
    } catch (const lifx_protocol::ParseError& e) {
        spdlog::debug("Discovery skipping StateService from {}: {}", senderIp, e.what());
        return std::nullopt;
    }
    if (service.service != protocol::service::UDP) {
        spdlog::trace("Discovery skipping service {} of {}", service.service, serial.toString());
        return std::nullopt;
    }

    const auto now = std::chrono::steady_clock::now();
    idleDeadline_ = now + options_.idleTimeout();

    if (!seen_.insert(serial).second) {
        spdlog::trace("Discovery duplicate reply from {}", serial.toString());
        return std::nullopt;
    }

    DiscoveredDevice device;
    device.serial = serial;
    device.ip = senderIp;
    device.port = (service.port == 0 || service.port > 0xFFFF)
                      ? datagram.sender.port()
                      : static_cast<uint16_t>(service.port);
    device.firstSeen = std::chrono::system_clock::now();
    device.responseTime = std::chrono::duration_cast<std::chrono::milliseconds>(now - sentAt_);
    device.timeout = options_.deviceRetry.timeout;
    device.maxRetries = options_.deviceRetry.maxRetries;

    spdlog::debug("Discovered {} at {}:{} in {}ms", serial.toString(), device.ip, device.port,
                  device.responseTime.count());
    return device;
}

DiscoveryStream discover(const DiscoveryOptions& options) {
    return DiscoveryStream(options);
}

std::vector<DiscoveredDevice> discoverAll(const DiscoveryOptions& options) {
    std::vector<DiscoveredDevice> devices;
    DiscoveryStream stream(options);
    while (auto device = stream.next()) {
        devices.push_back(std::move(*device));
    }
    return devices;
}

} // namespace lifx_network
