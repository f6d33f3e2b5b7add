#include "lifx_network/connection.hpp"
#include "lifx_protocol/error.hpp"
#include "lifx_protocol/protocol.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace lifx_network {

using lifx_protocol::ConnectionClosedError;
using lifx_protocol::ConnectionError;
using lifx_protocol::Packet;
using lifx_protocol::PacketKind;
using lifx_protocol::ProtocolError;
using lifx_protocol::TimeoutError;
using lifx_protocol::UnsupportedCommandError;
namespace packet_type = lifx_protocol::protocol::packet_type;

// ResponseStream

ResponseStream::ResponseStream(Connection* connection,
                               RequestKey key,
                               std::shared_ptr<PendingRequest> channel,
                               std::vector<uint8_t> message,
                               const Packet& packet,
                               const RetryPolicy& policy,
                               std::chrono::milliseconds multiResponseIdle)
    : connection_(connection),
      key_(key),
      channel_(std::move(channel)),
      message_(std::move(message)),
      requestType_(packet.type),
      kind_(packet.kind),
      stateType_(packet.stateType),
      multiResponse_(packet.multiResponse),
      schedule_(policy),
      multiResponseIdle_(multiResponseIdle),
      attempts_(1) {
}

ResponseStream::ResponseStream(ResponseStream&& other) noexcept
    : connection_(std::exchange(other.connection_, nullptr)),
      key_(other.key_),
      channel_(std::move(other.channel_)),
      message_(std::move(other.message_)),
      requestType_(other.requestType_),
      kind_(other.kind_),
      stateType_(other.stateType_),
      multiResponse_(other.multiResponse_),
      schedule_(std::move(other.schedule_)),
      multiResponseIdle_(other.multiResponseIdle_),
      attempts_(other.attempts_),
      received_(other.received_),
      finished_(std::exchange(other.finished_, true)) {
}

ResponseStream& ResponseStream::operator=(ResponseStream&& other) noexcept {
    if (this != &other) {
        close();
        connection_ = std::exchange(other.connection_, nullptr);
        key_ = other.key_;
        channel_ = std::move(other.channel_);
        message_ = std::move(other.message_);
        requestType_ = other.requestType_;
        kind_ = other.kind_;
        stateType_ = other.stateType_;
        multiResponse_ = other.multiResponse_;
        schedule_ = std::move(other.schedule_);
        multiResponseIdle_ = other.multiResponseIdle_;
        attempts_ = other.attempts_;
        received_ = other.received_;
        finished_ = std::exchange(other.finished_, true);
    }
    return *this;
}

ResponseStream::~ResponseStream() {
    close();
}

void ResponseStream::close() {
    finished_ = true;
    if (connection_) {
        connection_->release(key_);
        connection_ = nullptr;
    }
}

std::optional<Response> ResponseStream::next() {
    if (finished_ || !connection_) {
        return std::nullopt;
    }

    try {
        if (received_ == 0) {
            auto response = awaitFirst();
            if (!response) {
                const size_t attempts = attempts_;
                const std::string destination = connection_->describe();
                close();
                throw TimeoutError("No response from " + destination + " after " +
                                   std::to_string(attempts) + " attempts");
            }
            ++received_;
            Response accepted = accept(std::move(*response));
            if (!multiResponse_) {
                close();
            }
            return accepted;
        }

        auto response = channel_->waitFor(multiResponseIdle_);
        if (!response) {
            close();
            return std::nullopt;
        }
        ++received_;
        return accept(std::move(*response));
    } catch (const lifx_protocol::LifxError&) {
        close();
        throw;
    }
}

std::optional<Response> ResponseStream::awaitFirst() {
    const RetryPolicy& policy = schedule_.policy();

    while (true) {
        auto response = channel_->waitFor(policy.timeout);
        if (response) {
            return response;
        }
        if (attempts_ >= policy.maxRetries) {
            return std::nullopt;
        }

        // Late replies to an earlier attempt still count during the backoff
        response = channel_->waitFor(schedule_.backoffFor(attempts_ - 1));
        if (response) {
            return response;
        }

        ++attempts_;
        spdlog::debug("Retrying sequence {} to {} (attempt {}/{})",
                      key_.sequence, connection_->describe(), attempts_, policy.maxRetries);
        connection_->transmit(message_);
    }
}

Response ResponseStream::accept(Response response) {
    const uint16_t type = response.header.pktType;
    const auto& registry = connection_->registry_;

    if (kind_ == PacketKind::SET) {
        if (type == packet_type::ACKNOWLEDGEMENT || type == packet_type::STATE_UNHANDLED) {
            return response;
        }
        throw ProtocolError("Unexpected " + registry.name(type) + " reply to " + registry.name(requestType_));
    }

    if (type == packet_type::STATE_UNHANDLED) {
        throw UnsupportedCommandError(registry.name(requestType_) + " not handled by " +
                                      connection_->describe());
    }
    if ((stateType_ && type == *stateType_) || registry.isKnown(type)) {
        return response;
    }
    throw ProtocolError("Unknown reply type " + std::to_string(type) + " to " + registry.name(requestType_));
}

// Connection

Connection::Connection(const Config& config, const lifx_protocol::PacketRegistry& registry)
    : config_(config),
      registry_(registry),
      builder_(config.source),
      transport_([&config] {
          UdpTransport::Config transportConfig;
          transportConfig.bindAddress = config.bindAddress;
          return transportConfig;
      }()),
      serial_(config.serial) {
}

Connection::~Connection() {
    close();
}

void Connection::open() {
    std::unique_lock<std::mutex> lock(stateMutex_);
    stateCv_.wait(lock, [this] { return state_ != ConnectionState::OPENING; });
    if (state_ == ConnectionState::OPEN) {
        return;
    }
    state_ = ConnectionState::OPENING;
    lock.unlock();

    try {
        transport_.open();
        stopping_ = false;
        std::promise<void> done;
        receiverDone_ = done.get_future();
        receiver_ = std::thread(&Connection::receiveLoop, this, std::move(done));
    } catch (...) {
        transport_.close();
        lock.lock();
        state_ = ConnectionState::CLOSED;
        stateCv_.notify_all();
        throw;
    }

    lock.lock();
    state_ = ConnectionState::OPEN;
    stateCv_.notify_all();
    spdlog::debug("Connection to {} opened (source {})", describe(), builder_.source());
}

void Connection::close() {
    std::unique_lock<std::mutex> lock(stateMutex_);
    stateCv_.wait(lock, [this] { return state_ != ConnectionState::OPENING; });
    if (state_ == ConnectionState::CLOSED) {
        return;
    }

    spdlog::debug("Closing connection to {} from state {} with {} pending",
                  describe(), stateToString(state_), pending_.size());
    stopping_ = true;
    if (receiverDone_.valid() &&
        receiverDone_.wait_for(config_.shutdownGrace) == std::future_status::timeout) {
        spdlog::warn("Receive loop for {} exceeded shutdown grace of {}ms, cancelling",
                     describe(), config_.shutdownGrace.count());
        transport_.interrupt();
    }
    if (receiver_.joinable()) {
        receiver_.join();
    }

    pending_.failAll(std::make_exception_ptr(ConnectionClosedError("connection to " + describe())));
    transport_.close();

    state_ = ConnectionState::CLOSED;
    stateCv_.notify_all();
    spdlog::debug("Connection to {} closed", describe());
}

bool Connection::isOpen() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_ == ConnectionState::OPEN;
}

ConnectionState Connection::state() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

uint8_t Connection::nextSequence() {
    return builder_.nextSequence();
}

lifx_protocol::Serial Connection::serial() const {
    std::lock_guard<std::mutex> lock(serialMutex_);
    return serial_;
}

std::string Connection::describe() const {
    return serial().toString() + "@" + config_.ip + ":" + std::to_string(config_.port);
}

void Connection::send(const Packet& packet) {
    open();
    transmit(builder_.createMessage(packet, serial()));
}

Reply Connection::request(const Packet& packet) {
    return request(packet, config_.retry.timeout);
}

Reply Connection::request(const Packet& packet, std::chrono::milliseconds timeout) {
    ResponseStream stream = requestStream(packet, timeout);
    auto response = stream.next();
    if (!response) {
        throw TimeoutError("No response from " + describe());
    }

    if (packet.kind == PacketKind::SET) {
        return response->header.pktType == packet_type::ACKNOWLEDGEMENT;
    }
    return std::move(*response);
}

ResponseStream Connection::requestStream(const Packet& packet) {
    return requestStream(packet, config_.retry.timeout);
}

ResponseStream Connection::requestStream(const Packet& packet, std::chrono::milliseconds timeout) {
    bool ackRequired = false;
    bool resRequired = false;
    switch (packet.kind) {
        case PacketKind::GET:
            resRequired = true;
            break;
        case PacketKind::SET:
            ackRequired = true;
            break;
        default:
            if (!packet.stateType) {
                throw UnsupportedCommandError("cannot infer the reply to " + kindToString(packet.kind) +
                                              " packet " + registry_.name(packet.type));
            }
            resRequired = true;
            break;
    }

    open();

    const size_t capacity = packet.multiResponse ? config_.maxPendingResponses : 1;
    std::shared_ptr<PendingRequest> channel;
    const lifx_protocol::Serial target = serial();
    RequestKey key{builder_.source(), 0, target};
    for (int i = 0; i < 256 && !channel; ++i) {
        key.sequence = nextSequence();
        channel = pending_.add(key, capacity);
    }
    if (!channel) {
        throw ConnectionError("all sequence numbers in flight on " + describe());
    }

    auto message = builder_.createMessage(packet, target, ackRequired, resRequired, key.sequence);

    RetryPolicy policy = config_.retry;
    policy.timeout = timeout;
    ResponseStream stream(this, key, channel, std::move(message), packet, policy, config_.multiResponseIdle);

    spdlog::trace("Sending {} seq {} to {}", registry_.name(packet.type), key.sequence, describe());
    transmit(stream.message_);
    return stream;
}

void Connection::transmit(const std::vector<uint8_t>& message) {
    transport_.send(message, config_.ip, config_.port);
}

void Connection::release(const RequestKey& key) {
    pending_.remove(key);
}

void Connection::receiveLoop(std::promise<void> done) {
    while (!stopping_) {
        Datagram datagram;
        try {
            datagram = transport_.receive(config_.pollInterval);
        } catch (const TimeoutError&) {
            continue;
        } catch (const ProtocolError& e) {
            spdlog::debug("Dropping datagram on {}: {}", describe(), e.what());
            continue;
        } catch (const ConnectionError& e) {
            if (stopping_) {
                break;
            }
            spdlog::error("Receive on {} failed: {}", describe(), e.what());
            std::this_thread::sleep_for(config_.pollInterval);
            continue;
        }
        handleDatagram(datagram);
    }
    done.set_value();
}

void Connection::handleDatagram(const Datagram& datagram) {
    lifx_protocol::ParsedMessage message;
    try {
        message = lifx_protocol::parseMessage(datagram.data);
    } catch (const lifx_protocol::ParseError& e) {
        spdlog::debug("Dropping malformed datagram from {}: {}",
                      datagram.sender.address().to_string(), e.what());
        return;
    }

    RequestKey key{message.header.source, message.header.sequence, message.header.targetSerial()};
    const uint16_t type = message.header.pktType;
    const uint8_t sequence = message.header.sequence;

    if (!pending_.deliver(key, Response{message.header, std::move(message.payload)})) {
        spdlog::trace("No waiter for {} seq {} from {}", registry_.name(type), sequence,
                      datagram.sender.address().to_string());
        return;
    }

    if (!key.serial.isZero()) {
        std::lock_guard<std::mutex> lock(serialMutex_);
        if (serial_.isZero()) {
            serial_ = key.serial;
            spdlog::debug("Connection to {}:{} adopted serial {}", config_.ip, config_.port, serial_.toString());
        }
    }
}

} // namespace lifx_network
