#pragma once

#include "lifx_network/pending_request.hpp"
#include "lifx_network/retry.hpp"
#include "lifx_network/transport.hpp"
#include "lifx_network/types.hpp"
#include "lifx_protocol/message.hpp"
#include "lifx_protocol/packet.hpp"
#include "lifx_protocol/registry.hpp"
#include "lifx_protocol/serial.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lifx_network {

class Connection;

/**
 * @class ResponseStream
 * @brief Replies to one request, consumed with next()
 *
 * The first call to next() drives the retries. Destroying or closing the
 * stream unregisters the request. The owning Connection must outlive it.
 */
class ResponseStream {
public:
    ResponseStream(ResponseStream&& other) noexcept;
    ResponseStream& operator=(ResponseStream&& other) noexcept;
    ~ResponseStream();

    ResponseStream(const ResponseStream&) = delete;
    ResponseStream& operator=(const ResponseStream&) = delete;

    /**
     * @brief Wait for the next reply
     * @return The reply, or nullopt once the stream is exhausted
     * @throws TimeoutError when no reply arrived within the attempt budget
     * @throws ConnectionClosedError when the connection closed meanwhile
     * @throws UnsupportedCommandError when a GET was answered with StateUnhandled
     * @throws ProtocolError on a reply of an unexpected or unknown type
     */
    std::optional<Response> next();

    /**
     * @brief Stop waiting and unregister the request
     */
    void close();

    bool finished() const { return finished_; }
    uint8_t sequence() const { return key_.sequence; }
    size_t attempts() const { return attempts_; }

private:
    friend class Connection;

    ResponseStream(Connection* connection,
                   RequestKey key,
                   std::shared_ptr<PendingRequest> channel,
                   std::vector<uint8_t> message,
                   const lifx_protocol::Packet& packet,
                   const RetryPolicy& policy,
                   std::chrono::milliseconds multiResponseIdle);

    Response accept(Response response);
    std::optional<Response> awaitFirst();

    Connection* connection_;
    RequestKey key_;
    std::shared_ptr<PendingRequest> channel_;
    std::vector<uint8_t> message_;
    uint16_t requestType_;
    lifx_protocol::PacketKind kind_;
    std::optional<uint16_t> stateType_;
    bool multiResponse_;
    RetrySchedule schedule_;
    std::chrono::milliseconds multiResponseIdle_;
    size_t attempts_ = 0;
    size_t received_ = 0;
    bool finished_ = false;
};

/**
 * @class Connection
 * @brief Correlated request/response exchange with one device
 *
 * Owns a UDP socket and a background thread that routes every inbound
 * datagram to the request waiting for its (source, sequence, serial) key.
 * Replies are matched on protocol fields only, never on the sender address.
 */
class Connection {
public:
    /**
     * @brief Configuration for a connection
     */
    struct Config {
        lifx_protocol::Serial serial;                    ///< Zero when not yet known
        std::string ip;
        uint16_t port = lifx_protocol::protocol::LIFX_UDP_PORT;
        std::optional<uint32_t> source;                  ///< Random when not set
        RetryPolicy retry;
        std::chrono::milliseconds pollInterval{100};     ///< Receive loop wake-up period
        std::chrono::milliseconds shutdownGrace{1000};
        std::chrono::milliseconds multiResponseIdle{200};
        size_t maxPendingResponses = 32;                 ///< Channel size for multi-response GETs
        std::string bindAddress = "0.0.0.0";
    };

    explicit Connection(const Config& config,
                        const lifx_protocol::PacketRegistry& registry = lifx_protocol::PacketRegistry::global());
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @brief Bind the socket and start the receive loop; no-op when open
     *
     * Concurrent callers wait for a single open to finish.
     *
     * @throws ConnectionError if the socket cannot be bound
     */
    void open();

    /**
     * @brief Stop the receive loop, fail pending requests and release the socket
     *
     * Safe to call repeatedly and from any state.
     */
    void close();

    bool isOpen() const;
    ConnectionState state() const;

    /**
     * @brief Send without asking for a reply
     */
    void send(const lifx_protocol::Packet& packet);

    /**
     * @brief Send a request and wait for its single reply
     * @return Response for GET and echo packets, bool for SET packets
     */
    Reply request(const lifx_protocol::Packet& packet);
    Reply request(const lifx_protocol::Packet& packet, std::chrono::milliseconds timeout);

    /**
     * @brief Send a request and return its replies as a stream
     * @throws UnsupportedCommandError if no reply type can be inferred for the packet
     * @throws ConnectionError if all 256 sequence numbers are in flight
     */
    ResponseStream requestStream(const lifx_protocol::Packet& packet);
    ResponseStream requestStream(const lifx_protocol::Packet& packet, std::chrono::milliseconds timeout);

    /**
     * @brief Advance the sequence counter, wrapping from 255 to 0
     */
    uint8_t nextSequence();

    const Config& config() const { return config_; }
    uint32_t source() const { return builder_.source(); }

    /**
     * @brief Device serial; a zero serial is replaced by the first one a reply carries
     */
    lifx_protocol::Serial serial() const;
    size_t pendingCount() const { return pending_.size(); }

    /**
     * @brief Local address of the socket
     * @throws ConnectionError if the connection is not open
     */
    boost::asio::ip::udp::endpoint localEndpoint() const { return transport_.localEndpoint(); }

    std::string describe() const;

private:
    friend class ResponseStream;

    void transmit(const std::vector<uint8_t>& message);
    void release(const RequestKey& key);
    void receiveLoop(std::promise<void> done);
    void handleDatagram(const Datagram& datagram);

    Config config_;
    const lifx_protocol::PacketRegistry& registry_;
    lifx_protocol::MessageBuilder builder_;
    UdpTransport transport_;
    PendingRequestTable pending_;

    mutable std::mutex serialMutex_;
    lifx_protocol::Serial serial_;

    mutable std::mutex stateMutex_;
    std::condition_variable stateCv_;
    ConnectionState state_ = ConnectionState::CLOSED;

    std::atomic<bool> stopping_{false};
    std::thread receiver_;
    std::future<void> receiverDone_;
};

} // namespace lifx_network
