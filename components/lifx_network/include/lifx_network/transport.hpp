#pragma once

#include "lifx_network/types.hpp"
#include "lifx_protocol/protocol.hpp"

#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace lifx_network {

/**
 * @class UdpTransport
 * @brief Owns one UDP socket and provides blocking, deadline-bounded I/O
 *
 * Receives run the socket's private io_context for at most the requested
 * timeout, so only the calling thread blocks. One receive and one send may
 * run concurrently; concurrent receives are serialised.
 */
class UdpTransport {
public:
    /**
     * @brief Configuration for the transport
     */
    struct Config {
        std::string bindAddress = "0.0.0.0";
        uint16_t port = 0;  // 0 means OS-assigned
        bool broadcast = false;
        size_t minPacketSize = lifx_protocol::protocol::MIN_PACKET_SIZE;
        size_t maxPacketSize = lifx_protocol::protocol::MAX_PACKET_SIZE;
    };

    UdpTransport();
    explicit UdpTransport(const Config& config);
    ~UdpTransport();

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    /**
     * @brief Bind the socket; no-op when already open
     * @throws ConnectionError if the socket cannot be opened or bound
     */
    void open();

    /**
     * @brief Release the socket; no-op when already closed
     */
    void close();

    bool isOpen() const;

    /**
     * @brief Send one datagram
     * @throws ConnectionError if the socket is closed, the host does not
     *         resolve or the OS rejects the send
     */
    void send(const std::vector<uint8_t>& data, const std::string& host, uint16_t port);

    void send(const std::vector<uint8_t>& data, const boost::asio::ip::udp::endpoint& endpoint);

    /**
     * @brief Wait for one datagram
     * @param timeout Maximum time to wait
     * @throws TimeoutError when nothing arrives in time
     * @throws ProtocolError when the datagram violates the size bounds
     * @throws ConnectionError if the socket is closed or the receive fails
     */
    Datagram receive(std::chrono::milliseconds timeout);

    /**
     * @brief Collect datagrams until the deadline passes or maxPackets arrived
     *
     * Datagrams outside the size bounds are dropped. Running out of time is
     * a normal outcome and returns what was collected.
     *
     * @throws ConnectionError if the socket is closed
     */
    std::vector<Datagram> receiveMany(std::chrono::milliseconds timeout, size_t maxPackets = 100);

    /**
     * @brief Address the socket is bound to
     * @throws ConnectionError if the socket is closed
     */
    boost::asio::ip::udp::endpoint localEndpoint() const;

    /**
     * @brief Wake up a blocked receive; it reports a timeout
     */
    void interrupt();

    const Config& config() const { return config_; }

private:
    struct ReceiveResult {
        boost::system::error_code error;
        size_t bytes = 0;
    };

    ReceiveResult receiveOnce(std::chrono::milliseconds timeout,
                              boost::asio::ip::udp::endpoint& sender);

    Config config_;
    boost::asio::io_context ioContext_;
    boost::asio::ip::udp::socket socket_;
    std::vector<uint8_t> buffer_;

    mutable std::mutex stateMutex_;
    std::mutex receiveMutex_;
    std::mutex sendMutex_;
};

} // namespace lifx_network
