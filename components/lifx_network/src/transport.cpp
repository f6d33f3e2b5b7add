#include "lifx_network/transport.hpp"
#include "lifx_protocol/error.hpp"

#include <spdlog/spdlog.h>

namespace lifx_network {

using boost::asio::ip::udp;
using lifx_protocol::ConnectionError;
using lifx_protocol::ProtocolError;
using lifx_protocol::TimeoutError;

UdpTransport::UdpTransport()
    : UdpTransport(Config{}) {
}

UdpTransport::UdpTransport(const Config& config)
    : config_(config),
      socket_(ioContext_),
      buffer_(config.maxPacketSize + 1) {
}

UdpTransport::~UdpTransport() {
    close();
}

void UdpTransport::open() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (socket_.is_open()) {
        return;
    }

    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(config_.bindAddress, ec);
    if (ec) {
        throw ConnectionError("Invalid bind address '" + config_.bindAddress + "': " + ec.message());
    }
    udp::endpoint endpoint(address, config_.port);

    socket_.open(endpoint.protocol(), ec);
    if (ec) {
        throw ConnectionError("Failed to open socket: " + ec.message());
    }

    socket_.set_option(udp::socket::reuse_address(true), ec);
    if (!ec && config_.broadcast) {
        socket_.set_option(boost::asio::socket_base::broadcast(true), ec);
    }
    if (!ec) {
        socket_.bind(endpoint, ec);
    }
    if (ec) {
        boost::system::error_code ignored;
        socket_.close(ignored);
        throw ConnectionError("Failed to bind " + config_.bindAddress + ":" +
                              std::to_string(config_.port) + ": " + ec.message());
    }

    spdlog::debug("UDP transport bound to {}:{}{}",
                  socket_.local_endpoint().address().to_string(),
                  socket_.local_endpoint().port(),
                  config_.broadcast ? " (broadcast)" : "");
}

void UdpTransport::close() {
    interrupt();

    std::lock_guard<std::mutex> receiveLock(receiveMutex_);
    std::lock_guard<std::mutex> sendLock(sendMutex_);
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (!socket_.is_open()) {
        return;
    }

    boost::system::error_code ec;
    socket_.shutdown(udp::socket::shutdown_both, ec);
    socket_.close(ec);
    if (ec) {
        spdlog::warn("Error closing UDP socket: {}", ec.message());
    }
    spdlog::debug("UDP transport closed");
}

bool UdpTransport::isOpen() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return socket_.is_open();
}

void UdpTransport::send(const std::vector<uint8_t>& data, const std::string& host, uint16_t port) {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(host, ec);
    if (!ec) {
        send(data, udp::endpoint(address, port));
        return;
    }

    udp::resolver resolver(ioContext_);
    auto results = resolver.resolve(udp::v4(), host, std::to_string(port), ec);
    if (ec || results.empty()) {
        throw ConnectionError("Cannot resolve host '" + host + "': " + ec.message());
    }
    send(data, results.begin()->endpoint());
}

void UdpTransport::send(const std::vector<uint8_t>& data, const udp::endpoint& endpoint) {
    std::lock_guard<std::mutex> sendLock(sendMutex_);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!socket_.is_open()) {
            throw ConnectionError("Socket not open");
        }
    }

    boost::system::error_code ec;
    socket_.send_to(boost::asio::buffer(data), endpoint, 0, ec);
    if (ec) {
        throw ConnectionError("Send to " + endpoint.address().to_string() + ":" +
                              std::to_string(endpoint.port()) + " failed: " + ec.message());
    }
    spdlog::trace("Sent {} bytes to {}:{}", data.size(),
                  endpoint.address().to_string(), endpoint.port());
}

UdpTransport::ReceiveResult UdpTransport::receiveOnce(std::chrono::milliseconds timeout,
                                                      udp::endpoint& sender) {
    ReceiveResult result;
    bool done = false;

    socket_.async_receive_from(
        boost::asio::buffer(buffer_), sender,
        [&result, &done](const boost::system::error_code& ec, size_t bytes) {
            result.error = ec;
            result.bytes = bytes;
            done = true;
        });

    ioContext_.restart();
    ioContext_.run_for(timeout);

    if (!done) {
        // Deadline passed or interrupted: cancel and let the handler run
        boost::system::error_code ignored;
        socket_.cancel(ignored);
        while (!done) {
            ioContext_.restart();
            ioContext_.run();
        }
    }

    return result;
}

Datagram UdpTransport::receive(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> receiveLock(receiveMutex_);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!socket_.is_open()) {
            throw ConnectionError("Socket not open");
        }
    }

    Datagram datagram;
    ReceiveResult result = receiveOnce(timeout, datagram.sender);

    if (result.error == boost::asio::error::operation_aborted) {
        throw TimeoutError("No datagram within " + std::to_string(timeout.count()) + "ms");
    }
    if (result.error) {
        throw ConnectionError("Receive failed: " + result.error.message());
    }

    if (result.bytes < config_.minPacketSize) {
        throw ProtocolError("Datagram too small: " + std::to_string(result.bytes) + " bytes");
    }
    if (result.bytes > config_.maxPacketSize) {
        throw ProtocolError("Datagram too large: more than " +
                            std::to_string(config_.maxPacketSize) + " bytes");
    }

    datagram.data.assign(buffer_.begin(), buffer_.begin() + result.bytes);
    return datagram;
}

std::vector<Datagram> UdpTransport::receiveMany(std::chrono::milliseconds timeout, size_t maxPackets) {
    std::lock_guard<std::mutex> receiveLock(receiveMutex_);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!socket_.is_open()) {
            throw ConnectionError("Socket not open");
        }
    }

    std::vector<Datagram> datagrams;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (datagrams.size() < maxPackets) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        udp::endpoint sender;
        ReceiveResult result = receiveOnce(remaining, sender);

        if (result.error == boost::asio::error::operation_aborted) {
            break;
        }
        if (result.error) {
            spdlog::debug("receiveMany stopped early: {}", result.error.message());
            break;
        }
        if (result.bytes < config_.minPacketSize || result.bytes > config_.maxPacketSize) {
            spdlog::debug("Dropping datagram of {} bytes from {}:{}", result.bytes,
                          sender.address().to_string(), sender.port());
            continue;
        }

        datagrams.push_back(Datagram{
            std::vector<uint8_t>(buffer_.begin(), buffer_.begin() + result.bytes), sender});
    }

    return datagrams;
}

udp::endpoint UdpTransport::localEndpoint() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (!socket_.is_open()) {
        throw ConnectionError("Socket not open");
    }
    return socket_.local_endpoint();
}

void UdpTransport::interrupt() {
    ioContext_.stop();
}

} // namespace lifx_network
