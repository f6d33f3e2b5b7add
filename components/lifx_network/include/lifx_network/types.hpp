#pragma once

#include "lifx_protocol/header.hpp"

#include <boost/asio/ip/udp.hpp>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace lifx_network {

/**
 * @brief One datagram as received from the socket
 */
struct Datagram {
    std::vector<uint8_t> data;
    boost::asio::ip::udp::endpoint sender;
};

/**
 * @brief Reply correlated to a request
 */
struct Response {
    lifx_protocol::Header header;
    std::vector<uint8_t> payload;
};

/**
 * @brief Result of a single request
 *
 * GET and echo requests yield the Response; SET requests yield true for an
 * acknowledgement and false when the device answered StateUnhandled.
 */
using Reply = std::variant<Response, bool>;

/**
 * @brief Lifecycle state of a connection
 */
enum class ConnectionState {
    CLOSED,
    OPENING,
    OPEN
};

inline std::string stateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::CLOSED:  return "CLOSED";
        case ConnectionState::OPENING: return "OPENING";
        case ConnectionState::OPEN:    return "OPEN";
        default:                       return "UNKNOWN";
    }
}

} // namespace lifx_network
