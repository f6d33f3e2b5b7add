#pragma once

#include <stdexcept>
#include <string>

namespace lifx_protocol {

/**
 * @brief Base exception class for all device communication errors
 */
class LifxError : public std::exception {
public:
    explicit LifxError(const std::string& message) : message_(message) {}
    const char* what() const noexcept override { return message_.c_str(); }

protected:
    std::string message_;
};

/**
 * @brief Exception thrown when no matching reply arrives within the budget
 */
class TimeoutError : public LifxError {
public:
    explicit TimeoutError(const std::string& message) : LifxError("Timeout: " + message) {}
};

/**
 * @brief Exception thrown on socket failures or use of a closed socket
 */
class ConnectionError : public LifxError {
public:
    explicit ConnectionError(const std::string& message) : LifxError("Connection error: " + message) {}
};

/**
 * @brief Exception delivered to requests still pending when their connection closes
 */
class ConnectionClosedError : public ConnectionError {
public:
    explicit ConnectionClosedError(const std::string& message) : ConnectionError("closed: " + message) {}
};

/**
 * @brief Exception thrown when traffic violates the protocol
 */
class ProtocolError : public LifxError {
public:
    explicit ProtocolError(const std::string& message) : LifxError("Protocol error: " + message) {}
};

/**
 * @brief Exception thrown when a header or payload cannot be decoded
 */
class ParseError : public ProtocolError {
public:
    explicit ParseError(const std::string& message) : ProtocolError("parse: " + message) {}
};

/**
 * @brief Exception thrown when a device reports it does not implement a command
 */
class UnsupportedCommandError : public LifxError {
public:
    explicit UnsupportedCommandError(const std::string& message) : LifxError("Unsupported command: " + message) {}
};

} // namespace lifx_protocol
