#pragma once

#include "lifx_network/types.hpp"
#include "lifx_protocol/serial.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace lifx_network {

/**
 * @brief Correlation key of an outstanding request
 */
struct RequestKey {
    uint32_t source = 0;
    uint8_t sequence = 0;
    lifx_protocol::Serial serial;

    bool operator==(const RequestKey& other) const {
        return source == other.source && sequence == other.sequence && serial == other.serial;
    }
};

struct RequestKeyHash {
    std::size_t operator()(const RequestKey& key) const {
        std::size_t h1 = std::hash<uint32_t>{}(key.source);
        std::size_t h2 = std::hash<uint8_t>{}(key.sequence);
        std::size_t h3 = std::hash<lifx_protocol::Serial>{}(key.serial);
        return h1 ^ (h2 << 1) ^ (h3 << 2);
    }
};

/**
 * @class PendingRequest
 * @brief Bounded delivery channel for one outstanding request
 *
 * The receive loop delivers into it; the requester waits on it. A delivery
 * that finds the channel full is dropped.
 */
class PendingRequest {
public:
    explicit PendingRequest(size_t capacity = 1);

    /**
     * @brief Queue a response
     * @return false if the channel is closed or full
     */
    bool deliver(Response response);

    /**
     * @brief Close the channel with an error raised to the waiter
     */
    void fail(std::exception_ptr error);

    /**
     * @brief Close the channel; queued responses stay readable
     */
    void close();

    /**
     * @brief Wait for the next response
     * @return Response, or nullopt on timeout or when closed and drained
     * @throws The exception passed to fail() once the queue is drained
     */
    std::optional<Response> waitFor(std::chrono::milliseconds timeout);

    bool isClosed() const;
    size_t queued() const;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Response> queue_;
    bool closed_ = false;
    std::exception_ptr error_;
};

/**
 * @class PendingRequestTable
 * @brief Maps correlation keys to their waiting requests
 *
 * Mutated by requesters (register/remove) and by the receive loop (deliver),
 * so every operation takes the table lock.
 */
class PendingRequestTable {
public:
    /**
     * @brief Register a new request
     * @return The channel, or nullptr if the key is already taken
     */
    std::shared_ptr<PendingRequest> add(const RequestKey& key, size_t capacity = 1);

    /**
     * @brief Route a response to its waiter
     *
     * An exact key match wins; otherwise a request registered for the zero
     * serial under the same source and sequence receives it.
     *
     * @return true if a waiter accepted the response
     */
    bool deliver(const RequestKey& key, Response response);

    void remove(const RequestKey& key);

    bool contains(const RequestKey& key) const;

    /**
     * @brief Fail and forget every pending request
     */
    void failAll(std::exception_ptr error);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<RequestKey, std::shared_ptr<PendingRequest>, RequestKeyHash> requests_;
};

} // namespace lifx_network
