#pragma once

#include <chrono>
#include <cstddef>
#include <random>

namespace lifx_network {

/**
 * @brief Attempt budget and backoff parameters of a request
 */
struct RetryPolicy {
    size_t maxRetries = 8;                          ///< Total attempts, including the first
    std::chrono::milliseconds timeout{1000};        ///< Per-attempt deadline
    std::chrono::milliseconds backoffBase{100};
    double backoffMultiplier = 2.0;
    std::chrono::milliseconds maxBackoff{2000};
    double jitterRatio = 0.25;                      ///< Fraction of the delay added or removed at random
};

/**
 * @class RetrySchedule
 * @brief Computes the delay before each resend of a request
 */
class RetrySchedule {
public:
    explicit RetrySchedule(const RetryPolicy& policy);

    /**
     * @brief Delay to wait after the given failed attempt
     *
     * base * multiplier^attempt, capped at maxBackoff, then shifted by up to
     * jitterRatio of itself in either direction.
     *
     * @param attempt Zero-based index of the attempt that just timed out
     */
    std::chrono::milliseconds backoffFor(size_t attempt);

    /**
     * @brief Backoff without jitter
     */
    std::chrono::milliseconds nominalBackoff(size_t attempt) const;

    /**
     * @brief Upper bound on the time a request can take before giving up
     */
    std::chrono::milliseconds worstCaseDuration() const;

    const RetryPolicy& policy() const { return policy_; }

private:
    RetryPolicy policy_;
    std::mt19937 rng_;
};

} // namespace lifx_network
