#include "lifx_network/retry.hpp"

#include <algorithm>
#include <cmath>

namespace lifx_network {

RetrySchedule::RetrySchedule(const RetryPolicy& policy)
    : policy_(policy),
      rng_(std::random_device{}()) {
}

std::chrono::milliseconds RetrySchedule::nominalBackoff(size_t attempt) const {
    const double base = static_cast<double>(policy_.backoffBase.count());
    const double cap = static_cast<double>(policy_.maxBackoff.count());
    const double delay = std::min(base * std::pow(policy_.backoffMultiplier, static_cast<double>(attempt)), cap);
    return std::chrono::milliseconds(static_cast<long long>(std::max(delay, 0.0)));
}

std::chrono::milliseconds RetrySchedule::backoffFor(size_t attempt) {
    const auto nominal = nominalBackoff(attempt);
    if (policy_.jitterRatio <= 0.0 || nominal.count() == 0) {
        return nominal;
    }

    const double spread = static_cast<double>(nominal.count()) * std::min(policy_.jitterRatio, 1.0);
    std::uniform_real_distribution<double> jitter(-spread, spread);
    const double delay = static_cast<double>(nominal.count()) + jitter(rng_);
    return std::chrono::milliseconds(static_cast<long long>(std::max(delay, 0.0)));
}

std::chrono::milliseconds RetrySchedule::worstCaseDuration() const {
    std::chrono::milliseconds total{0};
    const double maxJitter = 1.0 + std::min(std::max(policy_.jitterRatio, 0.0), 1.0);
    for (size_t attempt = 0; attempt < policy_.maxRetries; ++attempt) {
        total += policy_.timeout;
        if (attempt + 1 < policy_.maxRetries) {
            total += std::chrono::milliseconds(static_cast<long long>(
                std::ceil(static_cast<double>(nominalBackoff(attempt).count()) * maxJitter)));
        }
    }
    return total;
}

} // namespace lifx_network
