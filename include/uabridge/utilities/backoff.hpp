#pragma once

#include <chrono>
#include <cstdint>

namespace uabridge::utilities {

struct BackoffPolicy {
    std::chrono::milliseconds initial{500};
    std::chrono::milliseconds max{30000};
    double multiplier = 2.0;
    /// Fraction of the delay randomized in both directions, in [0, 1].
    double jitter = 0.2;
};

/**
 * @brief Exponential backoff with symmetric jitter
 *
 * The n-th delay is min(initial * multiplier^n, max) scaled by a random
 * factor in [1 - jitter, 1 + jitter], and never exceeds max.
 */
class ExponentialBackoff {
public:
    explicit ExponentialBackoff(BackoffPolicy policy);

    std::chrono::milliseconds NextDelay();

    void Reset() noexcept { attempt_ = 0; }

    [[nodiscard]] uint32_t Attempts() const noexcept { return attempt_; }

    [[nodiscard]] const BackoffPolicy& Policy() const noexcept { return policy_; }

private:
    BackoffPolicy policy_;
    uint32_t attempt_ = 0;
};

}
