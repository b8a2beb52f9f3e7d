#include "uabridge/utilities/backoff.hpp"
#include "uabridge/crypto/sodium_interop.hpp"

#include <algorithm>
#include <cmath>

namespace uabridge::utilities {

namespace {
    constexpr uint32_t JITTER_RESOLUTION = 1'000'000;
}

ExponentialBackoff::ExponentialBackoff(BackoffPolicy policy)
    : policy_(policy) {
    policy_.multiplier = std::max(policy_.multiplier, 1.0);
    policy_.jitter = std::clamp(policy_.jitter, 0.0, 1.0);
    if (policy_.max < policy_.initial) {
        policy_.max = policy_.initial;
    }
}

std::chrono::milliseconds ExponentialBackoff::NextDelay() {
    const double base = static_cast<double>(policy_.initial.count()) *
                        std::pow(policy_.multiplier, static_cast<double>(attempt_));
    const double capped = std::min(base, static_cast<double>(policy_.max.count()));
    if (attempt_ < UINT32_MAX) {
        ++attempt_;
    }

    double factor = 1.0;
    if (policy_.jitter > 0.0) {
        const double unit = static_cast<double>(crypto::SodiumInterop::GenerateRandomUInt32(JITTER_RESOLUTION)) /
                            static_cast<double>(JITTER_RESOLUTION);
        factor = 1.0 - policy_.jitter + 2.0 * policy_.jitter * unit;
    }
    const double delay = std::min(capped * factor, static_cast<double>(policy_.max.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

}
