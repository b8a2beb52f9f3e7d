#pragma once

#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace uabridge::crypto {

class HmacSha256 {
public:
    /**
     * @brief Compute HMAC-SHA256(key, data) into output
     *
     * @param output Exactly 32 bytes. May alias key.
     */
    static Result<Unit, BridgeFailure> Compute(
        std::span<const uint8_t> key,
        std::span<const uint8_t> data,
        std::span<uint8_t> output);

    static Result<std::vector<uint8_t>, BridgeFailure> ComputeBytes(
        std::span<const uint8_t> key,
        std::span<const uint8_t> data);

    static constexpr size_t OUTPUT_LEN = 32;

private:
    HmacSha256() = delete;
};

} // namespace uabridge::crypto
