#pragma once

#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace uabridge::crypto {

/**
 * HKDF-SHA256 (RFC 5869) on top of the OpenSSL 3 KDF provider.
 */
class Hkdf {
public:
    static Result<Unit, BridgeFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, BridgeFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace uabridge::crypto
