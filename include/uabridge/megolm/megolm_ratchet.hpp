#pragma once

#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"
#include "uabridge/crypto/sodium_secure_memory_handle.hpp"

#include <cstdint>
#include <span>

namespace uabridge::proto::megolm {
class RatchetState;
}

namespace uabridge::megolm {

using crypto::SecureMemoryHandle;

/**
 * @brief Megolm hash ratchet
 *
 * Four 32-byte parts R(0)..R(3) and a 32-bit counter. Advancing the counter
 * by one rehashes R(h)..R(3), where h is the most significant counter byte
 * that changed:
 * ```
 * R(i) = HMAC-SHA256(key = R(h), data = i)    for i = 3 .. h
 * ```
 * R(0) therefore moves every 2^24 steps and R(3) every step, which lets
 * AdvanceTo() jump forward in at most 4 * 256 hash operations while earlier
 * values stay unrecoverable.
 *
 * Move-only. Parts live in libsodium secure memory.
 */
class MegolmRatchet {
public:
    [[nodiscard]] static Result<MegolmRatchet, BridgeFailure> CreateRandom();

    [[nodiscard]] static Result<MegolmRatchet, BridgeFailure> FromParts(
        std::span<const uint8_t> data,
        uint32_t counter);

    [[nodiscard]] static Result<MegolmRatchet, BridgeFailure> FromProtoState(
        const proto::megolm::RatchetState& state);

    [[nodiscard]] Result<proto::megolm::RatchetState, BridgeFailure> ToProtoState() const;

    /**
     * @brief Advance by exactly one step
     */
    Result<Unit, BridgeFailure> Advance();

    /**
     * @brief Advance forward to `target`
     *
     * A target below the current counter is an InvalidState failure; the
     * ratchet never wraps.
     */
    Result<Unit, BridgeFailure> AdvanceTo(uint32_t target);

    [[nodiscard]] Result<MegolmRatchet, BridgeFailure> Clone() const;

    [[nodiscard]] uint32_t Counter() const noexcept { return counter_; }

    [[nodiscard]] const SecureMemoryHandle& Data() const noexcept { return data_; }

    MegolmRatchet(MegolmRatchet&&) noexcept = default;
    MegolmRatchet& operator=(MegolmRatchet&&) noexcept = default;
    MegolmRatchet(const MegolmRatchet&) = delete;
    MegolmRatchet& operator=(const MegolmRatchet&) = delete;
    ~MegolmRatchet() = default;

private:
    MegolmRatchet(SecureMemoryHandle data, uint32_t counter) noexcept
        : data_(std::move(data)), counter_(counter) {}

    Result<Unit, BridgeFailure> RehashPart(size_t from_part, size_t to_part);

    SecureMemoryHandle data_;
    uint32_t counter_;
};

} // namespace uabridge::megolm
