#pragma once

#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"
#include "uabridge/core/constants.hpp"
#include "uabridge/megolm/megolm_ratchet.hpp"
#include "uabridge/megolm/message_keys.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace uabridge::proto::megolm {
class OutboundSessionState;
}

namespace uabridge::megolm {

/**
 * @brief Sending side of a Megolm session
 *
 * The session id is the Ed25519 public key that signs every message.
 * NextMessageKey() hands out the current ratchet step and advances the
 * ratchet in the same call, so two keys with the same index can never come
 * out of one session object.
 */
class OutboundGroupSession {
public:
    [[nodiscard]] static Result<OutboundGroupSession, BridgeFailure> Create();

    [[nodiscard]] static Result<OutboundGroupSession, BridgeFailure> FromProtoState(
        const proto::megolm::OutboundSessionState& state);

    [[nodiscard]] Result<proto::megolm::OutboundSessionState, BridgeFailure> ToProtoState() const;

    [[nodiscard]] const std::vector<uint8_t>& SessionId() const noexcept { return signing_public_key_; }

    /**
     * @brief Index the next message will be encrypted with
     */
    [[nodiscard]] uint32_t MessageIndex() const noexcept { return ratchet_.Counter(); }

    [[nodiscard]] std::chrono::system_clock::time_point CreatedAt() const noexcept { return created_at_; }

    /**
     * @brief True once every index of the 32-bit counter has been handed out
     */
    [[nodiscard]] bool IsExhausted() const noexcept {
        return ratchet_.Counter() == MegolmConstants::LAST_MESSAGE_INDEX;
    }

    [[nodiscard]] Result<OutboundMessageKey, BridgeFailure> NextMessageKey();

    /**
     * @brief Export the current ratchet as a signed, base64 session key
     *
     * Layout: version 0x02 | index (u32 BE) | ratchet (128) | Ed25519 public
     * key (32) | Ed25519 signature over everything before it (64).
     */
    [[nodiscard]] Result<std::string, BridgeFailure> ExportSessionKey() const;

    [[nodiscard]] Result<MegolmRatchet, BridgeFailure> CloneRatchet() const { return ratchet_.Clone(); }

    OutboundGroupSession(OutboundGroupSession&&) noexcept = default;
    OutboundGroupSession& operator=(OutboundGroupSession&&) noexcept = default;
    OutboundGroupSession(const OutboundGroupSession&) = delete;
    OutboundGroupSession& operator=(const OutboundGroupSession&) = delete;

private:
    OutboundGroupSession(
        MegolmRatchet ratchet,
        SecureMemoryHandle signing_secret_key,
        std::vector<uint8_t> signing_public_key,
        std::chrono::system_clock::time_point created_at) noexcept;

    MegolmRatchet ratchet_;
    SecureMemoryHandle signing_secret_key_;
    std::vector<uint8_t> signing_public_key_;
    std::chrono::system_clock::time_point created_at_;
};

} // namespace uabridge::megolm
