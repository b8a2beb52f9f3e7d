#pragma once

#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"
#include "uabridge/megolm/megolm_ratchet.hpp"
#include "uabridge/megolm/message_keys.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace uabridge::proto::megolm {
class InboundSessionState;
}

namespace uabridge::megolm {

class OutboundGroupSession;

/**
 * @brief Receiving side of a Megolm session
 *
 * Keeps the ratchet at the first known index and at the last accepted one.
 * Message indices are accepted strictly increasing: anything at or below the
 * highest accepted index is a replay, anything below the first known index
 * is undecryptable.
 */
class InboundGroupSession {
public:
    [[nodiscard]] static Result<InboundGroupSession, BridgeFailure> FromSessionKey(std::string_view encoded_key);

    [[nodiscard]] static Result<InboundGroupSession, BridgeFailure> FromOutbound(const OutboundGroupSession& outbound);

    [[nodiscard]] static Result<InboundGroupSession, BridgeFailure> FromProtoState(
        const proto::megolm::InboundSessionState& state);

    [[nodiscard]] Result<proto::megolm::InboundSessionState, BridgeFailure> ToProtoState() const;

    [[nodiscard]] const std::vector<uint8_t>& SessionId() const noexcept { return signing_public_key_; }

    [[nodiscard]] uint32_t FirstKnownIndex() const noexcept { return initial_ratchet_.Counter(); }

    [[nodiscard]] std::optional<uint32_t> HighestAcceptedIndex() const noexcept { return highest_accepted_; }

    /**
     * @brief Derive the key for `index` without changing the session
     */
    [[nodiscard]] Result<InboundMessageKey, BridgeFailure> DeriveMessageKey(uint32_t index) const;

    /**
     * @brief Record that the message for `key` was authenticated and consumed
     */
    Result<Unit, BridgeFailure> Commit(const InboundMessageKey& key);

    /**
     * @brief Take over the earlier starting point of another copy of this session
     *
     * Only the first known index moves back. The accepted history and the
     * latest ratchet stay, so indices already consumed remain replays.
     */
    Result<Unit, BridgeFailure> ExtendBackTo(InboundGroupSession&& earlier);

    InboundGroupSession(InboundGroupSession&&) noexcept = default;
    InboundGroupSession& operator=(InboundGroupSession&&) noexcept = default;
    InboundGroupSession(const InboundGroupSession&) = delete;
    InboundGroupSession& operator=(const InboundGroupSession&) = delete;

private:
    InboundGroupSession(
        MegolmRatchet initial_ratchet,
        MegolmRatchet latest_ratchet,
        std::vector<uint8_t> signing_public_key,
        std::optional<uint32_t> highest_accepted,
        bool signing_key_verified) noexcept;

    Result<Unit, BridgeFailure> CheckIndex(uint32_t index) const;

    MegolmRatchet initial_ratchet_;
    MegolmRatchet latest_ratchet_;
    std::vector<uint8_t> signing_public_key_;
    std::optional<uint32_t> highest_accepted_;
    bool signing_key_verified_;
};

} // namespace uabridge::megolm
