#pragma once

#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"
#include "uabridge/megolm/megolm_ratchet.hpp"
#include "uabridge/megolm/group_message.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace uabridge::megolm {

/**
 * @brief Key material for one outbound ratchet step
 *
 * Holds a snapshot of the ratchet at Index() and the session signing key.
 * By the time a caller receives one, the session it came from has already
 * moved past Index(). Seal() may be called at most once; a second call fails
 * instead of reusing the derived IV.
 */
class OutboundMessageKey {
public:
    OutboundMessageKey(
        MegolmRatchet ratchet,
        SecureMemoryHandle signing_key,
        std::vector<uint8_t> session_id) noexcept;

    [[nodiscard]] uint32_t Index() const noexcept { return ratchet_.Counter(); }

    [[nodiscard]] const std::vector<uint8_t>& SessionId() const noexcept { return session_id_; }

    [[nodiscard]] Result<CiphertextMessage, BridgeFailure> Seal(std::span<const uint8_t> plaintext);

    OutboundMessageKey(OutboundMessageKey&&) noexcept = default;
    OutboundMessageKey& operator=(OutboundMessageKey&&) noexcept = default;
    OutboundMessageKey(const OutboundMessageKey&) = delete;
    OutboundMessageKey& operator=(const OutboundMessageKey&) = delete;

private:
    MegolmRatchet ratchet_;
    SecureMemoryHandle signing_key_;
    std::vector<uint8_t> session_id_;
    bool used_ = false;
};

/**
 * @brief Key material for one inbound message index
 *
 * Open() authenticates before it decrypts: a MAC or signature mismatch
 * returns a Crypto failure without touching the ciphertext.
 */
class InboundMessageKey {
public:
    InboundMessageKey(MegolmRatchet ratchet, std::vector<uint8_t> session_id) noexcept;

    [[nodiscard]] uint32_t Index() const noexcept { return ratchet_.Counter(); }

    [[nodiscard]] const std::vector<uint8_t>& SessionId() const noexcept { return session_id_; }

    [[nodiscard]] const MegolmRatchet& Ratchet() const noexcept { return ratchet_; }

    [[nodiscard]] Result<std::vector<uint8_t>, BridgeFailure> Open(const CiphertextMessage& message) const;

    InboundMessageKey(InboundMessageKey&&) noexcept = default;
    InboundMessageKey& operator=(InboundMessageKey&&) noexcept = default;
    InboundMessageKey(const InboundMessageKey&) = delete;
    InboundMessageKey& operator=(const InboundMessageKey&) = delete;

private:
    MegolmRatchet ratchet_;
    std::vector<uint8_t> session_id_;
};

} // namespace uabridge::megolm
