#pragma once

#include "uabridge/interfaces/i_envelope_protector.hpp"
#include "uabridge/session/ratchet_session_store.hpp"

#include <memory>

namespace uabridge::protection {

/**
 * @brief Chooses the protector for a channel
 *
 * Channels resolve their protector once, at startup, and from then on run
 * the same code path whether they encrypt or not. Asking for an encrypting
 * protector when no session store is configured is a Config failure.
 */
class EncryptionEngine {
public:
    EncryptionEngine(
        std::shared_ptr<interfaces::IEnvelopeProtector> passthrough,
        std::shared_ptr<interfaces::IEnvelopeProtector> encrypting);

    /**
     * @brief Engine over `sessions`; a null store disables encryption
     */
    [[nodiscard]] static EncryptionEngine Create(std::shared_ptr<session::RatchetSessionStore> sessions);

    [[nodiscard]] Result<std::shared_ptr<interfaces::IEnvelopeProtector>, BridgeFailure> ProtectorFor(
        bool encrypted) const;

    [[nodiscard]] Result<std::vector<uint8_t>, BridgeFailure> Protect(
        bool encrypted,
        const codec::TelemetryEnvelope& envelope) const;

    [[nodiscard]] Result<codec::TelemetryEnvelope, BridgeFailure> Unprotect(
        bool encrypted,
        const std::string& device_id,
        std::span<const uint8_t> payload) const;

    [[nodiscard]] bool CanEncrypt() const noexcept { return encrypting_ != nullptr; }

private:
    std::shared_ptr<interfaces::IEnvelopeProtector> passthrough_;
    std::shared_ptr<interfaces::IEnvelopeProtector> encrypting_;
};

}
