#pragma once

#include "uabridge/interfaces/i_envelope_protector.hpp"
#include "uabridge/session/ratchet_session_store.hpp"

#include <memory>

namespace uabridge::protection {

/**
 * @brief Megolm group encryption of binary envelopes
 *
 * Protect() takes the next outbound key of the envelope's device from the
 * session store; by then the advanced ratchet is already on disk. Unprotect()
 * verifies signature and MAC before decrypting, and only a message that
 * decrypts to an envelope of the same device advances the inbound chain.
 */
class MegolmProtector final : public interfaces::IEnvelopeProtector {
public:
    explicit MegolmProtector(std::shared_ptr<session::RatchetSessionStore> sessions);

    [[nodiscard]] Result<std::vector<uint8_t>, BridgeFailure> Protect(
        const codec::TelemetryEnvelope& envelope) override;

    [[nodiscard]] Result<codec::TelemetryEnvelope, BridgeFailure> Unprotect(
        const std::string& device_id,
        std::span<const uint8_t> payload) override;

    [[nodiscard]] bool IsEncrypting() const noexcept override { return true; }

private:
    std::shared_ptr<session::RatchetSessionStore> sessions_;
};

}
