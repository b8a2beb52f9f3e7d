#include "uabridge/protection/encryption_engine.hpp"
#include "uabridge/protection/megolm_protector.hpp"
#include "uabridge/protection/passthrough_protector.hpp"

namespace uabridge::protection {

using interfaces::IEnvelopeProtector;

EncryptionEngine::EncryptionEngine(
    std::shared_ptr<IEnvelopeProtector> passthrough,
    std::shared_ptr<IEnvelopeProtector> encrypting)
    : passthrough_(std::move(passthrough))
    , encrypting_(std::move(encrypting)) {}

EncryptionEngine EncryptionEngine::Create(std::shared_ptr<session::RatchetSessionStore> sessions) {
    std::shared_ptr<IEnvelopeProtector> encrypting;
    if (sessions) {
        encrypting = std::make_shared<MegolmProtector>(std::move(sessions));
    }
    return EncryptionEngine(std::make_shared<PassthroughProtector>(), std::move(encrypting));
}

Result<std::shared_ptr<IEnvelopeProtector>, BridgeFailure> EncryptionEngine::ProtectorFor(const bool encrypted) const {
    if (!encrypted) {
        return Result<std::shared_ptr<IEnvelopeProtector>, BridgeFailure>::Ok(passthrough_);
    }
    if (!encrypting_) {
        return Result<std::shared_ptr<IEnvelopeProtector>, BridgeFailure>::Err(BridgeFailure::Config(
            "Encrypted channel configured but no ratchet state directory is set"));
    }
    return Result<std::shared_ptr<IEnvelopeProtector>, BridgeFailure>::Ok(encrypting_);
}

Result<std::vector<uint8_t>, BridgeFailure> EncryptionEngine::Protect(
    const bool encrypted,
    const codec::TelemetryEnvelope& envelope) const {
    auto protector = ProtectorFor(encrypted);
    if (protector.IsErr()) {
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(std::move(protector).UnwrapErr());
    }
    return protector.Unwrap()->Protect(envelope);
}

Result<codec::TelemetryEnvelope, BridgeFailure> EncryptionEngine::Unprotect(
    const bool encrypted,
    const std::string& device_id,
    std::span<const uint8_t> payload) const {
    auto protector = ProtectorFor(encrypted);
    if (protector.IsErr()) {
        return Result<codec::TelemetryEnvelope, BridgeFailure>::Err(std::move(protector).UnwrapErr());
    }
    return protector.Unwrap()->Unprotect(device_id, payload);
}

}
