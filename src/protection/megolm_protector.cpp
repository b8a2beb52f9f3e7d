#include "uabridge/protection/megolm_protector.hpp"
#include "uabridge/codec/envelope_serializer.hpp"
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/megolm/group_message.hpp"

#include <format>

#include <optional>

namespace uabridge::protection {

using codec::EnvelopeSerializer;
using codec::TelemetryEnvelope;
using crypto::SodiumInterop;

MegolmProtector::MegolmProtector(std::shared_ptr<session::RatchetSessionStore> sessions)
    : sessions_(std::move(sessions)) {}

Result<std::vector<uint8_t>, BridgeFailure> MegolmProtector::Protect(const TelemetryEnvelope& envelope) {
    using ResultType = Result<std::vector<uint8_t>, BridgeFailure>;

    auto plaintext = EnvelopeSerializer::SerializeBinary(envelope);
    if (plaintext.IsErr()) {
        return ResultType::Err(std::move(plaintext).UnwrapErr());
    }
    auto key = sessions_->AdvanceOutbound(envelope.device_id);
    if (key.IsErr()) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(plaintext.Unwrap()));
        return ResultType::Err(std::move(key).UnwrapErr());
    }
    auto message = key.Unwrap().Seal(plaintext.Unwrap());
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(plaintext.Unwrap()));
    if (message.IsErr()) {
        return ResultType::Err(std::move(message).UnwrapErr());
    }
    return megolm::SerializeMessage(message.Unwrap());
}

Result<TelemetryEnvelope, BridgeFailure> MegolmProtector::Unprotect(
    const std::string& device_id,
    std::span<const uint8_t> payload) {
    using ResultType = Result<TelemetryEnvelope, BridgeFailure>;

    auto message = megolm::ParseMessage(payload);
    if (message.IsErr()) {
        return ResultType::Err(std::move(message).UnwrapErr());
    }
    const auto& parsed = message.Unwrap();

    std::optional<TelemetryEnvelope> opened;
    auto accepted = sessions_->AcceptInbound(
        device_id,
        megolm::AsBytes(parsed.session_id()),
        parsed.message_index(),
        [&parsed, &opened, &device_id](const megolm::InboundMessageKey& key) -> Result<Unit, BridgeFailure> {
            auto plaintext = key.Open(parsed);
            if (plaintext.IsErr()) {
                return Result<Unit, BridgeFailure>::Err(std::move(plaintext).UnwrapErr());
            }
            auto envelope = EnvelopeSerializer::ParseBinary(plaintext.Unwrap());
            (void)SodiumInterop::SecureWipe(std::span<uint8_t>(plaintext.Unwrap()));
            if (envelope.IsErr()) {
                return Result<Unit, BridgeFailure>::Err(BridgeFailure::Crypto(
                    std::format("Decrypted payload is not an envelope: {}", envelope.UnwrapErr().message)));
            }
            if (envelope.Unwrap().device_id != device_id) {
                return Result<Unit, BridgeFailure>::Err(BridgeFailure::Crypto(std::format(
                    "Decrypted envelope names device {}, expected {}", envelope.Unwrap().device_id, device_id)));
            }
            opened = std::move(envelope).Unwrap();
            return Result<Unit, BridgeFailure>::Ok(unit);
        });
    if (accepted.IsErr()) {
        return ResultType::Err(std::move(accepted).UnwrapErr());
    }
    return ResultType::Ok(std::move(*opened));
}

}
