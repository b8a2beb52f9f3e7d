#include "uabridge/megolm/inbound_group_session.hpp"
#include "uabridge/megolm/outbound_group_session.hpp"
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/core/constants.hpp"

#include "megolm/session_state.pb.h"

#include <format>

namespace uabridge::megolm {

using crypto::SodiumInterop;

InboundGroupSession::InboundGroupSession(
    MegolmRatchet initial_ratchet,
    MegolmRatchet latest_ratchet,
    std::vector<uint8_t> signing_public_key,
    std::optional<uint32_t> highest_accepted,
    const bool signing_key_verified) noexcept
    : initial_ratchet_(std::move(initial_ratchet))
    , latest_ratchet_(std::move(latest_ratchet))
    , signing_public_key_(std::move(signing_public_key))
    , highest_accepted_(highest_accepted)
    , signing_key_verified_(signing_key_verified) {}

Result<InboundGroupSession, BridgeFailure> InboundGroupSession::FromSessionKey(std::string_view encoded_key) {
    auto decoded = SodiumInterop::FromBase64(encoded_key);
    if (decoded.IsErr()) {
        return Result<InboundGroupSession, BridgeFailure>::Err(
            BridgeFailure::Crypto("Session key is not valid base64"));
    }
    auto& key = decoded.Unwrap();
    if (key.size() != MegolmConstants::SESSION_KEY_LENGTH) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(key));
        return Result<InboundGroupSession, BridgeFailure>::Err(
            BridgeFailure::Crypto(std::format(
                "Session key must be {} bytes, got {}", MegolmConstants::SESSION_KEY_LENGTH, key.size())));
    }
    if (key[0] != MegolmConstants::SESSION_KEY_VERSION) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(key));
        return Result<InboundGroupSession, BridgeFailure>::Err(
            BridgeFailure::Crypto(std::format("Unsupported session key version {}", key[0])));
    }

    const std::span<const uint8_t> bytes(key);
    const uint32_t index = (uint32_t{bytes[1]} << 24) | (uint32_t{bytes[2]} << 16) |
                           (uint32_t{bytes[3]} << 8) | uint32_t{bytes[4]};
    const auto ratchet_bytes = bytes.subspan(5, MegolmConstants::RATCHET_LENGTH);
    const auto public_key = bytes.subspan(5 + MegolmConstants::RATCHET_LENGTH,
                                          Constants::ED_25519_PUBLIC_KEY_SIZE);
    const size_t signed_len = bytes.size() - Constants::ED_25519_SIGNATURE_SIZE;
    const auto signature = bytes.subspan(signed_len);

    if (!SodiumInterop::VerifyDetached(public_key, bytes.first(signed_len), signature)) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(key));
        return Result<InboundGroupSession, BridgeFailure>::Err(
            BridgeFailure::Crypto("Session key signature verification failed"));
    }

    auto initial = MegolmRatchet::FromParts(ratchet_bytes, index);
    auto latest = MegolmRatchet::FromParts(ratchet_bytes, index);
    std::vector<uint8_t> session_id(public_key.begin(), public_key.end());
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(key));
    if (initial.IsErr()) {
        return Result<InboundGroupSession, BridgeFailure>::Err(std::move(initial).UnwrapErr());
    }
    if (latest.IsErr()) {
        return Result<InboundGroupSession, BridgeFailure>::Err(std::move(latest).UnwrapErr());
    }
    return Result<InboundGroupSession, BridgeFailure>::Ok(InboundGroupSession(
        std::move(initial).Unwrap(),
        std::move(latest).Unwrap(),
        std::move(session_id),
        std::nullopt,
        true));
}

Result<InboundGroupSession, BridgeFailure> InboundGroupSession::FromOutbound(const OutboundGroupSession& outbound) {
    auto initial = outbound.CloneRatchet();
    if (initial.IsErr()) {
        return Result<InboundGroupSession, BridgeFailure>::Err(std::move(initial).UnwrapErr());
    }
    auto latest = outbound.CloneRatchet();
    if (latest.IsErr()) {
        return Result<InboundGroupSession, BridgeFailure>::Err(std::move(latest).UnwrapErr());
    }
    return Result<InboundGroupSession, BridgeFailure>::Ok(InboundGroupSession(
        std::move(initial).Unwrap(),
        std::move(latest).Unwrap(),
        outbound.SessionId(),
        std::nullopt,
        true));
}

Result<InboundGroupSession, BridgeFailure> InboundGroupSession::FromProtoState(
    const proto::megolm::InboundSessionState& state) {
    if (state.session_id().size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        return Result<InboundGroupSession, BridgeFailure>::Err(
            BridgeFailure::Persistence("Inbound session state has an invalid session id"));
    }
    auto initial = MegolmRatchet::FromProtoState(state.initial_ratchet());
    if (initial.IsErr()) {
        return Result<InboundGroupSession, BridgeFailure>::Err(std::move(initial).UnwrapErr());
    }
    auto latest = MegolmRatchet::FromProtoState(state.latest_ratchet());
    if (latest.IsErr()) {
        return Result<InboundGroupSession, BridgeFailure>::Err(std::move(latest).UnwrapErr());
    }
    const auto session_id = AsBytes(state.session_id());
    std::optional<uint32_t> highest;
    if (state.has_accepted()) {
        highest = state.highest_accepted_index();
    }
    return Result<InboundGroupSession, BridgeFailure>::Ok(InboundGroupSession(
        std::move(initial).Unwrap(),
        std::move(latest).Unwrap(),
        std::vector<uint8_t>(session_id.begin(), session_id.end()),
        highest,
        state.signing_key_verified()));
}

Result<proto::megolm::InboundSessionState, BridgeFailure> InboundGroupSession::ToProtoState() const {
    auto initial = initial_ratchet_.ToProtoState();
    if (initial.IsErr()) {
        return Result<proto::megolm::InboundSessionState, BridgeFailure>::Err(std::move(initial).UnwrapErr());
    }
    auto latest = latest_ratchet_.ToProtoState();
    if (latest.IsErr()) {
        return Result<proto::megolm::InboundSessionState, BridgeFailure>::Err(std::move(latest).UnwrapErr());
    }
    proto::megolm::InboundSessionState state;
    state.set_session_id(signing_public_key_.data(), signing_public_key_.size());
    *state.mutable_initial_ratchet() = std::move(initial).Unwrap();
    *state.mutable_latest_ratchet() = std::move(latest).Unwrap();
    state.set_has_accepted(highest_accepted_.has_value());
    state.set_highest_accepted_index(highest_accepted_.value_or(0));
    state.set_signing_key_verified(signing_key_verified_);
    return Result<proto::megolm::InboundSessionState, BridgeFailure>::Ok(std::move(state));
}

Result<Unit, BridgeFailure> InboundGroupSession::CheckIndex(const uint32_t index) const {
    if (index < initial_ratchet_.Counter()) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::Crypto(std::format(
                "Message index {} precedes the first known index {}", index, initial_ratchet_.Counter())));
    }
    if (highest_accepted_.has_value() && index <= *highest_accepted_) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::Crypto(std::format(
                "Message index {} already accepted (highest accepted {})", index, *highest_accepted_)));
    }
    return Result<Unit, BridgeFailure>::Ok(unit);
}

Result<InboundMessageKey, BridgeFailure> InboundGroupSession::DeriveMessageKey(const uint32_t index) const {
    UABRIDGE_TRY(CheckIndex(index));

    const MegolmRatchet& source = latest_ratchet_.Counter() <= index ? latest_ratchet_ : initial_ratchet_;
    auto ratchet = source.Clone();
    if (ratchet.IsErr()) {
        return Result<InboundMessageKey, BridgeFailure>::Err(std::move(ratchet).UnwrapErr());
    }
    UABRIDGE_TRY(ratchet.Unwrap().AdvanceTo(index));
    return Result<InboundMessageKey, BridgeFailure>::Ok(
        InboundMessageKey(std::move(ratchet).Unwrap(), signing_public_key_));
}

Result<Unit, BridgeFailure> InboundGroupSession::Commit(const InboundMessageKey& key) {
    UABRIDGE_TRY(CheckIndex(key.Index()));
    if (key.SessionId() != signing_public_key_) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::InvalidState("Message key belongs to a different session"));
    }
    auto ratchet = key.Ratchet().Clone();
    if (ratchet.IsErr()) {
        return Result<Unit, BridgeFailure>::Err(std::move(ratchet).UnwrapErr());
    }
    latest_ratchet_ = std::move(ratchet).Unwrap();
    highest_accepted_ = key.Index();
    return Result<Unit, BridgeFailure>::Ok(unit);
}

Result<Unit, BridgeFailure> InboundGroupSession::ExtendBackTo(InboundGroupSession&& earlier) {
    if (earlier.signing_public_key_ != signing_public_key_) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::InvalidState("Cannot merge chains of different sessions"));
    }
    if (earlier.FirstKnownIndex() >= FirstKnownIndex()) {
        return Result<Unit, BridgeFailure>::Ok(unit);
    }
    initial_ratchet_ = std::move(earlier.initial_ratchet_);
    signing_key_verified_ = signing_key_verified_ || earlier.signing_key_verified_;
    return Result<Unit, BridgeFailure>::Ok(unit);
}

} // namespace uabridge::megolm
