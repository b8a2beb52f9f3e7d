#include "uabridge/megolm/outbound_group_session.hpp"
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/core/constants.hpp"

#include "megolm/session_state.pb.h"

#include <format>
#include <google/protobuf/util/time_util.h>

namespace uabridge::megolm {

using crypto::SodiumInterop;
using google::protobuf::util::TimeUtil;

OutboundGroupSession::OutboundGroupSession(
    MegolmRatchet ratchet,
    SecureMemoryHandle signing_secret_key,
    std::vector<uint8_t> signing_public_key,
    std::chrono::system_clock::time_point created_at) noexcept
    : ratchet_(std::move(ratchet))
    , signing_secret_key_(std::move(signing_secret_key))
    , signing_public_key_(std::move(signing_public_key))
    , created_at_(created_at) {}

Result<OutboundGroupSession, BridgeFailure> OutboundGroupSession::Create() {
    auto ratchet = MegolmRatchet::CreateRandom();
    if (ratchet.IsErr()) {
        return Result<OutboundGroupSession, BridgeFailure>::Err(std::move(ratchet).UnwrapErr());
    }
    auto keypair = SodiumInterop::GenerateEd25519KeyPair();
    if (keypair.IsErr()) {
        return Result<OutboundGroupSession, BridgeFailure>::Err(std::move(keypair).UnwrapErr());
    }
    auto [secret_key, public_key] = std::move(keypair).Unwrap();
    return Result<OutboundGroupSession, BridgeFailure>::Ok(OutboundGroupSession(
        std::move(ratchet).Unwrap(),
        std::move(secret_key),
        std::move(public_key),
        std::chrono::system_clock::now()));
}

Result<OutboundGroupSession, BridgeFailure> OutboundGroupSession::FromProtoState(
    const proto::megolm::OutboundSessionState& state) {
    if (state.signing_public_key().size() != Constants::ED_25519_PUBLIC_KEY_SIZE ||
        state.signing_secret_key().size() != Constants::ED_25519_SECRET_KEY_SIZE) {
        return Result<OutboundGroupSession, BridgeFailure>::Err(
            BridgeFailure::Persistence("Outbound session state has invalid signing key sizes"));
    }
    auto ratchet = MegolmRatchet::FromProtoState(state.ratchet());
    if (ratchet.IsErr()) {
        return Result<OutboundGroupSession, BridgeFailure>::Err(std::move(ratchet).UnwrapErr());
    }
    auto secret_key = SecureMemoryHandle::FromBytes(AsBytes(state.signing_secret_key()));
    if (secret_key.IsErr()) {
        return Result<OutboundGroupSession, BridgeFailure>::Err(
            BridgeFailure::FromSodiumFailure(secret_key.UnwrapErr()));
    }
    const auto public_key = AsBytes(state.signing_public_key());
    const auto created_at = std::chrono::system_clock::time_point(
        std::chrono::microseconds(TimeUtil::TimestampToMicroseconds(state.created_at())));
    return Result<OutboundGroupSession, BridgeFailure>::Ok(OutboundGroupSession(
        std::move(ratchet).Unwrap(),
        std::move(secret_key).Unwrap(),
        std::vector<uint8_t>(public_key.begin(), public_key.end()),
        created_at));
}

Result<proto::megolm::OutboundSessionState, BridgeFailure> OutboundGroupSession::ToProtoState() const {
    auto ratchet_state = ratchet_.ToProtoState();
    if (ratchet_state.IsErr()) {
        return Result<proto::megolm::OutboundSessionState, BridgeFailure>::Err(
            std::move(ratchet_state).UnwrapErr());
    }
    auto secret = signing_secret_key_.ReadBytes(Constants::ED_25519_SECRET_KEY_SIZE);
    if (secret.IsErr()) {
        return Result<proto::megolm::OutboundSessionState, BridgeFailure>::Err(
            BridgeFailure::FromSodiumFailure(secret.UnwrapErr()));
    }

    proto::megolm::OutboundSessionState state;
    *state.mutable_ratchet() = std::move(ratchet_state).Unwrap();
    state.set_signing_public_key(signing_public_key_.data(), signing_public_key_.size());
    state.set_signing_secret_key(secret.Unwrap().data(), secret.Unwrap().size());
    *state.mutable_created_at() = TimeUtil::MicrosecondsToTimestamp(
        std::chrono::duration_cast<std::chrono::microseconds>(created_at_.time_since_epoch()).count());
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(secret.Unwrap()));
    return Result<proto::megolm::OutboundSessionState, BridgeFailure>::Ok(std::move(state));
}

Result<OutboundMessageKey, BridgeFailure> OutboundGroupSession::NextMessageKey() {
    auto snapshot = ratchet_.Clone();
    if (snapshot.IsErr()) {
        return Result<OutboundMessageKey, BridgeFailure>::Err(std::move(snapshot).UnwrapErr());
    }
    auto signing_key = signing_secret_key_.Clone();
    if (signing_key.IsErr()) {
        return Result<OutboundMessageKey, BridgeFailure>::Err(
            BridgeFailure::FromSodiumFailure(signing_key.UnwrapErr()));
    }
    UABRIDGE_TRY(ratchet_.Advance());
    return Result<OutboundMessageKey, BridgeFailure>::Ok(OutboundMessageKey(
        std::move(snapshot).Unwrap(),
        std::move(signing_key).Unwrap(),
        signing_public_key_));
}

Result<std::string, BridgeFailure> OutboundGroupSession::ExportSessionKey() const {
    auto ratchet_bytes = ratchet_.Data().ReadBytes(MegolmConstants::RATCHET_LENGTH);
    if (ratchet_bytes.IsErr()) {
        return Result<std::string, BridgeFailure>::Err(
            BridgeFailure::FromSodiumFailure(ratchet_bytes.UnwrapErr()));
    }

    const uint32_t index = ratchet_.Counter();
    std::vector<uint8_t> key;
    key.reserve(MegolmConstants::SESSION_KEY_LENGTH);
    key.push_back(MegolmConstants::SESSION_KEY_VERSION);
    key.push_back(static_cast<uint8_t>(index >> 24));
    key.push_back(static_cast<uint8_t>(index >> 16));
    key.push_back(static_cast<uint8_t>(index >> 8));
    key.push_back(static_cast<uint8_t>(index));
    key.insert(key.end(), ratchet_bytes.Unwrap().begin(), ratchet_bytes.Unwrap().end());
    key.insert(key.end(), signing_public_key_.begin(), signing_public_key_.end());
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(ratchet_bytes.Unwrap()));

    auto signature = SodiumInterop::SignDetached(signing_secret_key_, key);
    if (signature.IsErr()) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(key));
        return Result<std::string, BridgeFailure>::Err(std::move(signature).UnwrapErr());
    }
    key.insert(key.end(), signature.Unwrap().begin(), signature.Unwrap().end());

    auto encoded = SodiumInterop::ToBase64(key);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(key));
    return Result<std::string, BridgeFailure>::Ok(std::move(encoded));
}

} // namespace uabridge::megolm
