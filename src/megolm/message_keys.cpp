#include "uabridge/megolm/message_keys.hpp"
#include "uabridge/crypto/aes_sha256_cipher.hpp"
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/core/constants.hpp"

#include <format>

namespace uabridge::megolm {

using crypto::AesSha256Cipher;
using crypto::SodiumInterop;

namespace {
    Result<AesSha256Cipher, BridgeFailure> CipherFor(const MegolmRatchet& ratchet) {
        auto result = ratchet.Data().WithReadAccess([](std::span<const uint8_t> data) {
            return AesSha256Cipher::Create(data, MegolmConstants::MESSAGE_KEYS_INFO);
        });
        if (result.IsErr()) {
            return Result<AesSha256Cipher, BridgeFailure>::Err(
                BridgeFailure::FromSodiumFailure(result.UnwrapErr()));
        }
        return std::move(result).Unwrap();
    }
}

OutboundMessageKey::OutboundMessageKey(
    MegolmRatchet ratchet,
    SecureMemoryHandle signing_key,
    std::vector<uint8_t> session_id) noexcept
    : ratchet_(std::move(ratchet))
    , signing_key_(std::move(signing_key))
    , session_id_(std::move(session_id)) {}

Result<CiphertextMessage, BridgeFailure> OutboundMessageKey::Seal(std::span<const uint8_t> plaintext) {
    if (used_) {
        return Result<CiphertextMessage, BridgeFailure>::Err(
            BridgeFailure::InvalidState(std::format(
                "Message key {} has already been used", Index())));
    }
    used_ = true;

    auto cipher = CipherFor(ratchet_);
    if (cipher.IsErr()) {
        return Result<CiphertextMessage, BridgeFailure>::Err(std::move(cipher).UnwrapErr());
    }
    auto ciphertext = cipher.Unwrap().Encrypt(plaintext);
    if (ciphertext.IsErr()) {
        return Result<CiphertextMessage, BridgeFailure>::Err(std::move(ciphertext).UnwrapErr());
    }

    CiphertextMessage message;
    message.set_version(MegolmConstants::MESSAGE_VERSION);
    message.set_session_id(session_id_.data(), session_id_.size());
    message.set_message_index(Index());
    const auto& ct = ciphertext.Unwrap();
    message.set_ciphertext(ct.data(), ct.size());

    auto mac = cipher.Unwrap().Mac(BuildAuthenticatedHeader(message), MegolmConstants::MAC_LENGTH);
    if (mac.IsErr()) {
        return Result<CiphertextMessage, BridgeFailure>::Err(std::move(mac).UnwrapErr());
    }
    message.set_mac(mac.Unwrap().data(), mac.Unwrap().size());

    auto signature = SodiumInterop::SignDetached(signing_key_, BuildSignedContent(message));
    if (signature.IsErr()) {
        return Result<CiphertextMessage, BridgeFailure>::Err(std::move(signature).UnwrapErr());
    }
    message.set_signature(signature.Unwrap().data(), signature.Unwrap().size());

    return Result<CiphertextMessage, BridgeFailure>::Ok(std::move(message));
}

InboundMessageKey::InboundMessageKey(MegolmRatchet ratchet, std::vector<uint8_t> session_id) noexcept
    : ratchet_(std::move(ratchet))
    , session_id_(std::move(session_id)) {}

Result<std::vector<uint8_t>, BridgeFailure> InboundMessageKey::Open(const CiphertextMessage& message) const {
    if (message.message_index() != Index()) {
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(
            BridgeFailure::Crypto(std::format(
                "Message index {} does not match derived key index {}",
                message.message_index(), Index())));
    }
    if (!SodiumInterop::ConstantTimeEquals(AsBytes(message.session_id()), session_id_)) {
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(
            BridgeFailure::Crypto(std::string(ErrorMessages::UNKNOWN_SESSION)));
    }
    if (!SodiumInterop::VerifyDetached(session_id_, BuildSignedContent(message), AsBytes(message.signature()))) {
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(
            BridgeFailure::Crypto(std::string(ErrorMessages::BAD_SIGNATURE)));
    }

    auto cipher = CipherFor(ratchet_);
    if (cipher.IsErr()) {
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(std::move(cipher).UnwrapErr());
    }
    auto mac_ok = cipher.Unwrap().VerifyMac(BuildAuthenticatedHeader(message), AsBytes(message.mac()));
    if (mac_ok.IsErr()) {
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(std::move(mac_ok).UnwrapErr());
    }
    if (!mac_ok.Unwrap()) {
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(
            BridgeFailure::Crypto(std::string(ErrorMessages::MAC_MISMATCH)));
    }
    return cipher.Unwrap().Decrypt(AsBytes(message.ciphertext()));
}

} // namespace uabridge::megolm
