#include "uabridge/session/pickle_codec.hpp"
#include "uabridge/crypto/aes_sha256_cipher.hpp"
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/core/constants.hpp"

#include "megolm/session_state.pb.h"

#include <format>

#include <string>

namespace uabridge::session {

using crypto::AesSha256Cipher;
using crypto::SodiumInterop;

namespace {

    Result<AesSha256Cipher, BridgeFailure> CipherFor(
        interfaces::IStateKeyProvider& provider,
        std::span<const uint8_t> nonce) {
        auto key = provider.GetStateEncryptionKey();
        if (key.IsErr()) {
            return Result<AesSha256Cipher, BridgeFailure>::Err(std::move(key).UnwrapErr());
        }
        std::string info(MegolmConstants::PICKLE_INFO);
        info.append(reinterpret_cast<const char*>(nonce.data()), nonce.size());
        auto cipher = key.Unwrap().WithReadAccess([&info](std::span<const uint8_t> key_bytes) {
            return AesSha256Cipher::Create(key_bytes, info);
        });
        if (cipher.IsErr()) {
            return Result<AesSha256Cipher, BridgeFailure>::Err(
                BridgeFailure::FromSodiumFailure(cipher.UnwrapErr()));
        }
        return std::move(cipher).Unwrap();
    }

    std::vector<uint8_t> MacInput(std::span<const uint8_t> nonce, std::span<const uint8_t> payload) {
        std::vector<uint8_t> input(nonce.begin(), nonce.end());
        input.insert(input.end(), payload.begin(), payload.end());
        return input;
    }

    std::span<const uint8_t> AsBytes(const std::string& s) noexcept {
        return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
    }

}

PickleCodec::PickleCodec(std::shared_ptr<interfaces::IStateKeyProvider> key_provider)
    : key_provider_(std::move(key_provider)) {}

Result<std::vector<uint8_t>, BridgeFailure> PickleCodec::Encode(
    const proto::megolm::DeviceSessionState& state) const {
    using ResultType = Result<std::vector<uint8_t>, BridgeFailure>;

    std::string serialized;
    if (!state.SerializeToString(&serialized)) {
        return ResultType::Err(BridgeFailure::Persistence("Failed to serialize device session state"));
    }

    proto::megolm::PickledSessionState pickle;
    pickle.set_version(MegolmConstants::PICKLE_VERSION);

    if (!key_provider_) {
        pickle.set_encrypted(false);
        pickle.set_payload(std::move(serialized));
    } else {
        const auto nonce = SodiumInterop::GetRandomBytes(NONCE_SIZE);
        auto cipher = CipherFor(*key_provider_, nonce);
        if (cipher.IsErr()) {
            (void)SodiumInterop::SecureWipe(std::span<uint8_t>(
                reinterpret_cast<uint8_t*>(serialized.data()), serialized.size()));
            return ResultType::Err(std::move(cipher).UnwrapErr());
        }
        auto ciphertext = cipher.Unwrap().Encrypt(AsBytes(serialized));
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(
            reinterpret_cast<uint8_t*>(serialized.data()), serialized.size()));
        if (ciphertext.IsErr()) {
            return ResultType::Err(std::move(ciphertext).UnwrapErr());
        }
        auto mac = cipher.Unwrap().Mac(MacInput(nonce, ciphertext.Unwrap()), MegolmConstants::MAC_LENGTH);
        if (mac.IsErr()) {
            return ResultType::Err(std::move(mac).UnwrapErr());
        }
        pickle.set_encrypted(true);
        pickle.set_nonce(nonce.data(), nonce.size());
        pickle.set_payload(ciphertext.Unwrap().data(), ciphertext.Unwrap().size());
        pickle.set_mac(mac.Unwrap().data(), mac.Unwrap().size());
    }

    std::vector<uint8_t> bytes(pickle.ByteSizeLong());
    if (!pickle.SerializeToArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return ResultType::Err(BridgeFailure::Persistence("Failed to serialize pickle container"));
    }
    return ResultType::Ok(std::move(bytes));
}

Result<proto::megolm::DeviceSessionState, BridgeFailure> PickleCodec::Decode(
    std::span<const uint8_t> bytes) const {
    using ResultType = Result<proto::megolm::DeviceSessionState, BridgeFailure>;

    proto::megolm::PickledSessionState pickle;
    if (!pickle.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return ResultType::Err(BridgeFailure::Persistence("Corrupt pickle container"));
    }
    if (pickle.version() != MegolmConstants::PICKLE_VERSION) {
        return ResultType::Err(BridgeFailure::Persistence(
            std::format("Unsupported pickle version {}", pickle.version())));
    }

    proto::megolm::DeviceSessionState state;
    if (!pickle.encrypted()) {
        if (key_provider_) {
            return ResultType::Err(BridgeFailure::Persistence(
                "Refusing unencrypted session state while a state key is configured"));
        }
        if (!state.ParseFromString(pickle.payload())) {
            return ResultType::Err(BridgeFailure::Persistence("Corrupt device session state"));
        }
        return ResultType::Ok(std::move(state));
    }

    if (!key_provider_) {
        return ResultType::Err(BridgeFailure::Persistence(
            "Session state is encrypted but no state key is configured"));
    }
    if (pickle.nonce().size() != NONCE_SIZE || pickle.mac().size() != MegolmConstants::MAC_LENGTH) {
        return ResultType::Err(BridgeFailure::Persistence("Encrypted pickle has invalid field sizes"));
    }

    auto cipher = CipherFor(*key_provider_, AsBytes(pickle.nonce()));
    if (cipher.IsErr()) {
        return ResultType::Err(std::move(cipher).UnwrapErr());
    }
    auto mac_ok = cipher.Unwrap().VerifyMac(
        MacInput(AsBytes(pickle.nonce()), AsBytes(pickle.payload())), AsBytes(pickle.mac()));
    if (mac_ok.IsErr()) {
        return ResultType::Err(std::move(mac_ok).UnwrapErr());
    }
    if (!mac_ok.Unwrap()) {
        return ResultType::Err(BridgeFailure::Persistence(
            "Session state authentication failed (wrong state key or tampered file)"));
    }
    auto plaintext = cipher.Unwrap().Decrypt(AsBytes(pickle.payload()));
    if (plaintext.IsErr()) {
        return ResultType::Err(BridgeFailure::Persistence(std::move(plaintext).UnwrapErr().message));
    }
    const bool parsed = state.ParseFromArray(plaintext.Unwrap().data(), static_cast<int>(plaintext.Unwrap().size()));
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(plaintext.Unwrap()));
    if (!parsed) {
        return ResultType::Err(BridgeFailure::Persistence("Corrupt device session state"));
    }
    return ResultType::Ok(std::move(state));
}

}
