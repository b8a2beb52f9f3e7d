#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/crypto/sodium_secure_memory_handle.hpp"

#include <format>

namespace uabridge::crypto {

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                std::format("Buffer size {} exceeds maximum {}", buffer.size(), MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<const uint8_t> buffer) {
    return SecureWipe(std::span<uint8_t>(
        const_cast<uint8_t*>(buffer.data()),
        buffer.size()));
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, BridgeFailure>
SodiumInterop::GenerateEd25519KeyPair() {
    using ResultType = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, BridgeFailure>;

    auto sk_handle_result = SecureMemoryHandle::Allocate(Constants::ED_25519_SECRET_KEY_SIZE);
    if (sk_handle_result.IsErr()) {
        return ResultType::Err(BridgeFailure::FromSodiumFailure(sk_handle_result.UnwrapErr()));
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();

    std::vector<uint8_t> pk(Constants::ED_25519_PUBLIC_KEY_SIZE);
    auto keypair_result = sk_handle.WithWriteAccess([&pk](std::span<uint8_t> sk) {
        return crypto_sign_keypair(pk.data(), sk.data());
    });
    if (keypair_result.IsErr()) {
        return ResultType::Err(BridgeFailure::FromSodiumFailure(keypair_result.UnwrapErr()));
    }
    if (keypair_result.Unwrap() != 0) {
        return ResultType::Err(BridgeFailure::Crypto("Failed to generate Ed25519 key pair"));
    }

    return ResultType::Ok(std::make_pair(std::move(sk_handle), std::move(pk)));
}

Result<std::vector<uint8_t>, BridgeFailure> SodiumInterop::SignDetached(
    const SecureMemoryHandle& secret_key,
    std::span<const uint8_t> message) {
    if (secret_key.Size() != Constants::ED_25519_SECRET_KEY_SIZE) {
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(
            BridgeFailure::Crypto(std::format(
                "Ed25519 secret key must be {} bytes, got {}",
                Constants::ED_25519_SECRET_KEY_SIZE, secret_key.Size())));
    }

    std::vector<uint8_t> signature(Constants::ED_25519_SIGNATURE_SIZE);
    auto sign_result = secret_key.WithReadAccess([&](std::span<const uint8_t> sk) {
        return crypto_sign_detached(signature.data(), nullptr, message.data(), message.size(), sk.data());
    });
    if (sign_result.IsErr()) {
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(
            BridgeFailure::FromSodiumFailure(sign_result.UnwrapErr()));
    }
    if (sign_result.Unwrap() != 0) {
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(
            BridgeFailure::Crypto("Ed25519 signing failed"));
    }
    return Result<std::vector<uint8_t>, BridgeFailure>::Ok(std::move(signature));
}

bool SodiumInterop::VerifyDetached(
    std::span<const uint8_t> public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) noexcept {
    if (public_key.size() != Constants::ED_25519_PUBLIC_KEY_SIZE ||
        signature.size() != Constants::ED_25519_SIGNATURE_SIZE) {
        return false;
    }
    return crypto_sign_verify_detached(
        signature.data(), message.data(), message.size(), public_key.data()) == 0;
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

uint32_t SodiumInterop::GenerateRandomUInt32(uint32_t upper_bound) {
    return randombytes_uniform(upper_bound);
}

std::string SodiumInterop::ToBase64(std::span<const uint8_t> data) {
    constexpr int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string encoded(sodium_base64_encoded_len(data.size(), variant), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), variant);
    encoded.resize(std::char_traits<char>::length(encoded.c_str()));
    return encoded;
}

Result<std::vector<uint8_t>, BridgeFailure> SodiumInterop::FromBase64(std::string_view encoded) {
    // libolm exports are unpadded, so both forms are accepted.
    for (const int variant : {sodium_base64_VARIANT_ORIGINAL, sodium_base64_VARIANT_ORIGINAL_NO_PADDING}) {
        std::vector<uint8_t> decoded(encoded.size() / 4 * 3 + 3);
        size_t decoded_len = 0;
        const char* end = nullptr;
        if (sodium_base642bin(decoded.data(), decoded.size(),
                              encoded.data(), encoded.size(),
                              " \t\r\n", &decoded_len, &end, variant) == 0 &&
            end == encoded.data() + encoded.size()) {
            decoded.resize(decoded_len);
            return Result<std::vector<uint8_t>, BridgeFailure>::Ok(std::move(decoded));
        }
    }
    return Result<std::vector<uint8_t>, BridgeFailure>::Err(
        BridgeFailure::Decoding("Malformed base64 input"));
}

std::string SodiumInterop::ToHex(std::span<const uint8_t> data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.pop_back();
    return hex;
}

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace uabridge::crypto
