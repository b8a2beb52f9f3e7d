#include "uabridge/crypto/aes_sha256_cipher.hpp"
#include "uabridge/crypto/hkdf.hpp"
#include "uabridge/crypto/hmac_sha256.hpp"
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/core/constants.hpp"
#include <format>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <memory>
namespace uabridge::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    constexpr size_t AES_KEY_OFFSET = 0;
    constexpr size_t MAC_KEY_OFFSET = Constants::AES_KEY_SIZE;
    constexpr size_t IV_OFFSET = MAC_KEY_OFFSET + Constants::HMAC_SHA256_KEY_SIZE;

    Result<std::vector<uint8_t>, BridgeFailure> RunCipher(
        std::span<const uint8_t> keys,
        std::span<const uint8_t> input,
        const bool encrypt) {
        EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return Result<std::vector<uint8_t>, BridgeFailure>::Err(
                BridgeFailure::Crypto(
                    std::format("Failed to create cipher context: {}", GetOpenSSLError())));
        }
        const uint8_t* aes_key = keys.data() + AES_KEY_OFFSET;
        const uint8_t* iv = keys.data() + IV_OFFSET;
        if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, aes_key, iv,
                              encrypt ? 1 : 0) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, BridgeFailure>::Err(
                BridgeFailure::Crypto(
                    std::format("Failed to initialize AES-256-CBC: {}", GetOpenSSLError())));
        }
        std::vector<uint8_t> output(input.size() + Constants::AES_BLOCK_SIZE);
        int out_len = 0;
        if (EVP_CipherUpdate(ctx.get(), output.data(), &out_len,
                             input.data(), static_cast<int>(input.size())) != OpenSSL::SUCCESS) {
            (void)SodiumInterop::SecureWipe(std::span<uint8_t>(output));
            return Result<std::vector<uint8_t>, BridgeFailure>::Err(
                BridgeFailure::Crypto(
                    std::format("AES-256-CBC update failed: {}", GetOpenSSLError())));
        }
        int final_len = 0;
        if (EVP_CipherFinal_ex(ctx.get(), output.data() + out_len, &final_len) != OpenSSL::SUCCESS) {
            (void)SodiumInterop::SecureWipe(std::span<uint8_t>(output));
            return Result<std::vector<uint8_t>, BridgeFailure>::Err(
                BridgeFailure::Crypto(encrypt
                    ? std::format("AES-256-CBC finalization failed: {}", GetOpenSSLError())
                    : std::string("Invalid padding in decrypted message")));
        }
        output.resize(static_cast<size_t>(out_len + final_len));
        return Result<std::vector<uint8_t>, BridgeFailure>::Ok(std::move(output));
    }
}
Result<AesSha256Cipher, BridgeFailure> AesSha256Cipher::Create(
    std::span<const uint8_t> key,
    std::string_view info) {
    auto handle_result = SecureMemoryHandle::Allocate(DERIVED_KEYS_SIZE);
    if (handle_result.IsErr()) {
        return Result<AesSha256Cipher, BridgeFailure>::Err(
            BridgeFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    SecureMemoryHandle derived = std::move(handle_result).Unwrap();
    const std::span<const uint8_t> info_bytes(
        reinterpret_cast<const uint8_t*>(info.data()), info.size());
    auto derive_result = derived.WithWriteAccess([&](std::span<uint8_t> out) {
        return Hkdf::DeriveKey(key, out, {}, info_bytes);
    });
    if (derive_result.IsErr()) {
        return Result<AesSha256Cipher, BridgeFailure>::Err(
            BridgeFailure::FromSodiumFailure(derive_result.UnwrapErr()));
    }
    UABRIDGE_TRY(derive_result.Unwrap());
    return Result<AesSha256Cipher, BridgeFailure>::Ok(AesSha256Cipher(std::move(derived)));
}
Result<std::vector<uint8_t>, BridgeFailure> AesSha256Cipher::Encrypt(
    std::span<const uint8_t> plaintext) const {
    auto result = derived_.WithReadAccess([&](std::span<const uint8_t> keys) {
        return RunCipher(keys, plaintext, true);
    });
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(
            BridgeFailure::FromSodiumFailure(result.UnwrapErr()));
    }
    return std::move(result).Unwrap();
}
Result<std::vector<uint8_t>, BridgeFailure> AesSha256Cipher::Decrypt(
    std::span<const uint8_t> ciphertext) const {
    if (ciphertext.empty() || ciphertext.size() % Constants::AES_BLOCK_SIZE != 0) {
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(
            BridgeFailure::Crypto(std::format(
                "Ciphertext length {} is not a positive multiple of the AES block size",
                ciphertext.size())));
    }
    auto result = derived_.WithReadAccess([&](std::span<const uint8_t> keys) {
        return RunCipher(keys, ciphertext, false);
    });
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(
            BridgeFailure::FromSodiumFailure(result.UnwrapErr()));
    }
    return std::move(result).Unwrap();
}
Result<std::vector<uint8_t>, BridgeFailure> AesSha256Cipher::Mac(
    std::span<const uint8_t> data,
    const size_t length) const {
    if (length == 0 || length > HmacSha256::OUTPUT_LEN) {
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(
            BridgeFailure::Crypto(std::format("Invalid MAC length {}", length)));
    }
    auto result = derived_.WithReadAccess([&](std::span<const uint8_t> keys) {
        return HmacSha256::ComputeBytes(
            keys.subspan(MAC_KEY_OFFSET, Constants::HMAC_SHA256_KEY_SIZE), data);
    });
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(
            BridgeFailure::FromSodiumFailure(result.UnwrapErr()));
    }
    auto mac_result = std::move(result).Unwrap();
    if (mac_result.IsErr()) {
        return mac_result;
    }
    auto mac = std::move(mac_result).Unwrap();
    mac.resize(length);
    return Result<std::vector<uint8_t>, BridgeFailure>::Ok(std::move(mac));
}
Result<bool, BridgeFailure> AesSha256Cipher::VerifyMac(
    std::span<const uint8_t> data,
    std::span<const uint8_t> mac) const {
    auto expected = Mac(data, mac.size());
    if (expected.IsErr()) {
        return Result<bool, BridgeFailure>::Err(std::move(expected).UnwrapErr());
    }
    return Result<bool, BridgeFailure>::Ok(
        SodiumInterop::ConstantTimeEquals(expected.Unwrap(), mac));
}
}
