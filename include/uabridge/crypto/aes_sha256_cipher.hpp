#pragma once
#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"
#include "uabridge/crypto/sodium_secure_memory_handle.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
namespace uabridge::crypto {

/**
 * AES-256-CBC with PKCS#7 padding, authenticated by a truncated HMAC-SHA256.
 *
 * A cipher instance is bound to one key: HKDF-SHA256(key, info) expands to
 * an AES key, an HMAC key and the IV. The IV is therefore fixed per key, so a
 * key must never encrypt more than one plaintext. Megolm guarantees that by
 * deriving a fresh key from every ratchet step.
 */
class AesSha256Cipher {
public:
    [[nodiscard]] static Result<AesSha256Cipher, BridgeFailure> Create(
        std::span<const uint8_t> key,
        std::string_view info);

    [[nodiscard]] Result<std::vector<uint8_t>, BridgeFailure> Encrypt(
        std::span<const uint8_t> plaintext) const;

    [[nodiscard]] Result<std::vector<uint8_t>, BridgeFailure> Decrypt(
        std::span<const uint8_t> ciphertext) const;

    /**
     * @brief First `length` bytes of HMAC-SHA256(mac_key, data)
     */
    [[nodiscard]] Result<std::vector<uint8_t>, BridgeFailure> Mac(
        std::span<const uint8_t> data,
        size_t length) const;

    [[nodiscard]] Result<bool, BridgeFailure> VerifyMac(
        std::span<const uint8_t> data,
        std::span<const uint8_t> mac) const;

    static constexpr size_t DERIVED_KEYS_SIZE = 32 + 32 + 16;

private:
    explicit AesSha256Cipher(SecureMemoryHandle derived) noexcept
        : derived_(std::move(derived)) {}

    SecureMemoryHandle derived_;
};
}
