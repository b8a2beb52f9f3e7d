#pragma once

#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"
#include "uabridge/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace uabridge::crypto {

class SecureMemoryHandle;

/**
 * @brief Interop layer for libsodium
 *
 * Random numbers, secure memory, constant-time comparison, Ed25519 signing
 * and base64. Every entry point except Initialize() requires a prior
 * successful Initialize().
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are cleared through a volatile pointer, large ones with
     * sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    static Result<Unit, SodiumFailure> SecureWipe(std::span<const uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal.
     */
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    /**
     * @brief Generate an Ed25519 key pair
     *
     * @return Ok((secret_key, public_key)) with the secret key in secure memory
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, BridgeFailure>
    GenerateEd25519KeyPair();

    static Result<std::vector<uint8_t>, BridgeFailure> SignDetached(
        const SecureMemoryHandle& secret_key,
        std::span<const uint8_t> message);

    static bool VerifyDetached(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) noexcept;

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /**
     * @brief Uniform random value in [0, upper_bound)
     */
    static uint32_t GenerateRandomUInt32(uint32_t upper_bound);

    static std::string ToBase64(std::span<const uint8_t> data);

    static Result<std::vector<uint8_t>, BridgeFailure> FromBase64(std::string_view encoded);

    static std::string ToHex(std::span<const uint8_t> data);

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace uabridge::crypto
