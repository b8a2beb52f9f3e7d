#include "uabridge/crypto/hmac_sha256.hpp"
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/core/constants.hpp"

#include <format>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include <array>
#include <cstring>
#include <memory>
#include <string>

namespace uabridge::crypto {

namespace {
    struct EVP_MAC_Deleter {
        void operator()(EVP_MAC* mac) const { EVP_MAC_free(mac); }
    };
    struct EVP_MAC_CTX_Deleter {
        void operator()(EVP_MAC_CTX* ctx) const { EVP_MAC_CTX_free(ctx); }
    };
}

Result<Unit, BridgeFailure> HmacSha256::Compute(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data,
    std::span<uint8_t> output) {

    if (output.size() != OUTPUT_LEN) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::Crypto(std::format(
                "HMAC-SHA256 output buffer must be {} bytes, got {}", OUTPUT_LEN, output.size())));
    }

    std::unique_ptr<EVP_MAC, EVP_MAC_Deleter> mac(
        EVP_MAC_fetch(nullptr, std::string(OpenSSLConstants::ALGORITHM_HMAC).c_str(), nullptr));
    if (!mac) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::Crypto("Failed to fetch HMAC algorithm"));
    }
    std::unique_ptr<EVP_MAC_CTX, EVP_MAC_CTX_Deleter> ctx(EVP_MAC_CTX_new(mac.get()));
    if (!ctx) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::Crypto("Failed to create HMAC context"));
    }

    OSSL_PARAM params[2];
    params[0] = OSSL_PARAM_construct_utf8_string(
        OSSL_MAC_PARAM_DIGEST, const_cast<char*>("SHA256"), 0);
    params[1] = OSSL_PARAM_construct_end();

    // An empty HMAC key is valid; OpenSSL rejects a null pointer.
    static constexpr uint8_t empty_key = 0;
    const uint8_t* key_ptr = key.empty() ? &empty_key : key.data();

    if (EVP_MAC_init(ctx.get(), key_ptr, key.size(), params) != OpenSSLConstants::SUCCESS ||
        EVP_MAC_update(ctx.get(), data.data(), data.size()) != OpenSSLConstants::SUCCESS) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::Crypto("HMAC-SHA256 computation failed"));
    }

    std::array<uint8_t, OUTPUT_LEN> digest{};
    size_t digest_len = 0;
    if (EVP_MAC_final(ctx.get(), digest.data(), &digest_len, digest.size()) != OpenSSLConstants::SUCCESS ||
        digest_len != OUTPUT_LEN) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::Crypto("HMAC-SHA256 finalization failed"));
    }

    std::memcpy(output.data(), digest.data(), OUTPUT_LEN);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(digest));
    return Result<Unit, BridgeFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, BridgeFailure> HmacSha256::ComputeBytes(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data) {

    std::vector<uint8_t> output(OUTPUT_LEN);
    UABRIDGE_TRY(Compute(key, data, output));
    return Result<std::vector<uint8_t>, BridgeFailure>::Ok(std::move(output));
}

} // namespace uabridge::crypto
