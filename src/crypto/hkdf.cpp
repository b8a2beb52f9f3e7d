#include "uabridge/crypto/hkdf.hpp"
#include "uabridge/core/constants.hpp"

#include <format>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>

#include <memory>
#include <string>

namespace uabridge::crypto {

namespace {
    struct EVP_KDF_Deleter {
        void operator()(EVP_KDF* kdf) const { EVP_KDF_free(kdf); }
    };
    struct EVP_KDF_CTX_Deleter {
        void operator()(EVP_KDF_CTX* ctx) const { EVP_KDF_CTX_free(ctx); }
    };
}

Result<Unit, BridgeFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::Crypto(std::format(
                "HKDF output size exceeds maximum allowed: {} > {}", output.size(), MAX_OUTPUT_LEN)));
    }

    if (ikm.empty()) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::Crypto("HKDF input key material cannot be empty"));
    }

    std::unique_ptr<EVP_KDF, EVP_KDF_Deleter> kdf(
        EVP_KDF_fetch(nullptr, std::string(OpenSSLConstants::ALGORITHM_HKDF).c_str(), nullptr));
    if (!kdf) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::Crypto("Failed to fetch HKDF algorithm"));
    }

    std::unique_ptr<EVP_KDF_CTX, EVP_KDF_CTX_Deleter> kctx(EVP_KDF_CTX_new(kdf.get()));
    if (!kctx) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::Crypto("Failed to create HKDF context"));
    }

    OSSL_PARAM params[5];
    int param_idx = 0;
    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OSSL_KDF_PARAM_DIGEST, const_cast<char*>("SHA256"), 0);
    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_KEY, const_cast<uint8_t*>(ikm.data()), ikm.size());
    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
    }
    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_INFO, const_cast<uint8_t*>(info.data()), info.size());
    }
    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSLConstants::SUCCESS) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::Crypto("HKDF key derivation failed"));
    }

    return Result<Unit, BridgeFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, BridgeFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    std::vector<uint8_t> output(output_size);
    UABRIDGE_TRY(DeriveKey(ikm, output, salt, info));
    return Result<std::vector<uint8_t>, BridgeFailure>::Ok(std::move(output));
}

} // namespace uabridge::crypto
