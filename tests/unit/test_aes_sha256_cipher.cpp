#include <catch2/catch_test_macros.hpp>
#include "uabridge/crypto/aes_sha256_cipher.hpp"
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/core/constants.hpp"

#include <string>
#include <vector>

using namespace uabridge;
using namespace uabridge::crypto;

namespace {
    std::vector<uint8_t> Bytes(const std::string& s) {
        return {s.begin(), s.end()};
    }
}

TEST_CASE("AesSha256Cipher - Encrypt and decrypt", "[aes][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = SodiumInterop::GetRandomBytes(32);
    auto cipher = AesSha256Cipher::Create(key, MegolmConstants::MESSAGE_KEYS_INFO).Unwrap();

    SECTION("Ciphertext is padded to whole blocks") {
        for (const size_t len : {size_t{0}, size_t{1}, size_t{15}, size_t{16}, size_t{100}}) {
            const std::vector<uint8_t> plaintext(len, 0x42);
            auto ciphertext = cipher.Encrypt(plaintext).Unwrap();
            REQUIRE(ciphertext.size() % Constants::AES_BLOCK_SIZE == 0);
            REQUIRE(ciphertext.size() > len);
            REQUIRE(cipher.Decrypt(ciphertext).Unwrap() == plaintext);
        }
    }

    SECTION("Same key and info derive the same IV") {
        auto other = AesSha256Cipher::Create(key, MegolmConstants::MESSAGE_KEYS_INFO).Unwrap();
        const auto plaintext = Bytes(R"({"value":21.5})");
        REQUIRE(cipher.Encrypt(plaintext).Unwrap() == other.Encrypt(plaintext).Unwrap());
    }

    SECTION("Info string separates key material") {
        auto other = AesSha256Cipher::Create(key, MegolmConstants::PICKLE_INFO).Unwrap();
        const auto plaintext = Bytes("temperature");
        REQUIRE(cipher.Encrypt(plaintext).Unwrap() != other.Encrypt(plaintext).Unwrap());
    }

    SECTION("Ciphertext that is not block aligned is rejected") {
        auto result = cipher.Decrypt(std::vector<uint8_t>(17, 0));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == BridgeFailureType::Crypto);
        REQUIRE(cipher.Decrypt(std::vector<uint8_t>{}).IsErr());
    }
}

TEST_CASE("AesSha256Cipher - Truncated MAC", "[aes][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = SodiumInterop::GetRandomBytes(32);
    auto cipher = AesSha256Cipher::Create(key, MegolmConstants::MESSAGE_KEYS_INFO).Unwrap();
    const auto data = Bytes("header|ciphertext");

    auto mac = cipher.Mac(data, MegolmConstants::MAC_LENGTH).Unwrap();
    REQUIRE(mac.size() == MegolmConstants::MAC_LENGTH);

    SECTION("Untouched data verifies") {
        REQUIRE(cipher.VerifyMac(data, mac).Unwrap());
    }

    SECTION("Flipped data bit fails") {
        auto tampered = data;
        tampered.back() ^= 0x01;
        REQUIRE_FALSE(cipher.VerifyMac(tampered, mac).Unwrap());
    }

    SECTION("Flipped MAC bit fails") {
        mac[0] ^= 0x80;
        REQUIRE_FALSE(cipher.VerifyMac(data, mac).Unwrap());
    }

    SECTION("MAC under another key fails") {
        auto other = AesSha256Cipher::Create(SodiumInterop::GetRandomBytes(32),
                                             MegolmConstants::MESSAGE_KEYS_INFO).Unwrap();
        REQUIRE_FALSE(other.VerifyMac(data, mac).Unwrap());
    }

    SECTION("Out of range lengths are errors") {
        REQUIRE(cipher.Mac(data, 0).IsErr());
        REQUIRE(cipher.Mac(data, 33).IsErr());
    }
}
