#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "uabridge/core/constants.hpp"
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/megolm/group_message.hpp"
#include "uabridge/protection/encryption_engine.hpp"
#include "uabridge/session/ratchet_session_store.hpp"
#include "helpers/memory_state_store.hpp"

#include <string>
#include <vector>

using namespace uabridge;
using crypto::SodiumInterop;
using Catch::Matchers::ContainsSubstring;
using test_helpers::MemoryStateStore;

namespace {
    codec::TelemetryEnvelope Reading(const std::string& device, const uint64_t sequence) {
        codec::TelemetryEnvelope envelope;
        envelope.device_id = device;
        envelope.feature = "Pressure";
        envelope.node = "ns=2;s=Line1.Pressure";
        envelope.value = 4.2;
        envelope.sequence = sequence;
        return envelope;
    }

    std::vector<uint8_t> Wire(const megolm::CiphertextMessage& message) {
        return megolm::SerializeMessage(message).Unwrap();
    }
}

TEST_CASE("Tampering - Every field is authenticated", "[security][megolm][tamper]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto backing = std::make_shared<MemoryStateStore>();
    auto sessions = std::make_shared<session::RatchetSessionStore>(backing, session::PickleCodec());
    const auto engine = protection::EncryptionEngine::Create(sessions);

    const auto genuine = engine.Protect(true, Reading("press-4", 1)).Unwrap();
    const auto message = megolm::ParseMessage(genuine).Unwrap();

    SECTION("Flipped ciphertext byte") {
        auto forged = message;
        std::string ciphertext = forged.ciphertext();
        ciphertext[0] = static_cast<char>(ciphertext[0] ^ 0x80);
        forged.set_ciphertext(ciphertext);
        auto result = engine.Unprotect(true, "press-4", Wire(forged));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == BridgeFailureType::Crypto);
        REQUIRE_THAT(result.UnwrapErr().message, ContainsSubstring(std::string(ErrorMessages::BAD_SIGNATURE)));
    }

    SECTION("Flipped MAC byte") {
        auto forged = message;
        std::string mac = forged.mac();
        mac.back() = static_cast<char>(mac.back() ^ 0x01);
        forged.set_mac(mac);
        REQUIRE(engine.Unprotect(true, "press-4", Wire(forged)).IsErr());
    }

    SECTION("Stripped signature") {
        auto forged = message;
        forged.set_signature(std::string(forged.signature().size(), '\0'));
        REQUIRE(engine.Unprotect(true, "press-4", Wire(forged)).IsErr());
    }

    SECTION("Moved to a later index") {
        auto forged = message;
        forged.set_message_index(message.message_index() + 5);
        REQUIRE(engine.Unprotect(true, "press-4", Wire(forged)).IsErr());
    }

    SECTION("Unsupported version") {
        auto forged = message;
        forged.set_version(MegolmConstants::MESSAGE_VERSION + 1);
        REQUIRE(megolm::ParseMessage(Wire(forged)).IsErr());
        REQUIRE(engine.Unprotect(true, "press-4", Wire(forged)).IsErr());
    }

    SECTION("Truncated payload") {
        const std::vector<uint8_t> truncated(genuine.begin(), genuine.begin() + static_cast<std::ptrdiff_t>(genuine.size() / 2));
        REQUIRE(engine.Unprotect(true, "press-4", truncated).IsErr());
    }

    SECTION("Rejected forgeries do not consume the index") {
        auto forged = message;
        std::string ciphertext = forged.ciphertext();
        ciphertext.back() = static_cast<char>(ciphertext.back() ^ 0x01);
        forged.set_ciphertext(ciphertext);
        for (int i = 0; i < 3; ++i) {
            REQUIRE(engine.Unprotect(true, "press-4", Wire(forged)).IsErr());
        }
        auto opened = engine.Unprotect(true, "press-4", genuine);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == Reading("press-4", 1));
    }
}

TEST_CASE("Tampering - Messages are bound to their device", "[security][megolm][tamper]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto backing = std::make_shared<MemoryStateStore>();
    auto sessions = std::make_shared<session::RatchetSessionStore>(backing, session::PickleCodec());
    const auto engine = protection::EncryptionEngine::Create(sessions);

    const auto from_pump = engine.Protect(true, Reading("pump-1", 1)).Unwrap();
    REQUIRE(engine.Protect(true, Reading("valve-2", 1)).IsOk());

    SECTION("Another device has no chain for the session") {
        auto result = engine.Unprotect(true, "valve-2", from_pump);
        REQUIRE(result.IsErr());
        REQUIRE_THAT(result.UnwrapErr().message, ContainsSubstring(std::string(ErrorMessages::UNKNOWN_SESSION)));
    }

    SECTION("An imported chain still checks the envelope's device") {
        const auto key = sessions->ExportSessionKey("pump-1");
        REQUIRE(key.IsOk());
        // Exported after the first message, so re-encrypt one past it.
        REQUIRE(sessions->ImportSessionKey("valve-2", key.Unwrap()).IsOk());
        const auto later = engine.Protect(true, Reading("pump-1", 2)).Unwrap();
        auto result = engine.Unprotect(true, "valve-2", later);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == BridgeFailureType::Crypto);
        REQUIRE(engine.Unprotect(true, "pump-1", later).IsOk());
    }
}

TEST_CASE("Tampering - Replay", "[security][megolm][replay]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto backing = std::make_shared<MemoryStateStore>();
    auto sessions = std::make_shared<session::RatchetSessionStore>(backing, session::PickleCodec());
    const auto engine = protection::EncryptionEngine::Create(sessions);

    std::vector<std::vector<uint8_t>> payloads;
    for (uint64_t i = 1; i <= 4; ++i) {
        payloads.push_back(engine.Protect(true, Reading("press-4", i)).Unwrap());
    }

    REQUIRE(engine.Unprotect(true, "press-4", payloads[1]).IsOk());
    REQUIRE(engine.Unprotect(true, "press-4", payloads[1]).IsErr());
    REQUIRE(engine.Unprotect(true, "press-4", payloads[0]).IsErr());
    REQUIRE(engine.Unprotect(true, "press-4", payloads[3]).IsOk());
    REQUIRE(engine.Unprotect(true, "press-4", payloads[2]).IsErr());

    const auto info = sessions->Describe("press-4").Unwrap();
    REQUIRE(info.inbound.size() == 1);
    REQUIRE(info.inbound[0].highest_accepted_index == 3u);
}
