#include <catch2/catch_test_macros.hpp>
#include "uabridge/codec/envelope_serializer.hpp"
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/megolm/group_message.hpp"
#include "uabridge/protection/encryption_engine.hpp"
#include "uabridge/session/file_state_key_provider.hpp"
#include "uabridge/session/ratchet_session_store.hpp"
#include "helpers/temp_directory.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace uabridge;
using crypto::SodiumInterop;
using session::RatchetSessionStore;
using test_helpers::TempDirectory;

namespace {
    codec::TelemetryEnvelope Reading(const std::string& device, const uint64_t sequence, const double value) {
        codec::TelemetryEnvelope envelope;
        envelope.device_id = device;
        envelope.feature = "Position";
        envelope.node = "ns=2;s=Valve2.Position";
        envelope.value = value;
        envelope.timestamp = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
        envelope.status_name = "Good";
        envelope.sequence = sequence;
        return envelope;
    }

    /// What the encode tool prints: base64 of the wire message.
    std::string EncodeLine(const protection::EncryptionEngine& engine, const codec::TelemetryEnvelope& envelope) {
        auto payload = engine.Protect(true, envelope).Unwrap();
        return SodiumInterop::ToBase64(payload);
    }

    /// What the decode tool does with one line.
    Result<codec::TelemetryEnvelope, BridgeFailure> DecodeLine(
        const protection::EncryptionEngine& engine,
        const std::string& device,
        const std::string& line) {
        auto bytes = SodiumInterop::FromBase64(line);
        if (bytes.IsErr()) {
            return Result<codec::TelemetryEnvelope, BridgeFailure>::Err(std::move(bytes).UnwrapErr());
        }
        return engine.Unprotect(true, device, bytes.Unwrap());
    }
}

TEST_CASE("Offline tooling - Export, encode, import, decode", "[integration][tooling][megolm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    const auto agent_dir = dir.Path() / "agent";
    const auto receiver_dir = dir.Path() / "receiver";
    const auto key_file = dir.Path() / "pickle.key";
    REQUIRE(session::FileStateKeyProvider::Generate(key_file).IsOk());

    auto agent = RatchetSessionStore::Open(agent_dir, key_file).Unwrap();
    const auto agent_engine = protection::EncryptionEngine::Create(agent);

    // megolmctl init + export before anything is encrypted, so the
    // receiver can read from index zero.
    REQUIRE(agent->EnsureOutbound("valve-2").IsOk());
    const std::string session_key = agent->ExportSessionKey("valve-2").Unwrap();

    std::vector<std::string> lines;
    for (uint64_t i = 1; i <= 3; ++i) {
        lines.push_back(EncodeLine(agent_engine, Reading("valve-2", i, 0.1 * static_cast<double>(i))));
    }

    auto receiver = RatchetSessionStore::Open(receiver_dir, "").Unwrap();
    const auto session_id = receiver->ImportSessionKey("valve-2", session_key).Unwrap();
    REQUIRE(SodiumInterop::ToHex(session_id) == agent->Describe("valve-2").Unwrap().outbound_session_id);
    const auto receiver_engine = protection::EncryptionEngine::Create(receiver);

    SECTION("Every encoded line decodes to its envelope") {
        for (uint64_t i = 1; i <= 3; ++i) {
            auto envelope = DecodeLine(receiver_engine, "valve-2", lines[i - 1]).Unwrap();
            REQUIRE(envelope == Reading("valve-2", i, 0.1 * static_cast<double>(i)));
        }
        REQUIRE(codec::EnvelopeSerializer::SerializeJson(Reading("valve-2", 1, 0.1)).IsOk());
    }

    SECTION("Skipped messages stay decodable only forward") {
        REQUIRE(DecodeLine(receiver_engine, "valve-2", lines[2]).IsOk());
        REQUIRE(DecodeLine(receiver_engine, "valve-2", lines[0]).IsErr());
    }

    SECTION("Acceptance survives reopening the receiver state") {
        REQUIRE(DecodeLine(receiver_engine, "valve-2", lines[0]).IsOk());
        receiver.reset();

        auto reopened = RatchetSessionStore::Open(receiver_dir, "").Unwrap();
        const auto engine = protection::EncryptionEngine::Create(reopened);
        auto replayed = DecodeLine(engine, "valve-2", lines[0]);
        REQUIRE(replayed.IsErr());
        REQUIRE(replayed.UnwrapErr().type == BridgeFailureType::Crypto);
        REQUIRE(DecodeLine(engine, "valve-2", lines[1]).IsOk());
    }

    SECTION("Another device's name does not open the message") {
        REQUIRE(receiver->ImportSessionKey("pump-1", session_key).IsOk());
        auto wrong = DecodeLine(receiver_engine, "pump-1", lines[0]);
        REQUIRE(wrong.IsErr());
        REQUIRE(wrong.UnwrapErr().type == BridgeFailureType::Crypto);
    }

    SECTION("Agent state cannot be read without its pickle key") {
        auto keyless = RatchetSessionStore::Open(agent_dir, "").Unwrap();
        auto described = keyless->Describe("valve-2");
        REQUIRE(described.IsErr());
        REQUIRE(described.UnwrapErr().type == BridgeFailureType::Persistence);
    }

    SECTION("Agent resumes after the last encoded index") {
        agent.reset();
        auto reopened = RatchetSessionStore::Open(agent_dir, key_file).Unwrap();
        REQUIRE(reopened->Describe("valve-2").Unwrap().next_message_index == 3);
        const auto engine = protection::EncryptionEngine::Create(reopened);
        const auto line = EncodeLine(engine, Reading("valve-2", 4, 0.4));
        auto message = megolm::DecodeMessageBase64(line).Unwrap();
        REQUIRE(message.message_index() == 3);
        REQUIRE(DecodeLine(receiver_engine, "valve-2", line).Unwrap().sequence == 4);
    }
}
