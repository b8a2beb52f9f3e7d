#include "uabridge/codec/envelope_serializer.hpp"
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/observability/logging.hpp"
#include "uabridge/protection/encryption_engine.hpp"
#include "uabridge/session/ratchet_session_store.hpp"

#include "config/agent_config.pb.h"

#include <iostream>
#include <iterator>
#include <memory>
#include <string>

namespace {

using uabridge::BridgeFailure;
using uabridge::crypto::SodiumInterop;
using uabridge::observability::FailureField;
using uabridge::observability::StringField;

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " --state-dir <dir> [--state-key-file <file>] [--plain] [--device <id>]\n"
              << "\n"
              << "Reads a telemetry envelope as JSON on stdin and prints the payload the agent\n"
              << "would publish for it: a base64 Megolm message, or the JSON itself with --plain.\n"
              << "Encrypting advances the device's outbound ratchet by one step.\n";
}

int Fail(std::string_view what, const BridgeFailure& failure) {
    UABRIDGE_LOG_ERROR(what, {FailureField(failure), StringField("error", failure.message)});
    return 1;
}

}

int main(int argc, char** argv) {
    std::string state_dir;
    std::string state_key_file;
    std::string device;
    bool plain = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--state-dir" && i + 1 < argc) {
            state_dir = argv[++i];
        } else if (arg == "--state-key-file" && i + 1 < argc) {
            state_key_file = argv[++i];
        } else if (arg == "--device" && i + 1 < argc) {
            device = argv[++i];
        } else if (arg == "--plain") {
            plain = true;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            PrintUsage(argv[0]);
            return 2;
        }
    }
    if (!plain && state_dir.empty()) {
        PrintUsage(argv[0]);
        return 2;
    }

    uabridge::observability::InitializeLogging(
        uabridge::proto::config::LoggingConfig{}, uabridge::observability::LogTarget::Stderr);
    if (auto sodium = SodiumInterop::Initialize(); sodium.IsErr()) {
        UABRIDGE_LOG_ERROR("Cannot initialize libsodium", {StringField("error", sodium.UnwrapErr().message)});
        return 1;
    }

    const std::string input{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    auto parsed = uabridge::codec::EnvelopeSerializer::ParseJson(input);
    if (parsed.IsErr()) {
        return Fail("stdin is not a telemetry envelope", parsed.UnwrapErr());
    }
    auto envelope = std::move(parsed).Unwrap();
    if (!device.empty()) {
        envelope.device_id = device;
    }

    std::shared_ptr<uabridge::session::RatchetSessionStore> sessions;
    if (!plain) {
        auto opened = uabridge::session::RatchetSessionStore::Open(state_dir, state_key_file);
        if (opened.IsErr()) {
            return Fail("cannot open state directory", opened.UnwrapErr());
        }
        sessions = std::move(opened).Unwrap();
    }
    const auto engine = uabridge::protection::EncryptionEngine::Create(sessions);

    auto payload = engine.Protect(!plain, envelope);
    if (payload.IsErr()) {
        return Fail("encoding failed", payload.UnwrapErr());
    }
    if (plain) {
        const auto& bytes = payload.Unwrap();
        std::cout << std::string(bytes.begin(), bytes.end()) << "\n";
    } else {
        std::cout << SodiumInterop::ToBase64(payload.Unwrap()) << "\n";
    }
    return 0;
}
