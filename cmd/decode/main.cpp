#include "uabridge/codec/envelope_serializer.hpp"
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/megolm/group_message.hpp"
#include "uabridge/observability/logging.hpp"
#include "uabridge/protection/encryption_engine.hpp"
#include "uabridge/session/ratchet_session_store.hpp"

#include "config/agent_config.pb.h"

#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

namespace {

using uabridge::BridgeFailure;
using uabridge::Result;
using uabridge::crypto::SodiumInterop;
using uabridge::observability::FailureField;
using uabridge::observability::StringField;
using uabridge::session::RatchetSessionStore;

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " --state-dir <dir> [--state-key-file <file>] [--device <id>] [<message>]\n"
              << "\n"
              << "Decrypts a base64 Megolm message (argument or stdin) and prints the telemetry\n"
              << "envelope as JSON. Without --device, the device whose inbound sessions know the\n"
              << "message's session id is used. Accepted messages cannot be decoded twice.\n";
}

int Fail(std::string_view what, const BridgeFailure& failure) {
    UABRIDGE_LOG_ERROR(what, {FailureField(failure), StringField("error", failure.message)});
    return 1;
}

std::string Trim(std::string text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

Result<std::string, BridgeFailure> FindDevice(RatchetSessionStore& sessions, const std::string& session_id) {
    auto devices = sessions.ListDevices();
    if (devices.IsErr()) {
        return Result<std::string, BridgeFailure>::Err(std::move(devices).UnwrapErr());
    }
    for (const auto& device : devices.Unwrap()) {
        auto info = sessions.Describe(device);
        if (info.IsErr()) {
            UABRIDGE_LOG_WARN("Skipping unreadable device state", {
                StringField("device", device),
                StringField("error", info.UnwrapErr().message)
            });
            continue;
        }
        for (const auto& chain : info.Unwrap().inbound) {
            if (chain.session_id == session_id) {
                return Result<std::string, BridgeFailure>::Ok(device);
            }
        }
    }
    return Result<std::string, BridgeFailure>::Err(BridgeFailure::Crypto(
        "No device in the state directory knows session " + session_id));
}

}

int main(int argc, char** argv) {
    std::string state_dir;
    std::string state_key_file;
    std::string device;
    std::optional<std::string> message;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--state-dir" && i + 1 < argc) {
            state_dir = argv[++i];
        } else if (arg == "--state-key-file" && i + 1 < argc) {
            state_key_file = argv[++i];
        } else if (arg == "--device" && i + 1 < argc) {
            device = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (!message.has_value() && !arg.starts_with("--")) {
            message = arg;
        } else {
            PrintUsage(argv[0]);
            return 2;
        }
    }
    if (state_dir.empty()) {
        PrintUsage(argv[0]);
        return 2;
    }

    uabridge::observability::InitializeLogging(
        uabridge::proto::config::LoggingConfig{}, uabridge::observability::LogTarget::Stderr);
    if (auto sodium = SodiumInterop::Initialize(); sodium.IsErr()) {
        UABRIDGE_LOG_ERROR("Cannot initialize libsodium", {StringField("error", sodium.UnwrapErr().message)});
        return 1;
    }

    if (!message.has_value()) {
        message = std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    const std::string encoded = Trim(*message);

    auto decoded = SodiumInterop::FromBase64(encoded);
    if (decoded.IsErr()) {
        return Fail("message is not base64", decoded.UnwrapErr());
    }
    auto header = uabridge::megolm::ParseMessage(decoded.Unwrap());
    if (header.IsErr()) {
        return Fail("malformed message", header.UnwrapErr());
    }

    auto opened = RatchetSessionStore::Open(state_dir, state_key_file);
    if (opened.IsErr()) {
        return Fail("cannot open state directory", opened.UnwrapErr());
    }
    auto sessions = std::move(opened).Unwrap();

    if (device.empty()) {
        const std::string session_id = SodiumInterop::ToHex(uabridge::megolm::AsBytes(header.Unwrap().session_id()));
        auto found = FindDevice(*sessions, session_id);
        if (found.IsErr()) {
            return Fail("cannot attribute message", found.UnwrapErr());
        }
        device = std::move(found).Unwrap();
    }

    const auto engine = uabridge::protection::EncryptionEngine::Create(sessions);
    auto envelope = engine.Unprotect(true, device, decoded.Unwrap());
    if (envelope.IsErr()) {
        return Fail("decryption failed", envelope.UnwrapErr());
    }
    auto json = uabridge::codec::EnvelopeSerializer::SerializeJson(envelope.Unwrap());
    if (json.IsErr()) {
        return Fail("cannot print envelope", json.UnwrapErr());
    }
    std::cout << json.Unwrap() << "\n";
    return 0;
}
