#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/observability/logging.hpp"
#include "uabridge/session/file_state_key_provider.hpp"
#include "uabridge/session/ratchet_session_store.hpp"

#include "config/agent_config.pb.h"

#include <google/protobuf/util/time_util.h>

#include <cstring>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace {

using uabridge::BridgeFailure;
using uabridge::crypto::SodiumInterop;
using uabridge::observability::FailureField;
using uabridge::observability::StringField;
using uabridge::session::RatchetSessionStore;
using uabridge::session::SessionInfo;

struct Options {
    std::string state_dir;
    std::string state_key_file;
    std::string command;
    std::vector<std::string> arguments;
};

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " --state-dir <dir> [--state-key-file <file>] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  create <device>               create the outbound session if missing\n"
              << "  rotate <device>               start a new outbound session\n"
              << "  export <device>               print the outbound session key (base64)\n"
              << "  import <device> [<key>|-]     add an inbound session from a session key\n"
              << "  show [<device>]               list devices, or describe one\n"
              << "  keygen <file>                 write a new random state encryption key\n";
}

int Fail(std::string_view what, const BridgeFailure& failure) {
    UABRIDGE_LOG_ERROR(what, {FailureField(failure), StringField("error", failure.message)});
    return 1;
}

std::string FormatTime(const std::chrono::system_clock::time_point at) {
    using google::protobuf::util::TimeUtil;
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();
    return TimeUtil::ToString(TimeUtil::MillisecondsToTimestamp(millis));
}

void PrintSession(const SessionInfo& info) {
    std::cout << "device: " << info.device_id << "\n";
    if (info.has_outbound) {
        std::cout << "outbound session: " << info.outbound_session_id << "\n"
                  << "next message index: " << info.next_message_index << "\n"
                  << "created: " << FormatTime(info.created_at) << "\n";
    } else {
        std::cout << "outbound session: none\n";
    }
    std::cout << "generation: " << info.generation << "\n";
    for (const auto& chain : info.inbound) {
        std::cout << "inbound session: " << chain.session_id
                  << " first index " << chain.first_known_index;
        if (chain.highest_accepted_index.has_value()) {
            std::cout << " last accepted " << *chain.highest_accepted_index;
        }
        std::cout << "\n";
    }
}

int Create(RatchetSessionStore& sessions, const std::string& device) {
    auto info = sessions.EnsureOutbound(device);
    if (info.IsErr()) {
        return Fail("create failed", info.UnwrapErr());
    }
    PrintSession(info.Unwrap());
    return 0;
}

int Rotate(RatchetSessionStore& sessions, const std::string& device) {
    auto session_id = sessions.RotateOutbound(device);
    if (session_id.IsErr()) {
        return Fail("rotate failed", session_id.UnwrapErr());
    }
    std::cout << SodiumInterop::ToHex(session_id.Unwrap()) << "\n";
    return 0;
}

int Export(RatchetSessionStore& sessions, const std::string& device) {
    auto key = sessions.ExportSessionKey(device);
    if (key.IsErr()) {
        return Fail("export failed", key.UnwrapErr());
    }
    std::cout << key.Unwrap() << "\n";
    return 0;
}

int Import(RatchetSessionStore& sessions, const std::string& device, std::string key) {
    if (key.empty() || key == "-") {
        key.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    while (!key.empty() && (key.back() == '\n' || key.back() == '\r' || key.back() == ' ')) {
        key.pop_back();
    }
    auto session_id = sessions.ImportSessionKey(device, key);
    if (session_id.IsErr()) {
        return Fail("import failed", session_id.UnwrapErr());
    }
    std::cout << SodiumInterop::ToHex(session_id.Unwrap()) << "\n";
    return 0;
}

int Show(RatchetSessionStore& sessions, const std::vector<std::string>& arguments) {
    if (!arguments.empty()) {
        auto info = sessions.Describe(arguments.front());
        if (info.IsErr()) {
            return Fail("show failed", info.UnwrapErr());
        }
        PrintSession(info.Unwrap());
        return 0;
    }
    auto devices = sessions.ListDevices();
    if (devices.IsErr()) {
        return Fail("listing devices failed", devices.UnwrapErr());
    }
    for (const auto& device : devices.Unwrap()) {
        std::cout << device << "\n";
    }
    return 0;
}

int Dispatch(const Options& options) {
    if (options.command == "keygen") {
        if (options.arguments.size() != 1) {
            return -1;
        }
        auto generated = uabridge::session::FileStateKeyProvider::Generate(options.arguments.front());
        if (generated.IsErr()) {
            return Fail("keygen failed", generated.UnwrapErr());
        }
        std::cout << options.arguments.front() << "\n";
        return 0;
    }

    if (options.state_dir.empty()) {
        std::cerr << "--state-dir is required\n";
        return -1;
    }
    auto opened = RatchetSessionStore::Open(options.state_dir, options.state_key_file);
    if (opened.IsErr()) {
        return Fail("cannot open state directory", opened.UnwrapErr());
    }
    auto sessions = std::move(opened).Unwrap();

    const auto& args = options.arguments;
    if (options.command == "show") {
        return args.size() <= 1 ? Show(*sessions, args) : -1;
    }
    if (options.command == "import") {
        if (args.empty() || args.size() > 2) {
            return -1;
        }
        return Import(*sessions, args[0], args.size() == 2 ? args[1] : std::string());
    }
    if (args.size() != 1) {
        return -1;
    }
    if (options.command == "create") {
        return Create(*sessions, args[0]);
    }
    if (options.command == "rotate") {
        return Rotate(*sessions, args[0]);
    }
    if (options.command == "export") {
        return Export(*sessions, args[0]);
    }
    return -1;
}

}

int main(int argc, char** argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "--state-dir" || arg == "--state-key-file") && i + 1 < argc) {
            (arg == "--state-dir" ? options.state_dir : options.state_key_file) = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.arguments.push_back(arg);
        }
    }
    if (options.command.empty()) {
        PrintUsage(argv[0]);
        return 2;
    }

    uabridge::observability::InitializeLogging(
        uabridge::proto::config::LoggingConfig{}, uabridge::observability::LogTarget::Stderr);
    if (auto sodium = SodiumInterop::Initialize(); sodium.IsErr()) {
        UABRIDGE_LOG_ERROR("Cannot initialize libsodium", {StringField("error", sodium.UnwrapErr().message)});
        return 1;
    }

    const int status = Dispatch(options);
    if (status < 0) {
        PrintUsage(argv[0]);
        return 2;
    }
    return status;
}
