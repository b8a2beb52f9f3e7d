#include <catch2/catch_test_macros.hpp>
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/session/file_state_key_provider.hpp"
#include "uabridge/session/file_state_store.hpp"
#include "uabridge/session/ratchet_session_store.hpp"
#include "helpers/memory_state_store.hpp"
#include "helpers/temp_directory.hpp"

#include <fstream>
#include <iterator>
#include <set>
#include <string>
#include <vector>

using namespace uabridge;
using crypto::SodiumInterop;
using session::RatchetSessionStore;
using test_helpers::TempDirectory;

namespace {
    std::vector<uint8_t> ReadFile(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    uint32_t NextIndex(RatchetSessionStore& sessions, const std::string& device) {
        return sessions.AdvanceOutbound(device).Unwrap().Index();
    }
}

TEST_CASE("Crash recovery - Indices are never reissued", "[security][session][recovery]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    const auto key_file = dir.Path() / "pickle.key";
    REQUIRE(session::FileStateKeyProvider::Generate(key_file).IsOk());

    std::set<uint32_t> issued;
    std::string session_id;
    for (int restart = 0; restart < 4; ++restart) {
        // Each pass is a fresh process: nothing survives but the directory.
        auto sessions = RatchetSessionStore::Open(dir.Path() / "state", key_file).Unwrap();
        for (int i = 0; i < 5; ++i) {
            auto key = sessions->AdvanceOutbound("boiler-3").Unwrap();
            REQUIRE(issued.insert(key.Index()).second);
            const auto id = SodiumInterop::ToHex(key.SessionId());
            if (session_id.empty()) {
                session_id = id;
            }
            REQUIRE(id == session_id);
        }
    }
    REQUIRE(issued.size() == 20);
    REQUIRE(*issued.rbegin() == 19);
}

TEST_CASE("Crash recovery - Interrupted and damaged state", "[security][session][recovery]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    const auto state_dir = dir.Path() / "state";

    {
        auto sessions = RatchetSessionStore::Open(state_dir, "").Unwrap();
        for (int i = 0; i < 3; ++i) {
            REQUIRE(sessions->AdvanceOutbound("boiler-3").IsOk());
        }
    }
    const auto session_file = state_dir / ("boiler-3" + std::string(session::FileStateStore::FILE_EXTENSION));
    REQUIRE(std::filesystem::exists(session_file));

    SECTION("A half-written temporary file is ignored") {
        auto tmp = session_file;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary);
            out << "partial write";
        }
        auto sessions = RatchetSessionStore::Open(state_dir, "").Unwrap();
        REQUIRE(NextIndex(*sessions, "boiler-3") == 3);
        REQUIRE(sessions->ListDevices().Unwrap() == std::vector<std::string>{"boiler-3"});
    }

    SECTION("Corrupt state is reported, never replaced by a fresh session") {
        {
            std::ofstream out(session_file, std::ios::binary | std::ios::trunc);
            out << "not a pickle";
        }
        const auto before = ReadFile(session_file);

        auto sessions = RatchetSessionStore::Open(state_dir, "").Unwrap();
        auto advanced = sessions->AdvanceOutbound("boiler-3");
        REQUIRE(advanced.IsErr());
        REQUIRE(advanced.UnwrapErr().type == BridgeFailureType::Persistence);
        REQUIRE(sessions->EnsureOutbound("boiler-3").IsErr());
        REQUIRE(ReadFile(session_file) == before);
    }

    SECTION("Clean state reloads at the next index") {
        auto sessions = RatchetSessionStore::Open(state_dir, "").Unwrap();
        REQUIRE(sessions->Describe("boiler-3").Unwrap().next_message_index == 3);
    }
}

TEST_CASE("Crash recovery - Failed write after advance", "[security][session][recovery]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto backing = std::make_shared<test_helpers::MemoryStateStore>();

    {
        RatchetSessionStore sessions(backing, session::PickleCodec());
        REQUIRE(NextIndex(sessions, "boiler-3") == 0);
        REQUIRE(NextIndex(sessions, "boiler-3") == 1);

        backing->FailWrites(true);
        REQUIRE(sessions.AdvanceOutbound("boiler-3").IsErr());
        backing->FailWrites(false);
        // The process keeps refusing the device rather than handing out a
        // key the disk does not know about.
        REQUIRE(sessions.AdvanceOutbound("boiler-3").IsErr());
    }

    // The key for index 2 was never returned, so the restarted process may
    // issue it; index 1 and below stay burned.
    RatchetSessionStore restarted(backing, session::PickleCodec());
    REQUIRE(NextIndex(restarted, "boiler-3") == 2);
    REQUIRE(NextIndex(restarted, "boiler-3") == 3);
}
