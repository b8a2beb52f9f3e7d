#include <catch2/catch_test_macros.hpp>
#include "uabridge/session/file_state_store.hpp"
#include "uabridge/session/file_state_key_provider.hpp"
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/core/constants.hpp"
#include "helpers/temp_directory.hpp"

#include <fstream>
#include <sys/stat.h>

using namespace uabridge;
using namespace uabridge::session;
using test_helpers::TempDirectory;

TEST_CASE("FileStateStore - Device id escaping", "[session][store]") {
    REQUIRE(FileStateStore::EscapeDeviceId("pump-1") == "pump-1");
    REQUIRE(FileStateStore::EscapeDeviceId("plant/line 2") == "plant%2Fline%202");
    REQUIRE(FileStateStore::EscapeDeviceId("..") == "%2E.");
    REQUIRE(FileStateStore::EscapeDeviceId("50%") == "50%25");

    for (const std::string id : {"pump-1", "plant/line 2", "..", "50%", "ü"}) {
        REQUIRE(FileStateStore::UnescapeDeviceId(FileStateStore::EscapeDeviceId(id)) == id);
    }
    REQUIRE_FALSE(FileStateStore::UnescapeDeviceId("bad%2").has_value());
    REQUIRE_FALSE(FileStateStore::UnescapeDeviceId("bad%zz").has_value());
}

TEST_CASE("FileStateStore - Load and store", "[session][store]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    auto store = FileStateStore::Open(dir.Path() / "state").Unwrap();

    SECTION("Unknown device has no state") {
        auto loaded = store->Load("pump-1").Unwrap();
        REQUIRE_FALSE(loaded.has_value());
    }

    SECTION("Stored blob is read back and replaced whole") {
        const std::vector<uint8_t> first = {1, 2, 3, 4, 5, 6};
        const std::vector<uint8_t> second = {9, 9};
        REQUIRE(store->Store("pump-1", first).IsOk());
        REQUIRE(store->Load("pump-1").Unwrap() == first);
        REQUIRE(store->Store("pump-1", second).IsOk());
        REQUIRE(store->Load("pump-1").Unwrap() == second);
        REQUIRE_FALSE(std::filesystem::exists(store->PathFor("pump-1").string() + ".tmp"));
    }

    SECTION("State files are private to the owner") {
        REQUIRE(store->Store("valve-2", std::vector<uint8_t>{7}).IsOk());
        struct stat info{};
        REQUIRE(::stat(store->PathFor("valve-2").c_str(), &info) == 0);
        REQUIRE((info.st_mode & 0777) == 0600);
    }

    SECTION("Devices are listed from file names") {
        REQUIRE(store->Store("valve-2", std::vector<uint8_t>{1}).IsOk());
        REQUIRE(store->Store("plant/pump 1", std::vector<uint8_t>{2}).IsOk());
        std::ofstream(store->Directory() / "notes.txt") << "ignored";
        auto devices = store->ListDevices().Unwrap();
        REQUIRE(devices == std::vector<std::string>{"plant/pump 1", "valve-2"});
    }
}

TEST_CASE("FileStateStore - Open failures", "[session][store]") {
    TempDirectory dir;
    const auto file = dir.Path() / "occupied";
    std::ofstream(file) << "not a directory";
    auto result = FileStateStore::Open(file);
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == BridgeFailureType::Persistence);
}

TEST_CASE("FileStateKeyProvider - Key files", "[session][keys]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    const auto key_file = dir.Path() / "state.key";

    SECTION("Generated key is readable and private") {
        REQUIRE(FileStateKeyProvider::Generate(key_file).IsOk());
        struct stat info{};
        REQUIRE(::stat(key_file.c_str(), &info) == 0);
        REQUIRE((info.st_mode & 0777) == 0600);

        FileStateKeyProvider provider(key_file);
        auto key = provider.GetStateEncryptionKey().Unwrap();
        REQUIRE(key.Size() == Constants::PICKLE_KEY_SIZE);
    }

    SECTION("Existing key file is never overwritten") {
        REQUIRE(FileStateKeyProvider::Generate(key_file).IsOk());
        REQUIRE(FileStateKeyProvider::Generate(key_file).IsErr());
    }

    SECTION("Missing and malformed files are config errors") {
        FileStateKeyProvider missing(dir.Path() / "absent.key");
        REQUIRE(missing.GetStateEncryptionKey().UnwrapErr().type == BridgeFailureType::Config);

        std::ofstream(key_file) << "c2hvcnQ=\n";
        FileStateKeyProvider short_key(key_file);
        REQUIRE(short_key.GetStateEncryptionKey().UnwrapErr().type == BridgeFailureType::Config);
    }
}
