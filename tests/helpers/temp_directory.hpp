#pragma once
#include "uabridge/crypto/sodium_interop.hpp"

#include <filesystem>
#include <string>
#include <system_error>

namespace uabridge::test_helpers {

/**
 * Unique directory under the system temp path, removed with its contents on
 * destruction.
 */
class TempDirectory {
public:
    TempDirectory() {
        const auto suffix = crypto::SodiumInterop::ToHex(crypto::SodiumInterop::GetRandomBytes(8));
        path_ = std::filesystem::temp_directory_path() / ("uabridge-test-" + suffix);
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    [[nodiscard]] const std::filesystem::path& Path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}
