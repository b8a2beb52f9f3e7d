#pragma once

#include "uabridge/interfaces/i_state_store.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace uabridge::session {

/**
 * @brief One file per device under a state directory
 *
 * Writes go to `<name>.session.tmp`, are fsync'ed, renamed over
 * `<name>.session`, and the directory is fsync'ed so the rename itself is
 * durable. Device ids are escaped into file names with %XX for anything
 * outside [A-Za-z0-9._-].
 */
class FileStateStore final : public interfaces::IStateStore {
public:
    explicit FileStateStore(std::filesystem::path directory);

    [[nodiscard]] static Result<std::shared_ptr<FileStateStore>, BridgeFailure> Open(
        const std::filesystem::path& directory);

    [[nodiscard]] Result<std::optional<std::vector<uint8_t>>, BridgeFailure> Load(
        const std::string& device_id) override;

    [[nodiscard]] Result<Unit, BridgeFailure> Store(
        const std::string& device_id,
        std::span<const uint8_t> state) override;

    [[nodiscard]] Result<std::vector<std::string>, BridgeFailure> ListDevices() override;

    [[nodiscard]] const std::filesystem::path& Directory() const noexcept { return directory_; }

    [[nodiscard]] std::filesystem::path PathFor(const std::string& device_id) const;

    static std::string EscapeDeviceId(const std::string& device_id);

    static std::optional<std::string> UnescapeDeviceId(const std::string& file_stem);

    static constexpr std::string_view FILE_EXTENSION = ".session";

private:
    std::filesystem::path directory_;
    std::mutex directory_lock_;
};

}
