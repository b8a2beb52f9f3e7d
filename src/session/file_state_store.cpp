#include "uabridge/session/file_state_store.hpp"

#include <format>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <sys/stat.h>
#include <unistd.h>

namespace uabridge::session {

namespace {

    class FileDescriptor {
    public:
        explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
        ~FileDescriptor() {
            if (fd_ >= 0) {
                ::close(fd_);
            }
        }
        FileDescriptor(const FileDescriptor&) = delete;
        FileDescriptor& operator=(const FileDescriptor&) = delete;

        [[nodiscard]] int Get() const noexcept { return fd_; }
        [[nodiscard]] bool IsValid() const noexcept { return fd_ >= 0; }

        int Release() noexcept {
            const int fd = fd_;
            fd_ = -1;
            return fd;
        }

    private:
        int fd_;
    };

    std::string ErrnoMessage(std::string_view what, const std::filesystem::path& path) {
        return std::format("{} '{}': {}", what, path.string(), std::strerror(errno));
    }

    Result<Unit, BridgeFailure> WriteAll(int fd, std::span<const uint8_t> data, const std::filesystem::path& path) {
        size_t written = 0;
        while (written < data.size()) {
            const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return Result<Unit, BridgeFailure>::Err(
                    BridgeFailure::Persistence(ErrnoMessage("Failed to write", path)));
            }
            written += static_cast<size_t>(n);
        }
        return Result<Unit, BridgeFailure>::Ok(unit);
    }

    bool IsPlainFileChar(const char c) noexcept {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
    }

}

FileStateStore::FileStateStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

Result<std::shared_ptr<FileStateStore>, BridgeFailure> FileStateStore::Open(
    const std::filesystem::path& directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return Result<std::shared_ptr<FileStateStore>, BridgeFailure>::Err(
            BridgeFailure::Persistence(std::format(
                "Cannot create state directory '{}': {}", directory.string(), ec.message())));
    }
    if (!std::filesystem::is_directory(directory, ec)) {
        return Result<std::shared_ptr<FileStateStore>, BridgeFailure>::Err(
            BridgeFailure::Persistence(std::format(
                "State path '{}' is not a directory", directory.string())));
    }
    return Result<std::shared_ptr<FileStateStore>, BridgeFailure>::Ok(
        std::make_shared<FileStateStore>(directory));
}

std::string FileStateStore::EscapeDeviceId(const std::string& device_id) {
    std::string escaped;
    escaped.reserve(device_id.size());
    for (const char c : device_id) {
        if (IsPlainFileChar(c) && !(escaped.empty() && c == '.')) {
            escaped.push_back(c);
        } else {
            escaped += std::format("%{:02X}", static_cast<unsigned char>(c));
        }
    }
    return escaped;
}

std::optional<std::string> FileStateStore::UnescapeDeviceId(const std::string& file_stem) {
    std::string device_id;
    for (size_t i = 0; i < file_stem.size(); ++i) {
        if (file_stem[i] != '%') {
            device_id.push_back(file_stem[i]);
            continue;
        }
        if (i + 2 >= file_stem.size()) {
            return std::nullopt;
        }
        unsigned int value = 0;
        for (size_t k = 1; k <= 2; ++k) {
            const char h = file_stem[i + k];
            value <<= 4;
            if (h >= '0' && h <= '9') {
                value |= static_cast<unsigned>(h - '0');
            } else if (h >= 'A' && h <= 'F') {
                value |= static_cast<unsigned>(h - 'A' + 10);
            } else {
                return std::nullopt;
            }
        }
        device_id.push_back(static_cast<char>(value));
        i += 2;
    }
    return device_id;
}

std::filesystem::path FileStateStore::PathFor(const std::string& device_id) const {
    return directory_ / (EscapeDeviceId(device_id) + std::string(FILE_EXTENSION));
}

Result<std::optional<std::vector<uint8_t>>, BridgeFailure> FileStateStore::Load(const std::string& device_id) {
    using ResultType = Result<std::optional<std::vector<uint8_t>>, BridgeFailure>;
    const auto path = PathFor(device_id);

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return ResultType::Ok(std::nullopt);
        }
        return ResultType::Err(BridgeFailure::Persistence(ErrnoMessage("Failed to open", path)));
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return ResultType::Err(BridgeFailure::Persistence(ErrnoMessage("Failed to read", path)));
    }
    return ResultType::Ok(std::move(data));
}

Result<Unit, BridgeFailure> FileStateStore::Store(const std::string& device_id, std::span<const uint8_t> state) {
    const auto path = PathFor(device_id);
    auto tmp_path = path;
    tmp_path += ".tmp";

    std::lock_guard lock(directory_lock_);

    FileDescriptor fd(::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR));
    if (!fd.IsValid()) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::Persistence(ErrnoMessage("Failed to create", tmp_path)));
    }
    UABRIDGE_TRY(WriteAll(fd.Get(), state, tmp_path));
    if (::fsync(fd.Get()) != 0) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::Persistence(ErrnoMessage("Failed to fsync", tmp_path)));
    }
    if (::close(fd.Release()) != 0) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::Persistence(ErrnoMessage("Failed to close", tmp_path)));
    }
    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::Persistence(ErrnoMessage("Failed to rename into", path)));
    }

    FileDescriptor dir_fd(::open(directory_.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!dir_fd.IsValid() || ::fsync(dir_fd.Get()) != 0) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::Persistence(ErrnoMessage("Failed to fsync directory", directory_)));
    }
    return Result<Unit, BridgeFailure>::Ok(unit);
}

Result<std::vector<std::string>, BridgeFailure> FileStateStore::ListDevices() {
    std::vector<std::string> devices;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry_path = it->path();
        if (entry_path.extension() != FILE_EXTENSION) {
            continue;
        }
        auto device_id = UnescapeDeviceId(entry_path.stem().string());
        if (device_id.has_value()) {
            devices.push_back(std::move(*device_id));
        }
    }
    if (ec) {
        return Result<std::vector<std::string>, BridgeFailure>::Err(
            BridgeFailure::Persistence(std::format(
                "Failed to list state directory '{}': {}", directory_.string(), ec.message())));
    }
    std::sort(devices.begin(), devices.end());
    return Result<std::vector<std::string>, BridgeFailure>::Ok(std::move(devices));
}

}
