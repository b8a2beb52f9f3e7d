#include "uabridge/session/file_state_key_provider.hpp"
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/core/constants.hpp"

#include <format>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace uabridge::session {

using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;

FileStateKeyProvider::FileStateKeyProvider(std::filesystem::path key_file)
    : key_file_(std::move(key_file)) {}

Result<SecureMemoryHandle, BridgeFailure> FileStateKeyProvider::GetStateEncryptionKey() {
    std::ifstream in(key_file_);
    if (!in) {
        return Result<SecureMemoryHandle, BridgeFailure>::Err(
            BridgeFailure::Config(std::format("Cannot read state key file '{}'", key_file_.string())));
    }
    std::string encoded((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto decoded = SodiumInterop::FromBase64(encoded);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(
        reinterpret_cast<uint8_t*>(encoded.data()), encoded.size()));
    if (decoded.IsErr()) {
        return Result<SecureMemoryHandle, BridgeFailure>::Err(
            BridgeFailure::Config(std::format("State key file '{}' is not base64", key_file_.string())));
    }
    auto& key = decoded.Unwrap();
    if (key.size() != Constants::PICKLE_KEY_SIZE) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(key));
        return Result<SecureMemoryHandle, BridgeFailure>::Err(
            BridgeFailure::Config(std::format(
                "State key must be {} bytes, '{}' holds {}",
                Constants::PICKLE_KEY_SIZE, key_file_.string(), key.size())));
    }
    auto handle = SecureMemoryHandle::FromBytes(key);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(key));
    if (handle.IsErr()) {
        return Result<SecureMemoryHandle, BridgeFailure>::Err(
            BridgeFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    return Result<SecureMemoryHandle, BridgeFailure>::Ok(std::move(handle).Unwrap());
}

Result<Unit, BridgeFailure> FileStateKeyProvider::Generate(const std::filesystem::path& key_file) {
    auto key = SodiumInterop::GetRandomBytes(Constants::PICKLE_KEY_SIZE);
    auto encoded = SodiumInterop::ToBase64(key) + "\n";
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(key));

    const int fd = ::open(key_file.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::Persistence(std::format(
                "Cannot create state key file '{}': {}", key_file.string(), std::strerror(errno))));
    }
    const ssize_t written = ::write(fd, encoded.data(), encoded.size());
    const bool synced = ::fsync(fd) == 0;
    ::close(fd);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(
        reinterpret_cast<uint8_t*>(encoded.data()), encoded.size()));
    if (written != static_cast<ssize_t>(encoded.size()) || !synced) {
        return Result<Unit, BridgeFailure>::Err(
            BridgeFailure::Persistence(std::format("Failed to write state key file '{}'", key_file.string())));
    }
    return Result<Unit, BridgeFailure>::Ok(unit);
}

}
