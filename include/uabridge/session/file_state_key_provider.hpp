#pragma once

#include "uabridge/interfaces/i_state_key_provider.hpp"

#include <filesystem>

namespace uabridge::session {

/**
 * Reads the 32-byte state encryption key, base64 encoded, from a file.
 */
class FileStateKeyProvider final : public interfaces::IStateKeyProvider {
public:
    explicit FileStateKeyProvider(std::filesystem::path key_file);

    [[nodiscard]] Result<crypto::SecureMemoryHandle, BridgeFailure> GetStateEncryptionKey() override;

    /**
     * @brief Write a fresh random key to `key_file` with mode 0600
     *
     * Fails if the file already exists.
     */
    [[nodiscard]] static Result<Unit, BridgeFailure> Generate(const std::filesystem::path& key_file);

private:
    std::filesystem::path key_file_;
};

}
