#pragma once

#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"
#include "uabridge/interfaces/i_state_key_provider.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace uabridge::proto::megolm {
class DeviceSessionState;
}

namespace uabridge::session {

/**
 * @brief Serializes device ratchet state for storage
 *
 * Without a key provider the state is stored as plain protobuf inside a
 * PickledSessionState container. With one, every write draws a fresh nonce
 * and encrypts with AES-256-CBC/HMAC-SHA256 keyed by
 * HKDF(state key, "Pickle" || nonce). An encrypted pickle is never accepted
 * when no key is configured, and vice versa.
 */
class PickleCodec {
public:
    explicit PickleCodec(std::shared_ptr<interfaces::IStateKeyProvider> key_provider = nullptr);

    [[nodiscard]] Result<std::vector<uint8_t>, BridgeFailure> Encode(
        const proto::megolm::DeviceSessionState& state) const;

    [[nodiscard]] Result<proto::megolm::DeviceSessionState, BridgeFailure> Decode(
        std::span<const uint8_t> bytes) const;

    [[nodiscard]] bool IsEncrypting() const noexcept { return key_provider_ != nullptr; }

    static constexpr size_t NONCE_SIZE = 16;

private:
    std::shared_ptr<interfaces::IStateKeyProvider> key_provider_;
};

}
