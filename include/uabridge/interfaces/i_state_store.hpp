#pragma once
#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace uabridge::interfaces {

/**
 * @brief Durable per-device blob storage for ratchet state
 *
 * Store() must not return Ok before the bytes survive a process crash, and
 * must replace the previous blob atomically: a reader sees either the old or
 * the new state, never a mix.
 */
class IStateStore {
public:
    virtual ~IStateStore() = default;

    [[nodiscard]] virtual Result<std::optional<std::vector<uint8_t>>, BridgeFailure> Load(
        const std::string& device_id) = 0;

    [[nodiscard]] virtual Result<Unit, BridgeFailure> Store(
        const std::string& device_id,
        std::span<const uint8_t> state) = 0;

    [[nodiscard]] virtual Result<std::vector<std::string>, BridgeFailure> ListDevices() = 0;
};

}
