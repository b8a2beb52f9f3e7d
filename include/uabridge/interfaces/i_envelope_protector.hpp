#pragma once
#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"
#include "uabridge/codec/telemetry_envelope.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace uabridge::interfaces {

/**
 * @brief Turns an envelope into the bytes published for it, and back
 *
 * Each Protect() of an encrypting implementation consumes exactly one
 * ratchet step, whether or not the caller manages to publish the result.
 */
class IEnvelopeProtector {
public:
    virtual ~IEnvelopeProtector() = default;

    [[nodiscard]] virtual Result<std::vector<uint8_t>, BridgeFailure> Protect(
        const codec::TelemetryEnvelope& envelope) = 0;

    [[nodiscard]] virtual Result<codec::TelemetryEnvelope, BridgeFailure> Unprotect(
        const std::string& device_id,
        std::span<const uint8_t> payload) = 0;

    [[nodiscard]] virtual bool IsEncrypting() const noexcept = 0;
};

}
