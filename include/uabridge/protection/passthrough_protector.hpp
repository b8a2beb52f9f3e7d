#pragma once

#include "uabridge/interfaces/i_envelope_protector.hpp"

namespace uabridge::protection {

/// Publishes the envelope as protobuf JSON.
class PassthroughProtector final : public interfaces::IEnvelopeProtector {
public:
    [[nodiscard]] Result<std::vector<uint8_t>, BridgeFailure> Protect(
        const codec::TelemetryEnvelope& envelope) override;

    [[nodiscard]] Result<codec::TelemetryEnvelope, BridgeFailure> Unprotect(
        const std::string& device_id,
        std::span<const uint8_t> payload) override;

    [[nodiscard]] bool IsEncrypting() const noexcept override { return false; }
};

}
