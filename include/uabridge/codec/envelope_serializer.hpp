#pragma once

#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"
#include "uabridge/codec/telemetry_envelope.hpp"

#include "telemetry/envelope.pb.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace uabridge::codec {

/**
 * @brief Wire forms of a TelemetryEnvelope
 *
 * Binary protobuf is the plaintext inside Megolm messages; protobuf JSON
 * (original field names) is what unencrypted channels publish and what the
 * offline tools read and print.
 */
class EnvelopeSerializer {
public:
    [[nodiscard]] static proto::telemetry::TelemetryEnvelope ToProto(const TelemetryEnvelope& envelope);

    [[nodiscard]] static Result<TelemetryEnvelope, BridgeFailure> FromProto(
        const proto::telemetry::TelemetryEnvelope& message);

    [[nodiscard]] static Result<std::vector<uint8_t>, BridgeFailure> SerializeBinary(const TelemetryEnvelope& envelope);

    [[nodiscard]] static Result<TelemetryEnvelope, BridgeFailure> ParseBinary(std::span<const uint8_t> bytes);

    [[nodiscard]] static Result<std::string, BridgeFailure> SerializeJson(const TelemetryEnvelope& envelope);

    [[nodiscard]] static Result<TelemetryEnvelope, BridgeFailure> ParseJson(std::string_view json);
};

}
