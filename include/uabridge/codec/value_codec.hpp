#pragma once

#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"
#include "uabridge/codec/telemetry_envelope.hpp"

#include <open62541/types.h>

#include <cstdint>
#include <string>

namespace uabridge::codec {

struct SampleContext {
    std::string device_id;
    std::string feature;
    std::string node;
    uint64_t sequence = 0;
    Timestamp received_at{};
};

/**
 * @brief OPC-UA DataValue to TelemetryEnvelope
 *
 * Stateless. Accepts every builtin scalar and arrays of them; structured
 * payloads (ExtensionObject, DiagnosticInfo, nested Variant or DataValue)
 * fail with a Decoding failure so the sample can be dropped on its own.
 */
class ValueCodec {
public:
    [[nodiscard]] static Result<TelemetryEnvelope, BridgeFailure> Encode(
        const SampleContext& context,
        const UA_DataValue& value);

    [[nodiscard]] static Result<TelemetryValue, BridgeFailure> ConvertVariant(const UA_Variant& variant);
};

}
