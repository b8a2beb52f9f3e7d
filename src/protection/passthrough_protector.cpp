#include "uabridge/protection/passthrough_protector.hpp"
#include "uabridge/codec/envelope_serializer.hpp"

#include <string_view>

namespace uabridge::protection {

using codec::EnvelopeSerializer;
using codec::TelemetryEnvelope;

Result<std::vector<uint8_t>, BridgeFailure> PassthroughProtector::Protect(const TelemetryEnvelope& envelope) {
    auto json = EnvelopeSerializer::SerializeJson(envelope);
    if (json.IsErr()) {
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(std::move(json).UnwrapErr());
    }
    const auto& text = json.Unwrap();
    return Result<std::vector<uint8_t>, BridgeFailure>::Ok(std::vector<uint8_t>(text.begin(), text.end()));
}

Result<TelemetryEnvelope, BridgeFailure> PassthroughProtector::Unprotect(
    const std::string& device_id,
    std::span<const uint8_t> payload) {
    auto envelope = EnvelopeSerializer::ParseJson(
        std::string_view(reinterpret_cast<const char*>(payload.data()), payload.size()));
    if (envelope.IsOk() && !device_id.empty() && envelope.Unwrap().device_id != device_id) {
        return Result<TelemetryEnvelope, BridgeFailure>::Err(BridgeFailure::Decoding(
            "Envelope belongs to device " + envelope.Unwrap().device_id));
    }
    return envelope;
}

}
