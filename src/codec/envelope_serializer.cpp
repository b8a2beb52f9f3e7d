#include "uabridge/codec/envelope_serializer.hpp"

#include <format>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>

namespace uabridge::codec {

using google::protobuf::util::TimeUtil;

namespace {

    google::protobuf::Timestamp ToProtoTimestamp(const Timestamp value) {
        return TimeUtil::NanosecondsToTimestamp(
            std::chrono::duration_cast<std::chrono::nanoseconds>(value.time_since_epoch()).count());
    }

    Timestamp FromProtoTimestamp(const google::protobuf::Timestamp& value) {
        return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
            std::chrono::nanoseconds(TimeUtil::TimestampToNanoseconds(value))));
    }

    void ValueToProto(const TelemetryValue& value, proto::telemetry::TelemetryValue* out) {
        std::visit([out](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                out->set_empty(true);
            } else if constexpr (std::is_same_v<T, bool>) {
                out->set_bool_value(v);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                out->set_int_value(v);
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                out->set_uint_value(v);
            } else if constexpr (std::is_same_v<T, double>) {
                out->set_double_value(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                out->set_string_value(v);
            } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
                out->set_bytes_value(v.data(), v.size());
            } else {
                auto* array = out->mutable_array_value();
                for (const auto& item : v) {
                    ValueToProto(item, array->add_items());
                }
            }
        }, value.data);
    }

    Result<TelemetryValue, BridgeFailure> ValueFromProto(const proto::telemetry::TelemetryValue& value) {
        using ResultType = Result<TelemetryValue, BridgeFailure>;
        using Kind = proto::telemetry::TelemetryValue::KindCase;
        switch (value.kind_case()) {
            case Kind::KIND_NOT_SET:
            case Kind::kEmpty:
                return ResultType::Ok(TelemetryValue());
            case Kind::kBoolValue:
                return ResultType::Ok(TelemetryValue(value.bool_value()));
            case Kind::kIntValue:
                return ResultType::Ok(TelemetryValue(int64_t{value.int_value()}));
            case Kind::kUintValue:
                return ResultType::Ok(TelemetryValue(uint64_t{value.uint_value()}));
            case Kind::kDoubleValue:
                return ResultType::Ok(TelemetryValue(value.double_value()));
            case Kind::kStringValue:
                return ResultType::Ok(TelemetryValue(value.string_value()));
            case Kind::kBytesValue: {
                const auto& bytes = value.bytes_value();
                return ResultType::Ok(TelemetryValue(std::vector<uint8_t>(bytes.begin(), bytes.end())));
            }
            case Kind::kArrayValue: {
                ValueArray items;
                items.reserve(value.array_value().items_size());
                for (const auto& item : value.array_value().items()) {
                    auto converted = ValueFromProto(item);
                    if (converted.IsErr()) {
                        return converted;
                    }
                    items.push_back(std::move(converted).Unwrap());
                }
                return ResultType::Ok(TelemetryValue(std::move(items)));
            }
        }
        return ResultType::Err(BridgeFailure::Decoding("Unknown telemetry value kind"));
    }

}

proto::telemetry::TelemetryEnvelope EnvelopeSerializer::ToProto(const TelemetryEnvelope& envelope) {
    proto::telemetry::TelemetryEnvelope message;
    message.set_device_id(envelope.device_id);
    message.set_feature(envelope.feature);
    message.set_node(envelope.node);
    ValueToProto(envelope.value, message.mutable_value());
    *message.mutable_timestamp() = ToProtoTimestamp(envelope.timestamp);
    if (envelope.source_timestamp.has_value()) {
        *message.mutable_source_timestamp() = ToProtoTimestamp(*envelope.source_timestamp);
    }
    if (envelope.server_timestamp.has_value()) {
        *message.mutable_server_timestamp() = ToProtoTimestamp(*envelope.server_timestamp);
    }
    message.set_status_code(envelope.status_code);
    message.set_status_name(envelope.status_name);
    message.set_sequence(envelope.sequence);
    for (const auto& [feature, value] : envelope.features) {
        ValueToProto(value, &(*message.mutable_features())[feature]);
    }
    return message;
}

Result<TelemetryEnvelope, BridgeFailure> EnvelopeSerializer::FromProto(
    const proto::telemetry::TelemetryEnvelope& message) {
    if (message.device_id().empty()) {
        return Result<TelemetryEnvelope, BridgeFailure>::Err(
            BridgeFailure::Decoding("Envelope has no device id"));
    }
    auto value = ValueFromProto(message.value());
    if (value.IsErr()) {
        return Result<TelemetryEnvelope, BridgeFailure>::Err(std::move(value).UnwrapErr());
    }

    TelemetryEnvelope envelope;
    envelope.device_id = message.device_id();
    envelope.feature = message.feature();
    envelope.node = message.node();
    envelope.value = std::move(value).Unwrap();
    envelope.timestamp = FromProtoTimestamp(message.timestamp());
    if (message.has_source_timestamp()) {
        envelope.source_timestamp = FromProtoTimestamp(message.source_timestamp());
    }
    if (message.has_server_timestamp()) {
        envelope.server_timestamp = FromProtoTimestamp(message.server_timestamp());
    }
    envelope.status_code = message.status_code();
    envelope.status_name = message.status_name();
    envelope.sequence = message.sequence();
    for (const auto& [feature, feature_value] : message.features()) {
        auto converted = ValueFromProto(feature_value);
        if (converted.IsErr()) {
            return Result<TelemetryEnvelope, BridgeFailure>::Err(std::move(converted).UnwrapErr());
        }
        envelope.features.emplace(feature, std::move(converted).Unwrap());
    }
    return Result<TelemetryEnvelope, BridgeFailure>::Ok(std::move(envelope));
}

Result<std::vector<uint8_t>, BridgeFailure> EnvelopeSerializer::SerializeBinary(const TelemetryEnvelope& envelope) {
    const auto message = ToProto(envelope);
    std::vector<uint8_t> bytes(message.ByteSizeLong());
    if (!message.SerializeToArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(
            BridgeFailure::Decoding("Failed to serialize telemetry envelope"));
    }
    return Result<std::vector<uint8_t>, BridgeFailure>::Ok(std::move(bytes));
}

Result<TelemetryEnvelope, BridgeFailure> EnvelopeSerializer::ParseBinary(std::span<const uint8_t> bytes) {
    proto::telemetry::TelemetryEnvelope message;
    if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<TelemetryEnvelope, BridgeFailure>::Err(
            BridgeFailure::Decoding("Malformed telemetry envelope"));
    }
    return FromProto(message);
}

Result<std::string, BridgeFailure> EnvelopeSerializer::SerializeJson(const TelemetryEnvelope& envelope) {
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;

    std::string json;
    const auto status = google::protobuf::util::MessageToJsonString(ToProto(envelope), &json, options);
    if (!status.ok()) {
        return Result<std::string, BridgeFailure>::Err(BridgeFailure::Decoding(
            std::format("Failed to render envelope as JSON: {}", std::string(status.message()))));
    }
    return Result<std::string, BridgeFailure>::Ok(std::move(json));
}

Result<TelemetryEnvelope, BridgeFailure> EnvelopeSerializer::ParseJson(std::string_view json) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    proto::telemetry::TelemetryEnvelope message;
    const auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &message, options);
    if (!status.ok()) {
        return Result<TelemetryEnvelope, BridgeFailure>::Err(BridgeFailure::Decoding(
            std::format("Invalid envelope JSON: {}", std::string(status.message()))));
    }
    return FromProto(message);
}

}
