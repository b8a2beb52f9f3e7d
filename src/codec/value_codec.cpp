#include "uabridge/codec/value_codec.hpp"
#include "uabridge/opcua/node_reference.hpp"
#include "uabridge/opcua/ua_data_value.hpp"

#include <algorithm>
#include <format>
#include <string_view>
#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/util/time_util.h>

namespace uabridge::codec {

using opcua::ToStdString;
using opcua::ToTimePoint;

namespace {

    std::string FormatGuid(const UA_Guid& guid) {
        return std::format(
            "{:08x}-{:04x}-{:04x}-{:02x}{:02x}-{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}",
            guid.data1, guid.data2, guid.data3,
            guid.data4[0], guid.data4[1], guid.data4[2], guid.data4[3],
            guid.data4[4], guid.data4[5], guid.data4[6], guid.data4[7]);
    }

    // 9999-12-31T23:59:59.9999999Z, the last instant RFC 3339 can print.
    constexpr UA_DateTime LAST_PRINTABLE_DATETIME = 2650467743999999999;

    // Works in whole ticks so every UA_DateTime is formatted without overflow.
    // OPC-UA clamps to MinValue (1601) and MaxValue the same way.
    std::string FormatDateTime(const UA_DateTime value) {
        using google::protobuf::util::TimeUtil;
        const UA_DateTime clamped = std::clamp<UA_DateTime>(value, 0, LAST_PRINTABLE_DATETIME);
        const int64_t unix_seconds = clamped / UA_DATETIME_SEC - UA_DATETIME_UNIX_EPOCH / UA_DATETIME_SEC;
        const auto nanos = static_cast<int32_t>((clamped % UA_DATETIME_SEC) * 100);

        google::protobuf::Timestamp timestamp;
        timestamp.set_seconds(unix_seconds);
        timestamp.set_nanos(nanos);
        return TimeUtil::ToString(timestamp);
    }

    std::vector<uint8_t> ToBytes(const UA_ByteString& value) {
        if (value.length == 0 || value.data == nullptr) {
            return {};
        }
        return {value.data, value.data + value.length};
    }

    // Strict UTF-8: no overlong forms, no surrogates, nothing past U+10FFFF.
    bool IsValidUtf8(const std::string_view text) {
        size_t i = 0;
        while (i < text.size()) {
            const auto lead = static_cast<uint8_t>(text[i]);
            size_t length = 0;
            uint8_t low = 0x80;
            uint8_t high = 0xBF;
            if (lead < 0x80) {
                ++i;
                continue;
            }
            if (lead >= 0xC2 && lead <= 0xDF) {
                length = 2;
            } else if (lead >= 0xE0 && lead <= 0xEF) {
                length = 3;
                low = lead == 0xE0 ? 0xA0 : 0x80;
                high = lead == 0xED ? 0x9F : 0xBF;
            } else if (lead >= 0xF0 && lead <= 0xF4) {
                length = 4;
                low = lead == 0xF0 ? 0x90 : 0x80;
                high = lead == 0xF4 ? 0x8F : 0xBF;
            } else {
                return false;
            }
            if (text.size() - i < length) {
                return false;
            }
            for (size_t k = 1; k < length; ++k) {
                const auto next = static_cast<uint8_t>(text[i + k]);
                const uint8_t min = k == 1 ? low : 0x80;
                const uint8_t max = k == 1 ? high : 0xBF;
                if (next < min || next > max) {
                    return false;
                }
            }
            i += length;
        }
        return true;
    }

    Result<TelemetryValue, BridgeFailure> Text(std::string text) {
        if (!IsValidUtf8(text)) {
            return Result<TelemetryValue, BridgeFailure>::Err(
                BridgeFailure::Decoding("Text value is not valid UTF-8"));
        }
        return Result<TelemetryValue, BridgeFailure>::Ok(TelemetryValue(std::move(text)));
    }

    Result<TelemetryValue, BridgeFailure> ConvertScalar(const UA_DataType& type, const void* data) {
        using ResultType = Result<TelemetryValue, BridgeFailure>;
        switch (static_cast<UA_DataTypeKind>(type.typeKind)) {
            case UA_DATATYPEKIND_BOOLEAN:
                return ResultType::Ok(TelemetryValue(*static_cast<const UA_Boolean*>(data) != 0));
            case UA_DATATYPEKIND_SBYTE:
                return ResultType::Ok(TelemetryValue(int64_t{*static_cast<const UA_SByte*>(data)}));
            case UA_DATATYPEKIND_BYTE:
                return ResultType::Ok(TelemetryValue(uint64_t{*static_cast<const UA_Byte*>(data)}));
            case UA_DATATYPEKIND_INT16:
                return ResultType::Ok(TelemetryValue(int64_t{*static_cast<const UA_Int16*>(data)}));
            case UA_DATATYPEKIND_UINT16:
                return ResultType::Ok(TelemetryValue(uint64_t{*static_cast<const UA_UInt16*>(data)}));
            case UA_DATATYPEKIND_INT32:
                return ResultType::Ok(TelemetryValue(int64_t{*static_cast<const UA_Int32*>(data)}));
            case UA_DATATYPEKIND_UINT32:
                return ResultType::Ok(TelemetryValue(uint64_t{*static_cast<const UA_UInt32*>(data)}));
            case UA_DATATYPEKIND_INT64:
                return ResultType::Ok(TelemetryValue(int64_t{*static_cast<const UA_Int64*>(data)}));
            case UA_DATATYPEKIND_UINT64:
                return ResultType::Ok(TelemetryValue(uint64_t{*static_cast<const UA_UInt64*>(data)}));
            case UA_DATATYPEKIND_FLOAT:
                return ResultType::Ok(TelemetryValue(static_cast<double>(*static_cast<const UA_Float*>(data))));
            case UA_DATATYPEKIND_DOUBLE:
                return ResultType::Ok(TelemetryValue(double{*static_cast<const UA_Double*>(data)}));
            case UA_DATATYPEKIND_STRING:
                return Text(ToStdString(*static_cast<const UA_String*>(data)));
            case UA_DATATYPEKIND_XMLELEMENT:
                return Text(ToStdString(*static_cast<const UA_XmlElement*>(data)));
            case UA_DATATYPEKIND_DATETIME:
                return ResultType::Ok(TelemetryValue(FormatDateTime(*static_cast<const UA_DateTime*>(data))));
            case UA_DATATYPEKIND_GUID:
                return ResultType::Ok(TelemetryValue(FormatGuid(*static_cast<const UA_Guid*>(data))));
            case UA_DATATYPEKIND_STATUSCODE:
                return ResultType::Ok(TelemetryValue(
                    opcua::StatusCodeName(*static_cast<const UA_StatusCode*>(data))));
            case UA_DATATYPEKIND_BYTESTRING:
                return ResultType::Ok(TelemetryValue(ToBytes(*static_cast<const UA_ByteString*>(data))));
            case UA_DATATYPEKIND_QUALIFIEDNAME: {
                const auto* name = static_cast<const UA_QualifiedName*>(data);
                return Text(std::format("{}:{}", name->namespaceIndex, ToStdString(name->name)));
            }
            case UA_DATATYPEKIND_LOCALIZEDTEXT:
                return Text(ToStdString(static_cast<const UA_LocalizedText*>(data)->text));
            case UA_DATATYPEKIND_NODEID:
                return Text(opcua::NodeIdToString(*static_cast<const UA_NodeId*>(data)));
            case UA_DATATYPEKIND_EXPANDEDNODEID:
                return Text(opcua::ExpandedNodeIdToString(*static_cast<const UA_ExpandedNodeId*>(data)));
            case UA_DATATYPEKIND_ENUM:
                return ResultType::Ok(TelemetryValue(int64_t{*static_cast<const UA_Int32*>(data)}));
            default:
                return ResultType::Err(BridgeFailure::Decoding(
                    std::format("Unsupported value type (kind {})", static_cast<int>(type.typeKind))));
        }
    }

}

Result<TelemetryValue, BridgeFailure> ValueCodec::ConvertVariant(const UA_Variant& variant) {
    using ResultType = Result<TelemetryValue, BridgeFailure>;
    if (UA_Variant_isEmpty(&variant)) {
        return ResultType::Ok(TelemetryValue());
    }
    const UA_DataType& type = *variant.type;
    if (UA_Variant_isScalar(&variant)) {
        return ConvertScalar(type, variant.data);
    }

    ValueArray items;
    items.reserve(variant.arrayLength);
    const auto* cursor = static_cast<const uint8_t*>(variant.data);
    for (size_t i = 0; i < variant.arrayLength; ++i) {
        auto item = ConvertScalar(type, cursor + i * type.memSize);
        if (item.IsErr()) {
            return ResultType::Err(BridgeFailure::Decoding(
                std::format("Array element {}: {}", i, item.UnwrapErr().message)));
        }
        items.push_back(std::move(item).Unwrap());
    }
    return ResultType::Ok(TelemetryValue(std::move(items)));
}

Result<TelemetryEnvelope, BridgeFailure> ValueCodec::Encode(
    const SampleContext& context,
    const UA_DataValue& value) {
    TelemetryEnvelope envelope;
    envelope.device_id = context.device_id;
    envelope.feature = context.feature;
    envelope.node = context.node;
    envelope.sequence = context.sequence;

    if (value.hasValue) {
        auto converted = ConvertVariant(value.value);
        if (converted.IsErr()) {
            return Result<TelemetryEnvelope, BridgeFailure>::Err(BridgeFailure::Decoding(
                std::format("Node {}: {}", context.node, converted.UnwrapErr().message)));
        }
        envelope.value = std::move(converted).Unwrap();
    }

    if (value.hasSourceTimestamp) {
        envelope.source_timestamp = ToTimePoint(value.sourceTimestamp);
    }
    if (value.hasServerTimestamp) {
        envelope.server_timestamp = ToTimePoint(value.serverTimestamp);
    }
    // Unspecified or unrepresentable timestamps fall through to the next source.
    envelope.timestamp = envelope.source_timestamp.value_or(
        envelope.server_timestamp.value_or(context.received_at));

    envelope.status_code = value.hasStatus ? value.status : UA_STATUSCODE_GOOD;
    envelope.status_name = opcua::StatusCodeName(envelope.status_code);
    return Result<TelemetryEnvelope, BridgeFailure>::Ok(std::move(envelope));
}

}
