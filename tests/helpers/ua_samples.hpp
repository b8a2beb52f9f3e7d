#pragma once
#include "uabridge/opcua/data_change_stream.hpp"
#include "uabridge/opcua/ua_data_value.hpp"

#include <open62541/types.h>

#include <chrono>
#include <optional>
#include <string>

namespace uabridge::test_helpers {

/// Owned DataValue holding one scalar of `type`, with an optional source timestamp.
template<typename T>
opcua::OwnedDataValue MakeScalar(
    const T& value,
    const UA_DataType* type,
    std::optional<std::chrono::system_clock::time_point> source_time = std::nullopt) {
    UA_DataValue raw;
    UA_DataValue_init(&raw);
    UA_Variant_setScalar(&raw.value, const_cast<T*>(&value), type);
    raw.hasValue = true;
    if (source_time.has_value()) {
        raw.sourceTimestamp = opcua::FromTimePoint(*source_time);
        raw.hasSourceTimestamp = true;
    }
    // Copy() deep-copies, so pointing the variant at a stack value is fine here.
    return opcua::OwnedDataValue::Copy(raw).Unwrap();
}

inline opcua::OwnedDataValue MakeDouble(const double value) {
    return MakeScalar(value, &UA_TYPES[UA_TYPES_DOUBLE]);
}

inline opcua::DataChangeEvent MakeChange(
    const std::string& connection,
    const std::string& subscription,
    const std::string& node,
    opcua::OwnedDataValue value) {
    return opcua::DataChangeEvent{
        connection, subscription, node, std::move(value), std::chrono::system_clock::now()};
}

inline opcua::ItemStatusEvent MakeSubscribed(
    const std::string& connection,
    const std::string& subscription,
    const std::string& node) {
    return opcua::ItemStatusEvent{
        connection, subscription, node, true, UA_STATUSCODE_GOOD, std::chrono::system_clock::now()};
}

}
