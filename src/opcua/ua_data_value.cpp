#include "uabridge/opcua/ua_data_value.hpp"

#include <format>

#include <cstring>

namespace uabridge::opcua {

std::string ToStdString(const UA_String& value) {
    if (value.length == 0 || value.data == nullptr) {
        return {};
    }
    return {reinterpret_cast<const char*>(value.data), value.length};
}

std::optional<std::chrono::system_clock::time_point> ToTimePoint(const UA_DateTime value) noexcept {
    using Ticks = std::chrono::duration<int64_t, std::ratio<1, UA_DATETIME_SEC>>;
    using Clock = std::chrono::system_clock;
    if (value <= 0) {
        return std::nullopt;
    }
    const Ticks since_epoch(value - UA_DATETIME_UNIX_EPOCH);
    if (since_epoch > std::chrono::duration_cast<Ticks>(Clock::duration::max()) ||
        since_epoch < std::chrono::duration_cast<Ticks>(Clock::duration::min())) {
        return std::nullopt;
    }
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(since_epoch));
}

UA_DateTime FromTimePoint(const std::chrono::system_clock::time_point value) noexcept {
    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(value.time_since_epoch()).count();
    return static_cast<UA_DateTime>(ns / 100) + UA_DATETIME_UNIX_EPOCH;
}

std::string StatusCodeName(const UA_StatusCode code) {
    const char* name = UA_StatusCode_name(code);
    if (name == nullptr || std::strcmp(name, "Unknown StatusCode") == 0) {
        return std::format("0x{:08X}", code);
    }
    return name;
}

OwnedDataValue::OwnedDataValue() noexcept {
    UA_DataValue_init(&value_);
}

Result<OwnedDataValue, BridgeFailure> OwnedDataValue::Copy(const UA_DataValue& value) {
    OwnedDataValue owned;
    const UA_StatusCode status = UA_DataValue_copy(&value, &owned.value_);
    if (status != UA_STATUSCODE_GOOD) {
        return Result<OwnedDataValue, BridgeFailure>::Err(BridgeFailure::Decoding(
            std::format("Failed to copy data value: {}", StatusCodeName(status))));
    }
    return Result<OwnedDataValue, BridgeFailure>::Ok(std::move(owned));
}

OwnedDataValue::~OwnedDataValue() {
    UA_DataValue_clear(&value_);
}

OwnedDataValue::OwnedDataValue(OwnedDataValue&& other) noexcept
    : value_(other.value_) {
    UA_DataValue_init(&other.value_);
}

OwnedDataValue& OwnedDataValue::operator=(OwnedDataValue&& other) noexcept {
    if (this != &other) {
        UA_DataValue_clear(&value_);
        value_ = other.value_;
        UA_DataValue_init(&other.value_);
    }
    return *this;
}

}
