#pragma once

#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"

#include <open62541/types.h>

#include <chrono>
#include <optional>
#include <string>

namespace uabridge::opcua {

std::string ToStdString(const UA_String& value);

/**
 * @brief UA_DateTime (100 ns ticks since 1601-01-01 UTC) to system_clock
 *
 * Exact on platforms whose system_clock resolution is 100 ns or finer.
 * Values at or below zero are the OPC-UA "unspecified" MinValue, and values
 * system_clock cannot hold (MaxValue among them) are unrepresentable; both
 * yield nullopt.
 */
std::optional<std::chrono::system_clock::time_point> ToTimePoint(UA_DateTime value) noexcept;

UA_DateTime FromTimePoint(std::chrono::system_clock::time_point value) noexcept;

std::string StatusCodeName(UA_StatusCode code);

/**
 * @brief Deep copy of a UA_DataValue that releases itself
 *
 * open62541 frees notification payloads once the callback returns, so every
 * sample that crosses a thread boundary is copied into one of these first.
 */
class OwnedDataValue {
public:
    OwnedDataValue() noexcept;

    [[nodiscard]] static Result<OwnedDataValue, BridgeFailure> Copy(const UA_DataValue& value);

    ~OwnedDataValue();

    OwnedDataValue(OwnedDataValue&& other) noexcept;
    OwnedDataValue& operator=(OwnedDataValue&& other) noexcept;

    OwnedDataValue(const OwnedDataValue&) = delete;
    OwnedDataValue& operator=(const OwnedDataValue&) = delete;

    [[nodiscard]] const UA_DataValue& Get() const noexcept { return value_; }

    [[nodiscard]] UA_DataValue& Mutable() noexcept { return value_; }

private:
    UA_DataValue value_;
};

}
