#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace uabridge::codec {

struct TelemetryValue;

using ValueArray = std::vector<TelemetryValue>;

/**
 * @brief Closed set of value shapes a sample can carry
 *
 * Every OPC-UA builtin scalar maps onto exactly one alternative. Integers
 * keep their signedness, Float and Double both widen to double without
 * loss, and textual OPC-UA types (NodeId, Guid, LocalizedText, ...) become
 * their canonical string form.
 */
struct TelemetryValue {
    using Storage = std::variant<
        std::monostate,
        bool,
        int64_t,
        uint64_t,
        double,
        std::string,
        std::vector<uint8_t>,
        ValueArray>;

    Storage data;

    TelemetryValue() = default;

    TelemetryValue(bool value) : data(value) {}
    TelemetryValue(int64_t value) : data(value) {}
    TelemetryValue(uint64_t value) : data(value) {}
    TelemetryValue(double value) : data(value) {}
    TelemetryValue(std::string value) : data(std::move(value)) {}
    TelemetryValue(const char* value) : data(std::string(value)) {}
    TelemetryValue(std::vector<uint8_t> value) : data(std::move(value)) {}
    TelemetryValue(ValueArray value) : data(std::move(value)) {}

    [[nodiscard]] bool IsEmpty() const noexcept { return std::holds_alternative<std::monostate>(data); }

    template<typename T>
    [[nodiscard]] bool Is() const noexcept { return std::holds_alternative<T>(data); }

    template<typename T>
    [[nodiscard]] const T& As() const { return std::get<T>(data); }

    bool operator==(const TelemetryValue& other) const { return data == other.data; }
};

}
