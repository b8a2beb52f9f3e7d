#pragma once

#include "uabridge/codec/telemetry_value.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace uabridge::codec {

using Timestamp = std::chrono::system_clock::time_point;

struct TelemetryEnvelope {
    std::string device_id;
    std::string feature;
    std::string node;
    TelemetryValue value;
    /// Source timestamp, else server timestamp, else the time the sample arrived. Always UTC.
    Timestamp timestamp{};
    std::optional<Timestamp> source_timestamp;
    std::optional<Timestamp> server_timestamp;
    uint32_t status_code = 0;
    std::string status_name;
    uint64_t sequence = 0;
    /// Full channel state by feature; empty unless the channel publishes full state.
    std::map<std::string, TelemetryValue> features;

    bool operator==(const TelemetryEnvelope&) const = default;
};

}
