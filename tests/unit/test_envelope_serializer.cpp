#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "uabridge/codec/envelope_serializer.hpp"

#include <chrono>

using namespace uabridge;
using namespace uabridge::codec;
using Catch::Matchers::ContainsSubstring;

namespace {
    TelemetryEnvelope Sample() {
        TelemetryEnvelope envelope;
        envelope.device_id = "pump-1";
        envelope.feature = "Temperature";
        envelope.node = "ns=2;s=Pump1.Temperature";
        envelope.value = TelemetryValue(21.5);
        envelope.timestamp = Timestamp{std::chrono::milliseconds{1700000000123}};
        envelope.source_timestamp = envelope.timestamp;
        envelope.status_code = 0;
        envelope.status_name = "Good";
        envelope.sequence = 3;
        return envelope;
    }
}

TEST_CASE("EnvelopeSerializer - Binary form", "[codec][serializer]") {
    SECTION("Every value shape survives") {
        const std::vector<TelemetryValue> values = {
            TelemetryValue(),
            TelemetryValue(false),
            TelemetryValue(int64_t{-42}),
            TelemetryValue(uint64_t{UINT64_MAX}),
            TelemetryValue(3.25),
            TelemetryValue("open"),
            TelemetryValue(std::vector<uint8_t>{0, 1, 255}),
            TelemetryValue(ValueArray{TelemetryValue(int64_t{1}), TelemetryValue(ValueArray{TelemetryValue("x")})}),
        };
        for (const auto& value : values) {
            auto envelope = Sample();
            envelope.value = value;
            auto bytes = EnvelopeSerializer::SerializeBinary(envelope).Unwrap();
            REQUIRE(EnvelopeSerializer::ParseBinary(bytes).Unwrap() == envelope);
        }
    }

    SECTION("Absent timestamps stay absent") {
        auto envelope = Sample();
        envelope.source_timestamp.reset();
        auto parsed = EnvelopeSerializer::ParseBinary(EnvelopeSerializer::SerializeBinary(envelope).Unwrap()).Unwrap();
        REQUIRE_FALSE(parsed.source_timestamp.has_value());
        REQUIRE_FALSE(parsed.server_timestamp.has_value());
    }

    SECTION("Garbage and anonymous envelopes are rejected") {
        auto garbage = EnvelopeSerializer::ParseBinary(std::vector<uint8_t>{0xFF, 0xFF, 0xFF, 0xFF});
        REQUIRE(garbage.IsErr());
        REQUIRE(garbage.UnwrapErr().type == BridgeFailureType::Decoding);

        auto anonymous = Sample();
        anonymous.device_id.clear();
        auto bytes = EnvelopeSerializer::SerializeBinary(anonymous).Unwrap();
        REQUIRE(EnvelopeSerializer::ParseBinary(bytes).IsErr());
    }
}

TEST_CASE("EnvelopeSerializer - JSON form", "[codec][serializer][json]") {
    auto json = EnvelopeSerializer::SerializeJson(Sample()).Unwrap();

    SECTION("Uses original field names and RFC 3339 timestamps") {
        REQUIRE_THAT(json, ContainsSubstring("\"device_id\":\"pump-1\""));
        REQUIRE_THAT(json, ContainsSubstring("\"double_value\":21.5"));
        REQUIRE_THAT(json, ContainsSubstring("\"timestamp\":\"2023-11-14T22:13:20.123Z\""));
        REQUIRE_THAT(json, ContainsSubstring("\"sequence\":\"3\""));
    }

    SECTION("Parses back to the same envelope") {
        REQUIRE(EnvelopeSerializer::ParseJson(json).Unwrap() == Sample());
    }

    SECTION("Hand written JSON is accepted") {
        auto parsed = EnvelopeSerializer::ParseJson(R"({
            "device_id": "valve-2",
            "feature": "Position",
            "value": {"int_value": "-7"},
            "timestamp": "2024-01-01T00:00:00Z",
            "sequence": 1
        })").Unwrap();
        REQUIRE(parsed.device_id == "valve-2");
        REQUIRE(parsed.value == TelemetryValue(int64_t{-7}));
        REQUIRE(parsed.sequence == 1);
    }

    SECTION("Full channel state renders as a feature object") {
        auto envelope = Sample();
        envelope.features = {
            {"Temperature", TelemetryValue(21.5)},
            {"Running", TelemetryValue(true)},
        };
        const auto full = EnvelopeSerializer::SerializeJson(envelope).Unwrap();
        REQUIRE_THAT(full, ContainsSubstring("\"features\":{"));
        REQUIRE_THAT(full, ContainsSubstring("\"Running\":{\"bool_value\":true}"));
        REQUIRE(EnvelopeSerializer::ParseJson(full).Unwrap() == envelope);
        REQUIRE(EnvelopeSerializer::ParseBinary(
            EnvelopeSerializer::SerializeBinary(envelope).Unwrap()).Unwrap().features == envelope.features);
        REQUIRE_THAT(json, !ContainsSubstring("features"));
    }

    SECTION("Unknown fields are rejected") {
        auto result = EnvelopeSerializer::ParseJson(R"({"device_id":"pump-1","colour":"red"})");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == BridgeFailureType::Decoding);
    }

    SECTION("Malformed JSON is rejected") {
        REQUIRE(EnvelopeSerializer::ParseJson("{not json").IsErr());
    }
}
