#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "uabridge/codec/value_codec.hpp"
#include "uabridge/opcua/ua_data_value.hpp"
#include "helpers/ua_samples.hpp"

#include <chrono>

using namespace uabridge;
using namespace uabridge::codec;
using test_helpers::MakeScalar;

namespace {
    SampleContext Context(const uint64_t sequence = 1) {
        return SampleContext{"pump-1", "Temperature", "ns=2;s=Pump1.Temperature", sequence,
                             std::chrono::system_clock::time_point{std::chrono::seconds{1700000000}}};
    }

    TelemetryValue Convert(const opcua::OwnedDataValue& value) {
        return ValueCodec::ConvertVariant(value.Get().value).Unwrap();
    }
}

TEST_CASE("ValueCodec - Scalar conversion", "[codec][value]") {
    SECTION("Booleans") {
        const UA_Boolean on = true;
        REQUIRE(Convert(MakeScalar(on, &UA_TYPES[UA_TYPES_BOOLEAN])) == TelemetryValue(true));
    }

    SECTION("Signed integers widen to int64") {
        const UA_SByte small = -5;
        const UA_Int32 mid = -70000;
        const UA_Int64 big = INT64_MIN;
        REQUIRE(Convert(MakeScalar(small, &UA_TYPES[UA_TYPES_SBYTE])) == TelemetryValue(int64_t{-5}));
        REQUIRE(Convert(MakeScalar(mid, &UA_TYPES[UA_TYPES_INT32])) == TelemetryValue(int64_t{-70000}));
        REQUIRE(Convert(MakeScalar(big, &UA_TYPES[UA_TYPES_INT64])) == TelemetryValue(int64_t{INT64_MIN}));
    }

    SECTION("Unsigned integers keep their signedness") {
        const UA_Byte byte = 200;
        const UA_UInt64 max = UINT64_MAX;
        auto converted = Convert(MakeScalar(byte, &UA_TYPES[UA_TYPES_BYTE]));
        REQUIRE(converted.Is<uint64_t>());
        REQUIRE(converted.As<uint64_t>() == 200);
        REQUIRE(Convert(MakeScalar(max, &UA_TYPES[UA_TYPES_UINT64])) == TelemetryValue(uint64_t{UINT64_MAX}));
    }

    SECTION("Floats widen to double without loss") {
        const UA_Float value = 0.1f;
        auto converted = Convert(MakeScalar(value, &UA_TYPES[UA_TYPES_FLOAT]));
        REQUIRE(converted.Is<double>());
        REQUIRE(converted.As<double>() == static_cast<double>(0.1f));
    }

    SECTION("Strings and byte strings") {
        UA_String text = UA_STRING_STATIC("running");
        REQUIRE(Convert(MakeScalar(text, &UA_TYPES[UA_TYPES_STRING])) == TelemetryValue("running"));

        UA_Byte raw[] = {0x00, 0xFF, 0x10};
        UA_ByteString bytes{sizeof(raw), raw};
        REQUIRE(Convert(MakeScalar(bytes, &UA_TYPES[UA_TYPES_BYTESTRING]))
                == TelemetryValue(std::vector<uint8_t>{0x00, 0xFF, 0x10}));
    }

    SECTION("Textual OPC-UA types become strings") {
        UA_NodeId node = UA_NODEID_NUMERIC(2, 1001);
        auto node_text = Convert(MakeScalar(node, &UA_TYPES[UA_TYPES_NODEID]));
        REQUIRE(node_text.Is<std::string>());
        REQUIRE(node_text.As<std::string>() == "ns=2;i=1001");

        UA_QualifiedName name = UA_QUALIFIEDNAME(3, const_cast<char*>("Speed"));
        REQUIRE(Convert(MakeScalar(name, &UA_TYPES[UA_TYPES_QUALIFIEDNAME])) == TelemetryValue("3:Speed"));

        UA_LocalizedText label = UA_LOCALIZEDTEXT(const_cast<char*>("en"), const_cast<char*>("Open"));
        REQUIRE(Convert(MakeScalar(label, &UA_TYPES[UA_TYPES_LOCALIZEDTEXT])) == TelemetryValue("Open"));

        const UA_StatusCode status = UA_STATUSCODE_BADTIMEOUT;
        REQUIRE(Convert(MakeScalar(status, &UA_TYPES[UA_TYPES_STATUSCODE])) == TelemetryValue("BadTimeout"));
    }

    SECTION("Guid uses the canonical form") {
        UA_Guid guid{0x12345678, 0x9abc, 0xdef0, {0x01, 0x23, 0x45, 0x67, 0x89, 0xab, 0xcd, 0xef}};
        REQUIRE(Convert(MakeScalar(guid, &UA_TYPES[UA_TYPES_GUID]))
                == TelemetryValue("12345678-9abc-def0-0123-456789abcdef"));
    }

    SECTION("DateTime becomes RFC 3339 UTC") {
        const UA_DateTime when = opcua::FromTimePoint(
            std::chrono::system_clock::time_point{std::chrono::seconds{1700000000}});
        REQUIRE(Convert(MakeScalar(when, &UA_TYPES[UA_TYPES_DATETIME]))
                == TelemetryValue("2023-11-14T22:13:20Z"));
    }

    SECTION("DateTime MinValue and MaxValue clamp instead of overflowing") {
        const UA_DateTime min_value = 0;
        const UA_DateTime max_value = INT64_MAX;
        const UA_DateTime negative = INT64_MIN;
        REQUIRE(Convert(MakeScalar(min_value, &UA_TYPES[UA_TYPES_DATETIME]))
                == TelemetryValue("1601-01-01T00:00:00Z"));
        REQUIRE(Convert(MakeScalar(negative, &UA_TYPES[UA_TYPES_DATETIME]))
                == TelemetryValue("1601-01-01T00:00:00Z"));
        auto latest = Convert(MakeScalar(max_value, &UA_TYPES[UA_TYPES_DATETIME]));
        REQUIRE(latest.Is<std::string>());
        REQUIRE_THAT(latest.As<std::string>(), Catch::Matchers::StartsWith("9999-12-31T23:59:59"));
    }
}

TEST_CASE("ValueCodec - Arrays and unsupported types", "[codec][value]") {
    SECTION("Arrays convert element by element") {
        UA_Int16 values[] = {1, -2, 3};
        UA_DataValue raw;
        UA_DataValue_init(&raw);
        UA_Variant_setArray(&raw.value, values, 3, &UA_TYPES[UA_TYPES_INT16]);
        raw.hasValue = true;
        auto owned = opcua::OwnedDataValue::Copy(raw).Unwrap();

        auto converted = Convert(owned);
        REQUIRE(converted.Is<ValueArray>());
        REQUIRE(converted.As<ValueArray>() == ValueArray{int64_t{1}, int64_t{-2}, int64_t{3}});
    }

    SECTION("Empty variant is an empty value") {
        UA_Variant empty;
        UA_Variant_init(&empty);
        REQUIRE(ValueCodec::ConvertVariant(empty).Unwrap().IsEmpty());
    }

    SECTION("Text that is not UTF-8 is a decoding failure") {
        char broken[] = {'\xC3', '\x28'};
        UA_String text{sizeof(broken), reinterpret_cast<UA_Byte*>(broken)};
        auto owned = MakeScalar(text, &UA_TYPES[UA_TYPES_STRING]);
        auto result = ValueCodec::Encode(Context(), owned.Get());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == BridgeFailureType::Decoding);

        char surrogate[] = {'\xED', '\xA0', '\x80'};
        UA_LocalizedText label{UA_STRING_NULL, {sizeof(surrogate), reinterpret_cast<UA_Byte*>(surrogate)}};
        REQUIRE(ValueCodec::ConvertVariant(
            MakeScalar(label, &UA_TYPES[UA_TYPES_LOCALIZEDTEXT]).Get().value).IsErr());

        UA_String accented = UA_STRING_STATIC("d\xC3\xA9" "bit \xE2\x82\xAC \xF0\x9F\x94\xA7");
        REQUIRE(Convert(MakeScalar(accented, &UA_TYPES[UA_TYPES_STRING])).Is<std::string>());
    }

    SECTION("Structured payloads are decoding failures") {
        UA_ExtensionObject extension;
        UA_ExtensionObject_init(&extension);
        auto owned = MakeScalar(extension, &UA_TYPES[UA_TYPES_EXTENSIONOBJECT]);
        auto result = ValueCodec::Encode(Context(), owned.Get());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == BridgeFailureType::Decoding);
        REQUIRE_THAT(result.UnwrapErr().message, Catch::Matchers::ContainsSubstring("Pump1.Temperature"));
    }
}

TEST_CASE("ValueCodec - Envelope fields", "[codec][envelope]") {
    const auto source_time = std::chrono::system_clock::time_point{std::chrono::seconds{1700000100}};

    SECTION("Context and value are carried over") {
        auto owned = MakeScalar(21.5, &UA_TYPES[UA_TYPES_DOUBLE], source_time);
        auto envelope = ValueCodec::Encode(Context(7), owned.Get()).Unwrap();
        REQUIRE(envelope.device_id == "pump-1");
        REQUIRE(envelope.feature == "Temperature");
        REQUIRE(envelope.node == "ns=2;s=Pump1.Temperature");
        REQUIRE(envelope.sequence == 7);
        REQUIRE(envelope.value == TelemetryValue(21.5));
        REQUIRE(envelope.status_code == UA_STATUSCODE_GOOD);
        REQUIRE(envelope.status_name == "Good");
    }

    SECTION("Source timestamp wins") {
        auto owned = MakeScalar(1.0, &UA_TYPES[UA_TYPES_DOUBLE], source_time);
        owned.Mutable().serverTimestamp = opcua::FromTimePoint(source_time + std::chrono::seconds{5});
        owned.Mutable().hasServerTimestamp = true;
        auto envelope = ValueCodec::Encode(Context(), owned.Get()).Unwrap();
        REQUIRE(envelope.timestamp == source_time);
        REQUIRE(envelope.source_timestamp == source_time);
        REQUIRE(envelope.server_timestamp == source_time + std::chrono::seconds{5});
    }

    SECTION("Server timestamp is the fallback") {
        auto owned = test_helpers::MakeDouble(1.0);
        owned.Mutable().serverTimestamp = opcua::FromTimePoint(source_time);
        owned.Mutable().hasServerTimestamp = true;
        auto envelope = ValueCodec::Encode(Context(), owned.Get()).Unwrap();
        REQUIRE(envelope.timestamp == source_time);
        REQUIRE_FALSE(envelope.source_timestamp.has_value());
    }

    SECTION("Arrival time is the last resort") {
        auto envelope = ValueCodec::Encode(Context(), test_helpers::MakeDouble(1.0).Get()).Unwrap();
        REQUIRE(envelope.timestamp == Context().received_at);
    }

    SECTION("Unspecified and out of range timestamps fall through") {
        auto owned = test_helpers::MakeDouble(1.0);
        owned.Mutable().sourceTimestamp = 0;
        owned.Mutable().hasSourceTimestamp = true;
        owned.Mutable().serverTimestamp = INT64_MAX;
        owned.Mutable().hasServerTimestamp = true;
        auto envelope = ValueCodec::Encode(Context(), owned.Get()).Unwrap();
        REQUIRE_FALSE(envelope.source_timestamp.has_value());
        REQUIRE_FALSE(envelope.server_timestamp.has_value());
        REQUIRE(envelope.timestamp == Context().received_at);

        owned.Mutable().serverTimestamp = opcua::FromTimePoint(source_time);
        REQUIRE(ValueCodec::Encode(Context(), owned.Get()).Unwrap().timestamp == source_time);
    }

    SECTION("Bad status is carried with its name") {
        auto owned = test_helpers::MakeDouble(0.0);
        owned.Mutable().status = UA_STATUSCODE_BADSENSORFAILURE;
        owned.Mutable().hasStatus = true;
        auto envelope = ValueCodec::Encode(Context(), owned.Get()).Unwrap();
        REQUIRE(envelope.status_code == UA_STATUSCODE_BADSENSORFAILURE);
        REQUIRE(envelope.status_name == "BadSensorFailure");
    }

    SECTION("Sample without a value still produces an envelope") {
        UA_DataValue raw;
        UA_DataValue_init(&raw);
        auto envelope = ValueCodec::Encode(Context(), raw).Unwrap();
        REQUIRE(envelope.value.IsEmpty());
    }
}
