#include <catch2/catch_test_macros.hpp>
#include "uabridge/mqtt/topic_template.hpp"

using namespace uabridge;
using namespace uabridge::mqtt;

TEST_CASE("TopicTemplate - Parsing", "[mqtt][topic]") {
    SECTION("Literal topic") {
        auto topic = TopicTemplate::Parse("plant/telemetry").Unwrap();
        REQUIRE(topic.Text() == "plant/telemetry");
        REQUIRE_FALSE(topic.UsesPlaceholder("device"));
    }

    SECTION("Known placeholders") {
        auto topic = TopicTemplate::Parse("{connection}/{device}/{feature}").Unwrap();
        REQUIRE(topic.UsesPlaceholder("device"));
        REQUIRE(topic.UsesPlaceholder("connection"));
        REQUIRE(topic.UsesPlaceholder("feature"));
        REQUIRE_FALSE(topic.UsesPlaceholder("node"));
    }

    SECTION("Invalid templates are config errors") {
        for (const char* text : {"", "telemetry/{node}", "telemetry/{device", "telemetry/device}",
                                 "telemetry/+/x", "telemetry/#", "{de{vice}"}) {
            auto result = TopicTemplate::Parse(text);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == BridgeFailureType::Config);
        }
    }
}

TEST_CASE("TopicTemplate - Rendering", "[mqtt][topic]") {
    const TopicContext context{"pump-1", "plc-a", "Temperature"};

    SECTION("Placeholders are substituted") {
        auto topic = TopicTemplate::Parse("telemetry/{device}").Unwrap();
        REQUIRE(topic.Render(context).Unwrap() == "telemetry/pump-1");

        auto nested = TopicTemplate::Parse("site/{connection}/{device}/{feature}/v1").Unwrap();
        REQUIRE(nested.Render(context).Unwrap() == "site/plc-a/pump-1/Temperature/v1");
    }

    SECTION("Repeated placeholders") {
        auto topic = TopicTemplate::Parse("{device}/{device}").Unwrap();
        REQUIRE(topic.Render(context).Unwrap() == "pump-1/pump-1");
    }

    SECTION("Values with wildcards or empty values are refused") {
        auto topic = TopicTemplate::Parse("telemetry/{device}/{feature}").Unwrap();
        REQUIRE(topic.Render(TopicContext{"pump+1", "plc-a", "x"}).IsErr());
        REQUIRE(topic.Render(TopicContext{"pump-1", "plc-a", "#"}).IsErr());
        REQUIRE(topic.Render(TopicContext{"pump-1", "plc-a", ""}).IsErr());
    }

    SECTION("Unused empty values do not matter") {
        auto topic = TopicTemplate::Parse("telemetry/{device}").Unwrap();
        REQUIRE(topic.Render(TopicContext{"pump-1", "", ""}).Unwrap() == "telemetry/pump-1");
    }
}
