#include <catch2/catch_test_macros.hpp>
#include "uabridge/bridge/source_router.hpp"

using namespace uabridge::bridge;

TEST_CASE("SourceRouter - Addresses", "[bridge][router]") {
    const auto address = SourceRouter::SourceAddress("plc-a", "fast", "ns=2;s=Pump1.Temperature");
    REQUIRE(SourceRouter::FormatAddress(address) == "opcua/plc-a/subscriptions/fast/ns=2;s=Pump1.Temperature");
    REQUIRE(SourceRouter::DefaultFeature(address) == "ns=2;s=Pump1.Temperature");

    SECTION("Node segment keeps its slashes") {
        auto parsed = SourceRouter::ParseAddress("opcua/plc-a/subscriptions/fast/ns=3;s=Line/1/Speed");
        REQUIRE(parsed.size() == 5);
        REQUIRE(parsed[4] == "ns=3;s=Line/1/Speed");
    }

    SECTION("Prefixes and trailing slashes") {
        REQUIRE(SourceRouter::ParseAddress("opcua/plc-a/") == SourceRouter::Address{"opcua", "plc-a"});
        REQUIRE(SourceRouter::ParseAddress("").empty());
    }
}

TEST_CASE("SourceRouter - Routing", "[bridge][router]") {
    const auto address = SourceRouter::SourceAddress("plc-a", "fast", "ns=2;s=Pump1.Temperature");

    SECTION("No overrides keeps the channel defaults") {
        SourceRouter router;
        auto decision = router.Route(address, "pump-1", "Temperature");
        REQUIRE_FALSE(decision.drop);
        REQUIRE(decision.device == "pump-1");
        REQUIRE(decision.feature == "Temperature");
    }

    SECTION("Empty default feature falls back to the node") {
        SourceRouter router;
        REQUIRE(router.Route(address, "pump-1", "").feature == "ns=2;s=Pump1.Temperature");
    }

    SECTION("Most specific prefix wins field by field") {
        SourceRouter router({
            {"opcua/plc-a", SourceOverride{std::nullopt, "line-a", "Generic"}},
            {"opcua/plc-a/subscriptions/fast", SourceOverride{std::nullopt, "", "FastSignal"}},
            {"opcua/plc-a/subscriptions/fast/ns=2;s=Pump1.Temperature", SourceOverride{std::nullopt, "pump-7", ""}},
        });
        REQUIRE(router.Size() == 3);
        auto decision = router.Route(address, "pump-1", "Temperature");
        REQUIRE(decision.device == "pump-7");
        REQUIRE(decision.feature == "FastSignal");

        auto other = router.Route(SourceRouter::SourceAddress("plc-a", "slow", "ns=2;s=Level"), "tank-1", "Level");
        REQUIRE(other.device == "line-a");
        REQUIRE(other.feature == "Generic");
    }

    SECTION("Drop can be set broadly and lifted narrowly") {
        SourceRouter router({
            {"opcua/plc-a", SourceOverride{true, "", ""}},
            {"opcua/plc-a/subscriptions/fast/ns=2;s=Pump1.Temperature", SourceOverride{false, "", ""}},
        });
        REQUIRE_FALSE(router.Route(address, "pump-1", "Temperature").drop);
        REQUIRE(router.Route(SourceRouter::SourceAddress("plc-a", "fast", "ns=2;s=Other"), "pump-1", "x").drop);
        REQUIRE_FALSE(router.Route(SourceRouter::SourceAddress("plc-b", "fast", "ns=2;s=Other"), "pump-1", "x").drop);
    }

    SECTION("Partial segment names do not match") {
        SourceRouter router({{"opcua/plc", SourceOverride{true, "", ""}}});
        REQUIRE_FALSE(router.Route(address, "pump-1", "Temperature").drop);
    }
}
