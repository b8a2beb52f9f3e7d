#include <catch2/catch_test_macros.hpp>
#include "uabridge/bridge/channel_state.hpp"

using namespace uabridge;
using namespace uabridge::bridge;

TEST_CASE("ChannelState - Transition table", "[bridge][state]") {
    REQUIRE(CanTransition(ChannelState::Starting, ChannelState::Subscribing));
    REQUIRE(CanTransition(ChannelState::Subscribing, ChannelState::Streaming));
    REQUIRE(CanTransition(ChannelState::Subscribing, ChannelState::Reconnecting));
    REQUIRE(CanTransition(ChannelState::Streaming, ChannelState::Reconnecting));
    REQUIRE(CanTransition(ChannelState::Reconnecting, ChannelState::Streaming));

    REQUIRE_FALSE(CanTransition(ChannelState::Starting, ChannelState::Streaming));
    REQUIRE_FALSE(CanTransition(ChannelState::Streaming, ChannelState::Subscribing));
    REQUIRE_FALSE(CanTransition(ChannelState::Reconnecting, ChannelState::Starting));

    for (const auto live : {ChannelState::Starting, ChannelState::Subscribing,
                            ChannelState::Streaming, ChannelState::Reconnecting}) {
        REQUIRE(CanTransition(live, ChannelState::Failed));
        REQUIRE_FALSE(CanTransition(ChannelState::Failed, live));
    }
}

TEST_CASE("ChannelState - Names", "[bridge][state]") {
    REQUIRE(ToString(ChannelState::Starting) == "starting");
    REQUIRE(ToString(ChannelState::Streaming) == "streaming");
    REQUIRE(ToString(ChannelState::Failed) == "failed");
}

TEST_CASE("ChannelStateMachine - Lifecycle", "[bridge][state]") {
    ChannelStateMachine machine;
    REQUIRE(machine.State() == ChannelState::Starting);

    SECTION("Normal life of a channel") {
        REQUIRE(machine.Transition(ChannelState::Subscribing).IsOk());
        REQUIRE(machine.Transition(ChannelState::Streaming).IsOk());
        REQUIRE(machine.Transition(ChannelState::Streaming).IsOk());
        REQUIRE(machine.Transition(ChannelState::Reconnecting).IsOk());
        REQUIRE(machine.Transition(ChannelState::Streaming).IsOk());
        REQUIRE(machine.State() == ChannelState::Streaming);
    }

    SECTION("Illegal moves leave the state alone") {
        auto result = machine.Transition(ChannelState::Streaming);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == BridgeFailureType::InvalidState);
        REQUIRE(machine.State() == ChannelState::Starting);
    }

    SECTION("Failed is terminal") {
        REQUIRE(machine.Transition(ChannelState::Failed).IsOk());
        REQUIRE(machine.IsFailed());
        REQUIRE(machine.Transition(ChannelState::Failed).IsOk());
        REQUIRE(machine.Transition(ChannelState::Subscribing).IsErr());
        REQUIRE(machine.IsFailed());
    }
}
