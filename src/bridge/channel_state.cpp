#include "uabridge/bridge/channel_state.hpp"

#include <format>

namespace uabridge::bridge {

std::string_view ToString(const ChannelState state) noexcept {
    switch (state) {
        case ChannelState::Starting: return "starting";
        case ChannelState::Subscribing: return "subscribing";
        case ChannelState::Streaming: return "streaming";
        case ChannelState::Reconnecting: return "reconnecting";
        case ChannelState::Failed: return "failed";
    }
    return "unknown";
}

bool CanTransition(const ChannelState from, const ChannelState to) noexcept {
    if (from == ChannelState::Failed) {
        return false;
    }
    if (to == ChannelState::Failed) {
        return true;
    }
    switch (from) {
        case ChannelState::Starting:
            return to == ChannelState::Subscribing;
        case ChannelState::Subscribing:
            return to == ChannelState::Streaming || to == ChannelState::Reconnecting;
        case ChannelState::Streaming:
            return to == ChannelState::Reconnecting;
        case ChannelState::Reconnecting:
            return to == ChannelState::Streaming;
        case ChannelState::Failed:
            return false;
    }
    return false;
}

Result<Unit, BridgeFailure> ChannelStateMachine::Transition(const ChannelState next) {
    if (next == state_) {
        return Result<Unit, BridgeFailure>::Ok(unit);
    }
    if (!CanTransition(state_, next)) {
        return Result<Unit, BridgeFailure>::Err(BridgeFailure::InvalidState(
            std::format("Illegal channel transition {} -> {}", ToString(state_), ToString(next))));
    }
    state_ = next;
    return Result<Unit, BridgeFailure>::Ok(unit);
}

}
