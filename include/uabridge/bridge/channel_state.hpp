#pragma once

#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"

#include <string_view>

namespace uabridge::bridge {

enum class ChannelState {
    Starting,
    Subscribing,
    Streaming,
    Reconnecting,
    Failed
};

std::string_view ToString(ChannelState state) noexcept;

/**
 * Starting -> Subscribing -> Streaming -> Reconnecting -> Streaming | Failed.
 * Any live state may go to Failed; Failed is terminal.
 */
[[nodiscard]] bool CanTransition(ChannelState from, ChannelState to) noexcept;

class ChannelStateMachine {
public:
    ChannelStateMachine() = default;

    [[nodiscard]] ChannelState State() const noexcept { return state_; }

    [[nodiscard]] bool IsFailed() const noexcept { return state_ == ChannelState::Failed; }

    /**
     * @brief Move to `next`; staying in the current state is a no-op
     */
    Result<Unit, BridgeFailure> Transition(ChannelState next);

private:
    ChannelState state_ = ChannelState::Starting;
};

}
