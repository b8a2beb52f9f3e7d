#pragma once

#include "uabridge/opcua/ua_data_value.hpp"
#include "uabridge/utilities/blocking_queue.hpp"

#include <open62541/types.h>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace uabridge::opcua {

/// One sample of one monitored item, owned by the receiver.
struct DataChangeEvent {
    std::string connection;
    std::string subscription;
    std::string node;
    OwnedDataValue value;
    std::chrono::system_clock::time_point received_at;
};

/// A monitored item could not be created, or stopped delivering.
struct ItemStatusEvent {
    std::string connection;
    std::string subscription;
    std::string node;
    bool subscribed = false;
    UA_StatusCode status = UA_STATUSCODE_GOOD;
    std::chrono::system_clock::time_point at;
};

enum class ConnectionState {
    Connected,
    Disconnected,
    Failed
};

constexpr std::string_view ToString(const ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Failed: return "failed";
    }
    return "unknown";
}

/**
 * Session state of one OPC-UA connection. `Failed` is terminal: the
 * connection gave up and will not produce further events.
 */
struct ConnectionStatusEvent {
    std::string connection;
    ConnectionState state = ConnectionState::Disconnected;
    UA_StatusCode status = UA_STATUSCODE_GOOD;
    std::string detail;
    std::chrono::system_clock::time_point at;
};

using StreamEvent = std::variant<DataChangeEvent, ItemStatusEvent, ConnectionStatusEvent>;

using DataChangeStream = utilities::BlockingQueue<StreamEvent>;

}
