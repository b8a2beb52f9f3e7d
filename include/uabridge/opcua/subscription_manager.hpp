#pragma once

#include "uabridge/interfaces/i_data_source.hpp"
#include "uabridge/utilities/backoff.hpp"

#include <open62541/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace uabridge::opcua {

struct SubscriptionSpec {
    std::string name;
    std::chrono::milliseconds publish_interval{1000};
    UA_TimestampsToReturn timestamps = UA_TIMESTAMPSTORETURN_SOURCE;
    uint32_t queue_size = 10;
    std::vector<std::string> nodes;
};

struct ConnectionSpec {
    std::string id;
    std::string url;
    std::string security_policy = "None";
    std::string security_mode = "None";
    std::string username;
    std::string password;
    std::chrono::milliseconds session_timeout{60000};
    /// Consecutive failed connects before the connection is given up.
    uint32_t session_retry_limit = 10;
    /// Failed monitored-item creations before a node is skipped for good.
    uint32_t node_failure_limit = 3;
    utilities::BackoffPolicy backoff;
    std::vector<SubscriptionSpec> subscriptions;
};

/**
 * @brief OPC-UA client side of the bridge
 *
 * One thread per connection owns its UA_Client: it connects, creates one
 * subscription per publishing interval with one monitored item per node,
 * and drives the client with UA_Client_run_iterate. Subscription setup and
 * teardown happen only on that thread.
 *
 * When the session drops, the thread waits out an exponential backoff with
 * jitter and rebuilds session, subscriptions and monitored items. Rejected
 * credentials and an exhausted retry limit end the connection with a
 * ConnectionState::Failed event.
 */
class SubscriptionManager final : public interfaces::IDataSource {
public:
    explicit SubscriptionManager(std::vector<ConnectionSpec> connections);
    ~SubscriptionManager() override;

    SubscriptionManager(const SubscriptionManager&) = delete;
    SubscriptionManager& operator=(const SubscriptionManager&) = delete;

    [[nodiscard]] Result<std::shared_ptr<DataChangeStream>, BridgeFailure> Start() override;

    void Stop() override;

    [[nodiscard]] static bool IsFatalSessionStatus(UA_StatusCode status) noexcept;

    [[nodiscard]] static Result<UA_TimestampsToReturn, BridgeFailure> ParseTimestamps(std::string_view text);

private:
    class ConnectionWorker;

    std::vector<ConnectionSpec> specs_;
    std::vector<std::unique_ptr<ConnectionWorker>> workers_;
    std::shared_ptr<DataChangeStream> stream_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
};

}
