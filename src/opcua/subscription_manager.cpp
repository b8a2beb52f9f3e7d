#include "uabridge/opcua/subscription_manager.hpp"
#include "uabridge/opcua/node_reference.hpp"
#include "uabridge/core/constants.hpp"
#include "uabridge/observability/logging.hpp"

#include <open62541/client_config_default.h>
#include <open62541/client_highlevel.h>
#include <open62541/client_subscriptions.h>

#include <format>

#include <map>

namespace uabridge::opcua {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

    constexpr UA_UInt32 ITERATE_TIMEOUT_MS = 100;
    constexpr std::string_view SECURITY_POLICY_PREFIX = "http://opcfoundation.org/UA/SecurityPolicy#";

    struct ClientDeleter {
        void operator()(UA_Client* client) const noexcept {
            if (client != nullptr) {
                UA_Client_disconnect(client);
                UA_Client_delete(client);
            }
        }
    };
    using ClientPtr = std::unique_ptr<UA_Client, ClientDeleter>;

    Result<UA_MessageSecurityMode, BridgeFailure> ParseSecurityMode(std::string_view mode) {
        if (mode.empty() || mode == "None") {
            return Result<UA_MessageSecurityMode, BridgeFailure>::Ok(UA_MESSAGESECURITYMODE_NONE);
        }
        if (mode == "Sign") {
            return Result<UA_MessageSecurityMode, BridgeFailure>::Ok(UA_MESSAGESECURITYMODE_SIGN);
        }
        if (mode == "SignAndEncrypt") {
            return Result<UA_MessageSecurityMode, BridgeFailure>::Ok(UA_MESSAGESECURITYMODE_SIGNANDENCRYPT);
        }
        return Result<UA_MessageSecurityMode, BridgeFailure>::Err(BridgeFailure::Config(
            std::format("Unknown security mode '{}' (expected None, Sign or SignAndEncrypt)", mode)));
    }

    std::string NodeKey(const std::string& subscription, const std::string& node) {
        return subscription + '\n' + node;
    }

}

class SubscriptionManager::ConnectionWorker {
public:
    ConnectionWorker(ConnectionSpec spec, UA_MessageSecurityMode mode, std::shared_ptr<DataChangeStream> stream)
        : spec_(std::move(spec))
        , security_mode_(mode)
        , stream_(std::move(stream))
        , backoff_(spec_.backoff) {}

    ~ConnectionWorker() {
        RequestStop();
        Join();
    }

    ConnectionWorker(const ConnectionWorker&) = delete;
    ConnectionWorker& operator=(const ConnectionWorker&) = delete;

    void Launch() {
        thread_ = std::thread([this] { Run(); });
    }

    void RequestStop() {
        {
            std::lock_guard lock(wait_lock_);
            stop_requested_ = true;
        }
        wait_cv_.notify_all();
    }

    void Join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    struct ItemContext {
        ConnectionWorker* worker;
        std::string subscription;
        std::string node;
    };

    bool StopRequested() {
        std::lock_guard lock(wait_lock_);
        return stop_requested_;
    }

    /// Sleeps for `delay`; false if a stop was requested meanwhile.
    bool WaitFor(const std::chrono::milliseconds delay) {
        std::unique_lock lock(wait_lock_);
        return !wait_cv_.wait_for(lock, delay, [this] { return stop_requested_; });
    }

    void Run() {
        uint32_t failed_attempts = 0;
        while (!StopRequested()) {
            ClientPtr client(UA_Client_new());
            if (!client) {
                EmitConnection(ConnectionState::Failed, UA_STATUSCODE_BADOUTOFMEMORY, "Failed to allocate client");
                return;
            }
            Configure(client.get());

            const UA_StatusCode connect_status = Connect(client.get());
            if (connect_status != UA_STATUSCODE_GOOD) {
                ++failed_attempts;
                if (IsFatalSessionStatus(connect_status)) {
                    EmitConnection(ConnectionState::Failed, connect_status, "Server rejected the session credentials");
                    return;
                }
                if (spec_.session_retry_limit > 0 && failed_attempts >= spec_.session_retry_limit) {
                    EmitConnection(ConnectionState::Failed, connect_status,
                                   std::format("Giving up after {} connection attempts", failed_attempts));
                    return;
                }
                EmitConnection(ConnectionState::Disconnected, connect_status, "Connect failed");
                const auto delay = backoff_.NextDelay();
                UABRIDGE_LOG_WARN("OPC-UA connect failed, retrying", {
                    StringField("connection", spec_.id),
                    StringField("url", spec_.url),
                    StringField("status", StatusCodeName(connect_status)),
                    IntField("attempt", failed_attempts),
                    IntField("retry_in_ms", delay.count())
                });
                if (!WaitFor(delay)) {
                    return;
                }
                continue;
            }

            failed_attempts = 0;
            backoff_.Reset();
            EmitConnection(ConnectionState::Connected, UA_STATUSCODE_GOOD, spec_.url);
            CreateSubscriptions(client.get());

            UA_StatusCode lost = UA_STATUSCODE_GOOD;
            while (!StopRequested()) {
                lost = UA_Client_run_iterate(client.get(), ITERATE_TIMEOUT_MS);
                if (lost == UA_STATUSCODE_GOOD) {
                    UA_Client_getState(client.get(), nullptr, nullptr, &lost);
                }
                if (lost != UA_STATUSCODE_GOOD) {
                    break;
                }
            }

            client.reset();
            item_contexts_.clear();
            if (StopRequested()) {
                return;
            }

            EmitConnection(ConnectionState::Disconnected, lost, "Session lost");
            EmitAllUnsubscribed(lost);
            const auto delay = backoff_.NextDelay();
            UABRIDGE_LOG_WARN("OPC-UA session lost, reconnecting", {
                StringField("connection", spec_.id),
                StringField("status", StatusCodeName(lost)),
                IntField("retry_in_ms", delay.count())
            });
            if (!WaitFor(delay)) {
                return;
            }
        }
    }

    void Configure(UA_Client* client) {
        UA_ClientConfig* config = UA_Client_getConfig(client);
        UA_ClientConfig_setDefault(config);
        config->requestedSessionTimeout = static_cast<UA_Double>(spec_.session_timeout.count());
        config->securityMode = security_mode_;
        if (!spec_.security_policy.empty() && spec_.security_policy != "None") {
            const std::string uri = spec_.security_policy.find("://") != std::string::npos
                ? spec_.security_policy
                : std::string(SECURITY_POLICY_PREFIX) + spec_.security_policy;
            UA_String_clear(&config->securityPolicyUri);
            config->securityPolicyUri = UA_STRING_ALLOC(uri.c_str());
        }
    }

    UA_StatusCode Connect(UA_Client* client) {
        if (!spec_.username.empty()) {
            return UA_Client_connectUsername(client, spec_.url.c_str(),
                                             spec_.username.c_str(), spec_.password.c_str());
        }
        return UA_Client_connect(client, spec_.url.c_str());
    }

    void CreateSubscriptions(UA_Client* client) {
        for (const auto& subscription : spec_.subscriptions) {
            UA_CreateSubscriptionRequest request = UA_CreateSubscriptionRequest_default();
            request.requestedPublishingInterval = static_cast<UA_Double>(subscription.publish_interval.count());
            request.requestedLifetimeCount = BridgeDefaults::SUBSCRIPTION_LIFETIME_COUNT;
            request.requestedMaxKeepAliveCount = BridgeDefaults::SUBSCRIPTION_KEEPALIVE_COUNT;

            const UA_CreateSubscriptionResponse response =
                UA_Client_Subscriptions_create(client, request, nullptr, nullptr, nullptr);
            if (response.responseHeader.serviceResult != UA_STATUSCODE_GOOD) {
                UABRIDGE_LOG_ERROR("Failed to create subscription", {
                    StringField("connection", spec_.id),
                    StringField("subscription", subscription.name),
                    StringField("status", StatusCodeName(response.responseHeader.serviceResult))
                });
                for (const auto& node : subscription.nodes) {
                    EmitItem(subscription.name, node, false, response.responseHeader.serviceResult);
                }
                continue;
            }
            UABRIDGE_LOG_INFO("Created subscription", {
                StringField("connection", spec_.id),
                StringField("subscription", subscription.name),
                IntField("id", response.subscriptionId),
                IntField("interval_ms", subscription.publish_interval.count())
            });
            for (const auto& node : subscription.nodes) {
                CreateMonitoredItem(client, response.subscriptionId, subscription, node);
            }
        }
    }

    void CreateMonitoredItem(
        UA_Client* client,
        const UA_UInt32 subscription_id,
        const SubscriptionSpec& subscription,
        const std::string& node) {
        auto& failures = node_failures_[NodeKey(subscription.name, node)];
        if (spec_.node_failure_limit > 0 && failures >= spec_.node_failure_limit) {
            return;
        }

        auto reference = NodeReference::Parse(node);
        if (reference.IsErr()) {
            failures = spec_.node_failure_limit;
            UABRIDGE_LOG_ERROR("Skipping node with unparsable id", {
                StringField("connection", spec_.id),
                StringField("node", node),
                StringField("error", reference.UnwrapErr().message)
            });
            EmitItem(subscription.name, node, false, UA_STATUSCODE_BADNODEIDINVALID);
            return;
        }

        auto context = std::make_unique<ItemContext>(ItemContext{this, subscription.name, node});
        UA_MonitoredItemCreateRequest request = UA_MonitoredItemCreateRequest_default(reference.Unwrap().Id());
        request.requestedParameters.queueSize = subscription.queue_size;
        request.requestedParameters.samplingInterval = static_cast<UA_Double>(subscription.publish_interval.count());

        const UA_MonitoredItemCreateResult result = UA_Client_MonitoredItems_createDataChange(
            client, subscription_id, subscription.timestamps, request, context.get(), &OnDataChange, nullptr);
        if (result.statusCode != UA_STATUSCODE_GOOD) {
            ++failures;
            const bool skipped = spec_.node_failure_limit > 0 && failures >= spec_.node_failure_limit;
            UABRIDGE_LOG_WARN("Failed to monitor node", {
                StringField("connection", spec_.id),
                StringField("subscription", subscription.name),
                StringField("node", node),
                StringField("status", StatusCodeName(result.statusCode)),
                IntField("failures", failures),
                BoolField("skipped", skipped)
            });
            EmitItem(subscription.name, node, false, result.statusCode);
            return;
        }
        failures = 0;
        item_contexts_.push_back(std::move(context));
        EmitItem(subscription.name, node, true, UA_STATUSCODE_GOOD);
    }

    static void OnDataChange(
        UA_Client*,
        UA_UInt32,
        void*,
        UA_UInt32,
        void* monitored_context,
        UA_DataValue* value) {
        auto* context = static_cast<ItemContext*>(monitored_context);
        if (context == nullptr || value == nullptr) {
            return;
        }
        auto owned = OwnedDataValue::Copy(*value);
        if (owned.IsErr()) {
            UABRIDGE_LOG_WARN("Dropping data change", {
                StringField("connection", context->worker->spec_.id),
                StringField("node", context->node),
                StringField("error", owned.UnwrapErr().message)
            });
            return;
        }
        (void)context->worker->stream_->Push(DataChangeEvent{
            context->worker->spec_.id,
            context->subscription,
            context->node,
            std::move(owned).Unwrap(),
            std::chrono::system_clock::now()});
    }

    void EmitConnection(const ConnectionState state, const UA_StatusCode status, std::string detail) {
        (void)stream_->Push(ConnectionStatusEvent{
            spec_.id, state, status, std::move(detail), std::chrono::system_clock::now()});
    }

    void EmitItem(const std::string& subscription, const std::string& node, const bool subscribed,
                  const UA_StatusCode status) {
        (void)stream_->Push(ItemStatusEvent{
            spec_.id, subscription, node, subscribed, status, std::chrono::system_clock::now()});
    }

    void EmitAllUnsubscribed(const UA_StatusCode status) {
        for (const auto& subscription : spec_.subscriptions) {
            for (const auto& node : subscription.nodes) {
                EmitItem(subscription.name, node, false, status);
            }
        }
    }

    ConnectionSpec spec_;
    UA_MessageSecurityMode security_mode_;
    std::shared_ptr<DataChangeStream> stream_;
    utilities::ExponentialBackoff backoff_;
    std::thread thread_;
    std::mutex wait_lock_;
    std::condition_variable wait_cv_;
    bool stop_requested_ = false;
    std::map<std::string, uint32_t> node_failures_;
    std::vector<std::unique_ptr<ItemContext>> item_contexts_;
};

SubscriptionManager::SubscriptionManager(std::vector<ConnectionSpec> connections)
    : specs_(std::move(connections)) {}

SubscriptionManager::~SubscriptionManager() {
    Stop();
}

Result<std::shared_ptr<DataChangeStream>, BridgeFailure> SubscriptionManager::Start() {
    using ResultType = Result<std::shared_ptr<DataChangeStream>, BridgeFailure>;
    if (started_.exchange(true)) {
        return ResultType::Err(BridgeFailure::InvalidState("Subscription manager already started"));
    }

    std::vector<UA_MessageSecurityMode> modes;
    for (const auto& spec : specs_) {
        auto mode = ParseSecurityMode(spec.security_mode);
        if (mode.IsErr()) {
            return ResultType::Err(BridgeFailure::Config(
                std::format("Connection {}: {}", spec.id, mode.UnwrapErr().message)));
        }
        modes.push_back(mode.Unwrap());
    }

    stream_ = std::make_shared<DataChangeStream>();
    for (size_t i = 0; i < specs_.size(); ++i) {
        workers_.push_back(std::make_unique<ConnectionWorker>(specs_[i], modes[i], stream_));
    }
    for (auto& worker : workers_) {
        worker->Launch();
    }
    return ResultType::Ok(stream_);
}

void SubscriptionManager::Stop() {
    if (!started_.load() || stopped_.exchange(true)) {
        return;
    }
    for (auto& worker : workers_) {
        worker->RequestStop();
    }
    for (auto& worker : workers_) {
        worker->Join();
    }
    workers_.clear();
    stream_->Close();
}

bool SubscriptionManager::IsFatalSessionStatus(const UA_StatusCode status) noexcept {
    switch (status) {
        case UA_STATUSCODE_BADUSERACCESSDENIED:
        case UA_STATUSCODE_BADIDENTITYTOKENINVALID:
        case UA_STATUSCODE_BADIDENTITYTOKENREJECTED:
        case UA_STATUSCODE_BADSECURITYMODEREJECTED:
        case UA_STATUSCODE_BADSECURITYPOLICYREJECTED:
            return true;
        default:
            return false;
    }
}

Result<UA_TimestampsToReturn, BridgeFailure> SubscriptionManager::ParseTimestamps(std::string_view text) {
    using ResultType = Result<UA_TimestampsToReturn, BridgeFailure>;
    if (text.empty() || text == "Source") {
        return ResultType::Ok(UA_TIMESTAMPSTORETURN_SOURCE);
    }
    if (text == "None") {
        return ResultType::Ok(UA_TIMESTAMPSTORETURN_NEITHER);
    }
    if (text == "Server") {
        return ResultType::Ok(UA_TIMESTAMPSTORETURN_SERVER);
    }
    if (text == "Both") {
        return ResultType::Ok(UA_TIMESTAMPSTORETURN_BOTH);
    }
    return ResultType::Err(BridgeFailure::Config(
        std::format("Unknown timestamps selection '{}' (expected None, Source, Server or Both)", text)));
}

}
