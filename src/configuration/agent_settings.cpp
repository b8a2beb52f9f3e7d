#include "uabridge/configuration/agent_settings.hpp"
#include "uabridge/core/constants.hpp"
#include "uabridge/opcua/node_reference.hpp"

#include <google/protobuf/util/time_util.h>

#include <format>

#include <algorithm>

namespace uabridge::configuration {

namespace {

using google::protobuf::util::TimeUtil;

constexpr std::string_view DEFAULT_TOPIC = "telemetry/{device}";

template<typename T>
Result<T, BridgeFailure> ConfigError(std::string message) {
    return Result<T, BridgeFailure>::Err(BridgeFailure::Config(std::move(message)));
}

std::chrono::milliseconds DurationOr(
    const bool present,
    const google::protobuf::Duration& value,
    const std::chrono::milliseconds fallback) {
    if (!present) {
        return fallback;
    }
    const auto millis = TimeUtil::DurationToMilliseconds(value);
    return millis > 0 ? std::chrono::milliseconds(millis) : fallback;
}

Result<utilities::BackoffPolicy, BridgeFailure> ToBackoff(
    const std::string_view section,
    const bool present,
    const proto::config::BackoffConfig& config) {
    utilities::BackoffPolicy policy{
        BridgeDefaults::BACKOFF_INITIAL,
        BridgeDefaults::BACKOFF_MAX,
        BridgeDefaults::BACKOFF_MULTIPLIER,
        BridgeDefaults::BACKOFF_JITTER
    };
    if (!present) {
        return Result<utilities::BackoffPolicy, BridgeFailure>::Ok(policy);
    }
    policy.initial = DurationOr(config.has_initial(), config.initial(), policy.initial);
    policy.max = DurationOr(config.has_max(), config.max(), policy.max);
    if (config.multiplier() != 0.0) {
        if (config.multiplier() < 1.0) {
            return ConfigError<utilities::BackoffPolicy>(std::format(
                "{}.multiplier must be at least 1, got {}", section, config.multiplier()));
        }
        policy.multiplier = config.multiplier();
    }
    if (config.jitter() < 0.0 || config.jitter() > 1.0) {
        return ConfigError<utilities::BackoffPolicy>(std::format(
            "{}.jitter must be within [0, 1], got {}", section, config.jitter()));
    }
    if (config.jitter() != 0.0) {
        policy.jitter = config.jitter();
    }
    if (policy.max < policy.initial) {
        return ConfigError<utilities::BackoffPolicy>(std::format(
            "{}.max must not be shorter than {}.initial", section, section));
    }
    return Result<utilities::BackoffPolicy, BridgeFailure>::Ok(policy);
}

Result<opcua::SubscriptionSpec, BridgeFailure> ToSubscription(
    const std::string& name,
    const proto::config::SubscriptionConfig& config) {
    auto timestamps = opcua::SubscriptionManager::ParseTimestamps(config.timestamps());
    if (timestamps.IsErr()) {
        return Result<opcua::SubscriptionSpec, BridgeFailure>::Err(std::move(timestamps).UnwrapErr());
    }
    opcua::SubscriptionSpec spec;
    spec.name = name;
    spec.publish_interval = DurationOr(
        config.has_publish_interval(), config.publish_interval(), BridgeDefaults::PUBLISH_INTERVAL);
    spec.timestamps = timestamps.Unwrap();
    spec.queue_size = config.queue_size() > 0 ? config.queue_size() : BridgeDefaults::MONITORED_ITEM_QUEUE_SIZE;
    return Result<opcua::SubscriptionSpec, BridgeFailure>::Ok(std::move(spec));
}

Result<opcua::ConnectionSpec, BridgeFailure> ToConnection(
    const std::string& id,
    const proto::config::ConnectionConfig& config,
    const utilities::BackoffPolicy& backoff) {
    if (config.url().empty()) {
        return ConfigError<opcua::ConnectionSpec>(std::format("opcua.connections.{}.url is required", id));
    }
    opcua::ConnectionSpec spec;
    spec.id = id;
    spec.url = config.url();
    if (!config.security_policy().empty()) {
        spec.security_policy = config.security_policy();
    }
    if (!config.security_mode().empty()) {
        spec.security_mode = config.security_mode();
    }
    spec.username = config.credentials().username();
    spec.password = config.credentials().password();
    if (spec.username.empty() != spec.password.empty()) {
        return ConfigError<opcua::ConnectionSpec>(std::format(
            "opcua.connections.{}.credentials needs both username and password", id));
    }
    spec.session_timeout = DurationOr(
        config.has_session_timeout(), config.session_timeout(), BridgeDefaults::SESSION_TIMEOUT);
    spec.session_retry_limit = config.session_retry_limit() > 0
        ? config.session_retry_limit()
        : BridgeDefaults::SESSION_RETRY_LIMIT;
    spec.node_failure_limit = config.node_failure_limit() > 0
        ? config.node_failure_limit()
        : BridgeDefaults::NODE_FAILURE_LIMIT;
    spec.backoff = backoff;

    for (const auto& [name, subscription] : config.subscriptions()) {
        auto converted = ToSubscription(name, subscription);
        if (converted.IsErr()) {
            return ConfigError<opcua::ConnectionSpec>(std::format(
                "opcua.connections.{}.subscriptions.{}: {}", id, name, converted.UnwrapErr().message));
        }
        spec.subscriptions.push_back(std::move(converted).Unwrap());
    }
    return Result<opcua::ConnectionSpec, BridgeFailure>::Ok(std::move(spec));
}

opcua::SubscriptionSpec* FindSubscription(opcua::ConnectionSpec& connection, const std::string& name) {
    const auto it = std::find_if(connection.subscriptions.begin(), connection.subscriptions.end(),
        [&name](const opcua::SubscriptionSpec& s) { return s.name == name; });
    return it == connection.subscriptions.end() ? nullptr : &*it;
}

Result<mqtt::MqttTransportOptions, BridgeFailure> ToTransport(
    const proto::config::CloudConfig& cloud,
    const proto::config::RuntimeConfig& runtime) {
    if (cloud.host().empty()) {
        return ConfigError<mqtt::MqttTransportOptions>("cloud.host is required");
    }
    if (cloud.port() > 65535) {
        return ConfigError<mqtt::MqttTransportOptions>(std::format("cloud.port {} is out of range", cloud.port()));
    }
    mqtt::MqttTransportOptions options;
    options.host = cloud.host();
    options.tls = cloud.has_tls() ? cloud.tls() : true;
    options.port = cloud.port() > 0
        ? static_cast<uint16_t>(cloud.port())
        : (options.tls ? BridgeDefaults::MQTT_TLS_PORT : BridgeDefaults::MQTT_PLAIN_PORT);
    options.client_id = cloud.client_id();
    options.password = cloud.password();
    options.username = cloud.username();
    if (options.username.empty() && !options.password.empty()) {
        if (cloud.device().empty() || cloud.application().empty()) {
            return ConfigError<mqtt::MqttTransportOptions>(
                "cloud.password without cloud.username needs cloud.device and cloud.application");
        }
        options.username = std::format("{}@{}", cloud.device(), cloud.application());
    }
    options.trust_store = cloud.trust_store();
    options.keep_alive = std::chrono::duration_cast<std::chrono::seconds>(DurationOr(
        cloud.has_keep_alive(), cloud.keep_alive(),
        std::chrono::duration_cast<std::chrono::milliseconds>(BridgeDefaults::MQTT_KEEP_ALIVE)));
    options.clean_session = cloud.clean_session();
    options.delivery_timeout = DurationOr(
        runtime.has_delivery_timeout(), runtime.delivery_timeout(), BridgeDefaults::DELIVERY_TIMEOUT);
    return Result<mqtt::MqttTransportOptions, BridgeFailure>::Ok(std::move(options));
}

}

Result<AgentSettings, BridgeFailure> BuildAgentSettings(const proto::config::AgentConfig& config) {
    AgentSettings settings;
    settings.logging = config.logging();

    const auto& runtime = config.runtime();
    auto opcua_backoff = ToBackoff("runtime.opcua_backoff", runtime.has_opcua_backoff(), runtime.opcua_backoff());
    if (opcua_backoff.IsErr()) {
        return Result<AgentSettings, BridgeFailure>::Err(std::move(opcua_backoff).UnwrapErr());
    }
    auto mqtt_backoff = ToBackoff("runtime.mqtt_backoff", runtime.has_mqtt_backoff(), runtime.mqtt_backoff());
    if (mqtt_backoff.IsErr()) {
        return Result<AgentSettings, BridgeFailure>::Err(std::move(mqtt_backoff).UnwrapErr());
    }

    // Sorted by id so connection threads start in a stable order.
    std::map<std::string, opcua::ConnectionSpec> connections;
    for (const auto& [id, connection] : config.opcua().connections()) {
        auto converted = ToConnection(id, connection, opcua_backoff.Unwrap());
        if (converted.IsErr()) {
            return Result<AgentSettings, BridgeFailure>::Err(std::move(converted).UnwrapErr());
        }
        connections.emplace(id, std::move(converted).Unwrap());
    }

    if (config.channels().empty()) {
        return ConfigError<AgentSettings>("At least one entry in channels is required");
    }

    const bool encryption_configured = !config.encryption().state_dir().empty();
    const bool mandatory = config.encryption().has_mandatory() ? config.encryption().mandatory() : true;

    for (int i = 0; i < config.channels().size(); ++i) {
        const auto& channel = config.channels(i);
        const std::string where = std::format("channels[{}]", i);
        if (channel.device().empty()) {
            return ConfigError<AgentSettings>(where + ".device is required");
        }
        if (channel.node().empty()) {
            return ConfigError<AgentSettings>(where + ".node is required");
        }
        if (auto node = opcua::NodeReference::Parse(channel.node()); node.IsErr()) {
            return ConfigError<AgentSettings>(std::format("{}.node: {}", where, node.UnwrapErr().message));
        }
        const auto connection = connections.find(channel.connection());
        if (connection == connections.end()) {
            return ConfigError<AgentSettings>(std::format(
                "{}.connection '{}' is not defined under opcua.connections", where, channel.connection()));
        }
        if (channel.qos() > 2) {
            return ConfigError<AgentSettings>(std::format("{}.qos must be 0, 1 or 2", where));
        }
        if (channel.encrypted() && !encryption_configured) {
            return ConfigError<AgentSettings>(std::format(
                "{} is encrypted but encryption.state_dir is not set", where));
        }

        const std::string subscription_name = channel.subscription().empty()
            ? std::string(BridgeDefaults::DEFAULT_SUBSCRIPTION)
            : channel.subscription();
        auto* subscription = FindSubscription(connection->second, subscription_name);
        if (subscription == nullptr) {
            if (subscription_name != BridgeDefaults::DEFAULT_SUBSCRIPTION) {
                return ConfigError<AgentSettings>(std::format(
                    "{}.subscription '{}' is not defined for connection '{}'",
                    where, subscription_name, channel.connection()));
            }
            opcua::SubscriptionSpec defaults;
            defaults.name = subscription_name;
            defaults.publish_interval = BridgeDefaults::PUBLISH_INTERVAL;
            defaults.queue_size = BridgeDefaults::MONITORED_ITEM_QUEUE_SIZE;
            connection->second.subscriptions.push_back(std::move(defaults));
            subscription = &connection->second.subscriptions.back();
        }
        std::vector<bridge::GroupNode> group;
        std::vector<std::string> channel_nodes{channel.node()};
        for (int g = 0; g < channel.group().size(); ++g) {
            const auto& member = channel.group(g);
            const std::string member_where = std::format("{}.group[{}]", where, g);
            if (member.node().empty()) {
                return ConfigError<AgentSettings>(member_where + ".node is required");
            }
            if (auto node = opcua::NodeReference::Parse(member.node()); node.IsErr()) {
                return ConfigError<AgentSettings>(
                    std::format("{}.node: {}", member_where, node.UnwrapErr().message));
            }
            if (std::find(channel_nodes.begin(), channel_nodes.end(), member.node()) != channel_nodes.end()) {
                return ConfigError<AgentSettings>(std::format(
                    "{}.node '{}' appears twice in the channel", member_where, member.node()));
            }
            channel_nodes.push_back(member.node());
            group.push_back(bridge::GroupNode{member.node(), member.feature()});
        }
        for (const auto& node : channel_nodes) {
            if (std::find(subscription->nodes.begin(), subscription->nodes.end(), node) ==
                subscription->nodes.end()) {
                subscription->nodes.push_back(node);
            }
        }

        auto topic = mqtt::TopicTemplate::Parse(channel.topic().empty() ? DEFAULT_TOPIC : channel.topic());
        if (topic.IsErr()) {
            return ConfigError<AgentSettings>(std::format("{}.topic: {}", where, topic.UnwrapErr().message));
        }

        settings.channels.push_back(bridge::DeviceChannel{
            channel.device(),
            channel.connection(),
            subscription_name,
            channel.node(),
            std::move(topic).Unwrap(),
            static_cast<int>(channel.qos()),
            channel.encrypted(),
            mandatory,
            channel.feature(),
            std::move(group),
            channel.full_state()
        });
    }

    for (auto& [id, connection] : connections) {
        std::erase_if(connection.subscriptions, [](const opcua::SubscriptionSpec& s) { return s.nodes.empty(); });
        if (!connection.subscriptions.empty()) {
            settings.connections.push_back(std::move(connection));
        }
    }

    for (const auto& [address, source] : config.sources()) {
        bridge::SourceOverride entry;
        if (source.has_drop()) {
            entry.drop = source.drop();
        }
        entry.device = source.device();
        entry.feature = source.feature();
        settings.sources.emplace(address, std::move(entry));
    }

    auto transport = ToTransport(config.cloud(), runtime);
    if (transport.IsErr()) {
        return Result<AgentSettings, BridgeFailure>::Err(std::move(transport).UnwrapErr());
    }
    settings.transport = std::move(transport).Unwrap();

    auto backpressure = mqtt::ParseBackpressurePolicy(runtime.backpressure());
    if (backpressure.IsErr()) {
        return Result<AgentSettings, BridgeFailure>::Err(std::move(backpressure).UnwrapErr());
    }
    settings.publisher.capacity = runtime.publish_queue_capacity() > 0
        ? runtime.publish_queue_capacity()
        : BridgeDefaults::PUBLISH_QUEUE_CAPACITY;
    settings.publisher.backpressure = backpressure.Unwrap();
    settings.publisher.backoff = mqtt_backoff.Unwrap();
    settings.publisher.max_connect_attempts = config.cloud().max_connect_attempts() > 0
        ? config.cloud().max_connect_attempts()
        : BridgeDefaults::MQTT_MAX_CONNECT_ATTEMPTS;

    settings.orchestrator.worker_threads = runtime.worker_threads() > 0
        ? runtime.worker_threads()
        : BridgeDefaults::WORKER_THREADS;
    settings.orchestrator.strand_batch_size = BridgeDefaults::STRAND_BATCH_SIZE;

    if (encryption_configured) {
        settings.encryption = EncryptionSettings{
            config.encryption().state_dir(),
            config.encryption().pickle_key_file(),
            mandatory
        };
    }

    return Result<AgentSettings, BridgeFailure>::Ok(std::move(settings));
}

}
