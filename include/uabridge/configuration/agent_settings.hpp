#pragma once

#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"
#include "uabridge/bridge/bridge_orchestrator.hpp"
#include "uabridge/bridge/device_channel.hpp"
#include "uabridge/bridge/source_router.hpp"
#include "uabridge/mqtt/mqtt_publisher.hpp"
#include "uabridge/mqtt/paho_mqtt_transport.hpp"
#include "uabridge/opcua/subscription_manager.hpp"

#include "config/agent_config.pb.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace uabridge::configuration {

struct EncryptionSettings {
    std::string state_dir;
    /// Empty means pickles are stored unencrypted.
    std::string pickle_key_file;
    bool mandatory = true;
};

/**
 * @brief Validated, defaulted view of an AgentConfig
 *
 * Everything the agent needs to wire itself up, in the types the
 * components take. Subscriptions only carry the nodes some channel uses.
 */
struct AgentSettings {
    proto::config::LoggingConfig logging;
    std::vector<opcua::ConnectionSpec> connections;
    std::vector<bridge::DeviceChannel> channels;
    std::map<std::string, bridge::SourceOverride> sources;
    mqtt::MqttTransportOptions transport;
    mqtt::PublisherOptions publisher;
    bridge::OrchestratorOptions orchestrator;
    std::optional<EncryptionSettings> encryption;
};

[[nodiscard]] Result<AgentSettings, BridgeFailure> BuildAgentSettings(const proto::config::AgentConfig& config);

}
