#include "uabridge/bridge/bridge_orchestrator.hpp"
#include "uabridge/configuration/agent_settings.hpp"
#include "uabridge/configuration/config_loader.hpp"
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/mqtt/mqtt_publisher.hpp"
#include "uabridge/mqtt/paho_mqtt_transport.hpp"
#include "uabridge/observability/logging.hpp"
#include "uabridge/opcua/subscription_manager.hpp"
#include "uabridge/protection/encryption_engine.hpp"
#include "uabridge/session/ratchet_session_store.hpp"

#include <chrono>
#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void HandleSignal(int) {
    g_stop_requested = 1;
}

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <file>]\n"
              << "\n"
              << "Subscribes to OPC-UA data changes and publishes them as MQTT telemetry.\n"
              << "Without --config the file named by $CONFIG_FILE is used, else /etc/opcua-agent/config.yaml.\n";
}

using uabridge::observability::FailureField;
using uabridge::observability::StringField;

int Run(const std::string& config_path) {
    uabridge::proto::config::AgentConfig config;
    try {
        config = uabridge::configuration::ConfigLoader::LoadFromYaml(config_path);
    } catch (const std::exception& ex) {
        UABRIDGE_LOG_ERROR("Cannot load configuration", {
            StringField("path", config_path),
            StringField("error", ex.what())
        });
        return 2;
    }
    uabridge::observability::InitializeLogging(config.logging());

    auto built = uabridge::configuration::BuildAgentSettings(config);
    if (built.IsErr()) {
        UABRIDGE_LOG_ERROR("Invalid configuration", {
            StringField("path", config_path),
            FailureField(built.UnwrapErr()),
            StringField("error", built.UnwrapErr().message)
        });
        return 2;
    }
    auto settings = std::move(built).Unwrap();

    if (auto sodium = uabridge::crypto::SodiumInterop::Initialize(); sodium.IsErr()) {
        UABRIDGE_LOG_ERROR("Cannot initialize libsodium", {StringField("error", sodium.UnwrapErr().message)});
        return 1;
    }

    std::shared_ptr<uabridge::session::RatchetSessionStore> sessions;
    if (settings.encryption.has_value()) {
        auto opened = uabridge::session::RatchetSessionStore::Open(
            settings.encryption->state_dir, settings.encryption->pickle_key_file);
        if (opened.IsErr()) {
            UABRIDGE_LOG_ERROR("Cannot open ratchet state", {
                StringField("state_dir", settings.encryption->state_dir),
                FailureField(opened.UnwrapErr()),
                StringField("error", opened.UnwrapErr().message)
            });
            return 1;
        }
        sessions = std::move(opened).Unwrap();
    }

    auto transport = std::make_shared<uabridge::mqtt::PahoMqttTransport>(settings.transport);
    UABRIDGE_LOG_INFO("MQTT endpoint", {
        StringField("uri", transport->ServerUri()),
        StringField("client_id", transport->ClientId())
    });
    auto publisher = std::make_shared<uabridge::mqtt::MqttPublisher>(transport, settings.publisher);
    auto source = std::make_shared<uabridge::opcua::SubscriptionManager>(settings.connections);
    auto router = std::make_shared<const uabridge::bridge::SourceRouter>(settings.sources);

    uabridge::bridge::BridgeOrchestrator orchestrator(
        source,
        publisher,
        uabridge::protection::EncryptionEngine::Create(sessions),
        router,
        settings.channels,
        settings.orchestrator);

    if (auto started = orchestrator.Start(); started.IsErr()) {
        UABRIDGE_LOG_ERROR("Bridge failed to start", {
            FailureField(started.UnwrapErr()),
            StringField("error", started.UnwrapErr().message)
        });
        orchestrator.Stop();
        return 1;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    bool reported_all_failed = false;
    while (g_stop_requested == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (!reported_all_failed && orchestrator.AllChannelsFailed()) {
            reported_all_failed = true;
            UABRIDGE_LOG_ERROR("Every channel has failed; waiting for shutdown");
        }
    }

    UABRIDGE_LOG_INFO("Shutdown requested");
    orchestrator.Stop();
    return 0;
}

}

int main(int argc, char** argv) {
    std::optional<std::string> config_path;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 || std::strcmp(argv[i], "-c") == 0) {
            if (i + 1 >= argc) {
                PrintUsage(argv[0]);
                return 2;
            }
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            PrintUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << argv[i] << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
    }

    uabridge::observability::InitializeLogging(uabridge::proto::config::LoggingConfig{});
    const std::string path = uabridge::configuration::ConfigLoader::ResolvePath(config_path);
    UABRIDGE_LOG_INFO("Starting uabridge agent", {StringField("config", path)});

    const int status = Run(path);
    uabridge::observability::ShutdownLogging();
    return status;
}
