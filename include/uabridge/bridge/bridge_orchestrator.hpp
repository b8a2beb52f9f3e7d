#pragma once

#include "uabridge/bridge/channel_pipeline.hpp"
#include "uabridge/bridge/worker_pool.hpp"
#include "uabridge/interfaces/i_data_source.hpp"
#include "uabridge/protection/encryption_engine.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace uabridge::bridge {

struct OrchestratorOptions {
    size_t worker_threads = 4;
    size_t strand_batch_size = 32;
    /// How long Stop() waits for queued samples to reach the broker.
    std::chrono::milliseconds drain_timeout{5000};
};

struct ChannelStatus {
    std::string device_id;
    std::string connection;
    std::string node;
    ChannelState state = ChannelState::Starting;
    ChannelCounters counters;
    /// Encryption was given up after a persistence failure (non-mandatory only).
    bool plaintext_fallback = false;
};

/**
 * @brief Wires the data source, the channels and the publisher together
 *
 * A dispatcher thread pops the data source's event stream and posts each
 * event to the strands of the channels it concerns, so one channel's events
 * are handled in order while different channels run in parallel on the
 * worker pool. A channel that fails stays failed; the others keep running.
 */
class BridgeOrchestrator {
public:
    BridgeOrchestrator(
        std::shared_ptr<interfaces::IDataSource> source,
        std::shared_ptr<mqtt::MqttPublisher> publisher,
        protection::EncryptionEngine engine,
        std::shared_ptr<const SourceRouter> router,
        std::vector<DeviceChannel> channels,
        OrchestratorOptions options);
    ~BridgeOrchestrator();

    BridgeOrchestrator(const BridgeOrchestrator&) = delete;
    BridgeOrchestrator& operator=(const BridgeOrchestrator&) = delete;

    /**
     * @brief Resolve protectors, connect the publisher, start the data source
     *
     * Fails with Config when a channel asks for encryption that is not
     * configured, and with Connection when the broker cannot be reached
     * within the publisher's attempt limit.
     */
    [[nodiscard]] Result<Unit, BridgeFailure> Start();

    void Stop();

    [[nodiscard]] std::vector<ChannelStatus> Snapshot() const;

    [[nodiscard]] bool AllChannelsFailed() const;

private:
    struct ChannelSlot {
        std::shared_ptr<ChannelPipeline> pipeline;
        std::shared_ptr<Strand> strand;
    };

    static std::string ItemKey(const std::string& connection, const std::string& subscription, const std::string& node);

    void Dispatch(std::shared_ptr<opcua::DataChangeStream> stream);

    void Route(opcua::StreamEvent event);

    std::shared_ptr<interfaces::IDataSource> source_;
    std::shared_ptr<mqtt::MqttPublisher> publisher_;
    protection::EncryptionEngine engine_;
    std::shared_ptr<const SourceRouter> router_;
    std::vector<DeviceChannel> channel_specs_;
    OrchestratorOptions options_;

    std::unique_ptr<WorkerPool> pool_;
    std::vector<ChannelSlot> slots_;
    std::unordered_map<std::string, std::vector<size_t>> by_item_;
    std::unordered_map<std::string, std::vector<size_t>> by_connection_;
    std::thread dispatcher_;
    bool started_ = false;
    bool stopped_ = false;
};

}
