#include "uabridge/bridge/bridge_orchestrator.hpp"
#include "uabridge/observability/logging.hpp"

#include <format>

#include <future>

namespace uabridge::bridge {

using observability::BoolField;
using observability::FailureField;
using observability::IntField;
using observability::StringField;

BridgeOrchestrator::BridgeOrchestrator(
    std::shared_ptr<interfaces::IDataSource> source,
    std::shared_ptr<mqtt::MqttPublisher> publisher,
    protection::EncryptionEngine engine,
    std::shared_ptr<const SourceRouter> router,
    std::vector<DeviceChannel> channels,
    OrchestratorOptions options)
    : source_(std::move(source))
    , publisher_(std::move(publisher))
    , engine_(std::move(engine))
    , router_(std::move(router))
    , channel_specs_(std::move(channels))
    , options_(options) {}

BridgeOrchestrator::~BridgeOrchestrator() {
    Stop();
}

std::string BridgeOrchestrator::ItemKey(
    const std::string& connection,
    const std::string& subscription,
    const std::string& node) {
    return std::format("{}\n{}\n{}", connection, subscription, node);
}

Result<Unit, BridgeFailure> BridgeOrchestrator::Start() {
    if (started_) {
        return Result<Unit, BridgeFailure>::Err(BridgeFailure::InvalidState("Orchestrator already started"));
    }
    started_ = true;

    pool_ = std::make_unique<WorkerPool>(options_.worker_threads);
    slots_.reserve(channel_specs_.size());
    for (auto& spec : channel_specs_) {
        auto protector = engine_.ProtectorFor(spec.encrypted);
        if (protector.IsErr()) {
            return Result<Unit, BridgeFailure>::Err(BridgeFailure::Config(std::format(
                "Channel {} of device {}: {}", spec.node, spec.device_id, protector.UnwrapErr().message)));
        }
        std::shared_ptr<interfaces::IEnvelopeProtector> fallback;
        if (spec.encrypted && !spec.encryption_mandatory) {
            auto plaintext = engine_.ProtectorFor(false);
            if (plaintext.IsErr()) {
                return Result<Unit, BridgeFailure>::Err(std::move(plaintext).UnwrapErr());
            }
            fallback = std::move(plaintext).Unwrap();
        }
        const size_t index = slots_.size();
        for (const auto& member : spec.Nodes()) {
            by_item_[ItemKey(spec.connection, spec.subscription, member.node)].push_back(index);
        }
        by_connection_[spec.connection].push_back(index);
        slots_.push_back(ChannelSlot{
            std::make_shared<ChannelPipeline>(
                spec, router_, std::move(protector).Unwrap(), publisher_, std::move(fallback)),
            Strand::Create(*pool_, options_.strand_batch_size)
        });
    }

    auto connected = publisher_->Start();
    if (connected.IsErr()) {
        return connected;
    }

    for (const auto& slot : slots_) {
        slot.pipeline->Begin();
    }

    auto stream = source_->Start();
    if (stream.IsErr()) {
        for (const auto& slot : slots_) {
            slot.pipeline->Fail(stream.UnwrapErr());
        }
        return Result<Unit, BridgeFailure>::Err(std::move(stream).UnwrapErr());
    }

    dispatcher_ = std::thread([this, events = std::move(stream).Unwrap()]() mutable {
        Dispatch(std::move(events));
    });

    UABRIDGE_LOG_INFO("Bridge started", {
        IntField("channels", static_cast<int64_t>(slots_.size())),
        IntField("workers", static_cast<int64_t>(pool_->ThreadCount()))
    });
    return Result<Unit, BridgeFailure>::Ok(unit);
}

void BridgeOrchestrator::Dispatch(std::shared_ptr<opcua::DataChangeStream> stream) {
    while (auto event = stream->Pop()) {
        Route(std::move(*event));
    }
    UABRIDGE_LOG_DEBUG("Event stream closed");
}

void BridgeOrchestrator::Route(opcua::StreamEvent event) {
    if (auto* change = std::get_if<opcua::DataChangeEvent>(&event)) {
        const auto it = by_item_.find(ItemKey(change->connection, change->subscription, change->node));
        if (it == by_item_.end()) {
            UABRIDGE_LOG_DEBUG("Sample for unknown channel", {StringField("node", change->node)});
            return;
        }
        auto shared = std::make_shared<const opcua::DataChangeEvent>(std::move(*change));
        for (const size_t index : it->second) {
            const auto& slot = slots_[index];
            slot.strand->Post([pipeline = slot.pipeline, shared] { pipeline->OnDataChange(*shared); });
        }
        return;
    }
    if (const auto* item = std::get_if<opcua::ItemStatusEvent>(&event)) {
        const auto it = by_item_.find(ItemKey(item->connection, item->subscription, item->node));
        if (it == by_item_.end()) {
            return;
        }
        for (const size_t index : it->second) {
            const auto& slot = slots_[index];
            slot.strand->Post([pipeline = slot.pipeline, status = *item] { pipeline->OnItemStatus(status); });
        }
        return;
    }
    const auto& connection = std::get<opcua::ConnectionStatusEvent>(event);
    UABRIDGE_LOG_INFO("OPC-UA connection state", {
        StringField("connection", connection.connection),
        StringField("state", opcua::ToString(connection.state)),
        StringField("status", opcua::StatusCodeName(connection.status)),
        StringField("detail", connection.detail)
    });
    const auto it = by_connection_.find(connection.connection);
    if (it == by_connection_.end()) {
        return;
    }
    for (const size_t index : it->second) {
        const auto& slot = slots_[index];
        slot.strand->Post([pipeline = slot.pipeline, status = connection] { pipeline->OnConnectionStatus(status); });
    }
}

void BridgeOrchestrator::Stop() {
    if (!started_ || stopped_) {
        return;
    }
    stopped_ = true;

    source_->Stop();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }

    // Strands may be waiting for publish queue space; if the broker is gone,
    // stopping the publisher is what releases them.
    auto drained = std::async(std::launch::async, [this] { pool_->Shutdown(); });
    if (drained.wait_for(options_.drain_timeout) != std::future_status::ready) {
        UABRIDGE_LOG_WARN("Channels did not drain before the timeout", {
            IntField("timeout_ms", options_.drain_timeout.count())
        });
    }
    publisher_->Stop(options_.drain_timeout);
    drained.get();

    for (const auto& status : Snapshot()) {
        UABRIDGE_LOG_INFO("Channel summary", {
            StringField("device", status.device_id),
            StringField("channel", status.node),
            StringField("state", ToString(status.state)),
            IntField("published", static_cast<int64_t>(status.counters.published)),
            IntField("dropped", static_cast<int64_t>(status.counters.dropped)),
            IntField("crypto_failures", static_cast<int64_t>(status.counters.crypto_failures)),
            IntField("publish_failures", static_cast<int64_t>(status.counters.publish_failures)),
            BoolField("plaintext_fallback", status.plaintext_fallback)
        });
    }
}

std::vector<ChannelStatus> BridgeOrchestrator::Snapshot() const {
    std::vector<ChannelStatus> statuses;
    statuses.reserve(slots_.size());
    for (const auto& slot : slots_) {
        const auto& channel = slot.pipeline->Channel();
        statuses.push_back(ChannelStatus{
            channel.device_id,
            channel.connection,
            channel.node,
            slot.pipeline->State(),
            slot.pipeline->Counters(),
            slot.pipeline->IsDegraded()
        });
    }
    return statuses;
}

bool BridgeOrchestrator::AllChannelsFailed() const {
    if (slots_.empty()) {
        return false;
    }
    for (const auto& slot : slots_) {
        if (slot.pipeline->State() != ChannelState::Failed) {
            return false;
        }
    }
    return true;
}

}
