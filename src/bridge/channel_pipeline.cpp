#include "uabridge/bridge/channel_pipeline.hpp"
#include "uabridge/codec/value_codec.hpp"
#include "uabridge/observability/logging.hpp"

namespace uabridge::bridge {

using observability::BoolField;
using observability::FailureField;
using observability::IntField;
using observability::StringField;

ChannelPipeline::ChannelPipeline(
    DeviceChannel channel,
    std::shared_ptr<const SourceRouter> router,
    std::shared_ptr<interfaces::IEnvelopeProtector> protector,
    std::shared_ptr<mqtt::MqttPublisher> publisher,
    std::shared_ptr<interfaces::IEnvelopeProtector> fallback)
    : channel_(std::move(channel))
    , router_(std::move(router))
    , protector_(std::move(protector))
    , publisher_(std::move(publisher))
    , fallback_(std::move(fallback)) {
    if (!router_) {
        router_ = std::make_shared<SourceRouter>();
    }
    for (auto& member : channel_.Nodes()) {
        auto address = SourceRouter::SourceAddress(channel_.connection, channel_.subscription, member.node);
        members_.emplace(std::move(member.node), Member{std::move(address), std::move(member.feature)});
    }
}

void ChannelPipeline::Begin() {
    MoveTo(ChannelState::Subscribing);
}

void ChannelPipeline::OnDataChange(const opcua::DataChangeEvent& event) {
    if (State() == ChannelState::Failed) {
        dropped_.fetch_add(1);
        return;
    }
    // A notification proves the monitored item is live.
    MoveTo(ChannelState::Streaming);

    const auto member = members_.find(event.node);
    if (member == members_.end()) {
        UABRIDGE_LOG_DEBUG("Sample for a node outside the channel", {
            StringField("device", channel_.device_id),
            StringField("node", event.node)
        });
        return;
    }
    const RouteDecision route = router_->Route(member->second.address, channel_.device_id, member->second.feature);
    if (route.drop) {
        UABRIDGE_LOG_DEBUG("Sample dropped by source override", {
            StringField("source", SourceRouter::FormatAddress(member->second.address))
        });
        return;
    }

    const uint64_t sequence = sequence_.load() + 1;
    const codec::SampleContext context{route.device, route.feature, event.node, sequence, event.received_at};
    auto encoded = codec::ValueCodec::Encode(context, event.value.Get());
    if (encoded.IsErr()) {
        dropped_.fetch_add(1);
        UABRIDGE_LOG_WARN("Dropping sample that cannot be encoded", {
            StringField("device", route.device),
            StringField("channel", channel_.node),
            FailureField(encoded.UnwrapErr()),
            StringField("error", encoded.UnwrapErr().message)
        });
        return;
    }
    sequence_.store(sequence);
    auto& envelope = encoded.Unwrap();
    if (channel_.full_state) {
        features_.insert_or_assign(route.feature, envelope.value);
        envelope.features = features_;
    }
    Deliver(route, envelope);
}

void ChannelPipeline::Deliver(const RouteDecision& route, const codec::TelemetryEnvelope& envelope) {
    auto protected_payload = protector_->Protect(envelope);
    if (protected_payload.IsErr()) {
        if (HandleProtectFailure(route.device, protected_payload.UnwrapErr())) {
            Deliver(route, envelope);
        }
        return;
    }

    auto topic = channel_.topic.Render(mqtt::TopicContext{route.device, channel_.connection, route.feature});
    if (topic.IsErr()) {
        publish_failures_.fetch_add(1);
        UABRIDGE_LOG_ERROR("Cannot derive topic for sample", {
            StringField("device", route.device),
            StringField("channel", channel_.node),
            FailureField(topic.UnwrapErr()),
            StringField("error", topic.UnwrapErr().message)
        });
        return;
    }

    auto published = publisher_->Publish(
        std::move(topic).Unwrap(), std::move(protected_payload).Unwrap(), channel_.qos);
    if (published.IsErr()) {
        publish_failures_.fetch_add(1);
        UABRIDGE_LOG_WARN("Publish rejected", {
            StringField("device", route.device),
            StringField("channel", channel_.node),
            FailureField(published.UnwrapErr()),
            StringField("error", published.UnwrapErr().message)
        });
        return;
    }
    published_.fetch_add(1);
}

bool ChannelPipeline::HandleProtectFailure(const std::string& device, const BridgeFailure& failure) {
    crypto_failures_.fetch_add(1);
    if (failure.Is(BridgeFailureType::Persistence) && channel_.encrypted) {
        if (channel_.encryption_mandatory || !fallback_) {
            UABRIDGE_LOG_ERROR("Ratchet state could not be persisted, channel stops publishing", {
                StringField("device", device),
                StringField("channel", channel_.node),
                FailureField(failure),
                StringField("error", failure.message)
            });
            MoveTo(ChannelState::Failed);
            return false;
        }
        UABRIDGE_LOG_ERROR("Ratchet state could not be persisted, channel now publishes UNENCRYPTED", {
            StringField("device", device),
            StringField("channel", channel_.node),
            FailureField(failure),
            StringField("error", failure.message)
        });
        protector_ = std::move(fallback_);
        fallback_.reset();
        degraded_.store(true);
        return true;
    }
    UABRIDGE_LOG_ERROR("Dropping sample after protection failure", {
        StringField("device", device),
        StringField("channel", channel_.node),
        BoolField("encrypted", channel_.encrypted),
        FailureField(failure),
        StringField("error", failure.message)
    });
    return false;
}

void ChannelPipeline::OnItemStatus(const opcua::ItemStatusEvent& event) {
    if (event.subscribed) {
        // New monitored item, new subscription lifetime. Group members share
        // the primary node's lifetime.
        if (event.node == channel_.node) {
            sequence_.store(0);
        }
        MoveTo(ChannelState::Streaming);
        return;
    }
    UABRIDGE_LOG_WARN("Monitored item not active", {
        StringField("device", channel_.device_id),
        StringField("channel", channel_.node),
        StringField("status", opcua::StatusCodeName(event.status))
    });
    if (State() == ChannelState::Streaming) {
        MoveTo(ChannelState::Reconnecting);
    }
}

void ChannelPipeline::OnConnectionStatus(const opcua::ConnectionStatusEvent& event) {
    switch (event.state) {
        case opcua::ConnectionState::Connected:
            sequence_.store(0);
            break;
        case opcua::ConnectionState::Disconnected:
            if (State() == ChannelState::Streaming || State() == ChannelState::Subscribing) {
                MoveTo(ChannelState::Reconnecting);
            }
            break;
        case opcua::ConnectionState::Failed:
            Fail(BridgeFailure::Connection(event.detail));
            break;
    }
}

void ChannelPipeline::Fail(const BridgeFailure& failure) {
    if (State() == ChannelState::Failed) {
        return;
    }
    UABRIDGE_LOG_ERROR("Channel failed", {
        StringField("device", channel_.device_id),
        StringField("channel", channel_.node),
        FailureField(failure),
        StringField("error", failure.message)
    });
    MoveTo(ChannelState::Failed);
}

void ChannelPipeline::MoveTo(const ChannelState next) {
    ChannelState previous;
    {
        std::lock_guard lock(state_lock_);
        previous = state_.State();
        if (previous == next || state_.Transition(next).IsErr()) {
            return;
        }
    }
    UABRIDGE_LOG_INFO("Channel state changed", {
        StringField("device", channel_.device_id),
        StringField("channel", channel_.node),
        StringField("from", ToString(previous)),
        StringField("to", ToString(next))
    });
}

ChannelState ChannelPipeline::State() const {
    std::lock_guard lock(state_lock_);
    return state_.State();
}

ChannelCounters ChannelPipeline::Counters() const {
    return ChannelCounters{published_.load(), dropped_.load(), crypto_failures_.load(), publish_failures_.load()};
}

}
