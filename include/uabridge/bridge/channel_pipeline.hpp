#pragma once

#include "uabridge/bridge/channel_state.hpp"
#include "uabridge/bridge/device_channel.hpp"
#include "uabridge/bridge/source_router.hpp"
#include "uabridge/interfaces/i_envelope_protector.hpp"
#include "uabridge/mqtt/mqtt_publisher.hpp"
#include "uabridge/opcua/data_change_stream.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace uabridge::bridge {

struct ChannelCounters {
    uint64_t published = 0;
    uint64_t dropped = 0;
    uint64_t crypto_failures = 0;
    uint64_t publish_failures = 0;
};

/**
 * @brief subscribe -> map -> protect -> publish for one DeviceChannel
 *
 * The On* handlers are meant to run on the channel's strand, one at a time.
 * State() and Counters() may be read from any thread. Every node of the
 * channel's group shares the one sequence counter.
 *
 * Decoding failures drop the sample. Crypto failures drop the sample and
 * are counted. A Persistence failure on a channel with mandatory encryption
 * moves the channel to Failed, after which it publishes nothing. Without
 * mandatory encryption the channel switches to `fallback` for the rest of
 * the process and keeps streaming in plaintext.
 */
class ChannelPipeline {
public:
    ChannelPipeline(
        DeviceChannel channel,
        std::shared_ptr<const SourceRouter> router,
        std::shared_ptr<interfaces::IEnvelopeProtector> protector,
        std::shared_ptr<mqtt::MqttPublisher> publisher,
        std::shared_ptr<interfaces::IEnvelopeProtector> fallback = nullptr);

    ChannelPipeline(const ChannelPipeline&) = delete;
    ChannelPipeline& operator=(const ChannelPipeline&) = delete;

    void Begin();

    void OnDataChange(const opcua::DataChangeEvent& event);

    void OnItemStatus(const opcua::ItemStatusEvent& event);

    void OnConnectionStatus(const opcua::ConnectionStatusEvent& event);

    /// Fail the channel from outside, e.g. when the data source could not start.
    void Fail(const BridgeFailure& failure);

    [[nodiscard]] const DeviceChannel& Channel() const noexcept { return channel_; }

    [[nodiscard]] ChannelState State() const;

    [[nodiscard]] ChannelCounters Counters() const;

    [[nodiscard]] uint64_t LastSequence() const noexcept { return sequence_.load(); }

    /// True once the channel gave up encryption after a persistence failure.
    [[nodiscard]] bool IsDegraded() const noexcept { return degraded_.load(); }

private:
    void MoveTo(ChannelState next);

    void Deliver(const RouteDecision& route, const codec::TelemetryEnvelope& envelope);

    /// Returns true when the sample should be retried with the swapped-in protector.
    bool HandleProtectFailure(const std::string& device, const BridgeFailure& failure);

    DeviceChannel channel_;
    std::shared_ptr<const SourceRouter> router_;
    std::shared_ptr<interfaces::IEnvelopeProtector> protector_;
    std::shared_ptr<mqtt::MqttPublisher> publisher_;
    std::shared_ptr<interfaces::IEnvelopeProtector> fallback_;

    struct Member {
        SourceRouter::Address address;
        std::string feature;
    };
    std::map<std::string, Member> members_;
    /// Latest value per feature, kept only for full-state channels. Strand-confined.
    std::map<std::string, codec::TelemetryValue> features_;

    mutable std::mutex state_lock_;
    ChannelStateMachine state_;

    std::atomic<uint64_t> sequence_{0};
    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> crypto_failures_{0};
    std::atomic<uint64_t> publish_failures_{0};
    std::atomic<bool> degraded_{false};
};

}
