#pragma once

#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"
#include "uabridge/interfaces/i_mqtt_transport.hpp"
#include "uabridge/utilities/backoff.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace uabridge::mqtt {

enum class BackpressurePolicy {
    Block,
    DropNewest
};

[[nodiscard]] Result<BackpressurePolicy, BridgeFailure> ParseBackpressurePolicy(std::string_view text);

struct PublisherOptions {
    size_t capacity = 1024;
    BackpressurePolicy backpressure = BackpressurePolicy::Block;
    utilities::BackoffPolicy backoff;
    /// Connect attempts Start() makes before giving up; 0 retries forever.
    uint32_t max_connect_attempts = 10;
    /// Sends of a message the transport rejects as unacceptable before it is dropped.
    uint32_t max_rejected_attempts = 3;
};

struct PublisherCounters {
    uint64_t enqueued = 0;
    uint64_t published = 0;
    uint64_t dropped = 0;
    uint64_t retried = 0;
    uint64_t reconnects = 0;
};

/**
 * @brief Queued, ordered delivery to one broker connection
 *
 * Publish() only enqueues. A single delivery thread sends the queue head
 * and removes it only after the transport reports success, so a message
 * that is not yet acknowledged survives a disconnect and is sent again, in
 * its original position, after the reconnect. The queue is bounded: under
 * BackpressurePolicy::Block the caller waits for space, under DropNewest the
 * publish fails and is counted as dropped. Transient (Connection) send
 * failures are retried without limit; a message the transport rejects
 * outright is dropped after max_rejected_attempts so it cannot stall the
 * messages queued behind it.
 */
class MqttPublisher {
public:
    MqttPublisher(std::shared_ptr<interfaces::IMqttTransport> transport, PublisherOptions options);
    ~MqttPublisher();

    MqttPublisher(const MqttPublisher&) = delete;
    MqttPublisher& operator=(const MqttPublisher&) = delete;

    /**
     * @brief Connect and start the delivery thread
     *
     * Returns a Connection failure when max_connect_attempts are exhausted.
     */
    [[nodiscard]] Result<Unit, BridgeFailure> Start();

    [[nodiscard]] Result<Unit, BridgeFailure> Publish(
        std::string topic,
        std::vector<uint8_t> payload,
        int qos);

    /**
     * @brief Stop accepting messages, deliver what is queued within `drain_timeout`, disconnect
     */
    void Stop(std::chrono::milliseconds drain_timeout = std::chrono::milliseconds(5000));

    [[nodiscard]] PublisherCounters Counters() const;

    [[nodiscard]] size_t QueueDepth() const;

private:
    struct QueuedMessage {
        std::string topic;
        std::vector<uint8_t> payload;
        int qos;
    };

    void DeliveryLoop();

    /// Reconnect with backoff until connected or aborted; false when aborted.
    bool Reconnect();

    bool WaitUnlessAborted(std::chrono::milliseconds delay);

    std::shared_ptr<interfaces::IMqttTransport> transport_;
    PublisherOptions options_;

    mutable std::mutex lock_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::condition_variable drained_;
    std::deque<QueuedMessage> queue_;
    bool accepting_ = false;
    bool aborted_ = false;
    PublisherCounters counters_;

    std::thread delivery_thread_;
    std::atomic<bool> started_{false};
};

}
