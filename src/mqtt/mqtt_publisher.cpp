#include "uabridge/mqtt/mqtt_publisher.hpp"
#include "uabridge/observability/logging.hpp"

#include <format>

namespace uabridge::mqtt {

using observability::IntField;
using observability::StringField;

Result<BackpressurePolicy, BridgeFailure> ParseBackpressurePolicy(std::string_view text) {
    if (text.empty() || text == "block") {
        return Result<BackpressurePolicy, BridgeFailure>::Ok(BackpressurePolicy::Block);
    }
    if (text == "drop_newest") {
        return Result<BackpressurePolicy, BridgeFailure>::Ok(BackpressurePolicy::DropNewest);
    }
    return Result<BackpressurePolicy, BridgeFailure>::Err(BridgeFailure::Config(
        std::format("Unknown backpressure policy '{}' (expected block or drop_newest)", text)));
}

MqttPublisher::MqttPublisher(std::shared_ptr<interfaces::IMqttTransport> transport, PublisherOptions options)
    : transport_(std::move(transport))
    , options_(options) {
    if (options_.capacity == 0) {
        options_.capacity = 1;
    }
    if (options_.max_rejected_attempts == 0) {
        options_.max_rejected_attempts = 1;
    }
}

MqttPublisher::~MqttPublisher() {
    Stop(std::chrono::milliseconds(0));
}

Result<Unit, BridgeFailure> MqttPublisher::Start() {
    if (started_.exchange(true)) {
        return Result<Unit, BridgeFailure>::Err(BridgeFailure::InvalidState("Publisher already started"));
    }

    utilities::ExponentialBackoff backoff(options_.backoff);
    for (uint32_t attempt = 1;; ++attempt) {
        auto connected = transport_->Connect();
        if (connected.IsOk()) {
            break;
        }
        if (options_.max_connect_attempts > 0 && attempt >= options_.max_connect_attempts) {
            return Result<Unit, BridgeFailure>::Err(BridgeFailure::Connection(std::format(
                "Giving up on the MQTT broker after {} attempts: {}", attempt, connected.UnwrapErr().message)));
        }
        const auto delay = backoff.NextDelay();
        UABRIDGE_LOG_WARN("MQTT connect failed, retrying", {
            IntField("attempt", attempt),
            IntField("retry_in_ms", delay.count()),
            StringField("error", connected.UnwrapErr().message)
        });
        std::this_thread::sleep_for(delay);
    }

    {
        std::lock_guard lock(lock_);
        accepting_ = true;
    }
    delivery_thread_ = std::thread([this] { DeliveryLoop(); });
    return Result<Unit, BridgeFailure>::Ok(unit);
}

Result<Unit, BridgeFailure> MqttPublisher::Publish(
    std::string topic,
    std::vector<uint8_t> payload,
    const int qos) {
    {
        std::unique_lock lock(lock_);
        if (!accepting_) {
            return Result<Unit, BridgeFailure>::Err(BridgeFailure::InvalidState("Publisher is not running"));
        }
        if (queue_.size() >= options_.capacity) {
            if (options_.backpressure == BackpressurePolicy::DropNewest) {
                ++counters_.dropped;
                return Result<Unit, BridgeFailure>::Err(BridgeFailure::Connection(std::format(
                    "Publish queue full ({} messages), dropped message for {}", queue_.size(), topic)));
            }
            not_full_.wait(lock, [this] { return !accepting_ || queue_.size() < options_.capacity; });
            if (!accepting_) {
                return Result<Unit, BridgeFailure>::Err(BridgeFailure::InvalidState("Publisher stopped"));
            }
        }
        queue_.push_back(QueuedMessage{std::move(topic), std::move(payload), qos});
        ++counters_.enqueued;
    }
    not_empty_.notify_one();
    return Result<Unit, BridgeFailure>::Ok(unit);
}

void MqttPublisher::DeliveryLoop() {
    utilities::ExponentialBackoff backoff(options_.backoff);
    uint32_t head_rejections = 0;
    while (true) {
        const QueuedMessage* head = nullptr;
        {
            std::unique_lock lock(lock_);
            not_empty_.wait(lock, [this] { return aborted_ || !queue_.empty() || !accepting_; });
            if (aborted_) {
                return;
            }
            if (queue_.empty()) {
                if (!accepting_) {
                    return;
                }
                continue;
            }
            // Only this thread removes elements, and push_back keeps references valid.
            head = &queue_.front();
        }

        if (!transport_->IsConnected() && !Reconnect()) {
            return;
        }

        auto sent = transport_->Publish(head->topic, head->payload, head->qos);
        if (sent.IsOk()) {
            {
                std::lock_guard lock(lock_);
                queue_.pop_front();
                ++counters_.published;
            }
            not_full_.notify_one();
            drained_.notify_all();
            backoff.Reset();
            head_rejections = 0;
            continue;
        }

        if (!sent.UnwrapErr().Is(BridgeFailureType::Connection) &&
            ++head_rejections >= options_.max_rejected_attempts) {
            UABRIDGE_LOG_ERROR("MQTT publish rejected, dropping message", {
                StringField("topic", head->topic),
                IntField("qos", head->qos),
                IntField("attempts", head_rejections),
                StringField("error", sent.UnwrapErr().message)
            });
            {
                std::lock_guard lock(lock_);
                queue_.pop_front();
                ++counters_.dropped;
            }
            not_full_.notify_one();
            drained_.notify_all();
            head_rejections = 0;
            continue;
        }

        {
            std::lock_guard lock(lock_);
            ++counters_.retried;
        }
        const auto delay = backoff.NextDelay();
        UABRIDGE_LOG_WARN("MQTT publish failed, will retry", {
            StringField("topic", head->topic),
            IntField("qos", head->qos),
            IntField("retry_in_ms", delay.count()),
            StringField("error", sent.UnwrapErr().message)
        });
        if (!WaitUnlessAborted(delay)) {
            return;
        }
    }
}

bool MqttPublisher::Reconnect() {
    utilities::ExponentialBackoff backoff(options_.backoff);
    while (true) {
        {
            std::lock_guard lock(lock_);
            if (aborted_) {
                return false;
            }
        }
        auto connected = transport_->Connect();
        if (connected.IsOk()) {
            std::lock_guard lock(lock_);
            ++counters_.reconnects;
            UABRIDGE_LOG_INFO("Reconnected to MQTT broker", {
                IntField("attempts", backoff.Attempts() + 1),
                IntField("queued", static_cast<int64_t>(queue_.size()))
            });
            return true;
        }
        const auto delay = backoff.NextDelay();
        UABRIDGE_LOG_WARN("MQTT reconnect failed", {
            IntField("attempt", backoff.Attempts()),
            IntField("retry_in_ms", delay.count()),
            StringField("error", connected.UnwrapErr().message)
        });
        if (!WaitUnlessAborted(delay)) {
            return false;
        }
    }
}

bool MqttPublisher::WaitUnlessAborted(const std::chrono::milliseconds delay) {
    std::unique_lock lock(lock_);
    return !not_empty_.wait_for(lock, delay, [this] { return aborted_; });
}

void MqttPublisher::Stop(const std::chrono::milliseconds drain_timeout) {
    size_t remaining = 0;
    {
        std::unique_lock lock(lock_);
        accepting_ = false;
        not_full_.notify_all();
        not_empty_.notify_all();
        if (delivery_thread_.joinable()) {
            drained_.wait_for(lock, drain_timeout, [this] { return queue_.empty(); });
        }
        aborted_ = true;
        remaining = queue_.size();
    }
    not_empty_.notify_all();
    not_full_.notify_all();

    if (delivery_thread_.joinable()) {
        delivery_thread_.join();
        if (remaining > 0) {
            UABRIDGE_LOG_WARN("Publisher stopped with undelivered messages", {
                IntField("remaining", static_cast<int64_t>(remaining))
            });
        }
        transport_->Disconnect();
    }
}

PublisherCounters MqttPublisher::Counters() const {
    std::lock_guard lock(lock_);
    return counters_;
}

size_t MqttPublisher::QueueDepth() const {
    std::lock_guard lock(lock_);
    return queue_.size();
}

}
