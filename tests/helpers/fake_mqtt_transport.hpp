#pragma once
#include "uabridge/interfaces/i_mqtt_transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace uabridge::test_helpers {

struct PublishedMessage {
    std::string topic;
    std::vector<uint8_t> payload;
    int qos = 0;
};

/**
 * Broker stand-in. While the broker is "down" connects are refused and an
 * established connection is dropped, so publishes fail until it comes back.
 */
class FakeMqttTransport : public interfaces::IMqttTransport {
public:
    [[nodiscard]] Result<Unit, BridgeFailure> Connect() override {
        ++connect_attempts_;
        if (!broker_up_.load()) {
            return Result<Unit, BridgeFailure>::Err(BridgeFailure::Connection("connection refused"));
        }
        connected_.store(true);
        return Result<Unit, BridgeFailure>::Ok(unit);
    }

    [[nodiscard]] bool IsConnected() const override { return connected_.load(); }

    [[nodiscard]] Result<Unit, BridgeFailure> Publish(
        const std::string& topic,
        std::span<const uint8_t> payload,
        const int qos) override {
        if (!connected_.load()) {
            return Result<Unit, BridgeFailure>::Err(BridgeFailure::Connection("not connected"));
        }
        {
            std::lock_guard lock(lock_);
            if (topic == rejected_topic_) {
                ++rejections_;
                return Result<Unit, BridgeFailure>::Err(BridgeFailure::Config("topic not allowed"));
            }
            published_.push_back(PublishedMessage{topic, {payload.begin(), payload.end()}, qos});
        }
        published_cv_.notify_all();
        return Result<Unit, BridgeFailure>::Ok(unit);
    }

    void Disconnect() override { connected_.store(false); }

    void SetBrokerUp(const bool up) {
        broker_up_.store(up);
        if (!up) {
            connected_.store(false);
        }
    }

    [[nodiscard]] std::vector<PublishedMessage> Published() const {
        std::lock_guard lock(lock_);
        return published_;
    }

    bool WaitForPublished(const size_t count, const std::chrono::milliseconds timeout) {
        std::unique_lock lock(lock_);
        return published_cv_.wait_for(lock, timeout, [&] { return published_.size() >= count; });
    }

    [[nodiscard]] int ConnectAttempts() const { return connect_attempts_.load(); }

    /// Publishes to `topic` fail as unacceptable, the way a broker refuses a bad topic.
    void RejectTopic(std::string topic) {
        std::lock_guard lock(lock_);
        rejected_topic_ = std::move(topic);
    }

    [[nodiscard]] size_t Rejections() const {
        std::lock_guard lock(lock_);
        return rejections_;
    }

private:
    mutable std::mutex lock_;
    std::condition_variable published_cv_;
    std::vector<PublishedMessage> published_;
    std::string rejected_topic_;
    size_t rejections_ = 0;
    std::atomic<bool> broker_up_{true};
    std::atomic<bool> connected_{false};
    std::atomic<int> connect_attempts_{0};
};

}
