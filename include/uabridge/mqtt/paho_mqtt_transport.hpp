#pragma once

#include "uabridge/interfaces/i_mqtt_transport.hpp"

#include <MQTTAsync.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace uabridge::mqtt {

struct MqttTransportOptions {
    std::string host;
    uint16_t port = 0;
    bool tls = true;
    std::string client_id;
    std::string username;
    std::string password;
    std::string trust_store;
    std::chrono::seconds keep_alive{30};
    bool clean_session = true;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds delivery_timeout{10000};
};

/**
 * Owns an MQTTAsync handle and destroys it exactly once.
 */
class MqttAsyncHandle {
public:
    MqttAsyncHandle() noexcept = default;
    explicit MqttAsyncHandle(MQTTAsync client) noexcept : client_(client) {}
    ~MqttAsyncHandle() noexcept { Reset(); }

    MqttAsyncHandle(MqttAsyncHandle&& other) noexcept : client_(other.client_) { other.client_ = nullptr; }
    MqttAsyncHandle& operator=(MqttAsyncHandle&& other) noexcept {
        if (this != &other) {
            Reset();
            client_ = other.client_;
            other.client_ = nullptr;
        }
        return *this;
    }

    MqttAsyncHandle(const MqttAsyncHandle&) = delete;
    MqttAsyncHandle& operator=(const MqttAsyncHandle&) = delete;

    [[nodiscard]] MQTTAsync Get() const noexcept { return client_; }

    explicit operator bool() const noexcept { return client_ != nullptr; }

    void Reset() noexcept {
        if (client_ != nullptr) {
            MQTTAsync_destroy(&client_);
            client_ = nullptr;
        }
    }

private:
    MQTTAsync client_ = nullptr;
};

/**
 * @brief IMqttTransport over the Eclipse Paho asynchronous C client
 *
 * Automatic reconnect is left off; the publisher owns retry policy. When
 * only a password is configured, the username is `device@application`,
 * which the caller puts into `username` before constructing the transport.
 */
class PahoMqttTransport final : public interfaces::IMqttTransport {
public:
    explicit PahoMqttTransport(MqttTransportOptions options);
    ~PahoMqttTransport() override;

    PahoMqttTransport(const PahoMqttTransport&) = delete;
    PahoMqttTransport& operator=(const PahoMqttTransport&) = delete;

    [[nodiscard]] Result<Unit, BridgeFailure> Connect() override;

    [[nodiscard]] bool IsConnected() const override;

    [[nodiscard]] Result<Unit, BridgeFailure> Publish(
        const std::string& topic,
        std::span<const uint8_t> payload,
        int qos) override;

    void Disconnect() override;

    [[nodiscard]] std::string ServerUri() const;

    [[nodiscard]] const std::string& ClientId() const noexcept { return options_.client_id; }

    /**
     * @brief Random client id of `length` characters from [A-Za-z0-9]
     */
    static std::string GenerateClientId(size_t length);

private:
    static void OnConnectionLost(void* context, char* cause);
    static int OnMessageArrived(void* context, char* topic, int topic_length, MQTTAsync_message* message);

    Result<Unit, BridgeFailure> EnsureClient();

    MqttTransportOptions options_;
    MqttAsyncHandle client_;
    std::mutex connect_lock_;
    std::atomic<bool> connected_{false};
};

}
