#pragma once
#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace uabridge::interfaces {

/**
 * @brief One client connection to an MQTT broker
 *
 * Publish() returns once the message is handed to the client for QoS 0, and
 * once the broker acknowledged it for QoS 1 and 2. Calls come from a single
 * delivery thread; IsConnected() may be called from any thread.
 *
 * A Connection failure from Publish() is transient. Any other failure type
 * means the message itself is unacceptable and resending it will not help.
 */
class IMqttTransport {
public:
    virtual ~IMqttTransport() = default;

    [[nodiscard]] virtual Result<Unit, BridgeFailure> Connect() = 0;

    [[nodiscard]] virtual bool IsConnected() const = 0;

    [[nodiscard]] virtual Result<Unit, BridgeFailure> Publish(
        const std::string& topic,
        std::span<const uint8_t> payload,
        int qos) = 0;

    virtual void Disconnect() = 0;
};

}
