#include <catch2/catch_test_macros.hpp>
#include "uabridge/mqtt/mqtt_publisher.hpp"
#include "helpers/fake_mqtt_transport.hpp"

#include <atomic>
#include <future>
#include <string>
#include <thread>

using namespace uabridge;
using namespace uabridge::mqtt;
using namespace std::chrono_literals;
using test_helpers::FakeMqttTransport;

namespace {
    PublisherOptions FastOptions(const size_t capacity = 16,
                                 const BackpressurePolicy policy = BackpressurePolicy::Block) {
        PublisherOptions options;
        options.capacity = capacity;
        options.backpressure = policy;
        options.backoff = utilities::BackoffPolicy{1ms, 10ms, 2.0, 0.0};
        options.max_connect_attempts = 3;
        return options;
    }

    std::vector<uint8_t> Payload(const std::string& text) {
        return {text.begin(), text.end()};
    }
}

TEST_CASE("MqttPublisher - Backpressure policy names", "[mqtt][publisher][config]") {
    REQUIRE(ParseBackpressurePolicy("").Unwrap() == BackpressurePolicy::Block);
    REQUIRE(ParseBackpressurePolicy("block").Unwrap() == BackpressurePolicy::Block);
    REQUIRE(ParseBackpressurePolicy("drop_newest").Unwrap() == BackpressurePolicy::DropNewest);
    REQUIRE(ParseBackpressurePolicy("drop_oldest").UnwrapErr().type == BridgeFailureType::Config);
}

TEST_CASE("MqttPublisher - Startup", "[mqtt][publisher]") {
    auto transport = std::make_shared<FakeMqttTransport>();

    SECTION("Publishing before start is refused") {
        MqttPublisher publisher(transport, FastOptions());
        auto result = publisher.Publish("telemetry/pump-1", Payload("x"), 1);
        REQUIRE(result.UnwrapErr().type == BridgeFailureType::InvalidState);
    }

    SECTION("Gives up after the configured attempts") {
        transport->SetBrokerUp(false);
        MqttPublisher publisher(transport, FastOptions());
        auto result = publisher.Start();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == BridgeFailureType::Connection);
        REQUIRE(transport->ConnectAttempts() == 3);
    }

    SECTION("Cannot start twice") {
        MqttPublisher publisher(transport, FastOptions());
        REQUIRE(publisher.Start().IsOk());
        REQUIRE(publisher.Start().UnwrapErr().type == BridgeFailureType::InvalidState);
    }
}

TEST_CASE("MqttPublisher - Ordered delivery", "[mqtt][publisher]") {
    auto transport = std::make_shared<FakeMqttTransport>();
    MqttPublisher publisher(transport, FastOptions());
    REQUIRE(publisher.Start().IsOk());

    SECTION("Messages arrive in publish order with their QoS") {
        for (int i = 0; i < 10; ++i) {
            REQUIRE(publisher.Publish("telemetry/pump-1", Payload(std::to_string(i)), 1).IsOk());
        }
        REQUIRE(transport->WaitForPublished(10, 2s));
        const auto published = transport->Published();
        for (int i = 0; i < 10; ++i) {
            REQUIRE(published[i].payload == Payload(std::to_string(i)));
            REQUIRE(published[i].qos == 1);
        }
        REQUIRE(publisher.Counters().published == 10);
    }

    SECTION("Unacknowledged messages survive a broker outage") {
        REQUIRE(publisher.Publish("t", Payload("before"), 1).IsOk());
        REQUIRE(transport->WaitForPublished(1, 2s));

        transport->SetBrokerUp(false);
        REQUIRE(publisher.Publish("t", Payload("during-1"), 1).IsOk());
        REQUIRE(publisher.Publish("t", Payload("during-2"), 1).IsOk());
        std::this_thread::sleep_for(30ms);
        REQUIRE(transport->Published().size() == 1);
        REQUIRE(publisher.QueueDepth() == 2);

        transport->SetBrokerUp(true);
        REQUIRE(transport->WaitForPublished(3, 2s));
        const auto published = transport->Published();
        REQUIRE(published[1].payload == Payload("during-1"));
        REQUIRE(published[2].payload == Payload("during-2"));
        REQUIRE(publisher.Counters().reconnects >= 1);
    }

    SECTION("A rejected message is dropped instead of stalling the queue") {
        transport->RejectTopic("telemetry/bad topic");
        REQUIRE(publisher.Publish("telemetry/bad topic", Payload("never"), 1).IsOk());
        REQUIRE(publisher.Publish("telemetry/pump-1", Payload("after"), 1).IsOk());
        REQUIRE(transport->WaitForPublished(1, 2s));
        publisher.Stop(2s);

        const auto published = transport->Published();
        REQUIRE(published.size() == 1);
        REQUIRE(published[0].payload == Payload("after"));
        REQUIRE(transport->Rejections() == 3);
        const auto counters = publisher.Counters();
        REQUIRE(counters.dropped == 1);
        REQUIRE(counters.retried == 2);
        REQUIRE(counters.published == 1);
        REQUIRE(publisher.QueueDepth() == 0);
    }

    SECTION("Stop drains the queue and refuses new messages") {
        for (int i = 0; i < 5; ++i) {
            REQUIRE(publisher.Publish("t", Payload("m"), 0).IsOk());
        }
        publisher.Stop(2s);
        REQUIRE(transport->Published().size() == 5);
        REQUIRE_FALSE(transport->IsConnected());
        REQUIRE(publisher.Publish("t", Payload("late"), 0).IsErr());
    }
}

TEST_CASE("MqttPublisher - Bounded queue", "[mqtt][publisher][backpressure]") {
    auto transport = std::make_shared<FakeMqttTransport>();

    SECTION("DropNewest rejects when full") {
        MqttPublisher publisher(transport, FastOptions(2, BackpressurePolicy::DropNewest));
        REQUIRE(publisher.Start().IsOk());
        transport->SetBrokerUp(false);

        // The delivery thread holds the head until it is acknowledged, so the
        // queue fills up while the broker is away.
        REQUIRE(publisher.Publish("t", Payload("1"), 1).IsOk());
        REQUIRE(publisher.Publish("t", Payload("2"), 1).IsOk());
        auto rejected = publisher.Publish("t", Payload("3"), 1);
        REQUIRE(rejected.IsErr());
        REQUIRE(publisher.Counters().dropped == 1);

        transport->SetBrokerUp(true);
        REQUIRE(transport->WaitForPublished(2, 2s));
        const auto published = transport->Published();
        REQUIRE(published.size() == 2);
        REQUIRE(published[1].payload == Payload("2"));
    }

    SECTION("Block waits for space") {
        MqttPublisher publisher(transport, FastOptions(1, BackpressurePolicy::Block));
        REQUIRE(publisher.Start().IsOk());
        transport->SetBrokerUp(false);
        REQUIRE(publisher.Publish("t", Payload("first"), 1).IsOk());

        std::atomic<bool> returned{false};
        auto blocked = std::async(std::launch::async, [&] {
            auto result = publisher.Publish("t", Payload("second"), 1);
            returned = true;
            return result.IsOk();
        });
        std::this_thread::sleep_for(50ms);
        REQUIRE_FALSE(returned.load());

        transport->SetBrokerUp(true);
        REQUIRE(blocked.get());
        REQUIRE(transport->WaitForPublished(2, 2s));
        REQUIRE(transport->Published()[1].payload == Payload("second"));
        REQUIRE(publisher.Counters().dropped == 0);
    }

    SECTION("Stop releases a blocked publisher") {
        MqttPublisher publisher(transport, FastOptions(1, BackpressurePolicy::Block));
        REQUIRE(publisher.Start().IsOk());
        transport->SetBrokerUp(false);
        REQUIRE(publisher.Publish("t", Payload("stuck"), 1).IsOk());

        auto blocked = std::async(std::launch::async, [&] {
            return publisher.Publish("t", Payload("waiting"), 1).IsErr();
        });
        std::this_thread::sleep_for(20ms);
        publisher.Stop(10ms);
        REQUIRE(blocked.get());
    }
}
