#include "uabridge/mqtt/paho_mqtt_transport.hpp"
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/core/constants.hpp"
#include "uabridge/observability/logging.hpp"

#include <format>

#include <future>
#include <memory>

namespace uabridge::mqtt {

using observability::StringField;

namespace {

    constexpr std::string_view CLIENT_ID_ALPHABET =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    constexpr std::chrono::milliseconds CALLBACK_GRACE{1000};
    constexpr int DISCONNECT_TIMEOUT_MS = 5000;

    // Heap box shared between the waiting caller and the Paho callback thread.
    // The callback owns the box and deletes it; the caller may have given up.
    using Completion = std::shared_ptr<std::promise<int>>;

    void* NewCompletionContext(const Completion& completion) {
        return new Completion(completion);
    }

    void DeleteCompletionContext(void* context) {
        delete static_cast<Completion*>(context);
    }

    void OnActionSuccess(void* context, MQTTAsync_successData*) {
        std::unique_ptr<Completion> box(static_cast<Completion*>(context));
        (*box)->set_value(MQTTASYNC_SUCCESS);
    }

    void OnActionFailure(void* context, MQTTAsync_failureData* response) {
        std::unique_ptr<Completion> box(static_cast<Completion*>(context));
        (*box)->set_value(response != nullptr && response->code != MQTTASYNC_SUCCESS
                              ? response->code
                              : MQTTASYNC_FAILURE);
    }

    std::string DescribeCode(const int code) {
        const char* text = MQTTAsync_strerror(code);
        return std::format("{} ({})", text != nullptr ? text : "unknown error", code);
    }

    // Codes that no amount of retrying turns into a successful send.
    bool IsPermanentRejection(const int code) {
        switch (code) {
            case MQTTASYNC_BAD_UTF8_STRING:
            case MQTTASYNC_NULL_PARAMETER:
            case MQTTASYNC_TOPICNAME_TRUNCATED:
            case MQTTASYNC_BAD_STRUCTURE:
            case MQTTASYNC_BAD_QOS:
                return true;
            default:
                return false;
        }
    }

}

PahoMqttTransport::PahoMqttTransport(MqttTransportOptions options)
    : options_(std::move(options)) {
    if (options_.port == 0) {
        options_.port = options_.tls ? BridgeDefaults::MQTT_TLS_PORT : BridgeDefaults::MQTT_PLAIN_PORT;
    }
    if (options_.client_id.empty()) {
        options_.client_id = GenerateClientId(BridgeDefaults::CLIENT_ID_LENGTH);
    }
}

PahoMqttTransport::~PahoMqttTransport() {
    Disconnect();
    client_.Reset();
}

std::string PahoMqttTransport::ServerUri() const {
    return std::format("{}://{}:{}", options_.tls ? "ssl" : "tcp", options_.host, options_.port);
}

std::string PahoMqttTransport::GenerateClientId(const size_t length) {
    std::string id;
    id.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        id.push_back(CLIENT_ID_ALPHABET[crypto::SodiumInterop::GenerateRandomUInt32(
            static_cast<uint32_t>(CLIENT_ID_ALPHABET.size()))]);
    }
    return id;
}

Result<Unit, BridgeFailure> PahoMqttTransport::EnsureClient() {
    if (client_) {
        return Result<Unit, BridgeFailure>::Ok(unit);
    }
    MQTTAsync raw_client = nullptr;
    int rc = MQTTAsync_create(&raw_client, ServerUri().c_str(), options_.client_id.c_str(),
                              MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        return Result<Unit, BridgeFailure>::Err(BridgeFailure::Connection(
            std::format("Failed to create MQTT client: {}", DescribeCode(rc))));
    }
    MqttAsyncHandle handle(raw_client);
    rc = MQTTAsync_setCallbacks(handle.Get(), this, &OnConnectionLost, &OnMessageArrived, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        return Result<Unit, BridgeFailure>::Err(BridgeFailure::Connection(
            std::format("Failed to install MQTT callbacks: {}", DescribeCode(rc))));
    }
    client_ = std::move(handle);
    return Result<Unit, BridgeFailure>::Ok(unit);
}

Result<Unit, BridgeFailure> PahoMqttTransport::Connect() {
    std::lock_guard lock(connect_lock_);
    if (connected_.load()) {
        return Result<Unit, BridgeFailure>::Ok(unit);
    }
    UABRIDGE_TRY(EnsureClient());

    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    conn_opts.keepAliveInterval = static_cast<int>(options_.keep_alive.count());
    conn_opts.cleansession = options_.clean_session ? 1 : 0;
    conn_opts.connectTimeout = static_cast<int>(
        std::chrono::duration_cast<std::chrono::seconds>(options_.connect_timeout).count());
    conn_opts.automaticReconnect = 0;
    conn_opts.username = options_.username.empty() ? nullptr : options_.username.c_str();
    conn_opts.password = options_.password.empty() ? nullptr : options_.password.c_str();

    MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;
    if (options_.tls) {
        ssl_opts.trustStore = options_.trust_store.empty() ? nullptr : options_.trust_store.c_str();
        ssl_opts.enableServerCertAuth = 1;
        conn_opts.ssl = &ssl_opts;
    }

    auto completion = std::make_shared<std::promise<int>>();
    auto done = completion->get_future();
    void* context = NewCompletionContext(completion);
    conn_opts.context = context;
    conn_opts.onSuccess = &OnActionSuccess;
    conn_opts.onFailure = &OnActionFailure;

    const int rc = MQTTAsync_connect(client_.Get(), &conn_opts);
    if (rc != MQTTASYNC_SUCCESS) {
        DeleteCompletionContext(context);
        return Result<Unit, BridgeFailure>::Err(BridgeFailure::Connection(
            std::format("MQTT connect to {} failed: {}", ServerUri(), DescribeCode(rc))));
    }
    if (done.wait_for(options_.connect_timeout + CALLBACK_GRACE) == std::future_status::timeout) {
        return Result<Unit, BridgeFailure>::Err(BridgeFailure::Connection(
            std::format("MQTT connect to {} timed out", ServerUri())));
    }
    const int code = done.get();
    if (code != MQTTASYNC_SUCCESS) {
        return Result<Unit, BridgeFailure>::Err(BridgeFailure::Connection(
            std::format("MQTT connect to {} refused: {}", ServerUri(), DescribeCode(code))));
    }
    connected_.store(true);
    UABRIDGE_LOG_INFO("Connected to MQTT broker", {
        StringField("uri", ServerUri()),
        StringField("client_id", options_.client_id)
    });
    return Result<Unit, BridgeFailure>::Ok(unit);
}

bool PahoMqttTransport::IsConnected() const {
    return connected_.load();
}

Result<Unit, BridgeFailure> PahoMqttTransport::Publish(
    const std::string& topic,
    std::span<const uint8_t> payload,
    const int qos) {
    if (!connected_.load() || !client_) {
        return Result<Unit, BridgeFailure>::Err(BridgeFailure::Connection("MQTT client is not connected"));
    }

    MQTTAsync_message message = MQTTAsync_message_initializer;
    message.payload = const_cast<uint8_t*>(payload.data());
    message.payloadlen = static_cast<int>(payload.size());
    message.qos = qos;
    message.retained = 0;

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    Completion completion;
    std::future<int> done;
    void* context = nullptr;
    if (qos > 0) {
        completion = std::make_shared<std::promise<int>>();
        done = completion->get_future();
        context = NewCompletionContext(completion);
        opts.context = context;
        opts.onSuccess = &OnActionSuccess;
        opts.onFailure = &OnActionFailure;
    }

    const int rc = MQTTAsync_sendMessage(client_.Get(), topic.c_str(), &message, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        if (context != nullptr) {
            DeleteCompletionContext(context);
        }
        if (rc == MQTTASYNC_DISCONNECTED) {
            connected_.store(false);
        }
        if (IsPermanentRejection(rc)) {
            return Result<Unit, BridgeFailure>::Err(BridgeFailure::Config(
                std::format("Publish to {} rejected: {}", topic, DescribeCode(rc))));
        }
        return Result<Unit, BridgeFailure>::Err(BridgeFailure::Connection(
            std::format("Publish to {} failed: {}", topic, DescribeCode(rc))));
    }
    if (qos == 0) {
        return Result<Unit, BridgeFailure>::Ok(unit);
    }

    if (done.wait_for(options_.delivery_timeout) == std::future_status::timeout) {
        return Result<Unit, BridgeFailure>::Err(BridgeFailure::Connection(
            std::format("No acknowledgement for publish to {} within {} ms",
                        topic, options_.delivery_timeout.count())));
    }
    const int code = done.get();
    if (code != MQTTASYNC_SUCCESS) {
        return Result<Unit, BridgeFailure>::Err(BridgeFailure::Connection(
            std::format("Broker rejected publish to {}: {}", topic, DescribeCode(code))));
    }
    return Result<Unit, BridgeFailure>::Ok(unit);
}

void PahoMqttTransport::Disconnect() {
    std::lock_guard lock(connect_lock_);
    if (!client_ || !connected_.exchange(false)) {
        return;
    }
    auto completion = std::make_shared<std::promise<int>>();
    auto done = completion->get_future();
    void* context = NewCompletionContext(completion);

    MQTTAsync_disconnectOptions opts = MQTTAsync_disconnectOptions_initializer;
    opts.timeout = DISCONNECT_TIMEOUT_MS;
    opts.context = context;
    opts.onSuccess = &OnActionSuccess;
    opts.onFailure = &OnActionFailure;

    const int rc = MQTTAsync_disconnect(client_.Get(), &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        DeleteCompletionContext(context);
        UABRIDGE_LOG_WARN("MQTT disconnect failed", {StringField("error", DescribeCode(rc))});
        return;
    }
    if (done.wait_for(std::chrono::milliseconds(DISCONNECT_TIMEOUT_MS) + CALLBACK_GRACE) ==
        std::future_status::timeout) {
        UABRIDGE_LOG_WARN("MQTT disconnect timed out", {StringField("uri", ServerUri())});
    }
}

void PahoMqttTransport::OnConnectionLost(void* context, char* cause) {
    auto* transport = static_cast<PahoMqttTransport*>(context);
    if (transport == nullptr) {
        return;
    }
    transport->connected_.store(false);
    UABRIDGE_LOG_WARN("MQTT connection lost", {
        StringField("uri", transport->ServerUri()),
        StringField("cause", cause != nullptr ? cause : "unknown")
    });
}

int PahoMqttTransport::OnMessageArrived(void*, char* topic, int, MQTTAsync_message* message) {
    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topic);
    return 1;
}

}
