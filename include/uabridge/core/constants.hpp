#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace uabridge {
struct Constants {
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t ED_25519_SECRET_KEY_SIZE = 64;
    static constexpr size_t ED_25519_SIGNATURE_SIZE = 64;
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_BLOCK_SIZE = 16;
    static constexpr size_t HMAC_SHA256_KEY_SIZE = 32;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr size_t PICKLE_KEY_SIZE = 32;
};
struct MegolmConstants {
    static constexpr size_t RATCHET_PARTS = 4;
    static constexpr size_t RATCHET_PART_LENGTH = 32;
    static constexpr size_t RATCHET_LENGTH = RATCHET_PARTS * RATCHET_PART_LENGTH;
    static constexpr size_t MAC_LENGTH = 8;
    static constexpr uint32_t MESSAGE_VERSION = 3;
    static constexpr uint32_t LAST_MESSAGE_INDEX = 0xFFFFFFFF;
    static constexpr uint8_t SESSION_KEY_VERSION = 0x02;
    static constexpr size_t SESSION_KEY_LENGTH =
        1 + 4 + RATCHET_LENGTH + Constants::ED_25519_PUBLIC_KEY_SIZE + Constants::ED_25519_SIGNATURE_SIZE;
    static constexpr uint32_t STATE_VERSION = 1;
    static constexpr uint32_t PICKLE_VERSION = 1;
    static constexpr std::string_view MESSAGE_KEYS_INFO = "MEGOLM_KEYS";
    static constexpr std::string_view PICKLE_INFO = "Pickle";
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_HKDF = "HKDF";
    static constexpr std::string_view ALGORITHM_HMAC = "HMAC";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct BridgeDefaults {
    static constexpr std::string_view CONFIG_FILE_ENV = "CONFIG_FILE";
    static constexpr std::string_view CONFIG_FILE_PATH = "/etc/opcua-agent/config.yaml";
    static constexpr std::string_view DEFAULT_SUBSCRIPTION = "default";
    static constexpr std::chrono::milliseconds PUBLISH_INTERVAL{1000};
    static constexpr std::chrono::milliseconds SESSION_TIMEOUT{60000};
    static constexpr uint32_t SESSION_RETRY_LIMIT = 10;
    static constexpr uint32_t NODE_FAILURE_LIMIT = 3;
    static constexpr uint32_t SUBSCRIPTION_LIFETIME_COUNT = 30;
    static constexpr uint32_t SUBSCRIPTION_KEEPALIVE_COUNT = 10;
    static constexpr uint32_t MONITORED_ITEM_QUEUE_SIZE = 10;
    static constexpr uint16_t MQTT_TLS_PORT = 8883;
    static constexpr uint16_t MQTT_PLAIN_PORT = 1883;
    static constexpr std::chrono::seconds MQTT_KEEP_ALIVE{30};
    static constexpr uint32_t MQTT_MAX_CONNECT_ATTEMPTS = 10;
    static constexpr size_t CLIENT_ID_LENGTH = 20;
    static constexpr size_t PUBLISH_QUEUE_CAPACITY = 1024;
    static constexpr std::chrono::milliseconds DELIVERY_TIMEOUT{10000};
    static constexpr std::chrono::milliseconds BACKOFF_INITIAL{500};
    static constexpr std::chrono::milliseconds BACKOFF_MAX{30000};
    static constexpr double BACKOFF_MULTIPLIER = 2.0;
    static constexpr double BACKOFF_JITTER = 0.2;
    static constexpr uint32_t WORKER_THREADS = 4;
    static constexpr size_t STRAND_BATCH_SIZE = 32;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Secure memory handle has been disposed";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data exceeds secure buffer size";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view UNKNOWN_SESSION = "Unknown Megolm session";
    static constexpr std::string_view MAC_MISMATCH = "Message authentication failed";
    static constexpr std::string_view BAD_SIGNATURE = "Message signature verification failed";
    static constexpr std::string_view DEVICE_POISONED = "Device ratchet state is unusable after a persistence failure";
};
}
