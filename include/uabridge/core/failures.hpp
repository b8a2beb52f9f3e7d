#pragma once
#include <string>
#include <string_view>
namespace uabridge {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    InvalidOperation
};
enum class BridgeFailureType {
    Generic,
    Connection,
    Config,
    Decoding,
    Crypto,
    Persistence,
    InvalidState
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
/**
 * @brief Failure taxonomy shared by every bridge component
 *
 * Connection and Decoding failures are recovered next to where they happen.
 * Crypto and Persistence failures travel up to the channel that owns the
 * device so it can decide between dropping one sample and refusing to publish.
 */
class BridgeFailure {
public:
    BridgeFailureType type;
    std::string message;
    BridgeFailure(const BridgeFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static BridgeFailure Generic(std::string msg) {
        return {BridgeFailureType::Generic, std::move(msg)};
    }
    static BridgeFailure Connection(std::string msg) {
        return {BridgeFailureType::Connection, std::move(msg)};
    }
    static BridgeFailure Config(std::string msg) {
        return {BridgeFailureType::Config, std::move(msg)};
    }
    static BridgeFailure Decoding(std::string msg) {
        return {BridgeFailureType::Decoding, std::move(msg)};
    }
    static BridgeFailure Crypto(std::string msg) {
        return {BridgeFailureType::Crypto, std::move(msg)};
    }
    static BridgeFailure Persistence(std::string msg) {
        return {BridgeFailureType::Persistence, std::move(msg)};
    }
    static BridgeFailure InvalidState(std::string msg) {
        return {BridgeFailureType::InvalidState, std::move(msg)};
    }
    static BridgeFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Crypto(sf.message);
    }
    [[nodiscard]] bool Is(const BridgeFailureType t) const noexcept {
        return type == t;
    }
};
constexpr std::string_view ToString(const BridgeFailureType type) noexcept {
    switch (type) {
        case BridgeFailureType::Generic: return "generic";
        case BridgeFailureType::Connection: return "connection";
        case BridgeFailureType::Config: return "config";
        case BridgeFailureType::Decoding: return "decoding";
        case BridgeFailureType::Crypto: return "crypto";
        case BridgeFailureType::Persistence: return "persistence";
        case BridgeFailureType::InvalidState: return "invalid_state";
    }
    return "unknown";
}
}
