#include "uabridge/megolm/group_message.hpp"
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/core/constants.hpp"

#include <format>

namespace uabridge::megolm {

using crypto::SodiumInterop;

std::vector<uint8_t> BuildAuthenticatedHeader(
    const uint32_t version,
    std::span<const uint8_t> session_id,
    const uint32_t message_index,
    std::span<const uint8_t> ciphertext) {
    std::vector<uint8_t> header;
    header.reserve(1 + session_id.size() + 4 + ciphertext.size());
    header.push_back(static_cast<uint8_t>(version));
    header.insert(header.end(), session_id.begin(), session_id.end());
    header.push_back(static_cast<uint8_t>(message_index >> 24));
    header.push_back(static_cast<uint8_t>(message_index >> 16));
    header.push_back(static_cast<uint8_t>(message_index >> 8));
    header.push_back(static_cast<uint8_t>(message_index));
    header.insert(header.end(), ciphertext.begin(), ciphertext.end());
    return header;
}

std::vector<uint8_t> BuildAuthenticatedHeader(const CiphertextMessage& message) {
    return BuildAuthenticatedHeader(
        message.version(),
        AsBytes(message.session_id()),
        message.message_index(),
        AsBytes(message.ciphertext()));
}

std::vector<uint8_t> BuildSignedContent(const CiphertextMessage& message) {
    auto content = BuildAuthenticatedHeader(message);
    const auto mac = AsBytes(message.mac());
    content.insert(content.end(), mac.begin(), mac.end());
    return content;
}

Result<std::vector<uint8_t>, BridgeFailure> SerializeMessage(const CiphertextMessage& message) {
    std::vector<uint8_t> bytes(message.ByteSizeLong());
    if (!message.SerializeToArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(
            BridgeFailure::Crypto("Failed to serialize Megolm message"));
    }
    return Result<std::vector<uint8_t>, BridgeFailure>::Ok(std::move(bytes));
}

Result<CiphertextMessage, BridgeFailure> ParseMessage(std::span<const uint8_t> bytes) {
    CiphertextMessage message;
    if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<CiphertextMessage, BridgeFailure>::Err(
            BridgeFailure::Crypto("Malformed Megolm message"));
    }
    if (message.version() != MegolmConstants::MESSAGE_VERSION) {
        return Result<CiphertextMessage, BridgeFailure>::Err(
            BridgeFailure::Crypto(std::format(
                "Unsupported Megolm message version {}", message.version())));
    }
    if (message.session_id().size() != Constants::ED_25519_PUBLIC_KEY_SIZE ||
        message.mac().size() != MegolmConstants::MAC_LENGTH ||
        message.signature().size() != Constants::ED_25519_SIGNATURE_SIZE ||
        message.ciphertext().empty()) {
        return Result<CiphertextMessage, BridgeFailure>::Err(
            BridgeFailure::Crypto("Megolm message has invalid field sizes"));
    }
    return Result<CiphertextMessage, BridgeFailure>::Ok(std::move(message));
}

Result<std::string, BridgeFailure> EncodeMessageBase64(const CiphertextMessage& message) {
    auto bytes = SerializeMessage(message);
    if (bytes.IsErr()) {
        return Result<std::string, BridgeFailure>::Err(std::move(bytes).UnwrapErr());
    }
    return Result<std::string, BridgeFailure>::Ok(SodiumInterop::ToBase64(bytes.Unwrap()));
}

Result<CiphertextMessage, BridgeFailure> DecodeMessageBase64(std::string_view encoded) {
    auto bytes = SodiumInterop::FromBase64(encoded);
    if (bytes.IsErr()) {
        return Result<CiphertextMessage, BridgeFailure>::Err(
            BridgeFailure::Crypto(std::move(bytes).UnwrapErr().message));
    }
    return ParseMessage(bytes.Unwrap());
}

} // namespace uabridge::megolm
