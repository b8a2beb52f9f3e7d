#pragma once

#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"

#include "megolm/message.pb.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace uabridge::megolm {

using proto::megolm::CiphertextMessage;

/**
 * @brief Bytes covered by the message MAC
 *
 * version (1 byte) || session id (32 bytes) || message index (4 bytes, big
 * endian) || ciphertext
 */
std::vector<uint8_t> BuildAuthenticatedHeader(
    uint32_t version,
    std::span<const uint8_t> session_id,
    uint32_t message_index,
    std::span<const uint8_t> ciphertext);

std::vector<uint8_t> BuildAuthenticatedHeader(const CiphertextMessage& message);

/**
 * @brief Bytes covered by the Ed25519 signature: header || MAC
 */
std::vector<uint8_t> BuildSignedContent(const CiphertextMessage& message);

Result<std::vector<uint8_t>, BridgeFailure> SerializeMessage(const CiphertextMessage& message);

/**
 * @brief Parse and structurally validate a wire message
 *
 * Rejects unknown versions and wrong field sizes with a Crypto failure. Does
 * not authenticate anything.
 */
Result<CiphertextMessage, BridgeFailure> ParseMessage(std::span<const uint8_t> bytes);

Result<std::string, BridgeFailure> EncodeMessageBase64(const CiphertextMessage& message);

Result<CiphertextMessage, BridgeFailure> DecodeMessageBase64(std::string_view encoded);

inline std::span<const uint8_t> AsBytes(const std::string& s) noexcept {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

} // namespace uabridge::megolm
