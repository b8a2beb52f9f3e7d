#include "uabridge/megolm/megolm_ratchet.hpp"
#include "uabridge/crypto/hmac_sha256.hpp"
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/core/constants.hpp"

#include "megolm/session_state.pb.h"

#include <format>

#include <array>

namespace uabridge::megolm {

using crypto::HmacSha256;
using crypto::SodiumInterop;

namespace {
    constexpr std::array<std::array<uint8_t, 1>, MegolmConstants::RATCHET_PARTS> HASH_KEY_SEEDS = {{
        {0x00}, {0x01}, {0x02}, {0x03}
    }};
}

Result<MegolmRatchet, BridgeFailure> MegolmRatchet::CreateRandom() {
    auto random = SodiumInterop::GetRandomBytes(MegolmConstants::RATCHET_LENGTH);
    auto result = FromParts(random, 0);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(random));
    return result;
}

Result<MegolmRatchet, BridgeFailure> MegolmRatchet::FromParts(
    std::span<const uint8_t> data,
    const uint32_t counter) {
    if (data.size() != MegolmConstants::RATCHET_LENGTH) {
        return Result<MegolmRatchet, BridgeFailure>::Err(
            BridgeFailure::Crypto(std::format(
                "Megolm ratchet must be {} bytes, got {}",
                MegolmConstants::RATCHET_LENGTH, data.size())));
    }
    auto handle = SecureMemoryHandle::FromBytes(data);
    if (handle.IsErr()) {
        return Result<MegolmRatchet, BridgeFailure>::Err(
            BridgeFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    return Result<MegolmRatchet, BridgeFailure>::Ok(
        MegolmRatchet(std::move(handle).Unwrap(), counter));
}

Result<MegolmRatchet, BridgeFailure> MegolmRatchet::FromProtoState(
    const proto::megolm::RatchetState& state) {
    const auto& data = state.data();
    return FromParts(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()), data.size()),
        state.counter());
}

Result<proto::megolm::RatchetState, BridgeFailure> MegolmRatchet::ToProtoState() const {
    auto bytes = data_.ReadBytes(MegolmConstants::RATCHET_LENGTH);
    if (bytes.IsErr()) {
        return Result<proto::megolm::RatchetState, BridgeFailure>::Err(
            BridgeFailure::FromSodiumFailure(bytes.UnwrapErr()));
    }
    auto& raw = bytes.Unwrap();
    proto::megolm::RatchetState state;
    state.set_data(raw.data(), raw.size());
    state.set_counter(counter_);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(raw));
    return Result<proto::megolm::RatchetState, BridgeFailure>::Ok(std::move(state));
}

Result<Unit, BridgeFailure> MegolmRatchet::RehashPart(const size_t from_part, const size_t to_part) {
    constexpr size_t part_len = MegolmConstants::RATCHET_PART_LENGTH;
    auto result = data_.WithWriteAccess([&](std::span<uint8_t> parts) {
        return HmacSha256::Compute(
            parts.subspan(from_part * part_len, part_len),
            HASH_KEY_SEEDS[to_part],
            parts.subspan(to_part * part_len, part_len));
    });
    if (result.IsErr()) {
        return Result<Unit, BridgeFailure>::Err(BridgeFailure::FromSodiumFailure(result.UnwrapErr()));
    }
    return std::move(result).Unwrap();
}

Result<Unit, BridgeFailure> MegolmRatchet::Advance() {
    if (counter_ == MegolmConstants::LAST_MESSAGE_INDEX) {
        return Result<Unit, BridgeFailure>::Err(BridgeFailure::InvalidState(
            "Megolm ratchet is exhausted, the session must be rotated"));
    }
    uint32_t mask = 0x00FFFFFF;
    size_t h = 0;

    counter_++;

    while (h < MegolmConstants::RATCHET_PARTS) {
        if (!(counter_ & mask)) {
            break;
        }
        h++;
        mask >>= 8;
    }

    for (size_t i = MegolmConstants::RATCHET_PARTS; i-- > h;) {
        UABRIDGE_TRY(RehashPart(h, i));
    }
    return Result<Unit, BridgeFailure>::Ok(unit);
}

Result<Unit, BridgeFailure> MegolmRatchet::AdvanceTo(const uint32_t target) {
    if (target < counter_) {
        return Result<Unit, BridgeFailure>::Err(BridgeFailure::InvalidState(std::format(
            "Megolm ratchet cannot move back from {} to {}", counter_, target)));
    }
    for (size_t j = 0; j < MegolmConstants::RATCHET_PARTS; j++) {
        const auto shift = static_cast<unsigned>((MegolmConstants::RATCHET_PARTS - j - 1) * 8);
        const uint32_t mask = ~uint32_t{0} << shift;

        // Lower parts may be ahead after a higher part was carried.
        unsigned int steps = ((target >> shift) - (counter_ >> shift)) & 0xff;
        if (steps == 0) {
            continue;
        }

        while (steps > 1) {
            UABRIDGE_TRY(RehashPart(j, j));
            steps--;
        }

        for (size_t k = MegolmConstants::RATCHET_PARTS; k-- > j;) {
            UABRIDGE_TRY(RehashPart(j, k));
        }
        counter_ = target & mask;
    }
    return Result<Unit, BridgeFailure>::Ok(unit);
}

Result<MegolmRatchet, BridgeFailure> MegolmRatchet::Clone() const {
    auto handle = data_.Clone();
    if (handle.IsErr()) {
        return Result<MegolmRatchet, BridgeFailure>::Err(
            BridgeFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    return Result<MegolmRatchet, BridgeFailure>::Ok(
        MegolmRatchet(std::move(handle).Unwrap(), counter_));
}

} // namespace uabridge::megolm
