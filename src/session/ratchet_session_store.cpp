#include "uabridge/session/ratchet_session_store.hpp"
#include "uabridge/session/file_state_key_provider.hpp"
#include "uabridge/session/file_state_store.hpp"
#include "uabridge/crypto/sodium_interop.hpp"
#include "uabridge/core/constants.hpp"
#include "uabridge/observability/logging.hpp"

#include "megolm/session_state.pb.h"

#include <format>

namespace uabridge::session {

using crypto::SodiumInterop;
using megolm::InboundGroupSession;
using megolm::InboundMessageKey;
using megolm::OutboundGroupSession;
using megolm::OutboundMessageKey;
using observability::FailureField;
using observability::IntField;
using observability::StringField;

namespace {

    Result<Unit, BridgeFailure> ValidateDeviceId(const std::string& device_id) {
        if (device_id.empty()) {
            return Result<Unit, BridgeFailure>::Err(
                BridgeFailure::InvalidState("Device id must not be empty"));
        }
        return Result<Unit, BridgeFailure>::Ok(unit);
    }

}

RatchetSessionStore::RatchetSessionStore(
    std::shared_ptr<interfaces::IStateStore> store,
    PickleCodec codec)
    : store_(std::move(store))
    , codec_(std::move(codec)) {}

Result<std::shared_ptr<RatchetSessionStore>, BridgeFailure> RatchetSessionStore::Open(
    const std::filesystem::path& state_dir,
    const std::filesystem::path& pickle_key_file) {
    auto store = FileStateStore::Open(state_dir);
    if (store.IsErr()) {
        return Result<std::shared_ptr<RatchetSessionStore>, BridgeFailure>::Err(std::move(store).UnwrapErr());
    }
    std::shared_ptr<interfaces::IStateKeyProvider> keys;
    if (!pickle_key_file.empty()) {
        keys = std::make_shared<FileStateKeyProvider>(pickle_key_file);
    }
    return Result<std::shared_ptr<RatchetSessionStore>, BridgeFailure>::Ok(
        std::make_shared<RatchetSessionStore>(std::move(store).Unwrap(), PickleCodec(std::move(keys))));
}

std::shared_ptr<RatchetSessionStore::DeviceEntry> RatchetSessionStore::EntryFor(const std::string& device_id) {
    {
        std::shared_lock read_lock(entries_lock_);
        if (const auto it = entries_.find(device_id); it != entries_.end()) {
            return it->second;
        }
    }
    std::unique_lock write_lock(entries_lock_);
    auto& entry = entries_[device_id];
    if (!entry) {
        entry = std::make_shared<DeviceEntry>();
    }
    return entry;
}

Result<Unit, BridgeFailure> RatchetSessionStore::EnsureLoaded(const std::string& device_id, DeviceEntry& entry) {
    if (entry.poisoned.has_value()) {
        return Result<Unit, BridgeFailure>::Err(*entry.poisoned);
    }
    if (entry.loaded) {
        return Result<Unit, BridgeFailure>::Ok(unit);
    }

    auto blob = store_->Load(device_id);
    if (blob.IsErr()) {
        return Result<Unit, BridgeFailure>::Err(std::move(blob).UnwrapErr());
    }
    if (!blob.Unwrap().has_value()) {
        entry.loaded = true;
        return Result<Unit, BridgeFailure>::Ok(unit);
    }

    auto decoded = codec_.Decode(*blob.Unwrap());
    if (decoded.IsErr()) {
        return Result<Unit, BridgeFailure>::Err(std::move(decoded).UnwrapErr());
    }
    const auto& state = decoded.Unwrap();
    if (state.version() != MegolmConstants::STATE_VERSION) {
        return Result<Unit, BridgeFailure>::Err(BridgeFailure::Persistence(
            std::format("Unsupported session state version {} for device {}", state.version(), device_id)));
    }
    if (state.device_id() != device_id) {
        return Result<Unit, BridgeFailure>::Err(BridgeFailure::Persistence(
            std::format("Session state for device {} is stored under {}", state.device_id(), device_id)));
    }

    std::optional<OutboundGroupSession> outbound;
    if (state.has_outbound()) {
        auto restored = OutboundGroupSession::FromProtoState(state.outbound());
        if (restored.IsErr()) {
            return Result<Unit, BridgeFailure>::Err(std::move(restored).UnwrapErr());
        }
        outbound.emplace(std::move(restored).Unwrap());
    }
    std::map<std::string, InboundGroupSession> inbound;
    for (const auto& chain_state : state.inbound()) {
        auto chain = InboundGroupSession::FromProtoState(chain_state);
        if (chain.IsErr()) {
            return Result<Unit, BridgeFailure>::Err(std::move(chain).UnwrapErr());
        }
        auto key = SodiumInterop::ToHex(chain.Unwrap().SessionId());
        inbound.emplace(std::move(key), std::move(chain).Unwrap());
    }

    entry.outbound = std::move(outbound);
    entry.inbound = std::move(inbound);
    entry.generation = state.generation();
    entry.loaded = true;
    UABRIDGE_LOG_DEBUG("Loaded ratchet state", {
        StringField("device", device_id),
        IntField("generation", static_cast<int64_t>(entry.generation)),
        IntField("inbound_chains", static_cast<int64_t>(entry.inbound.size()))
    });
    return Result<Unit, BridgeFailure>::Ok(unit);
}

Result<Unit, BridgeFailure> RatchetSessionStore::CreateOutbound(DeviceEntry& entry) {
    auto session = OutboundGroupSession::Create();
    if (session.IsErr()) {
        return Result<Unit, BridgeFailure>::Err(std::move(session).UnwrapErr());
    }
    auto chain = InboundGroupSession::FromOutbound(session.Unwrap());
    if (chain.IsErr()) {
        return Result<Unit, BridgeFailure>::Err(std::move(chain).UnwrapErr());
    }
    auto key = SodiumInterop::ToHex(session.Unwrap().SessionId());
    entry.inbound.insert_or_assign(std::move(key), std::move(chain).Unwrap());
    entry.outbound.emplace(std::move(session).Unwrap());
    return Result<Unit, BridgeFailure>::Ok(unit);
}

Result<Unit, BridgeFailure> RatchetSessionStore::Persist(const std::string& device_id, DeviceEntry& entry) {
    proto::megolm::DeviceSessionState state;
    state.set_version(MegolmConstants::STATE_VERSION);
    state.set_device_id(device_id);
    state.set_generation(entry.generation + 1);
    if (entry.outbound.has_value()) {
        auto outbound = entry.outbound->ToProtoState();
        if (outbound.IsErr()) {
            return Result<Unit, BridgeFailure>::Err(std::move(outbound).UnwrapErr());
        }
        *state.mutable_outbound() = std::move(outbound).Unwrap();
    }
    for (const auto& [_, chain] : entry.inbound) {
        auto chain_state = chain.ToProtoState();
        if (chain_state.IsErr()) {
            return Result<Unit, BridgeFailure>::Err(std::move(chain_state).UnwrapErr());
        }
        *state.add_inbound() = std::move(chain_state).Unwrap();
    }

    auto encoded = codec_.Encode(state);
    state.Clear();
    if (encoded.IsErr()) {
        return Result<Unit, BridgeFailure>::Err(std::move(encoded).UnwrapErr());
    }
    auto stored = store_->Store(device_id, encoded.Unwrap());
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(encoded.Unwrap()));
    if (stored.IsErr()) {
        auto failure = std::move(stored).UnwrapErr();
        if (!failure.Is(BridgeFailureType::Persistence)) {
            failure = BridgeFailure::Persistence(failure.message);
        }
        return Result<Unit, BridgeFailure>::Err(std::move(failure));
    }
    ++entry.generation;
    return Result<Unit, BridgeFailure>::Ok(unit);
}

Result<OutboundMessageKey, BridgeFailure> RatchetSessionStore::AdvanceOutbound(const std::string& device_id) {
    UABRIDGE_TRY(ValidateDeviceId(device_id));
    const auto entry = EntryFor(device_id);
    std::lock_guard lock(entry->lock);
    UABRIDGE_TRY(EnsureLoaded(device_id, *entry));

    if (!entry->outbound.has_value()) {
        UABRIDGE_TRY(CreateOutbound(*entry));
        UABRIDGE_LOG_INFO("Created outbound Megolm session", {
            StringField("device", device_id),
            StringField("session", SodiumInterop::ToHex(entry->outbound->SessionId()))
        });
    } else if (entry->outbound->IsExhausted()) {
        const auto previous = SodiumInterop::ToHex(entry->outbound->SessionId());
        UABRIDGE_TRY(CreateOutbound(*entry));
        UABRIDGE_LOG_WARN("Outbound Megolm session exhausted its indices, rotated", {
            StringField("device", device_id),
            StringField("previous", previous),
            StringField("session", SodiumInterop::ToHex(entry->outbound->SessionId()))
        });
    }

    auto key = entry->outbound->NextMessageKey();
    if (key.IsErr()) {
        return key;
    }

    auto persisted = Persist(device_id, *entry);
    if (persisted.IsErr()) {
        auto failure = std::move(persisted).UnwrapErr();
        entry->poisoned = BridgeFailure::Persistence(
            std::format("{}: {}", ErrorMessages::DEVICE_POISONED, failure.message));
        UABRIDGE_LOG_ERROR("Failed to persist outbound ratchet advance", {
            StringField("device", device_id),
            FailureField(failure),
            IntField("index", key.Unwrap().Index()),
            StringField("error", failure.message)
        });
        return Result<OutboundMessageKey, BridgeFailure>::Err(std::move(failure));
    }
    return key;
}

Result<Unit, BridgeFailure> RatchetSessionStore::AcceptInbound(
    const std::string& device_id,
    std::span<const uint8_t> session_id,
    const uint32_t index,
    const KeyUse& use) {
    UABRIDGE_TRY(ValidateDeviceId(device_id));
    const auto entry = EntryFor(device_id);
    std::lock_guard lock(entry->lock);
    UABRIDGE_TRY(EnsureLoaded(device_id, *entry));

    const auto chain_it = entry->inbound.find(SodiumInterop::ToHex(session_id));
    if (chain_it == entry->inbound.end()) {
        return Result<Unit, BridgeFailure>::Err(BridgeFailure::Crypto(
            std::format("{} for device {}", ErrorMessages::UNKNOWN_SESSION, device_id)));
    }

    auto key = chain_it->second.DeriveMessageKey(index);
    if (key.IsErr()) {
        return Result<Unit, BridgeFailure>::Err(std::move(key).UnwrapErr());
    }
    UABRIDGE_TRY(use(key.Unwrap()));
    UABRIDGE_TRY(chain_it->second.Commit(key.Unwrap()));

    auto persisted = Persist(device_id, *entry);
    if (persisted.IsErr()) {
        auto failure = std::move(persisted).UnwrapErr();
        entry->poisoned = BridgeFailure::Persistence(
            std::format("{}: {}", ErrorMessages::DEVICE_POISONED, failure.message));
        UABRIDGE_LOG_ERROR("Failed to persist inbound ratchet advance", {
            StringField("device", device_id),
            FailureField(failure),
            IntField("index", index),
            StringField("error", failure.message)
        });
        return Result<Unit, BridgeFailure>::Err(std::move(failure));
    }
    return Result<Unit, BridgeFailure>::Ok(unit);
}

Result<SessionInfo, BridgeFailure> RatchetSessionStore::EnsureOutbound(const std::string& device_id) {
    UABRIDGE_TRY(ValidateDeviceId(device_id));
    const auto entry = EntryFor(device_id);
    std::lock_guard lock(entry->lock);
    UABRIDGE_TRY(EnsureLoaded(device_id, *entry));

    if (!entry->outbound.has_value()) {
        UABRIDGE_TRY(CreateOutbound(*entry));
        auto persisted = Persist(device_id, *entry);
        if (persisted.IsErr()) {
            entry->poisoned = persisted.UnwrapErr();
            return Result<SessionInfo, BridgeFailure>::Err(std::move(persisted).UnwrapErr());
        }
    }
    return Result<SessionInfo, BridgeFailure>::Ok(Summarize(device_id, *entry));
}

Result<std::vector<uint8_t>, BridgeFailure> RatchetSessionStore::RotateOutbound(const std::string& device_id) {
    UABRIDGE_TRY(ValidateDeviceId(device_id));
    const auto entry = EntryFor(device_id);
    std::lock_guard lock(entry->lock);
    UABRIDGE_TRY(EnsureLoaded(device_id, *entry));

    std::optional<std::string> previous;
    if (entry->outbound.has_value()) {
        previous = SodiumInterop::ToHex(entry->outbound->SessionId());
    }
    UABRIDGE_TRY(CreateOutbound(*entry));
    auto persisted = Persist(device_id, *entry);
    if (persisted.IsErr()) {
        entry->poisoned = persisted.UnwrapErr();
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(std::move(persisted).UnwrapErr());
    }
    UABRIDGE_LOG_INFO("Rotated outbound Megolm session", {
        StringField("device", device_id),
        StringField("previous", previous.value_or("none")),
        StringField("session", SodiumInterop::ToHex(entry->outbound->SessionId()))
    });
    return Result<std::vector<uint8_t>, BridgeFailure>::Ok(entry->outbound->SessionId());
}

Result<std::string, BridgeFailure> RatchetSessionStore::ExportSessionKey(const std::string& device_id) {
    UABRIDGE_TRY(ValidateDeviceId(device_id));
    const auto entry = EntryFor(device_id);
    std::lock_guard lock(entry->lock);
    UABRIDGE_TRY(EnsureLoaded(device_id, *entry));

    if (!entry->outbound.has_value()) {
        return Result<std::string, BridgeFailure>::Err(BridgeFailure::InvalidState(
            std::format("Device {} has no outbound session", device_id)));
    }
    return entry->outbound->ExportSessionKey();
}

Result<std::vector<uint8_t>, BridgeFailure> RatchetSessionStore::ImportSessionKey(
    const std::string& device_id,
    std::string_view session_key) {
    UABRIDGE_TRY(ValidateDeviceId(device_id));
    auto chain = InboundGroupSession::FromSessionKey(session_key);
    if (chain.IsErr()) {
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(std::move(chain).UnwrapErr());
    }

    const auto entry = EntryFor(device_id);
    std::lock_guard lock(entry->lock);
    UABRIDGE_TRY(EnsureLoaded(device_id, *entry));

    auto session_id = chain.Unwrap().SessionId();
    auto key = SodiumInterop::ToHex(session_id);
    if (const auto existing = entry->inbound.find(key);
        existing != entry->inbound.end() &&
        existing->second.FirstKnownIndex() <= chain.Unwrap().FirstKnownIndex()) {
        UABRIDGE_LOG_INFO("Session key already known at an earlier index", {
            StringField("device", device_id),
            StringField("session", key),
            IntField("known_index", existing->second.FirstKnownIndex())
        });
        return Result<std::vector<uint8_t>, BridgeFailure>::Ok(std::move(session_id));
    }
    if (const auto existing = entry->inbound.find(key); existing != entry->inbound.end()) {
        UABRIDGE_TRY(existing->second.ExtendBackTo(std::move(chain).Unwrap()));
    } else {
        entry->inbound.emplace(key, std::move(chain).Unwrap());
    }

    auto persisted = Persist(device_id, *entry);
    if (persisted.IsErr()) {
        entry->poisoned = persisted.UnwrapErr();
        return Result<std::vector<uint8_t>, BridgeFailure>::Err(std::move(persisted).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, BridgeFailure>::Ok(std::move(session_id));
}

Result<SessionInfo, BridgeFailure> RatchetSessionStore::Describe(const std::string& device_id) {
    UABRIDGE_TRY(ValidateDeviceId(device_id));
    const auto entry = EntryFor(device_id);
    std::lock_guard lock(entry->lock);
    UABRIDGE_TRY(EnsureLoaded(device_id, *entry));
    return Result<SessionInfo, BridgeFailure>::Ok(Summarize(device_id, *entry));
}

Result<std::vector<std::string>, BridgeFailure> RatchetSessionStore::ListDevices() {
    return store_->ListDevices();
}

SessionInfo RatchetSessionStore::Summarize(const std::string& device_id, const DeviceEntry& entry) {
    SessionInfo info;
    info.device_id = device_id;
    info.generation = entry.generation;
    if (entry.outbound.has_value()) {
        info.has_outbound = true;
        info.outbound_session_id = SodiumInterop::ToHex(entry.outbound->SessionId());
        info.next_message_index = entry.outbound->MessageIndex();
        info.created_at = entry.outbound->CreatedAt();
    }
    for (const auto& [session_id, chain] : entry.inbound) {
        info.inbound.push_back(InboundChainInfo{
            session_id, chain.FirstKnownIndex(), chain.HighestAcceptedIndex()});
    }
    return info;
}

}
