#pragma once

#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"
#include "uabridge/interfaces/i_state_store.hpp"
#include "uabridge/megolm/inbound_group_session.hpp"
#include "uabridge/megolm/message_keys.hpp"
#include "uabridge/megolm/outbound_group_session.hpp"
#include "uabridge/session/pickle_codec.hpp"

#include <chrono>
#include <filesystem>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace uabridge::session {

struct InboundChainInfo {
    std::string session_id;
    uint32_t first_known_index = 0;
    std::optional<uint32_t> highest_accepted_index;
};

struct SessionInfo {
    std::string device_id;
    bool has_outbound = false;
    std::string outbound_session_id;
    uint32_t next_message_index = 0;
    std::chrono::system_clock::time_point created_at{};
    uint64_t generation = 0;
    std::vector<InboundChainInfo> inbound;
};

/**
 * @brief Owner of every device's Megolm state
 *
 * All operations on one device are serialized by a per-device mutex; devices
 * never wait for each other except for the short map lookup. Every change is
 * written through the IStateStore before the operation returns, and the
 * written state is always the state after the change. A key handed out by
 * AdvanceOutbound() is therefore already behind the persisted ratchet.
 *
 * If a write fails after the in-memory ratchet moved, the device is poisoned:
 * the ratchet is never rolled back, and every later call for that device
 * returns the original Persistence failure until the process restarts and
 * reloads whatever reached the disk.
 */
class RatchetSessionStore {
public:
    using KeyUse = std::function<Result<Unit, BridgeFailure>(const megolm::InboundMessageKey&)>;

    RatchetSessionStore(std::shared_ptr<interfaces::IStateStore> store, PickleCodec codec);

    /**
     * @brief Store over a FileStateStore in `state_dir`
     *
     * Pickles are encrypted with the key in `pickle_key_file` when one is given.
     */
    [[nodiscard]] static Result<std::shared_ptr<RatchetSessionStore>, BridgeFailure> Open(
        const std::filesystem::path& state_dir,
        const std::filesystem::path& pickle_key_file);

    RatchetSessionStore(const RatchetSessionStore&) = delete;
    RatchetSessionStore& operator=(const RatchetSessionStore&) = delete;

    /**
     * @brief Hand out the next outbound message key for `device_id`
     *
     * Loads persisted state or creates a new outbound session on first use.
     * The returned key's index is strictly greater than any index handed out
     * before for the same session, in this process or an earlier one.
     */
    [[nodiscard]] Result<megolm::OutboundMessageKey, BridgeFailure> AdvanceOutbound(const std::string& device_id);

    /**
     * @brief Derive the inbound key for (session_id, index) and run `use` on it
     *
     * The chain advances, and the advance is persisted, only when `use`
     * returns Ok. Indices at or below the highest accepted one are rejected
     * with a Crypto failure before `use` is invoked.
     */
    [[nodiscard]] Result<Unit, BridgeFailure> AcceptInbound(
        const std::string& device_id,
        std::span<const uint8_t> session_id,
        uint32_t index,
        const KeyUse& use);

    /**
     * @brief Create the outbound session if the device has none
     */
    [[nodiscard]] Result<SessionInfo, BridgeFailure> EnsureOutbound(const std::string& device_id);

    /**
     * @brief Replace the outbound session; existing inbound chains stay usable
     *
     * @return Id of the new session
     */
    [[nodiscard]] Result<std::vector<uint8_t>, BridgeFailure> RotateOutbound(const std::string& device_id);

    [[nodiscard]] Result<std::string, BridgeFailure> ExportSessionKey(const std::string& device_id);

    /**
     * @brief Add an inbound chain from an exported session key
     *
     * Importing a key for a session the device already knows keeps the chain
     * with the earlier first index.
     */
    [[nodiscard]] Result<std::vector<uint8_t>, BridgeFailure> ImportSessionKey(
        const std::string& device_id,
        std::string_view session_key);

    [[nodiscard]] Result<SessionInfo, BridgeFailure> Describe(const std::string& device_id);

    [[nodiscard]] Result<std::vector<std::string>, BridgeFailure> ListDevices();

private:
    struct DeviceEntry {
        std::mutex lock;
        bool loaded = false;
        std::optional<megolm::OutboundGroupSession> outbound;
        std::map<std::string, megolm::InboundGroupSession> inbound;
        uint64_t generation = 0;
        std::optional<BridgeFailure> poisoned;
    };

    std::shared_ptr<DeviceEntry> EntryFor(const std::string& device_id);

    Result<Unit, BridgeFailure> EnsureLoaded(const std::string& device_id, DeviceEntry& entry);

    Result<Unit, BridgeFailure> CreateOutbound(DeviceEntry& entry);

    Result<Unit, BridgeFailure> Persist(const std::string& device_id, DeviceEntry& entry);

    static SessionInfo Summarize(const std::string& device_id, const DeviceEntry& entry);

    std::shared_ptr<interfaces::IStateStore> store_;
    PickleCodec codec_;
    std::shared_mutex entries_lock_;
    std::unordered_map<std::string, std::shared_ptr<DeviceEntry>> entries_;
};

}
