#pragma once
#include "uabridge/interfaces/i_state_store.hpp"

#include <atomic>
#include <map>
#include <mutex>

namespace uabridge::test_helpers {

/**
 * IStateStore kept in memory. Writes can be made to fail to simulate a
 * full or read-only disk; a failed write leaves the previous blob in place.
 */
class MemoryStateStore : public interfaces::IStateStore {
public:
    [[nodiscard]] Result<std::optional<std::vector<uint8_t>>, BridgeFailure> Load(
        const std::string& device_id) override {
        std::lock_guard lock(lock_);
        const auto it = blobs_.find(device_id);
        if (it == blobs_.end()) {
            return Result<std::optional<std::vector<uint8_t>>, BridgeFailure>::Ok(std::nullopt);
        }
        return Result<std::optional<std::vector<uint8_t>>, BridgeFailure>::Ok(it->second);
    }

    [[nodiscard]] Result<Unit, BridgeFailure> Store(
        const std::string& device_id,
        std::span<const uint8_t> state) override {
        if (fail_writes_.load()) {
            return Result<Unit, BridgeFailure>::Err(BridgeFailure::Persistence("simulated write failure"));
        }
        std::lock_guard lock(lock_);
        blobs_[device_id].assign(state.begin(), state.end());
        ++writes_;
        return Result<Unit, BridgeFailure>::Ok(unit);
    }

    [[nodiscard]] Result<std::vector<std::string>, BridgeFailure> ListDevices() override {
        std::lock_guard lock(lock_);
        std::vector<std::string> devices;
        for (const auto& [device, blob] : blobs_) {
            devices.push_back(device);
        }
        return Result<std::vector<std::string>, BridgeFailure>::Ok(std::move(devices));
    }

    void FailWrites(const bool fail) { fail_writes_.store(fail); }

    [[nodiscard]] size_t Writes() const {
        std::lock_guard lock(lock_);
        return writes_;
    }

    [[nodiscard]] std::optional<std::vector<uint8_t>> Blob(const std::string& device_id) const {
        std::lock_guard lock(lock_);
        const auto it = blobs_.find(device_id);
        if (it == blobs_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void SetBlob(const std::string& device_id, std::vector<uint8_t> blob) {
        std::lock_guard lock(lock_);
        blobs_[device_id] = std::move(blob);
    }

private:
    mutable std::mutex lock_;
    std::map<std::string, std::vector<uint8_t>> blobs_;
    size_t writes_ = 0;
    std::atomic<bool> fail_writes_{false};
};

}
