#pragma once
#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"
#include "uabridge/crypto/sodium_secure_memory_handle.hpp"

namespace uabridge::interfaces {

class IStateKeyProvider {
public:
    virtual ~IStateKeyProvider() = default;

    [[nodiscard]] virtual Result<crypto::SecureMemoryHandle, BridgeFailure> GetStateEncryptionKey() = 0;
};

}
