#pragma once
#include "blockvault/core/failures.hpp"
#include "blockvault/core/result.hpp"
#include "blockvault/crypto/sodium_secure_memory_handle.hpp"

namespace blockvault::interfaces {

/// Supplies the 32-byte key that seals key material at rest.
class IStorageKeyProvider {
public:
    virtual ~IStorageKeyProvider() = default;

    [[nodiscard]] virtual Result<crypto::SecureMemoryHandle, TransferFailure> GetStorageKey() = 0;
};

}
