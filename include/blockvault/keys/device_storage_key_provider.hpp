#pragma once
#include "blockvault/interfaces/i_storage_key_provider.hpp"

#include <filesystem>
#include <mutex>
#include <optional>

namespace blockvault::keys {

/// Storage key = HKDF-SHA256(installation secret, info "BlockVault-KeyStore-Seal").
///
/// The installation secret is 32 random bytes created on first use in
/// <directory>/installation.secret with mode 0600 and cached in guarded
/// memory afterwards.
class DeviceStorageKeyProvider final : public interfaces::IStorageKeyProvider {
public:
    explicit DeviceStorageKeyProvider(std::filesystem::path directory);

    [[nodiscard]] Result<crypto::SecureMemoryHandle, TransferFailure> GetStorageKey() override;

private:
    Result<Unit, TransferFailure> LoadOrCreateSecret();

    std::filesystem::path directory_;
    std::mutex mutex_;
    std::optional<crypto::SecureMemoryHandle> secret_;
};

}
