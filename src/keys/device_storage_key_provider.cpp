#include "blockvault/keys/device_storage_key_provider.hpp"
#include "blockvault/core/atomic_file.hpp"
#include "blockvault/core/logging.hpp"
#include "blockvault/crypto/hkdf.hpp"
#include "blockvault/crypto/sodium_interop.hpp"
#include "blockvault/transfer/constants.hpp"

#include <vector>

namespace blockvault::keys {

    namespace {
        constexpr const char* kComponent = "StorageKey";
    }

    DeviceStorageKeyProvider::DeviceStorageKeyProvider(std::filesystem::path directory)
        : directory_(std::move(directory)) {}

    Result<Unit, TransferFailure> DeviceStorageKeyProvider::LoadOrCreateSecret() {
        if (secret_.has_value()) {
            return Result<Unit, TransferFailure>::Ok(unit);
        }
        auto dir_result = storage::EnsurePrivateDirectory(directory_);
        if (dir_result.IsErr()) {
            return dir_result;
        }
        const auto path = directory_ / std::string(kInstallationSecretFileName);
        auto read_result = storage::ReadFileIfExists(path);
        if (read_result.IsErr()) {
            return Result<Unit, TransferFailure>::Err(read_result.UnwrapErr());
        }
        std::vector<uint8_t> secret_bytes;
        auto& existing = read_result.Unwrap();
        if (existing.has_value()) {
            if (existing->size() != kInstallationSecretBytes) {
                auto _wipe = crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(*existing));
                (void)_wipe;
                return Result<Unit, TransferFailure>::Err(
                    TransferFailure::Storage("Installation secret has the wrong length: " + path.string()));
            }
            secret_bytes = std::move(*existing);
        } else {
            secret_bytes = crypto::SodiumInterop::GetRandomBytes(kInstallationSecretBytes);
            auto write_result = storage::WriteFileAtomic(path, secret_bytes);
            if (write_result.IsErr()) {
                auto _wipe = crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(secret_bytes));
                (void)_wipe;
                return write_result;
            }
            BLOCKVAULT_LOG_INFO(kComponent, "Created installation secret at {}", path.string());
        }

        auto handle = crypto::SecureMemoryHandle::FromBytes(secret_bytes);
        {
            auto _wipe = crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(secret_bytes));
            (void)_wipe;
        }
        if (handle.IsErr()) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        secret_.emplace(std::move(handle).Unwrap());
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    Result<crypto::SecureMemoryHandle, TransferFailure> DeviceStorageKeyProvider::GetStorageKey() {
        std::lock_guard lock(mutex_);
        auto load_result = LoadOrCreateSecret();
        if (load_result.IsErr()) {
            return Result<crypto::SecureMemoryHandle, TransferFailure>::Err(load_result.UnwrapErr());
        }

        auto allocated = crypto::SecureMemoryHandle::Allocate(kAesKeyBytes);
        if (allocated.IsErr()) {
            return Result<crypto::SecureMemoryHandle, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(allocated.UnwrapErr()));
        }
        auto storage_key = std::move(allocated).Unwrap();

        std::vector<uint8_t> derived(kAesKeyBytes);
        const std::span<const uint8_t> info(
            reinterpret_cast<const uint8_t*>(kStorageKeyInfo.data()), kStorageKeyInfo.size());
        auto derive_result = secret_->WithReadAccess([&](std::span<const uint8_t> secret) {
            return crypto::Hkdf::DeriveKey(secret, derived, {}, info);
        });
        Result<Unit, TransferFailure> outcome = Result<Unit, TransferFailure>::Ok(unit);
        if (derive_result.IsErr()) {
            outcome = Result<Unit, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(derive_result.UnwrapErr()));
        } else if (derive_result.Unwrap().IsErr()) {
            outcome = Result<Unit, TransferFailure>::Err(derive_result.Unwrap().UnwrapErr());
        } else if (auto write = storage_key.Write(derived); write.IsErr()) {
            outcome = Result<Unit, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(write.UnwrapErr()));
        }
        {
            auto _wipe = crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(derived));
            (void)_wipe;
        }
        if (outcome.IsErr()) {
            return Result<crypto::SecureMemoryHandle, TransferFailure>::Err(outcome.UnwrapErr());
        }
        return Result<crypto::SecureMemoryHandle, TransferFailure>::Ok(std::move(storage_key));
    }

}
