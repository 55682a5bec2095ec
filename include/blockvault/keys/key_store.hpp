#pragma once
#include "blockvault/core/failures.hpp"
#include "blockvault/core/result.hpp"
#include "blockvault/crypto/sodium_secure_memory_handle.hpp"
#include "blockvault/interfaces/i_storage_key_provider.hpp"
#include "keys/key_store.pb.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string_view>

namespace blockvault::keys {

/**
 * @brief On-disk home of the key registry
 *
 * Everything lives in one KeyStoreSnapshot file (key_store.pb) inside a
 * 0700 directory, replaced atomically on every Save. Key material is
 * sealed with AES-256-GCM under the provider's storage key, bound to the
 * key id through the associated data.
 *
 * Not thread-safe; KeyManager serializes access.
 */
class KeyStore {
public:
    [[nodiscard]] static Result<std::unique_ptr<KeyStore>, TransferFailure> Open(
        std::filesystem::path directory,
        std::shared_ptr<interfaces::IStorageKeyProvider> storage_key_provider);

    /// Empty snapshot when nothing has been saved yet.
    [[nodiscard]] Result<proto::keys::KeyStoreSnapshot, TransferFailure> Load() const;

    [[nodiscard]] Result<Unit, TransferFailure> Save(const proto::keys::KeyStoreSnapshot& snapshot) const;

    [[nodiscard]] Result<proto::keys::SealedMaterial, TransferFailure> Seal(
        std::string_view key_id,
        const crypto::SecureMemoryHandle& material) const;

    [[nodiscard]] Result<crypto::SecureMemoryHandle, TransferFailure> Unseal(
        std::string_view key_id,
        const proto::keys::SealedMaterial& sealed) const;

    /// AES-256-GCM under an arbitrary wrapping key with a fresh random nonce.
    [[nodiscard]] static Result<proto::keys::SealedMaterial, TransferFailure> SealWithKey(
        std::span<const uint8_t> wrapping_key,
        std::span<const uint8_t> associated_data,
        const crypto::SecureMemoryHandle& material);

    [[nodiscard]] static Result<crypto::SecureMemoryHandle, TransferFailure> UnsealWithKey(
        std::span<const uint8_t> wrapping_key,
        std::span<const uint8_t> associated_data,
        const proto::keys::SealedMaterial& sealed);

    [[nodiscard]] const std::filesystem::path& GetFilePath() const noexcept { return file_path_; }

    KeyStore(const KeyStore&) = delete;
    KeyStore& operator=(const KeyStore&) = delete;

private:
    KeyStore(
        std::filesystem::path file_path,
        std::shared_ptr<interfaces::IStorageKeyProvider> storage_key_provider);

    std::filesystem::path file_path_;
    std::shared_ptr<interfaces::IStorageKeyProvider> storage_key_provider_;
};

}  // namespace blockvault::keys
