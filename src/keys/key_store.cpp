#include "blockvault/keys/key_store.hpp"
#include "blockvault/core/atomic_file.hpp"
#include "blockvault/core/logging.hpp"
#include "blockvault/crypto/aes_gcm.hpp"
#include "blockvault/crypto/sodium_interop.hpp"
#include "blockvault/transfer/constants.hpp"

#include <vector>

namespace blockvault::keys {

    namespace {
        constexpr const char* kComponent = "KeyStore";

        std::span<const uint8_t> AsBytes(const std::string_view text) {
            return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
        }

        std::span<const uint8_t> AsBytes(const std::string& text) {
            return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
        }
    }

    KeyStore::KeyStore(
        std::filesystem::path file_path,
        std::shared_ptr<interfaces::IStorageKeyProvider> storage_key_provider)
        : file_path_(std::move(file_path))
        , storage_key_provider_(std::move(storage_key_provider)) {}

    Result<std::unique_ptr<KeyStore>, TransferFailure> KeyStore::Open(
        std::filesystem::path directory,
        std::shared_ptr<interfaces::IStorageKeyProvider> storage_key_provider) {
        if (!storage_key_provider) {
            return Result<std::unique_ptr<KeyStore>, TransferFailure>::Err(
                TransferFailure::InvalidInput("Storage key provider is required"));
        }
        auto dir_result = storage::EnsurePrivateDirectory(directory);
        if (dir_result.IsErr()) {
            return Result<std::unique_ptr<KeyStore>, TransferFailure>::Err(dir_result.UnwrapErr());
        }
        auto file_path = directory / std::string(kKeyStoreFileName);
        return Result<std::unique_ptr<KeyStore>, TransferFailure>::Ok(
            std::unique_ptr<KeyStore>(new KeyStore(std::move(file_path), std::move(storage_key_provider))));
    }

    Result<proto::keys::KeyStoreSnapshot, TransferFailure> KeyStore::Load() const {
        auto read_result = storage::ReadFileIfExists(file_path_);
        if (read_result.IsErr()) {
            return Result<proto::keys::KeyStoreSnapshot, TransferFailure>::Err(read_result.UnwrapErr());
        }
        proto::keys::KeyStoreSnapshot snapshot;
        const auto& contents = read_result.Unwrap();
        if (!contents.has_value()) {
            snapshot.set_version(kStateFormatVersion);
            return Result<proto::keys::KeyStoreSnapshot, TransferFailure>::Ok(std::move(snapshot));
        }
        if (!snapshot.ParseFromArray(contents->data(), static_cast<int>(contents->size()))) {
            return Result<proto::keys::KeyStoreSnapshot, TransferFailure>::Err(
                TransferFailure::Decode("Key store file is corrupt: " + file_path_.string()));
        }
        if (snapshot.version() != kStateFormatVersion) {
            return Result<proto::keys::KeyStoreSnapshot, TransferFailure>::Err(
                TransferFailure::Decode(compat::format(
                    "Unsupported key store version {} (expected {})",
                    snapshot.version(), kStateFormatVersion)));
        }
        BLOCKVAULT_LOG_DEBUG(kComponent, "Loaded {} key records, {} revocations, {} rotation events",
            snapshot.keys_size(), snapshot.revoked_ids_size(), snapshot.rotation_events_size());
        return Result<proto::keys::KeyStoreSnapshot, TransferFailure>::Ok(std::move(snapshot));
    }

    Result<Unit, TransferFailure> KeyStore::Save(const proto::keys::KeyStoreSnapshot& snapshot) const {
        auto bytes_result = storage::SerializeDeterministic(snapshot);
        if (bytes_result.IsErr()) {
            return Result<Unit, TransferFailure>::Err(bytes_result.UnwrapErr());
        }
        return storage::WriteFileAtomic(file_path_, bytes_result.Unwrap());
    }

    Result<proto::keys::SealedMaterial, TransferFailure> KeyStore::Seal(
        const std::string_view key_id,
        const crypto::SecureMemoryHandle& material) const {
        auto key_result = storage_key_provider_->GetStorageKey();
        if (key_result.IsErr()) {
            return Result<proto::keys::SealedMaterial, TransferFailure>::Err(key_result.UnwrapErr());
        }
        auto sealed = key_result.Unwrap().WithReadAccess(
            [&](std::span<const uint8_t> storage_key) {
                return SealWithKey(storage_key, AsBytes(key_id), material);
            });
        if (sealed.IsErr()) {
            return Result<proto::keys::SealedMaterial, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(sealed.UnwrapErr()));
        }
        return std::move(sealed).Unwrap();
    }

    Result<crypto::SecureMemoryHandle, TransferFailure> KeyStore::Unseal(
        const std::string_view key_id,
        const proto::keys::SealedMaterial& sealed) const {
        auto key_result = storage_key_provider_->GetStorageKey();
        if (key_result.IsErr()) {
            return Result<crypto::SecureMemoryHandle, TransferFailure>::Err(key_result.UnwrapErr());
        }
        auto opened = key_result.Unwrap().WithReadAccess(
            [&](std::span<const uint8_t> storage_key) {
                return UnsealWithKey(storage_key, AsBytes(key_id), sealed);
            });
        if (opened.IsErr()) {
            return Result<crypto::SecureMemoryHandle, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(opened.UnwrapErr()));
        }
        return std::move(opened).Unwrap();
    }

    Result<proto::keys::SealedMaterial, TransferFailure> KeyStore::SealWithKey(
        std::span<const uint8_t> wrapping_key,
        std::span<const uint8_t> associated_data,
        const crypto::SecureMemoryHandle& material) {
        const auto nonce = crypto::SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);
        auto encrypted = material.WithReadAccess([&](std::span<const uint8_t> plaintext) {
            return crypto::AesGcm::Encrypt(wrapping_key, nonce, plaintext, associated_data);
        });
        if (encrypted.IsErr()) {
            return Result<proto::keys::SealedMaterial, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(encrypted.UnwrapErr()));
        }
        auto inner = std::move(encrypted).Unwrap();
        if (inner.IsErr()) {
            return Result<proto::keys::SealedMaterial, TransferFailure>::Err(inner.UnwrapErr());
        }
        const auto& sealed_bytes = inner.Unwrap();
        proto::keys::SealedMaterial sealed;
        sealed.set_ciphertext(sealed_bytes.ciphertext.data(), sealed_bytes.ciphertext.size());
        sealed.set_tag(sealed_bytes.tag.data(), sealed_bytes.tag.size());
        sealed.set_nonce(nonce.data(), nonce.size());
        return Result<proto::keys::SealedMaterial, TransferFailure>::Ok(std::move(sealed));
    }

    Result<crypto::SecureMemoryHandle, TransferFailure> KeyStore::UnsealWithKey(
        std::span<const uint8_t> wrapping_key,
        std::span<const uint8_t> associated_data,
        const proto::keys::SealedMaterial& sealed) {
        auto decrypted = crypto::AesGcm::Decrypt(
            wrapping_key, AsBytes(sealed.nonce()), AsBytes(sealed.ciphertext()),
            AsBytes(sealed.tag()), associated_data);
        if (decrypted.IsErr()) {
            return Result<crypto::SecureMemoryHandle, TransferFailure>::Err(decrypted.UnwrapErr());
        }
        auto& plaintext = decrypted.Unwrap();
        if (plaintext.size() != kAesKeyBytes) {
            auto _wipe = crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(plaintext));
            (void)_wipe;
            return Result<crypto::SecureMemoryHandle, TransferFailure>::Err(
                TransferFailure::Decode("Sealed key material has the wrong length"));
        }
        auto handle = crypto::SecureMemoryHandle::FromBytes(plaintext);
        {
            auto _wipe = crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(plaintext));
            (void)_wipe;
        }
        if (handle.IsErr()) {
            return Result<crypto::SecureMemoryHandle, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        return Result<crypto::SecureMemoryHandle, TransferFailure>::Ok(std::move(handle).Unwrap());
    }

}
