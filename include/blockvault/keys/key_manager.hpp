#pragma once
#include "blockvault/configuration/key_lifecycle_config.hpp"
#include "blockvault/core/failures.hpp"
#include "blockvault/core/result.hpp"
#include "blockvault/crypto/password_key_derivation.hpp"
#include "blockvault/crypto/sodium_secure_memory_handle.hpp"
#include "blockvault/hardware/hardware_identity.hpp"
#include "blockvault/interfaces/i_clock.hpp"
#include "blockvault/interfaces/i_key_provider.hpp"
#include "blockvault/interfaces/i_key_rotation_notifier.hpp"
#include "blockvault/interfaces/i_storage_key_provider.hpp"
#include "blockvault/keys/key_store.hpp"
#include "blockvault/keys/managed_key.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace blockvault::keys {

/**
 * @brief Sole owner of symmetric key material
 *
 * Generates, persists, rotates, binds and revokes 256-bit AES keys. Raw
 * bytes stay in libsodium guarded memory and are only lent out through
 * ExecuteWithKey(); every other call returns ManagedKey snapshots.
 *
 * Lifecycle (forward only):
 * @code
 *   Active -> Rotating -> Deprecated -> Expired
 *      \________\______________\________> Revoked
 * @endcode
 * A Deprecated key keeps encrypting and decrypting for the configured
 * rotation overlap, then counts as Expired. An Expired key only opens
 * existing ciphertext (ExecuteWithKeyForDecrypt()) until
 * CleanupExpiredKeys() purges it and erases the material. Status is re-evaluated against the clock on
 * every access, so an elapsed window takes effect before
 * CleanupExpiredKeys() persists it.
 *
 * Thread-safety: all public methods may be called concurrently. The
 * registry is guarded by a shared mutex, each key has its own lock, and
 * the revocation set has its own shared mutex so the revocation check
 * before and after every use never waits on a rotation.
 */
class KeyManager final : public interfaces::IKeyProvider {
public:
    [[nodiscard]] static Result<std::unique_ptr<KeyManager>, TransferFailure> Create(
        configuration::KeyLifecycleConfig config,
        std::shared_ptr<hardware::IHardwareIdentitySource> identity_source,
        std::shared_ptr<interfaces::IStorageKeyProvider> storage_key_provider,
        std::shared_ptr<interfaces::IClock> clock = nullptr,
        std::shared_ptr<interfaces::IKeyRotationNotifier> notifier = nullptr);

    ~KeyManager() override;

    KeyManager(const KeyManager&) = delete;
    KeyManager& operator=(const KeyManager&) = delete;

    // ========================================================================
    // Generation
    // ========================================================================

    /**
     * @brief Derive a key bound to this machine
     *
     * key = KDF(context.secret ":" key_id, SHA-256(label || fingerprint || salt))
     * with PBKDF2-HMAC-SHA256 or Argon2id as configured.
     *
     * @return HardwareUnavailable if no machine identifier can be read,
     *         InvalidInput if context.secret is empty
     */
    [[nodiscard]] Result<ManagedKey, TransferFailure> GenerateHardwareBoundKey(const KeyContext& context);

    /// CSPRNG key, not bound to hardware. Used for transfer-scoped keys.
    [[nodiscard]] Result<ManagedKey, TransferFailure> GenerateRandomKey(const KeyContext& context);

    /**
     * @brief Recompute this machine's fingerprint and compare it with the stored one
     *
     * False for unknown or revoked keys and on mismatch. Keys that are not
     * hardware-bound validate true. No side effects.
     */
    [[nodiscard]] bool ValidateHardwareBinding(const std::string& key_id);

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Replace @p old_key_id with a fresh successor
     *
     * The old key passes through Rotating while the successor is derived,
     * then both records and the rotation event are committed in one store
     * write: old -> Deprecated, new -> Active with generation + 1. Targets
     * are notified afterwards; notification failures are logged only.
     *
     * @return RotationFailed on any error; the old key is left Active
     */
    [[nodiscard]] Result<ManagedKey, TransferFailure> RotateKey(
        const std::string& old_key_id,
        const KeyContext& context,
        const std::vector<std::string>& notify_targets = {});

    /**
     * @brief Irreversibly revoke a key
     *
     * Effective immediately, including for operations already holding the
     * material. Returns false for an unknown key.
     */
    bool RevokeKey(const std::string& key_id, const std::string& reason);

    /// Deprecate an Active key without a successor. It keeps decrypting
    /// for the overlap window.
    [[nodiscard]] Result<Unit, TransferFailure> RetireKey(const std::string& key_id);

    /**
     * @brief Expire keys whose lifetime or overlap elapsed and purge old records
     *
     * Material of every newly expired key is wiped at once. Expired
     * records past the retention window are removed from the store.
     *
     * @return Number of records purged
     */
    size_t CleanupExpiredKeys();

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] std::optional<ManagedKey> GetKey(const std::string& key_id) const;

    /// Keys currently usable for encryption, optionally for one model.
    [[nodiscard]] std::vector<ManagedKey> ListActiveKeys(const std::string& model_id = {}) const;

    /// Rotation events naming @p key_id as old or new key, oldest first.
    [[nodiscard]] std::vector<KeyRotationEvent> GetRotationHistory(const std::string& key_id) const;

    [[nodiscard]] bool IsRevoked(const std::string& key_id) const;

    /**
     * @brief Lend the key to @p operation
     *
     * Usable: Active, Rotating, and Deprecated inside the overlap window
     * (sessions started before a rotation finish on their key). Fails with
     * KeyRevoked (also when revocation lands while @p operation runs),
     * KeyExpired, HardwareMismatch or NotFound.
     */
    [[nodiscard]] Result<Unit, TransferFailure> ExecuteWithKey(
        const std::string& key_id,
        std::function<Result<Unit, TransferFailure>(std::span<const uint8_t>)> operation) override;

    /**
     * @brief Lend the key for opening existing ciphertext
     *
     * As ExecuteWithKey(), but Expired keys are accepted while their
     * material is still held, that is until CleanupExpiredKeys() purges
     * them. Revoked keys are refused at once.
     */
    [[nodiscard]] Result<Unit, TransferFailure> ExecuteWithKeyForDecrypt(
        const std::string& key_id,
        std::function<Result<Unit, TransferFailure>(std::span<const uint8_t>)> operation) override;

    // ========================================================================
    // Distribution
    // ========================================================================

    /**
     * @brief Seal a key for another node
     *
     * The wrapping key is HKDF(wrap_secret, random salt,
     * "BlockVault-Key-Distribution" || recipient_id). Revoked and expired
     * keys cannot be exported.
     */
    [[nodiscard]] Result<proto::keys::KeyDistributionPackage, TransferFailure> ExportForDistribution(
        const std::string& key_id,
        const std::string& recipient_id,
        std::span<const uint8_t> wrap_secret);

    /// Install a key exported by another node. Origin becomes Imported.
    [[nodiscard]] Result<ManagedKey, TransferFailure> ImportDistributedKey(
        const proto::keys::KeyDistributionPackage& package,
        std::span<const uint8_t> wrap_secret);

    [[nodiscard]] const configuration::KeyLifecycleConfig& GetConfig() const noexcept { return config_; }

private:
    struct KeyEntry {
        std::mutex state_lock;
        std::mutex rotation_lock;
        ManagedKey meta;
        std::shared_ptr<crypto::SecureMemoryHandle> material;
        std::string kdf_salt;
        crypto::PasswordKdfAlgorithm kdf_algorithm = crypto::PasswordKdfAlgorithm::Pbkdf2HmacSha256;
        uint32_t kdf_iterations = 0;
        std::string secret_hash;
        proto::keys::SealedMaterial sealed;
    };

    KeyManager(
        configuration::KeyLifecycleConfig config,
        std::shared_ptr<hardware::IHardwareIdentitySource> identity_source,
        std::unique_ptr<KeyStore> store,
        std::shared_ptr<interfaces::IClock> clock,
        std::shared_ptr<interfaces::IKeyRotationNotifier> notifier);

    Result<Unit, TransferFailure> LoadFromStore();

    [[nodiscard]] std::shared_ptr<KeyEntry> FindEntry(const std::string& key_id) const;

    [[nodiscard]] Result<Unit, TransferFailure> LendKey(
        const std::string& key_id,
        interfaces::KeyUsage usage,
        const std::function<Result<Unit, TransferFailure>(std::span<const uint8_t>)>& operation);

    [[nodiscard]] Result<std::string, TransferFailure> CurrentFingerprint() const;

    /// Status as of @p now, folding in elapsed lifetime and overlap windows.
    [[nodiscard]] KeyStatus EffectiveStatus(const ManagedKey& meta, TimePoint now) const;

    struct DerivedKey {
        crypto::SecureMemoryHandle material;
        std::string kdf_salt;
        std::string secret_hash;
    };

    [[nodiscard]] Result<DerivedKey, TransferFailure> DeriveHardwareBoundMaterial(
        const std::string& key_id,
        const std::string& secret,
        const std::string& fingerprint) const;

    [[nodiscard]] Result<std::shared_ptr<KeyEntry>, TransferFailure> BuildEntry(
        ManagedKey meta,
        crypto::SecureMemoryHandle material,
        std::string kdf_salt,
        std::string secret_hash) const;

    [[nodiscard]] Result<ManagedKey, TransferFailure> InsertNewKey(std::shared_ptr<KeyEntry> entry);

    [[nodiscard]] Result<std::shared_ptr<KeyEntry>, TransferFailure> CreateSuccessor(
        const ManagedKey& old_meta,
        const KeyContext& context) const;

    void FillRecord(const KeyEntry& entry, proto::keys::KeyRecord* record) const;

    /**
     * Applies @p upserts and @p removals to the persisted record cache and
     * writes the snapshot. The cache only changes when the write succeeds.
     * Callers hold the state locks of the entries they pass in.
     */
    Result<Unit, TransferFailure> CommitRecords(
        const std::vector<const KeyEntry*>& upserts,
        const std::vector<std::string>& removals,
        const std::optional<KeyRotationEvent>& event);

    void RecordFailedRotation(KeyRotationEvent event);

    void MarkRevoked(const std::string& key_id);

    configuration::KeyLifecycleConfig config_;
    std::shared_ptr<hardware::IHardwareIdentitySource> identity_source_;
    std::unique_ptr<KeyStore> store_;
    std::shared_ptr<interfaces::IClock> clock_;
    std::shared_ptr<interfaces::IKeyRotationNotifier> notifier_;

    mutable std::shared_mutex registry_lock_;
    std::unordered_map<std::string, std::shared_ptr<KeyEntry>> keys_;
    // Ids whose first snapshot write is in progress.
    std::unordered_set<std::string> reserved_ids_;

    mutable std::shared_mutex revoked_lock_;
    std::unordered_set<std::string> revoked_;

    mutable std::mutex persist_lock_;
    std::unordered_map<std::string, proto::keys::KeyRecord> records_;
    std::vector<proto::keys::RotationEvent> events_;
};

}  // namespace blockvault::keys
