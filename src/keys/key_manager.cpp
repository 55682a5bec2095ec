#include "blockvault/keys/key_manager.hpp"
#include "blockvault/core/logging.hpp"
#include "blockvault/crypto/hkdf.hpp"
#include "blockvault/crypto/sodium_interop.hpp"
#include "blockvault/keys/device_storage_key_provider.hpp"
#include "blockvault/transfer/constants.hpp"

#include <algorithm>

namespace blockvault::keys {
    using crypto::SecureMemoryHandle;
    using crypto::SodiumInterop;

    namespace {
        constexpr const char* kComponent = "KeyManager";
        constexpr size_t kEventIdBytes = 8;
        constexpr size_t kMinWrapSecretBytes = 16;

        std::span<const uint8_t> AsBytes(const std::string& text) {
            return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
        }

        std::string Sha256Hex(const std::string& text) {
            return logging::ToHex(SodiumInterop::Sha256(AsBytes(text)));
        }

        bool FingerprintsMatch(const std::string& stored, const std::string& current) {
            if (stored.size() != current.size()) {
                return false;
            }
            auto equal = SodiumInterop::ConstantTimeEquals(AsBytes(stored), AsBytes(current));
            return equal.IsOk() && equal.Unwrap();
        }

        proto::keys::KdfAlgorithm ToProto(const crypto::PasswordKdfAlgorithm algorithm) {
            return algorithm == crypto::PasswordKdfAlgorithm::Argon2id
                ? proto::keys::KDF_ARGON2ID
                : proto::keys::KDF_PBKDF2_HMAC_SHA256;
        }

        crypto::PasswordKdfAlgorithm FromProto(const proto::keys::KdfAlgorithm algorithm) {
            return algorithm == proto::keys::KDF_ARGON2ID
                ? crypto::PasswordKdfAlgorithm::Argon2id
                : crypto::PasswordKdfAlgorithm::Pbkdf2HmacSha256;
        }

        Result<SecureMemoryHandle, TransferFailure> RandomMaterial() {
            auto bytes = SodiumInterop::GetRandomBytes(kAesKeyBytes);
            auto handle = SecureMemoryHandle::FromBytes(bytes);
            { auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(bytes)); (void)_wipe; }
            if (handle.IsErr()) {
                return Result<SecureMemoryHandle, TransferFailure>::Err(
                    TransferFailure::KeyGeneration(handle.UnwrapErr().message));
            }
            return Result<SecureMemoryHandle, TransferFailure>::Ok(std::move(handle).Unwrap());
        }

        Result<std::vector<uint8_t>, TransferFailure> DeriveWrapKey(
            std::span<const uint8_t> wrap_secret,
            std::span<const uint8_t> salt,
            const std::string& recipient_id) {
            std::string info(kDistributionWrapInfo);
            info += recipient_id;
            return crypto::Hkdf::DeriveKeyBytes(wrap_secret, kAesKeyBytes, salt, AsBytes(info));
        }

        std::string DistributionAad(const std::string& key_id, const std::string& recipient_id) {
            return key_id + "|" + recipient_id;
        }
    }

    // ========================================================================
    // Construction
    // ========================================================================

    KeyManager::KeyManager(
        configuration::KeyLifecycleConfig config,
        std::shared_ptr<hardware::IHardwareIdentitySource> identity_source,
        std::unique_ptr<KeyStore> store,
        std::shared_ptr<interfaces::IClock> clock,
        std::shared_ptr<interfaces::IKeyRotationNotifier> notifier)
        : config_(std::move(config))
        , identity_source_(std::move(identity_source))
        , store_(std::move(store))
        , clock_(std::move(clock))
        , notifier_(std::move(notifier)) {}

    KeyManager::~KeyManager() = default;

    Result<std::unique_ptr<KeyManager>, TransferFailure> KeyManager::Create(
        configuration::KeyLifecycleConfig config,
        std::shared_ptr<hardware::IHardwareIdentitySource> identity_source,
        std::shared_ptr<interfaces::IStorageKeyProvider> storage_key_provider,
        std::shared_ptr<interfaces::IClock> clock,
        std::shared_ptr<interfaces::IKeyRotationNotifier> notifier) {
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<std::unique_ptr<KeyManager>, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        if (auto valid = config.Validate(); valid.IsErr()) {
            return Result<std::unique_ptr<KeyManager>, TransferFailure>::Err(valid.UnwrapErr());
        }
        if (!identity_source) {
            return Result<std::unique_ptr<KeyManager>, TransferFailure>::Err(
                TransferFailure::InvalidInput("Hardware identity source is required"));
        }
        if (!storage_key_provider) {
            storage_key_provider = std::make_shared<DeviceStorageKeyProvider>(config.GetStorageDirectory());
        }
        if (!clock) {
            clock = std::make_shared<interfaces::SystemClock>();
        }

        auto store = KeyStore::Open(config.GetStorageDirectory(), std::move(storage_key_provider));
        if (store.IsErr()) {
            return Result<std::unique_ptr<KeyManager>, TransferFailure>::Err(store.UnwrapErr());
        }

        std::unique_ptr<KeyManager> manager(new KeyManager(
            std::move(config), std::move(identity_source), std::move(store).Unwrap(),
            std::move(clock), std::move(notifier)));
        if (auto loaded = manager->LoadFromStore(); loaded.IsErr()) {
            return Result<std::unique_ptr<KeyManager>, TransferFailure>::Err(loaded.UnwrapErr());
        }
        BLOCKVAULT_LOG_INFO(kComponent, "Key manager ready: {} keys, {} revoked",
            manager->keys_.size(), manager->revoked_.size());
        return Result<std::unique_ptr<KeyManager>, TransferFailure>::Ok(std::move(manager));
    }

    Result<Unit, TransferFailure> KeyManager::LoadFromStore() {
        auto snapshot_result = store_->Load();
        if (snapshot_result.IsErr()) {
            return Result<Unit, TransferFailure>::Err(snapshot_result.UnwrapErr());
        }
        const auto& snapshot = snapshot_result.Unwrap();

        for (const auto& id : snapshot.revoked_ids()) {
            revoked_.insert(id);
        }

        for (const auto& record : snapshot.keys()) {
            auto entry = std::make_shared<KeyEntry>();
            entry->meta = ReadMetadata(record);
            entry->kdf_salt = record.kdf_salt();
            entry->kdf_algorithm = FromProto(record.kdf_algorithm());
            entry->kdf_iterations = record.kdf_iterations();
            entry->secret_hash = record.secret_hash();

            const std::string& id = entry->meta.key_id;
            if (entry->meta.status == KeyStatus::Revoked) {
                revoked_.insert(id);
            } else if (revoked_.contains(id)) {
                entry->meta.status = KeyStatus::Revoked;
            }
            // Rotating is never persisted by this version; treat it as an
            // abandoned rotation.
            if (entry->meta.status == KeyStatus::Rotating) {
                entry->meta.status = KeyStatus::Active;
            }

            // Expired keys keep their material for decryption until purged.
            if (entry->meta.status != KeyStatus::Revoked) {
                if (!record.has_material()) {
                    if (entry->meta.status != KeyStatus::Expired) {
                        BLOCKVAULT_LOG_WARN(kComponent, "Key {} has no stored material", id);
                    }
                } else {
                    auto unsealed = store_->Unseal(id, record.material());
                    if (unsealed.IsErr()) {
                        return Result<Unit, TransferFailure>::Err(TransferFailure::Storage(
                            compat::format("Cannot unseal key {}: {}", id, unsealed.UnwrapErr().message)));
                    }
                    entry->material = std::make_shared<SecureMemoryHandle>(std::move(unsealed).Unwrap());
                    entry->sealed = record.material();
                }
            }

            records_.emplace(id, record);
            keys_.emplace(id, std::move(entry));
        }
        events_.assign(snapshot.rotation_events().begin(), snapshot.rotation_events().end());
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    // ========================================================================
    // Internal helpers
    // ========================================================================

    std::shared_ptr<KeyManager::KeyEntry> KeyManager::FindEntry(const std::string& key_id) const {
        std::shared_lock lock(registry_lock_);
        const auto it = keys_.find(key_id);
        if (it == keys_.end()) {
            return nullptr;
        }
        return it->second;
    }

    Result<std::string, TransferFailure> KeyManager::CurrentFingerprint() const {
        return hardware::HardwareFingerprint::FromSource(*identity_source_);
    }

    KeyStatus KeyManager::EffectiveStatus(const ManagedKey& meta, const TimePoint now) const {
        switch (meta.status) {
            case KeyStatus::Revoked:
            case KeyStatus::Expired:
                return meta.status;
            case KeyStatus::Deprecated:
                if (meta.deprecated_at.has_value() &&
                    now >= *meta.deprecated_at + config_.GetRotationOverlap()) {
                    return KeyStatus::Expired;
                }
                return meta.status;
            case KeyStatus::Active:
            case KeyStatus::Rotating:
                if (meta.expires_at.has_value() && now >= *meta.expires_at) {
                    return KeyStatus::Expired;
                }
                return meta.status;
        }
        return meta.status;
    }

    Result<KeyManager::DerivedKey, TransferFailure> KeyManager::DeriveHardwareBoundMaterial(
        const std::string& key_id,
        const std::string& secret,
        const std::string& fingerprint) const {
        const auto per_key_salt = SodiumInterop::GetRandomBytes(kKeySaltBytes);
        const auto salt = crypto::PasswordKeyDerivation::BuildDeviceSalt(fingerprint, per_key_salt);
        auto derived = crypto::PasswordKeyDerivation::DeriveKey(secret, key_id, salt, config_.GetKdfParams());
        if (derived.IsErr()) {
            return Result<DerivedKey, TransferFailure>::Err(derived.UnwrapErr());
        }
        return Result<DerivedKey, TransferFailure>::Ok(DerivedKey{
            std::move(derived).Unwrap(),
            std::string(per_key_salt.begin(), per_key_salt.end()),
            Sha256Hex(secret)});
    }

    Result<std::shared_ptr<KeyManager::KeyEntry>, TransferFailure> KeyManager::BuildEntry(
        ManagedKey meta,
        SecureMemoryHandle material,
        std::string kdf_salt,
        std::string secret_hash) const {
        auto sealed = store_->Seal(meta.key_id, material);
        if (sealed.IsErr()) {
            return Result<std::shared_ptr<KeyEntry>, TransferFailure>::Err(sealed.UnwrapErr());
        }
        auto entry = std::make_shared<KeyEntry>();
        const auto& params = config_.GetKdfParams();
        if (meta.IsHardwareBound()) {
            entry->kdf_algorithm = params.algorithm;
            entry->kdf_iterations = params.algorithm == crypto::PasswordKdfAlgorithm::Argon2id
                ? static_cast<uint32_t>(params.argon2_ops_limit)
                : params.pbkdf2_iterations;
        }
        entry->meta = std::move(meta);
        entry->material = std::make_shared<SecureMemoryHandle>(std::move(material));
        entry->kdf_salt = std::move(kdf_salt);
        entry->secret_hash = std::move(secret_hash);
        entry->sealed = std::move(sealed).Unwrap();
        return Result<std::shared_ptr<KeyEntry>, TransferFailure>::Ok(std::move(entry));
    }

    Result<ManagedKey, TransferFailure> KeyManager::InsertNewKey(std::shared_ptr<KeyEntry> entry) {
        const std::string id = entry->meta.key_id;
        {
            std::unique_lock registry(registry_lock_);
            if (keys_.contains(id) || reserved_ids_.contains(id)) {
                return Result<ManagedKey, TransferFailure>::Err(
                    TransferFailure::InvalidState("Key already exists: " + id));
            }
            reserved_ids_.insert(id);
        }

        // The snapshot write runs without the registry lock so lookups of
        // other keys never wait on the disk.
        ManagedKey snapshot;
        std::optional<TransferFailure> commit_failure;
        {
            std::lock_guard state(entry->state_lock);
            auto commit = CommitRecords({entry.get()}, {}, std::nullopt);
            if (commit.IsErr()) {
                commit_failure = commit.UnwrapErr();
            } else {
                snapshot = entry->meta;
            }
        }

        std::unique_lock registry(registry_lock_);
        reserved_ids_.erase(id);
        if (commit_failure.has_value()) {
            return Result<ManagedKey, TransferFailure>::Err(*commit_failure);
        }
        keys_.emplace(id, std::move(entry));
        return Result<ManagedKey, TransferFailure>::Ok(std::move(snapshot));
    }

    void KeyManager::FillRecord(const KeyEntry& entry, proto::keys::KeyRecord* record) const {
        WriteMetadata(entry.meta, record);
        record->set_kdf_salt(entry.kdf_salt);
        record->set_kdf_algorithm(ToProto(entry.kdf_algorithm));
        record->set_kdf_iterations(entry.kdf_iterations);
        record->set_secret_hash(entry.secret_hash);
        if (entry.sealed.ciphertext().empty()) {
            record->clear_material();
        } else {
            *record->mutable_material() = entry.sealed;
        }
    }

    Result<Unit, TransferFailure> KeyManager::CommitRecords(
        const std::vector<const KeyEntry*>& upserts,
        const std::vector<std::string>& removals,
        const std::optional<KeyRotationEvent>& event) {
        std::lock_guard lock(persist_lock_);

        auto records = records_;
        auto events = events_;
        for (const KeyEntry* entry : upserts) {
            FillRecord(*entry, &records[entry->meta.key_id]);
        }
        for (const auto& id : removals) {
            records.erase(id);
        }
        if (event.has_value()) {
            const auto existing = std::find_if(events.begin(), events.end(),
                [&](const proto::keys::RotationEvent& e) { return e.event_id() == event->event_id; });
            if (existing != events.end()) {
                WriteEvent(*event, &*existing);
            } else {
                WriteEvent(*event, &events.emplace_back());
            }
            const size_t capacity = config_.GetRotationLogCapacity();
            if (events.size() > capacity) {
                events.erase(events.begin(), events.begin() + static_cast<std::ptrdiff_t>(events.size() - capacity));
            }
        }

        proto::keys::KeyStoreSnapshot snapshot;
        snapshot.set_version(kStateFormatVersion);
        std::vector<const proto::keys::KeyRecord*> ordered;
        ordered.reserve(records.size());
        for (const auto& [id, record] : records) {
            ordered.push_back(&record);
        }
        std::sort(ordered.begin(), ordered.end(),
            [](const auto* a, const auto* b) { return a->key_id() < b->key_id(); });
        for (const auto* record : ordered) {
            *snapshot.add_keys() = *record;
        }
        {
            std::shared_lock revoked_lock(revoked_lock_);
            std::vector<std::string> revoked(revoked_.begin(), revoked_.end());
            std::sort(revoked.begin(), revoked.end());
            for (auto& id : revoked) {
                snapshot.add_revoked_ids(std::move(id));
            }
        }
        for (const auto& e : events) {
            *snapshot.add_rotation_events() = e;
        }

        auto saved = store_->Save(snapshot);
        if (saved.IsErr()) {
            return saved;
        }
        records_ = std::move(records);
        events_ = std::move(events);
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    void KeyManager::RecordFailedRotation(KeyRotationEvent event) {
        event.status = RotationStatus::Failed;
        if (auto commit = CommitRecords({}, {}, event); commit.IsErr()) {
            BLOCKVAULT_LOG_ERROR(kComponent, "Cannot record failed rotation {}: {}",
                event.event_id, commit.UnwrapErr().message);
        }
    }

    void KeyManager::MarkRevoked(const std::string& key_id) {
        std::unique_lock lock(revoked_lock_);
        revoked_.insert(key_id);
    }

    // ========================================================================
    // Generation
    // ========================================================================

    Result<ManagedKey, TransferFailure> KeyManager::GenerateHardwareBoundKey(const KeyContext& context) {
        if (context.secret.empty()) {
            return Result<ManagedKey, TransferFailure>::Err(
                TransferFailure::InvalidInput("Hardware-bound keys need a secret"));
        }
        auto fingerprint = CurrentFingerprint();
        if (fingerprint.IsErr()) {
            BLOCKVAULT_LOG_ERROR(kComponent, "Hardware fingerprint unavailable: {}",
                fingerprint.UnwrapErr().message);
            return Result<ManagedKey, TransferFailure>::Err(fingerprint.UnwrapErr());
        }

        const auto now = clock_->Now();
        ManagedKey meta;
        meta.key_id = GenerateKeyId(context.model_id);
        meta.origin = KeyOrigin::HardwareBound;
        meta.model_id = context.model_id;
        meta.labels = context.labels;
        meta.hardware_fingerprint = fingerprint.Unwrap();
        meta.created_at = now;
        meta.expires_at = now + config_.GetKeyLifetime();

        auto derived = DeriveHardwareBoundMaterial(meta.key_id, context.secret, meta.hardware_fingerprint);
        if (derived.IsErr()) {
            return Result<ManagedKey, TransferFailure>::Err(derived.UnwrapErr());
        }
        auto& parts = derived.Unwrap();
        auto entry = BuildEntry(std::move(meta), std::move(parts.material),
                                std::move(parts.kdf_salt), std::move(parts.secret_hash));
        if (entry.IsErr()) {
            return Result<ManagedKey, TransferFailure>::Err(entry.UnwrapErr());
        }
        auto inserted = InsertNewKey(std::move(entry).Unwrap());
        if (inserted.IsOk()) {
            BLOCKVAULT_LOG_INFO(kComponent, "Generated hardware-bound key {} (fingerprint {})",
                inserted.Unwrap().key_id, logging::ShortHex(fingerprint.Unwrap(), kFingerprintLogPrefix));
        }
        return inserted;
    }

    Result<ManagedKey, TransferFailure> KeyManager::GenerateRandomKey(const KeyContext& context) {
        auto material = RandomMaterial();
        if (material.IsErr()) {
            return Result<ManagedKey, TransferFailure>::Err(material.UnwrapErr());
        }
        const auto now = clock_->Now();
        ManagedKey meta;
        meta.key_id = GenerateKeyId(context.model_id);
        meta.origin = KeyOrigin::Random;
        meta.model_id = context.model_id;
        meta.labels = context.labels;
        meta.created_at = now;
        meta.expires_at = now + config_.GetKeyLifetime();

        auto entry = BuildEntry(std::move(meta), std::move(material).Unwrap(), {}, {});
        if (entry.IsErr()) {
            return Result<ManagedKey, TransferFailure>::Err(entry.UnwrapErr());
        }
        auto inserted = InsertNewKey(std::move(entry).Unwrap());
        if (inserted.IsOk()) {
            BLOCKVAULT_LOG_DEBUG(kComponent, "Generated random key {}", inserted.Unwrap().key_id);
        }
        return inserted;
    }

    bool KeyManager::ValidateHardwareBinding(const std::string& key_id) {
        if (IsRevoked(key_id)) {
            BLOCKVAULT_LOG_WARN(kComponent, "Binding check on revoked key {}", key_id);
            return false;
        }
        const auto entry = FindEntry(key_id);
        if (!entry) {
            BLOCKVAULT_LOG_WARN(kComponent, "Binding check on unknown key {}", key_id);
            return false;
        }
        std::string stored;
        bool bound = false;
        {
            std::lock_guard state(entry->state_lock);
            stored = entry->meta.hardware_fingerprint;
            bound = entry->meta.IsHardwareBound();
        }
        if (!bound) {
            return true;
        }
        auto current = CurrentFingerprint();
        if (current.IsErr()) {
            BLOCKVAULT_LOG_WARN(kComponent, "Cannot fingerprint this machine: {}", current.UnwrapErr().message);
            return false;
        }
        if (!FingerprintsMatch(stored, current.Unwrap())) {
            BLOCKVAULT_LOG_WARN(kComponent, "Hardware fingerprint mismatch for key {}", key_id);
            BLOCKVAULT_LOG_DEBUG(kComponent, "Expected {}, current {}",
                logging::ShortHex(stored, kFingerprintLogPrefix),
                logging::ShortHex(current.Unwrap(), kFingerprintLogPrefix));
            return false;
        }
        return true;
    }

    // ========================================================================
    // Lifecycle
    // ========================================================================

    Result<std::shared_ptr<KeyManager::KeyEntry>, TransferFailure> KeyManager::CreateSuccessor(
        const ManagedKey& old_meta,
        const KeyContext& context) const {
        const auto now = clock_->Now();
        ManagedKey meta;
        meta.model_id = context.model_id.empty() ? old_meta.model_id : context.model_id;
        meta.key_id = GenerateKeyId(meta.model_id);
        meta.origin = old_meta.IsHardwareBound() ? KeyOrigin::HardwareBound : KeyOrigin::Random;
        meta.labels = context.labels.empty() ? old_meta.labels : context.labels;
        meta.predecessor_id = old_meta.key_id;
        meta.generation = old_meta.generation + 1;
        meta.created_at = now;
        meta.expires_at = now + config_.GetKeyLifetime();

        if (!meta.IsHardwareBound()) {
            auto material = RandomMaterial();
            if (material.IsErr()) {
                return Result<std::shared_ptr<KeyEntry>, TransferFailure>::Err(material.UnwrapErr());
            }
            return BuildEntry(std::move(meta), std::move(material).Unwrap(), {}, {});
        }

        if (context.secret.empty()) {
            return Result<std::shared_ptr<KeyEntry>, TransferFailure>::Err(
                TransferFailure::InvalidInput("Rotating a hardware-bound key needs the secret"));
        }
        auto fingerprint = CurrentFingerprint();
        if (fingerprint.IsErr()) {
            return Result<std::shared_ptr<KeyEntry>, TransferFailure>::Err(fingerprint.UnwrapErr());
        }
        meta.hardware_fingerprint = fingerprint.Unwrap();
        auto derived = DeriveHardwareBoundMaterial(meta.key_id, context.secret, meta.hardware_fingerprint);
        if (derived.IsErr()) {
            return Result<std::shared_ptr<KeyEntry>, TransferFailure>::Err(derived.UnwrapErr());
        }
        auto& parts = derived.Unwrap();
        return BuildEntry(std::move(meta), std::move(parts.material),
                          std::move(parts.kdf_salt), std::move(parts.secret_hash));
    }

    Result<ManagedKey, TransferFailure> KeyManager::RotateKey(
        const std::string& old_key_id,
        const KeyContext& context,
        const std::vector<std::string>& notify_targets) {
        const auto entry = FindEntry(old_key_id);
        if (!entry) {
            return Result<ManagedKey, TransferFailure>::Err(
                TransferFailure::RotationFailed(std::string(ErrorMessages::UNKNOWN_KEY) + old_key_id));
        }
        std::unique_lock rotation(entry->rotation_lock, std::try_to_lock);
        if (!rotation.owns_lock()) {
            return Result<ManagedKey, TransferFailure>::Err(
                TransferFailure::RotationFailed("Key " + old_key_id + " is already being rotated"));
        }
        if (IsRevoked(old_key_id)) {
            return Result<ManagedKey, TransferFailure>::Err(
                TransferFailure::RotationFailed("Key " + old_key_id + " has been revoked"));
        }

        const auto now = clock_->Now();
        ManagedKey old_meta;
        {
            std::lock_guard state(entry->state_lock);
            const KeyStatus status = EffectiveStatus(entry->meta, now);
            if (status != KeyStatus::Active) {
                return Result<ManagedKey, TransferFailure>::Err(TransferFailure::RotationFailed(
                    compat::format("Key {} is {} and cannot be rotated", old_key_id, ToString(status))));
            }
            entry->meta.status = KeyStatus::Rotating;
            old_meta = entry->meta;
        }

        KeyRotationEvent event;
        event.event_id = "rot_" + SodiumInterop::GetRandomHex(kEventIdBytes);
        event.old_key_id = old_key_id;
        event.occurred_at = now;
        event.reason = context.labels.contains("reason") ? context.labels.at("reason") : "rotation";

        auto abandon = [&](const TransferFailure& failure) {
            {
                std::lock_guard state(entry->state_lock);
                if (entry->meta.status == KeyStatus::Rotating) {
                    entry->meta.status = KeyStatus::Active;
                }
            }
            event.error = failure.message;
            RecordFailedRotation(event);
            BLOCKVAULT_LOG_ERROR(kComponent, "Rotation of {} failed: {}", old_key_id, failure.message);
            return Result<ManagedKey, TransferFailure>::Err(TransferFailure::RotationFailed(
                compat::format("Rotation of {} failed: {}", old_key_id, failure.message)));
        };

        auto successor = CreateSuccessor(old_meta, context);
        if (successor.IsErr()) {
            return abandon(successor.UnwrapErr());
        }
        std::shared_ptr<KeyEntry> new_entry = std::move(successor).Unwrap();
        event.new_key_id = new_entry->meta.key_id;
        event.status = RotationStatus::Completed;

        std::optional<TransferFailure> commit_failure;
        {
            std::lock_guard state(entry->state_lock);
            if (entry->meta.status != KeyStatus::Rotating) {
                commit_failure = TransferFailure::InvalidState(
                    compat::format("Key became {} during rotation", ToString(entry->meta.status)));
            } else {
                const ManagedKey previous = entry->meta;
                entry->meta.status = KeyStatus::Deprecated;
                entry->meta.deprecated_at = now;
                entry->meta.successor_id = new_entry->meta.key_id;

                std::lock_guard new_state(new_entry->state_lock);
                auto commit = CommitRecords({entry.get(), new_entry.get()}, {}, event);
                if (commit.IsErr()) {
                    entry->meta = previous;
                    commit_failure = commit.UnwrapErr();
                }
            }
        }
        if (commit_failure.has_value()) {
            event.new_key_id.clear();
            return abandon(*commit_failure);
        }

        {
            std::unique_lock registry(registry_lock_);
            keys_.emplace(new_entry->meta.key_id, new_entry);
        }
        BLOCKVAULT_LOG_INFO(kComponent, "Rotated key {} -> {} (generation {})",
            old_key_id, new_entry->meta.key_id, new_entry->meta.generation);

        if (!notify_targets.empty()) {
            if (!notifier_) {
                BLOCKVAULT_LOG_WARN(kComponent, "No rotation notifier configured; {} targets not notified",
                    notify_targets.size());
            } else {
                for (const auto& target : notify_targets) {
                    auto notified = notifier_->NotifyRotation(target, event);
                    if (notified.IsErr()) {
                        BLOCKVAULT_LOG_WARN(kComponent, "Rotation notice to {} failed: {}",
                            target, notified.UnwrapErr().message);
                        continue;
                    }
                    event.notified_targets.push_back(target);
                }
                if (!event.notified_targets.empty()) {
                    if (auto commit = CommitRecords({}, {}, event); commit.IsErr()) {
                        BLOCKVAULT_LOG_WARN(kComponent, "Cannot record notified targets for {}: {}",
                            event.event_id, commit.UnwrapErr().message);
                    }
                }
            }
        }

        std::lock_guard new_state(new_entry->state_lock);
        return Result<ManagedKey, TransferFailure>::Ok(new_entry->meta);
    }

    bool KeyManager::RevokeKey(const std::string& key_id, const std::string& reason) {
        const auto entry = FindEntry(key_id);
        if (!entry) {
            BLOCKVAULT_LOG_WARN(kComponent, "Revocation of unknown key {}", key_id);
            return false;
        }
        MarkRevoked(key_id);

        std::lock_guard state(entry->state_lock);
        if (entry->meta.status == KeyStatus::Revoked) {
            return true;
        }
        if (entry->meta.status != KeyStatus::Expired) {
            entry->meta.status = KeyStatus::Revoked;
            entry->meta.revoked_at = clock_->Now();
            entry->meta.revocation_reason = reason;
        }
        entry->material.reset();
        entry->sealed.Clear();

        if (auto commit = CommitRecords({entry.get()}, {}, std::nullopt); commit.IsErr()) {
            BLOCKVAULT_LOG_ERROR(kComponent, "Key {} revoked in memory but not persisted: {}",
                key_id, commit.UnwrapErr().message);
        }
        BLOCKVAULT_LOG_WARN(kComponent, "Revoked key {}: {}", key_id, reason);
        return true;
    }

    Result<Unit, TransferFailure> KeyManager::RetireKey(const std::string& key_id) {
        const auto entry = FindEntry(key_id);
        if (!entry) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::NotFound(std::string(ErrorMessages::UNKNOWN_KEY) + key_id));
        }
        std::lock_guard state(entry->state_lock);
        const auto now = clock_->Now();
        const KeyStatus status = EffectiveStatus(entry->meta, now);
        if (status != KeyStatus::Active) {
            return Result<Unit, TransferFailure>::Err(TransferFailure::InvalidState(
                compat::format("Key {} is {} and cannot be retired", key_id, ToString(status))));
        }
        const ManagedKey previous = entry->meta;
        entry->meta.status = KeyStatus::Deprecated;
        entry->meta.deprecated_at = now;
        auto commit = CommitRecords({entry.get()}, {}, std::nullopt);
        if (commit.IsErr()) {
            entry->meta = previous;
            return commit;
        }
        BLOCKVAULT_LOG_INFO(kComponent, "Retired key {}", key_id);
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    size_t KeyManager::CleanupExpiredKeys() {
        std::vector<std::shared_ptr<KeyEntry>> entries;
        {
            std::shared_lock registry(registry_lock_);
            entries.reserve(keys_.size());
            for (const auto& [id, entry] : keys_) {
                entries.push_back(entry);
            }
        }

        const auto now = clock_->Now();
        size_t purged = 0;
        for (const auto& entry : entries) {
            std::string purged_id;
            {
                std::lock_guard state(entry->state_lock);
                ManagedKey& meta = entry->meta;
                if (meta.status != KeyStatus::Expired && EffectiveStatus(meta, now) == KeyStatus::Expired) {
                    const ManagedKey previous = meta;
                    meta.status = KeyStatus::Expired;
                    meta.expired_at = now;
                    if (auto commit = CommitRecords({entry.get()}, {}, std::nullopt); commit.IsErr()) {
                        meta = previous;
                        BLOCKVAULT_LOG_ERROR(kComponent, "Cannot persist expiry of {}: {}",
                            meta.key_id, commit.UnwrapErr().message);
                        continue;
                    }
                    BLOCKVAULT_LOG_INFO(kComponent, "Key {} expired; decrypt-only until purged", meta.key_id);
                }
                if (meta.status != KeyStatus::Expired) {
                    continue;
                }
                const TimePoint expired_at = meta.expired_at.value_or(now);
                if (expired_at + config_.GetKeyRetention() > now) {
                    continue;
                }
                if (auto commit = CommitRecords({}, {meta.key_id}, std::nullopt); commit.IsErr()) {
                    BLOCKVAULT_LOG_ERROR(kComponent, "Cannot purge key {}: {}",
                        meta.key_id, commit.UnwrapErr().message);
                    continue;
                }
                entry->material.reset();
                entry->sealed.Clear();
                purged_id = meta.key_id;
            }
            {
                std::unique_lock registry(registry_lock_);
                keys_.erase(purged_id);
            }
            ++purged;
            BLOCKVAULT_LOG_DEBUG(kComponent, "Purged key {}; material erased", purged_id);
        }
        if (purged > 0) {
            BLOCKVAULT_LOG_INFO(kComponent, "Cleanup purged {} expired keys", purged);
        }
        return purged;
    }

    // ========================================================================
    // Queries
    // ========================================================================

    std::optional<ManagedKey> KeyManager::GetKey(const std::string& key_id) const {
        const auto entry = FindEntry(key_id);
        if (!entry) {
            return std::nullopt;
        }
        std::lock_guard state(entry->state_lock);
        ManagedKey snapshot = entry->meta;
        snapshot.status = EffectiveStatus(snapshot, clock_->Now());
        return snapshot;
    }

    std::vector<ManagedKey> KeyManager::ListActiveKeys(const std::string& model_id) const {
        std::vector<std::shared_ptr<KeyEntry>> entries;
        {
            std::shared_lock registry(registry_lock_);
            for (const auto& [id, entry] : keys_) {
                entries.push_back(entry);
            }
        }
        const auto now = clock_->Now();
        std::vector<ManagedKey> active;
        for (const auto& entry : entries) {
            std::lock_guard state(entry->state_lock);
            if (EffectiveStatus(entry->meta, now) != KeyStatus::Active) {
                continue;
            }
            if (!model_id.empty() && entry->meta.model_id != model_id) {
                continue;
            }
            active.push_back(entry->meta);
        }
        std::sort(active.begin(), active.end(),
            [](const ManagedKey& a, const ManagedKey& b) { return a.created_at < b.created_at; });
        return active;
    }

    std::vector<KeyRotationEvent> KeyManager::GetRotationHistory(const std::string& key_id) const {
        std::lock_guard lock(persist_lock_);
        std::vector<KeyRotationEvent> history;
        for (const auto& record : events_) {
            if (record.old_key_id() == key_id || record.new_key_id() == key_id) {
                history.push_back(ReadEvent(record));
            }
        }
        return history;
    }

    bool KeyManager::IsRevoked(const std::string& key_id) const {
        std::shared_lock lock(revoked_lock_);
        return revoked_.contains(key_id);
    }

    Result<Unit, TransferFailure> KeyManager::ExecuteWithKey(
        const std::string& key_id,
        std::function<Result<Unit, TransferFailure>(std::span<const uint8_t>)> operation) {
        return LendKey(key_id, interfaces::KeyUsage::Encrypt, std::move(operation));
    }

    Result<Unit, TransferFailure> KeyManager::ExecuteWithKeyForDecrypt(
        const std::string& key_id,
        std::function<Result<Unit, TransferFailure>(std::span<const uint8_t>)> operation) {
        return LendKey(key_id, interfaces::KeyUsage::Decrypt, std::move(operation));
    }

    Result<Unit, TransferFailure> KeyManager::LendKey(
        const std::string& key_id,
        const interfaces::KeyUsage usage,
        const std::function<Result<Unit, TransferFailure>(std::span<const uint8_t>)>& operation) {
        if (IsRevoked(key_id)) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::KeyRevoked("Key " + key_id + " has been revoked"));
        }
        const auto entry = FindEntry(key_id);
        if (!entry) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::NotFound(std::string(ErrorMessages::UNKNOWN_KEY) + key_id));
        }

        std::shared_ptr<SecureMemoryHandle> material;
        std::string stored_fingerprint;
        bool bound = false;
        {
            std::lock_guard state(entry->state_lock);
            switch (EffectiveStatus(entry->meta, clock_->Now())) {
                case KeyStatus::Revoked:
                    return Result<Unit, TransferFailure>::Err(
                        TransferFailure::KeyRevoked("Key " + key_id + " has been revoked"));
                case KeyStatus::Expired:
                    if (usage != interfaces::KeyUsage::Decrypt || !entry->material) {
                        return Result<Unit, TransferFailure>::Err(
                            TransferFailure::KeyExpired("Key " + key_id + " has expired"));
                    }
                    break;
                case KeyStatus::Active:
                case KeyStatus::Rotating:
                case KeyStatus::Deprecated:
                    break;
            }
            if (!entry->material || entry->material->IsInvalid()) {
                return Result<Unit, TransferFailure>::Err(
                    TransferFailure::InvalidState("Key " + key_id + " has no material"));
            }
            material = entry->material;
            stored_fingerprint = entry->meta.hardware_fingerprint;
            bound = entry->meta.IsHardwareBound();
        }

        if (bound) {
            auto current = CurrentFingerprint();
            if (current.IsErr()) {
                return Result<Unit, TransferFailure>::Err(TransferFailure::HardwareMismatch(
                    "Cannot verify hardware binding of " + key_id + ": " + current.UnwrapErr().message));
            }
            if (!FingerprintsMatch(stored_fingerprint, current.Unwrap())) {
                BLOCKVAULT_LOG_WARN(kComponent, "Refusing key {} on foreign hardware", key_id);
                return Result<Unit, TransferFailure>::Err(TransferFailure::HardwareMismatch(
                    "Key " + key_id + " is bound to different hardware"));
            }
        }

        {
            std::lock_guard state(entry->state_lock);
            entry->meta.last_used_at = clock_->Now();
            ++entry->meta.usage_count;
        }

        auto result = material->WithReadAccess([&](std::span<const uint8_t> key) {
            return operation(key);
        });
        if (result.IsErr()) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(result.UnwrapErr()));
        }
        if (IsRevoked(key_id)) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::KeyRevoked("Key " + key_id + " was revoked during use"));
        }
        return std::move(result).Unwrap();
    }

    // ========================================================================
    // Distribution
    // ========================================================================

    Result<proto::keys::KeyDistributionPackage, TransferFailure> KeyManager::ExportForDistribution(
        const std::string& key_id,
        const std::string& recipient_id,
        std::span<const uint8_t> wrap_secret) {
        if (recipient_id.empty() || wrap_secret.size() < kMinWrapSecretBytes) {
            return Result<proto::keys::KeyDistributionPackage, TransferFailure>::Err(
                TransferFailure::InvalidInput("Distribution needs a recipient and a 16+ byte wrapping secret"));
        }
        if (IsRevoked(key_id)) {
            return Result<proto::keys::KeyDistributionPackage, TransferFailure>::Err(
                TransferFailure::KeyRevoked("Key " + key_id + " has been revoked"));
        }
        const auto entry = FindEntry(key_id);
        if (!entry) {
            return Result<proto::keys::KeyDistributionPackage, TransferFailure>::Err(
                TransferFailure::NotFound(std::string(ErrorMessages::UNKNOWN_KEY) + key_id));
        }

        std::shared_ptr<SecureMemoryHandle> material;
        ManagedKey meta;
        {
            std::lock_guard state(entry->state_lock);
            meta = entry->meta;
            meta.status = EffectiveStatus(meta, clock_->Now());
            material = entry->material;
        }
        if (IsTerminal(meta.status) || !material) {
            return Result<proto::keys::KeyDistributionPackage, TransferFailure>::Err(
                TransferFailure::KeyExpired("Key " + key_id + " is no longer usable"));
        }

        const auto salt = SodiumInterop::GetRandomBytes(kKeySaltBytes);
        auto wrap_key = DeriveWrapKey(wrap_secret, salt, recipient_id);
        if (wrap_key.IsErr()) {
            return Result<proto::keys::KeyDistributionPackage, TransferFailure>::Err(wrap_key.UnwrapErr());
        }
        const std::string aad = DistributionAad(key_id, recipient_id);
        auto sealed = KeyStore::SealWithKey(wrap_key.Unwrap(), AsBytes(aad), *material);
        { auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(wrap_key.Unwrap())); (void)_wipe; }
        if (sealed.IsErr()) {
            return Result<proto::keys::KeyDistributionPackage, TransferFailure>::Err(sealed.UnwrapErr());
        }

        proto::keys::KeyDistributionPackage package;
        package.set_recipient_id(recipient_id);
        WriteMetadata(meta, package.mutable_metadata());
        *package.mutable_wrapped_key() = std::move(sealed).Unwrap();
        package.set_wrap_salt(salt.data(), salt.size());
        SetTimestamp(package.mutable_created_at(), clock_->Now());
        BLOCKVAULT_LOG_INFO(kComponent, "Exported key {} for {}", key_id, recipient_id);
        return Result<proto::keys::KeyDistributionPackage, TransferFailure>::Ok(std::move(package));
    }

    Result<ManagedKey, TransferFailure> KeyManager::ImportDistributedKey(
        const proto::keys::KeyDistributionPackage& package,
        std::span<const uint8_t> wrap_secret) {
        if (package.metadata().key_id().empty() || wrap_secret.empty()) {
            return Result<ManagedKey, TransferFailure>::Err(
                TransferFailure::InvalidInput("Distribution package has no key id"));
        }
        ManagedKey meta = ReadMetadata(package.metadata());
        if (IsTerminal(meta.status) || meta.status == KeyStatus::Rotating) {
            return Result<ManagedKey, TransferFailure>::Err(TransferFailure::InvalidInput(
                compat::format("Cannot import a {} key", ToString(meta.status))));
        }
        if (IsRevoked(meta.key_id)) {
            return Result<ManagedKey, TransferFailure>::Err(
                TransferFailure::KeyRevoked("Key " + meta.key_id + " has been revoked"));
        }

        auto wrap_key = DeriveWrapKey(wrap_secret, AsBytes(package.wrap_salt()), package.recipient_id());
        if (wrap_key.IsErr()) {
            return Result<ManagedKey, TransferFailure>::Err(wrap_key.UnwrapErr());
        }
        const std::string aad = DistributionAad(meta.key_id, package.recipient_id());
        auto material = KeyStore::UnsealWithKey(wrap_key.Unwrap(), AsBytes(aad), package.wrapped_key());
        { auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(wrap_key.Unwrap())); (void)_wipe; }
        if (material.IsErr()) {
            BLOCKVAULT_LOG_WARN(kComponent, "Rejected distribution package for {}: {}",
                meta.key_id, material.UnwrapErr().message);
            return Result<ManagedKey, TransferFailure>::Err(material.UnwrapErr());
        }

        meta.origin = KeyOrigin::Imported;
        meta.hardware_fingerprint.clear();
        meta.usage_count = 0;
        meta.last_used_at.reset();

        auto entry = BuildEntry(std::move(meta), std::move(material).Unwrap(), {}, {});
        if (entry.IsErr()) {
            return Result<ManagedKey, TransferFailure>::Err(entry.UnwrapErr());
        }
        auto inserted = InsertNewKey(std::move(entry).Unwrap());
        if (inserted.IsOk()) {
            BLOCKVAULT_LOG_INFO(kComponent, "Imported key {} from distribution package", inserted.Unwrap().key_id);
        }
        return inserted;
    }

}
