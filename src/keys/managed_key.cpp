#include "blockvault/keys/managed_key.hpp"
#include "blockvault/crypto/sodium_interop.hpp"
#include "blockvault/transfer/constants.hpp"

namespace blockvault::keys {

    namespace {
        proto::keys::KeyStatus ToProto(const KeyStatus status) {
            switch (status) {
                case KeyStatus::Active: return proto::keys::KEY_STATUS_ACTIVE;
                case KeyStatus::Rotating: return proto::keys::KEY_STATUS_ROTATING;
                case KeyStatus::Deprecated: return proto::keys::KEY_STATUS_DEPRECATED;
                case KeyStatus::Expired: return proto::keys::KEY_STATUS_EXPIRED;
                case KeyStatus::Revoked: return proto::keys::KEY_STATUS_REVOKED;
            }
            return proto::keys::KEY_STATUS_REVOKED;
        }

        KeyStatus FromProto(const proto::keys::KeyStatus status) {
            switch (status) {
                case proto::keys::KEY_STATUS_ACTIVE: return KeyStatus::Active;
                case proto::keys::KEY_STATUS_ROTATING: return KeyStatus::Rotating;
                case proto::keys::KEY_STATUS_DEPRECATED: return KeyStatus::Deprecated;
                case proto::keys::KEY_STATUS_EXPIRED: return KeyStatus::Expired;
                case proto::keys::KEY_STATUS_REVOKED: return KeyStatus::Revoked;
                default: return KeyStatus::Revoked;
            }
        }

        proto::keys::KeyOrigin ToProto(const KeyOrigin origin) {
            switch (origin) {
                case KeyOrigin::HardwareBound: return proto::keys::KEY_ORIGIN_HARDWARE_BOUND;
                case KeyOrigin::Random: return proto::keys::KEY_ORIGIN_RANDOM;
                case KeyOrigin::Imported: return proto::keys::KEY_ORIGIN_IMPORTED;
            }
            return proto::keys::KEY_ORIGIN_RANDOM;
        }

        KeyOrigin FromProto(const proto::keys::KeyOrigin origin) {
            switch (origin) {
                case proto::keys::KEY_ORIGIN_HARDWARE_BOUND: return KeyOrigin::HardwareBound;
                case proto::keys::KEY_ORIGIN_IMPORTED: return KeyOrigin::Imported;
                default: return KeyOrigin::Random;
            }
        }

        proto::keys::RotationStatus ToProto(const RotationStatus status) {
            switch (status) {
                case RotationStatus::InProgress: return proto::keys::ROTATION_IN_PROGRESS;
                case RotationStatus::Completed: return proto::keys::ROTATION_COMPLETED;
                case RotationStatus::Failed: return proto::keys::ROTATION_FAILED;
            }
            return proto::keys::ROTATION_FAILED;
        }

        RotationStatus FromProto(const proto::keys::RotationStatus status) {
            switch (status) {
                case proto::keys::ROTATION_IN_PROGRESS: return RotationStatus::InProgress;
                case proto::keys::ROTATION_COMPLETED: return RotationStatus::Completed;
                default: return RotationStatus::Failed;
            }
        }
    }

    std::string GenerateKeyId(const std::string_view model_id) {
        std::string id = model_id.empty() ? std::string("key") : std::string(model_id);
        id.push_back('_');
        id += crypto::SodiumInterop::GetRandomHex(kKeyIdSuffixBytes);
        return id;
    }

    void WriteMetadata(const ManagedKey& key, proto::keys::KeyRecord* record) {
        record->set_key_id(key.key_id);
        record->set_status(ToProto(key.status));
        record->set_origin(ToProto(key.origin));
        auto* context = record->mutable_context();
        context->set_model_id(key.model_id);
        context->mutable_labels()->clear();
        for (const auto& [name, value] : key.labels) {
            (*context->mutable_labels())[name] = value;
        }
        record->set_hardware_fingerprint(key.hardware_fingerprint);
        record->set_predecessor_id(key.predecessor_id);
        record->set_successor_id(key.successor_id);
        record->set_generation(key.generation);
        SetTimestamp(record->mutable_created_at(), key.created_at);

        record->clear_expires_at();
        record->clear_last_used_at();
        record->clear_deprecated_at();
        record->clear_revoked_at();
        record->clear_expired_at();
        if (key.expires_at) SetTimestamp(record->mutable_expires_at(), *key.expires_at);
        if (key.last_used_at) SetTimestamp(record->mutable_last_used_at(), *key.last_used_at);
        if (key.deprecated_at) SetTimestamp(record->mutable_deprecated_at(), *key.deprecated_at);
        if (key.revoked_at) SetTimestamp(record->mutable_revoked_at(), *key.revoked_at);
        if (key.expired_at) SetTimestamp(record->mutable_expired_at(), *key.expired_at);

        record->set_revocation_reason(key.revocation_reason);
        record->set_usage_count(key.usage_count);
    }

    ManagedKey ReadMetadata(const proto::keys::KeyRecord& record) {
        ManagedKey key;
        key.key_id = record.key_id();
        key.status = FromProto(record.status());
        key.origin = FromProto(record.origin());
        key.model_id = record.context().model_id();
        for (const auto& [name, value] : record.context().labels()) {
            key.labels.emplace(name, value);
        }
        key.hardware_fingerprint = record.hardware_fingerprint();
        key.predecessor_id = record.predecessor_id();
        key.successor_id = record.successor_id();
        key.generation = record.generation();
        key.created_at = FromTimestamp(record.created_at());
        key.expires_at = FromOptionalTimestamp(record.has_expires_at(), record.expires_at());
        key.last_used_at = FromOptionalTimestamp(record.has_last_used_at(), record.last_used_at());
        key.deprecated_at = FromOptionalTimestamp(record.has_deprecated_at(), record.deprecated_at());
        key.revoked_at = FromOptionalTimestamp(record.has_revoked_at(), record.revoked_at());
        key.expired_at = FromOptionalTimestamp(record.has_expired_at(), record.expired_at());
        key.revocation_reason = record.revocation_reason();
        key.usage_count = record.usage_count();
        return key;
    }

    void WriteEvent(const KeyRotationEvent& event, proto::keys::RotationEvent* record) {
        record->set_event_id(event.event_id);
        record->set_old_key_id(event.old_key_id);
        record->set_new_key_id(event.new_key_id);
        SetTimestamp(record->mutable_occurred_at(), event.occurred_at);
        record->set_status(ToProto(event.status));
        record->clear_notified_targets();
        for (const auto& target : event.notified_targets) {
            record->add_notified_targets(target);
        }
        record->set_reason(event.reason);
        record->set_error(event.error);
    }

    KeyRotationEvent ReadEvent(const proto::keys::RotationEvent& record) {
        KeyRotationEvent event;
        event.event_id = record.event_id();
        event.old_key_id = record.old_key_id();
        event.new_key_id = record.new_key_id();
        event.occurred_at = FromTimestamp(record.occurred_at());
        event.status = FromProto(record.status());
        event.notified_targets.assign(record.notified_targets().begin(), record.notified_targets().end());
        event.reason = record.reason();
        event.error = record.error();
        return event;
    }

}
