#pragma once
#include "blockvault/core/timestamp.hpp"
#include "keys/key_store.pb.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blockvault::keys {

enum class KeyStatus : uint8_t {
    Active,
    Rotating,
    Deprecated,
    Expired,
    Revoked
};

enum class KeyOrigin : uint8_t {
    HardwareBound,
    Random,
    Imported
};

enum class RotationStatus : uint8_t {
    InProgress,
    Completed,
    Failed
};

/// What a key is for. @c secret feeds hardware-bound derivation only and
/// is never stored or copied into a ManagedKey.
struct KeyContext {
    std::string model_id;
    std::string secret;
    std::map<std::string, std::string> labels;
};

/// Metadata snapshot of a key owned by KeyManager. Never carries material.
struct ManagedKey {
    std::string key_id;
    KeyStatus status = KeyStatus::Active;
    KeyOrigin origin = KeyOrigin::Random;
    std::string model_id;
    std::map<std::string, std::string> labels;

    std::string hardware_fingerprint;

    std::string predecessor_id;
    std::string successor_id;
    uint32_t generation = 1;

    TimePoint created_at{};
    std::optional<TimePoint> expires_at;
    std::optional<TimePoint> last_used_at;
    std::optional<TimePoint> deprecated_at;
    std::optional<TimePoint> revoked_at;
    std::optional<TimePoint> expired_at;
    std::string revocation_reason;
    uint64_t usage_count = 0;

    [[nodiscard]] bool IsHardwareBound() const noexcept {
        return origin == KeyOrigin::HardwareBound;
    }
};

struct KeyRotationEvent {
    std::string event_id;
    std::string old_key_id;
    std::string new_key_id;
    TimePoint occurred_at{};
    RotationStatus status = RotationStatus::InProgress;
    std::vector<std::string> notified_targets;
    std::string reason;
    std::string error;
};

[[nodiscard]] constexpr bool IsTerminal(const KeyStatus status) noexcept {
    return status == KeyStatus::Expired || status == KeyStatus::Revoked;
}

/// Forward-only lifecycle: Active -> Rotating -> Deprecated -> Expired,
/// skips allowed, Revoked from any non-terminal state. Rotating may fall
/// back to Active when a staged rotation is abandoned.
[[nodiscard]] constexpr bool CanTransition(const KeyStatus from, const KeyStatus to) noexcept {
    if (IsTerminal(from)) {
        return false;
    }
    if (to == KeyStatus::Revoked) {
        return true;
    }
    if (from == KeyStatus::Rotating && to == KeyStatus::Active) {
        return true;
    }
    return static_cast<uint8_t>(to) > static_cast<uint8_t>(from);
}

[[nodiscard]] constexpr std::string_view ToString(const KeyStatus status) noexcept {
    switch (status) {
        case KeyStatus::Active: return "Active";
        case KeyStatus::Rotating: return "Rotating";
        case KeyStatus::Deprecated: return "Deprecated";
        case KeyStatus::Expired: return "Expired";
        case KeyStatus::Revoked: return "Revoked";
    }
    return "Unknown";
}

[[nodiscard]] constexpr std::string_view ToString(const KeyOrigin origin) noexcept {
    switch (origin) {
        case KeyOrigin::HardwareBound: return "HardwareBound";
        case KeyOrigin::Random: return "Random";
        case KeyOrigin::Imported: return "Imported";
    }
    return "Unknown";
}

/// "<model_id>_<8 hex chars>", or "key_<8 hex chars>" without a model id.
[[nodiscard]] std::string GenerateKeyId(std::string_view model_id);

// Conversions to and from the persisted records. Material and KDF fields
// are owned by KeyManager and left untouched here.
void WriteMetadata(const ManagedKey& key, proto::keys::KeyRecord* record);
[[nodiscard]] ManagedKey ReadMetadata(const proto::keys::KeyRecord& record);

void WriteEvent(const KeyRotationEvent& event, proto::keys::RotationEvent* record);
[[nodiscard]] KeyRotationEvent ReadEvent(const proto::keys::RotationEvent& record);

}  // namespace blockvault::keys
