#pragma once
#include "blockvault/core/failures.hpp"
#include "blockvault/core/timestamp.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blockvault::transfer {

enum class SessionStatus {
    Created,
    Active,
    Paused,
    Completed,
    Failed,
    Cancelled
};

enum class BlockStatus {
    Pending,
    InFlight,
    Verifying,
    Completed,
    Failed
};

[[nodiscard]] constexpr std::string_view ToString(const SessionStatus status) noexcept {
    switch (status) {
        case SessionStatus::Created: return "Created";
        case SessionStatus::Active: return "Active";
        case SessionStatus::Paused: return "Paused";
        case SessionStatus::Completed: return "Completed";
        case SessionStatus::Failed: return "Failed";
        case SessionStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

[[nodiscard]] constexpr std::string_view ToString(const BlockStatus status) noexcept {
    switch (status) {
        case BlockStatus::Pending: return "Pending";
        case BlockStatus::InFlight: return "InFlight";
        case BlockStatus::Verifying: return "Verifying";
        case BlockStatus::Completed: return "Completed";
        case BlockStatus::Failed: return "Failed";
    }
    return "Unknown";
}

[[nodiscard]] constexpr bool IsTerminal(const SessionStatus status) noexcept {
    return status == SessionStatus::Completed || status == SessionStatus::Cancelled;
}

/**
 * @brief Allowed session transitions
 *
 * @code
 *   Created -> Active <-> Paused -> ...
 *   Active  -> Completed
 *   any non-terminal -> Failed | Cancelled
 *   Failed  -> Active (resume)
 * @endcode
 */
[[nodiscard]] constexpr bool CanTransition(const SessionStatus from, const SessionStatus to) noexcept {
    if (IsTerminal(from) || from == to) {
        return false;
    }
    switch (to) {
        case SessionStatus::Created:
            return false;
        case SessionStatus::Active:
            return from == SessionStatus::Created ||
                   from == SessionStatus::Paused ||
                   from == SessionStatus::Failed;
        case SessionStatus::Paused:
            return from == SessionStatus::Created || from == SessionStatus::Active;
        case SessionStatus::Completed:
            return from == SessionStatus::Active;
        case SessionStatus::Failed:
        case SessionStatus::Cancelled:
            return true;
    }
    return false;
}

[[nodiscard]] constexpr bool CanTransition(const BlockStatus from, const BlockStatus to) noexcept {
    switch (to) {
        case BlockStatus::Pending:
            return from == BlockStatus::InFlight ||
                   from == BlockStatus::Verifying ||
                   from == BlockStatus::Failed;
        case BlockStatus::InFlight:
            return from == BlockStatus::Pending || from == BlockStatus::Verifying;
        case BlockStatus::Verifying:
            return from == BlockStatus::InFlight;
        case BlockStatus::Completed:
            return from == BlockStatus::Verifying;
        case BlockStatus::Failed:
            return from == BlockStatus::InFlight || from == BlockStatus::Verifying;
    }
    return false;
}

/// Snapshot of one block's transfer state.
struct BlockTransferInfo {
    uint32_t index = 0;
    uint64_t offset = 0;
    uint64_t size = 0;
    std::vector<uint8_t> digest;
    BlockStatus status = BlockStatus::Pending;
    uint32_t retry_count = 0;
    std::optional<TransferFailure> last_error;
    std::optional<TimePoint> last_attempt_at;
    std::optional<TimePoint> completed_at;
};

/// What callers see of a session.
struct SessionReport {
    std::string session_id;
    std::string artifact_id;
    std::string source_id;
    std::string sink_id;
    std::string key_id;
    SessionStatus status = SessionStatus::Created;
    std::optional<TransferFailure> failure;
    uint32_t completed_blocks = 0;
    uint32_t total_blocks = 0;
    uint64_t completed_bytes = 0;
    uint64_t total_bytes = 0;
    uint32_t resume_count = 0;
    TimePoint created_at{};
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;

    /// Completed blocks over total, 0-100. An empty session is 100.
    [[nodiscard]] double Progress() const noexcept {
        if (total_blocks == 0) {
            return 100.0;
        }
        return static_cast<double>(completed_blocks) * 100.0 / static_cast<double>(total_blocks);
    }
};

struct TransferStatistics {
    uint64_t sessions_started = 0;
    uint64_t sessions_completed = 0;
    uint64_t sessions_failed = 0;
    uint64_t sessions_cancelled = 0;
    uint64_t blocks_transferred = 0;
    uint64_t bytes_transferred = 0;
    uint64_t retry_attempts = 0;
    uint64_t integrity_failures = 0;
};

/// Wire value of a TransferFailureType, as carried in DeliveryAck.failure_kind.
[[nodiscard]] constexpr std::optional<TransferFailureType> FailureTypeFromWire(const uint32_t value) noexcept {
    if (value > static_cast<uint32_t>(TransferFailureType::Cancelled)) {
        return std::nullopt;
    }
    return static_cast<TransferFailureType>(value);
}

}  // namespace blockvault::transfer
