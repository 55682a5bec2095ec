#pragma once
#include "blockvault/core/failures.hpp"
#include "blockvault/core/result.hpp"
#include "blockvault/core/timestamp.hpp"
#include "blockvault/interfaces/i_block_io.hpp"
#include "blockvault/transfer/nonce.hpp"
#include "blockvault/transfer/transfer_types.hpp"
#include "transfer/session_state.pb.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace blockvault::transfer {

/// State of one artifact transfer.
///
/// The persisted SessionRecord is the state: every mutation happens on it
/// under the session lock, so ExportState() always yields a resumable
/// snapshot. Blocks are addressed by their position in the record, which
/// equals ascending index order.
///
/// Thread Safety: all public methods are thread-safe.
class TransferSession {
public:
    struct Parameters {
        std::string session_id;
        std::string artifact_id;
        std::string source_id;
        std::string sink_id;
        std::string key_id;
        std::vector<interfaces::BlockDescriptor> blocks;
        uint32_t max_resume_attempts = 0;
    };

    [[nodiscard]] static Result<std::unique_ptr<TransferSession>, TransferFailure> Create(
        Parameters parameters,
        TimePoint now);

    [[nodiscard]] static Result<std::unique_ptr<TransferSession>, TransferFailure> FromState(
        const proto::transfer::SessionRecord& record);

    [[nodiscard]] proto::transfer::SessionRecord ExportState() const;

    /// After a restart nothing is running: Created and Active become
    /// Paused, InFlight and Verifying blocks go back to Pending.
    /// Returns true when anything changed.
    bool RecoverAfterRestart();

    [[nodiscard]] const std::string& Id() const noexcept { return session_id_; }
    [[nodiscard]] size_t BlockCount() const noexcept { return block_count_; }
    [[nodiscard]] std::string KeyId() const;
    [[nodiscard]] SessionStatus Status() const;
    [[nodiscard]] uint32_t ResumeCount() const;
    [[nodiscard]] uint32_t MaxResumeAttempts() const;
    [[nodiscard]] std::optional<TransferFailure> Failure() const;
    [[nodiscard]] std::optional<TimePoint> FinishedAt() const;

    // ========================================================================
    // Session transitions
    // ========================================================================

    [[nodiscard]] Result<Unit, TransferFailure> Transition(SessionStatus to, TimePoint now);

    /// Moves to Failed and records @p failure as the session's reason.
    [[nodiscard]] Result<Unit, TransferFailure> Fail(const TransferFailure& failure, TimePoint now);

    /**
     * @brief Prepare a Paused or Failed session for another run
     *
     * Failed blocks return to Pending with a fresh retry budget, the
     * failure reason is cleared and the resume count grows by one.
     * Completed blocks are left alone.
     *
     * @return Number of blocks reset
     */
    [[nodiscard]] Result<uint32_t, TransferFailure> PrepareResume();

    /// Points the session at another key. Not allowed while Active.
    [[nodiscard]] Result<Unit, TransferFailure> ReplaceKey(const std::string& key_id);

    // ========================================================================
    // Block transitions
    // ========================================================================

    /// Lowest-index Pending block, moved to InFlight. nullopt when none is left.
    [[nodiscard]] std::optional<size_t> ClaimNextBlock(TimePoint now);

    [[nodiscard]] interfaces::BlockDescriptor Descriptor(size_t position) const;

    /// Next AES-GCM nonce for the block at @p position.
    [[nodiscard]] Result<std::vector<uint8_t>, TransferFailure> NextNonce(size_t position);

    [[nodiscard]] Result<Unit, TransferFailure> MarkVerifying(size_t position);

    [[nodiscard]] Result<Unit, TransferFailure> MarkCompleted(size_t position, TimePoint now);

    /// Counts a failed attempt; a Verifying block goes back to InFlight.
    /// @return Retry count after the increment
    [[nodiscard]] Result<uint32_t, TransferFailure> RecordAttemptFailure(
        size_t position,
        const TransferFailure& failure,
        TimePoint now);

    [[nodiscard]] Result<Unit, TransferFailure> MarkBlockFailed(size_t position, const TransferFailure& failure);

    /// Hands an unfinished block back, e.g. when the session pauses mid-attempt.
    [[nodiscard]] Result<Unit, TransferFailure> ReturnToPending(size_t position);

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] bool AllBlocksCompleted() const;
    [[nodiscard]] double Progress() const;
    [[nodiscard]] BlockTransferInfo GetBlock(size_t position) const;
    [[nodiscard]] std::vector<BlockTransferInfo> GetBlocks() const;
    [[nodiscard]] SessionReport Report() const;

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;
    TransferSession(TransferSession&&) noexcept = delete;
    TransferSession& operator=(TransferSession&&) noexcept = delete;
    ~TransferSession() = default;

private:
    TransferSession(proto::transfer::SessionRecord state, NonceGenerator nonce);

    [[nodiscard]] Result<Unit, TransferFailure> TransitionLocked(SessionStatus to, TimePoint now);
    [[nodiscard]] Result<Unit, TransferFailure> MoveBlock(size_t position, BlockStatus to);
    [[nodiscard]] uint32_t CompletedBlocksLocked() const;

    const std::string session_id_;
    const size_t block_count_;
    proto::transfer::SessionRecord state_{};
    NonceGenerator nonce_;
    mutable std::mutex lock_;
};

}  // namespace blockvault::transfer
