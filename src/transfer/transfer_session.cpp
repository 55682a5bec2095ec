#include "blockvault/transfer/transfer_session.hpp"
#include "blockvault/transfer/constants.hpp"

#include <utility>

namespace blockvault::transfer {

    namespace {
        proto::transfer::SessionStatus ToProto(const SessionStatus status) {
            switch (status) {
                case SessionStatus::Created: return proto::transfer::SESSION_CREATED;
                case SessionStatus::Active: return proto::transfer::SESSION_ACTIVE;
                case SessionStatus::Paused: return proto::transfer::SESSION_PAUSED;
                case SessionStatus::Completed: return proto::transfer::SESSION_COMPLETED;
                case SessionStatus::Failed: return proto::transfer::SESSION_FAILED;
                case SessionStatus::Cancelled: return proto::transfer::SESSION_CANCELLED;
            }
            return proto::transfer::SESSION_CREATED;
        }

        SessionStatus FromProto(const proto::transfer::SessionStatus status) {
            switch (status) {
                case proto::transfer::SESSION_CREATED: return SessionStatus::Created;
                case proto::transfer::SESSION_ACTIVE: return SessionStatus::Active;
                case proto::transfer::SESSION_PAUSED: return SessionStatus::Paused;
                case proto::transfer::SESSION_COMPLETED: return SessionStatus::Completed;
                case proto::transfer::SESSION_FAILED: return SessionStatus::Failed;
                case proto::transfer::SESSION_CANCELLED: return SessionStatus::Cancelled;
                default: break;
            }
            return SessionStatus::Failed;
        }

        proto::transfer::BlockStatus ToProto(const BlockStatus status) {
            switch (status) {
                case BlockStatus::Pending: return proto::transfer::BLOCK_PENDING;
                case BlockStatus::InFlight: return proto::transfer::BLOCK_IN_FLIGHT;
                case BlockStatus::Verifying: return proto::transfer::BLOCK_VERIFYING;
                case BlockStatus::Completed: return proto::transfer::BLOCK_COMPLETED;
                case BlockStatus::Failed: return proto::transfer::BLOCK_FAILED;
            }
            return proto::transfer::BLOCK_PENDING;
        }

        BlockStatus FromProto(const proto::transfer::BlockStatus status) {
            switch (status) {
                case proto::transfer::BLOCK_PENDING: return BlockStatus::Pending;
                case proto::transfer::BLOCK_IN_FLIGHT: return BlockStatus::InFlight;
                case proto::transfer::BLOCK_VERIFYING: return BlockStatus::Verifying;
                case proto::transfer::BLOCK_COMPLETED: return BlockStatus::Completed;
                case proto::transfer::BLOCK_FAILED: return BlockStatus::Failed;
                default: break;
            }
            return BlockStatus::Failed;
        }

        std::string FailureText(const TransferFailure& failure) {
            return failure.message.empty() ? std::string(ToString(failure.type)) : failure.message;
        }

        std::optional<TransferFailure> LoadFailure(const uint32_t kind, const std::string& message) {
            if (message.empty()) {
                return std::nullopt;
            }
            const auto type = FailureTypeFromWire(kind).value_or(TransferFailureType::Generic);
            return TransferFailure(type, message);
        }

        BlockTransferInfo ToInfo(const proto::transfer::BlockState& block) {
            BlockTransferInfo info;
            info.index = block.index();
            info.offset = block.offset();
            info.size = block.size();
            info.digest.assign(block.digest().begin(), block.digest().end());
            info.status = FromProto(block.status());
            info.retry_count = block.retry_count();
            info.last_error = LoadFailure(block.last_error_kind(), block.last_error());
            info.last_attempt_at = FromOptionalTimestamp(block.has_last_attempt_at(), block.last_attempt_at());
            info.completed_at = FromOptionalTimestamp(block.has_completed_at(), block.completed_at());
            return info;
        }

        Result<Unit, TransferFailure> ValidateBlocks(
            const google::protobuf::RepeatedPtrField<proto::transfer::BlockState>& blocks) {
            if (blocks.empty()) {
                return Result<Unit, TransferFailure>::Err(
                    TransferFailure::InvalidInput("Session has no blocks"));
            }
            for (int i = 0; i < blocks.size(); ++i) {
                const auto& block = blocks.Get(i);
                if (i > 0 && block.index() <= blocks.Get(i - 1).index()) {
                    return Result<Unit, TransferFailure>::Err(
                        TransferFailure::InvalidInput("Block indices must be unique and ascending"));
                }
                if (block.digest().size() != kDigestBytes) {
                    return Result<Unit, TransferFailure>::Err(
                        TransferFailure::InvalidInput(
                            "Block " + std::to_string(block.index()) + " has an invalid digest size"));
                }
                if (block.size() == 0) {
                    return Result<Unit, TransferFailure>::Err(
                        TransferFailure::InvalidInput(
                            "Block " + std::to_string(block.index()) + " is empty"));
                }
            }
            return Result<Unit, TransferFailure>::Ok(unit);
        }
    }

    TransferSession::TransferSession(proto::transfer::SessionRecord state, NonceGenerator nonce)
        : session_id_(state.session_id())
        , block_count_(static_cast<size_t>(state.blocks_size()))
        , state_(std::move(state))
        , nonce_(std::move(nonce)) {
    }

    Result<std::unique_ptr<TransferSession>, TransferFailure> TransferSession::Create(
        Parameters parameters,
        const TimePoint now) {
        if (parameters.session_id.empty() || parameters.key_id.empty()) {
            return Result<std::unique_ptr<TransferSession>, TransferFailure>::Err(
                TransferFailure::InvalidInput("Session id and key id are required"));
        }
        if (parameters.artifact_id.empty()) {
            return Result<std::unique_ptr<TransferSession>, TransferFailure>::Err(
                TransferFailure::InvalidInput("Artifact id is required"));
        }

        proto::transfer::SessionRecord record;
        record.set_version(kStateFormatVersion);
        record.set_session_id(parameters.session_id);
        record.set_artifact_id(std::move(parameters.artifact_id));
        record.set_source_id(std::move(parameters.source_id));
        record.set_sink_id(std::move(parameters.sink_id));
        record.set_key_id(std::move(parameters.key_id));
        record.set_status(proto::transfer::SESSION_CREATED);
        record.set_max_resume_attempts(parameters.max_resume_attempts);
        SetTimestamp(record.mutable_created_at(), now);
        for (const auto& descriptor : parameters.blocks) {
            auto* block = record.add_blocks();
            block->set_index(descriptor.index);
            block->set_offset(descriptor.offset);
            block->set_size(descriptor.size);
            block->set_digest(descriptor.digest.data(), descriptor.digest.size());
            block->set_status(proto::transfer::BLOCK_PENDING);
        }
        if (auto valid = ValidateBlocks(record.blocks()); valid.IsErr()) {
            return Result<std::unique_ptr<TransferSession>, TransferFailure>::Err(valid.UnwrapErr());
        }

        auto nonce_result = NonceGenerator::Create(record.session_id());
        if (nonce_result.IsErr()) {
            return Result<std::unique_ptr<TransferSession>, TransferFailure>::Err(nonce_result.UnwrapErr());
        }
        return Result<std::unique_ptr<TransferSession>, TransferFailure>::Ok(
            std::unique_ptr<TransferSession>(
                new TransferSession(std::move(record), std::move(nonce_result).Unwrap())));
    }

    Result<std::unique_ptr<TransferSession>, TransferFailure> TransferSession::FromState(
        const proto::transfer::SessionRecord& record) {
        if (record.version() != kStateFormatVersion) {
            return Result<std::unique_ptr<TransferSession>, TransferFailure>::Err(
                TransferFailure::Decode("Unsupported session record version"));
        }
        if (record.session_id().empty() || record.key_id().empty()) {
            return Result<std::unique_ptr<TransferSession>, TransferFailure>::Err(
                TransferFailure::Decode("Session record lacks its session or key id"));
        }
        if (!proto::transfer::SessionStatus_IsValid(record.status())) {
            return Result<std::unique_ptr<TransferSession>, TransferFailure>::Err(
                TransferFailure::Decode("Session record has an unknown status"));
        }
        for (const auto& block : record.blocks()) {
            if (!proto::transfer::BlockStatus_IsValid(block.status())) {
                return Result<std::unique_ptr<TransferSession>, TransferFailure>::Err(
                    TransferFailure::Decode("Session record has an unknown block status"));
            }
        }
        if (auto valid = ValidateBlocks(record.blocks()); valid.IsErr()) {
            return Result<std::unique_ptr<TransferSession>, TransferFailure>::Err(
                TransferFailure::Decode(valid.UnwrapErr().message));
        }

        auto nonce_result = NonceGenerator::Resume(record.session_id(), record.nonce_counter());
        if (nonce_result.IsErr()) {
            return Result<std::unique_ptr<TransferSession>, TransferFailure>::Err(nonce_result.UnwrapErr());
        }
        return Result<std::unique_ptr<TransferSession>, TransferFailure>::Ok(
            std::unique_ptr<TransferSession>(
                new TransferSession(record, std::move(nonce_result).Unwrap())));
    }

    proto::transfer::SessionRecord TransferSession::ExportState() const {
        std::lock_guard<std::mutex> guard(lock_);
        proto::transfer::SessionRecord copy = state_;
        copy.set_nonce_counter(nonce_.ExportState().counter);
        return copy;
    }

    bool TransferSession::RecoverAfterRestart() {
        std::lock_guard<std::mutex> guard(lock_);
        bool changed = false;
        const auto status = FromProto(state_.status());
        if (status == SessionStatus::Created || status == SessionStatus::Active) {
            state_.set_status(proto::transfer::SESSION_PAUSED);
            changed = true;
        }
        for (auto& block : *state_.mutable_blocks()) {
            const auto block_status = FromProto(block.status());
            if (block_status == BlockStatus::InFlight || block_status == BlockStatus::Verifying) {
                block.set_status(proto::transfer::BLOCK_PENDING);
                changed = true;
            }
        }
        return changed;
    }

    std::string TransferSession::KeyId() const {
        std::lock_guard<std::mutex> guard(lock_);
        return state_.key_id();
    }

    SessionStatus TransferSession::Status() const {
        std::lock_guard<std::mutex> guard(lock_);
        return FromProto(state_.status());
    }

    uint32_t TransferSession::ResumeCount() const {
        std::lock_guard<std::mutex> guard(lock_);
        return state_.resume_count();
    }

    uint32_t TransferSession::MaxResumeAttempts() const {
        std::lock_guard<std::mutex> guard(lock_);
        return state_.max_resume_attempts();
    }

    std::optional<TransferFailure> TransferSession::Failure() const {
        std::lock_guard<std::mutex> guard(lock_);
        return LoadFailure(state_.failure_kind(), state_.failure_message());
    }

    std::optional<TimePoint> TransferSession::FinishedAt() const {
        std::lock_guard<std::mutex> guard(lock_);
        return FromOptionalTimestamp(state_.has_finished_at(), state_.finished_at());
    }

    // ========================================================================
    // Session transitions
    // ========================================================================

    Result<Unit, TransferFailure> TransferSession::Transition(const SessionStatus to, const TimePoint now) {
        std::lock_guard<std::mutex> guard(lock_);
        return TransitionLocked(to, now);
    }

    Result<Unit, TransferFailure> TransferSession::TransitionLocked(const SessionStatus to, const TimePoint now) {
        const auto from = FromProto(state_.status());
        if (!CanTransition(from, to)) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidState(
                    "Session " + session_id_ + " cannot move from " +
                    std::string(ToString(from)) + " to " + std::string(ToString(to))));
        }
        if (to == SessionStatus::Completed && CompletedBlocksLocked() != block_count_) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidState("Session " + session_id_ + " still has unfinished blocks"));
        }
        state_.set_status(ToProto(to));
        switch (to) {
            case SessionStatus::Active:
                if (!state_.has_started_at()) {
                    SetTimestamp(state_.mutable_started_at(), now);
                }
                break;
            case SessionStatus::Completed:
                SetTimestamp(state_.mutable_completed_at(), now);
                SetTimestamp(state_.mutable_finished_at(), now);
                break;
            case SessionStatus::Cancelled:
                SetTimestamp(state_.mutable_finished_at(), now);
                break;
            case SessionStatus::Created:
            case SessionStatus::Paused:
            case SessionStatus::Failed:
                break;
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    Result<Unit, TransferFailure> TransferSession::Fail(const TransferFailure& failure, const TimePoint now) {
        std::lock_guard<std::mutex> guard(lock_);
        auto moved = TransitionLocked(SessionStatus::Failed, now);
        if (moved.IsErr()) {
            return moved;
        }
        state_.set_failure_kind(static_cast<uint32_t>(failure.type));
        state_.set_failure_message(FailureText(failure));
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    Result<uint32_t, TransferFailure> TransferSession::PrepareResume() {
        std::lock_guard<std::mutex> guard(lock_);
        const auto status = FromProto(state_.status());
        if (status != SessionStatus::Paused && status != SessionStatus::Failed) {
            return Result<uint32_t, TransferFailure>::Err(
                TransferFailure::InvalidState(
                    "Session " + session_id_ + " is " + std::string(ToString(status)) + ", not resumable"));
        }
        uint32_t reset = 0;
        for (auto& block : *state_.mutable_blocks()) {
            const auto block_status = FromProto(block.status());
            if (block_status == BlockStatus::Completed) {
                continue;
            }
            if (block_status == BlockStatus::Failed) {
                block.set_retry_count(0);
                block.set_last_error_kind(0);
                block.clear_last_error();
                ++reset;
            }
            block.set_status(proto::transfer::BLOCK_PENDING);
        }
        state_.set_resume_count(state_.resume_count() + 1);
        state_.set_failure_kind(0);
        state_.clear_failure_message();
        return Result<uint32_t, TransferFailure>::Ok(reset);
    }

    Result<Unit, TransferFailure> TransferSession::ReplaceKey(const std::string& key_id) {
        if (key_id.empty()) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("Key id is required"));
        }
        std::lock_guard<std::mutex> guard(lock_);
        const auto status = FromProto(state_.status());
        if (status == SessionStatus::Active || IsTerminal(status)) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidState(
                    "Cannot replace the key of a " + std::string(ToString(status)) + " session"));
        }
        state_.set_key_id(key_id);
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    // ========================================================================
    // Block transitions
    // ========================================================================

    Result<Unit, TransferFailure> TransferSession::MoveBlock(const size_t position, const BlockStatus to) {
        if (position >= block_count_) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("Block position out of range"));
        }
        auto* block = state_.mutable_blocks(static_cast<int>(position));
        const auto from = FromProto(block->status());
        if (!CanTransition(from, to)) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidState(
                    "Block " + std::to_string(block->index()) + " cannot move from " +
                    std::string(ToString(from)) + " to " + std::string(ToString(to))));
        }
        block->set_status(ToProto(to));
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    std::optional<size_t> TransferSession::ClaimNextBlock(const TimePoint now) {
        std::lock_guard<std::mutex> guard(lock_);
        for (size_t position = 0; position < block_count_; ++position) {
            auto* block = state_.mutable_blocks(static_cast<int>(position));
            if (block->status() == proto::transfer::BLOCK_PENDING) {
                block->set_status(proto::transfer::BLOCK_IN_FLIGHT);
                SetTimestamp(block->mutable_last_attempt_at(), now);
                return position;
            }
        }
        return std::nullopt;
    }

    interfaces::BlockDescriptor TransferSession::Descriptor(const size_t position) const {
        std::lock_guard<std::mutex> guard(lock_);
        const auto& block = state_.blocks(static_cast<int>(position));
        interfaces::BlockDescriptor descriptor;
        descriptor.index = block.index();
        descriptor.offset = block.offset();
        descriptor.size = block.size();
        descriptor.digest.assign(block.digest().begin(), block.digest().end());
        return descriptor;
    }

    Result<std::vector<uint8_t>, TransferFailure> TransferSession::NextNonce(const size_t position) {
        std::lock_guard<std::mutex> guard(lock_);
        if (position >= block_count_) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::InvalidInput("Block position out of range"));
        }
        return nonce_.Next();
    }

    Result<Unit, TransferFailure> TransferSession::MarkVerifying(const size_t position) {
        std::lock_guard<std::mutex> guard(lock_);
        return MoveBlock(position, BlockStatus::Verifying);
    }

    Result<Unit, TransferFailure> TransferSession::MarkCompleted(const size_t position, const TimePoint now) {
        std::lock_guard<std::mutex> guard(lock_);
        auto moved = MoveBlock(position, BlockStatus::Completed);
        if (moved.IsErr()) {
            return moved;
        }
        auto* block = state_.mutable_blocks(static_cast<int>(position));
        SetTimestamp(block->mutable_completed_at(), now);
        block->set_last_error_kind(0);
        block->clear_last_error();
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    Result<uint32_t, TransferFailure> TransferSession::RecordAttemptFailure(
        const size_t position,
        const TransferFailure& failure,
        const TimePoint now) {
        std::lock_guard<std::mutex> guard(lock_);
        if (position >= block_count_) {
            return Result<uint32_t, TransferFailure>::Err(
                TransferFailure::InvalidInput("Block position out of range"));
        }
        auto* block = state_.mutable_blocks(static_cast<int>(position));
        if (block->status() == proto::transfer::BLOCK_VERIFYING) {
            auto moved = MoveBlock(position, BlockStatus::InFlight);
            if (moved.IsErr()) {
                return Result<uint32_t, TransferFailure>::Err(moved.UnwrapErr());
            }
        } else if (block->status() != proto::transfer::BLOCK_IN_FLIGHT) {
            return Result<uint32_t, TransferFailure>::Err(
                TransferFailure::InvalidState(
                    "Block " + std::to_string(block->index()) + " is not in flight"));
        }
        block->set_retry_count(block->retry_count() + 1);
        block->set_last_error_kind(static_cast<uint32_t>(failure.type));
        block->set_last_error(FailureText(failure));
        SetTimestamp(block->mutable_last_attempt_at(), now);
        return Result<uint32_t, TransferFailure>::Ok(block->retry_count());
    }

    Result<Unit, TransferFailure> TransferSession::MarkBlockFailed(
        const size_t position,
        const TransferFailure& failure) {
        std::lock_guard<std::mutex> guard(lock_);
        auto moved = MoveBlock(position, BlockStatus::Failed);
        if (moved.IsErr()) {
            return moved;
        }
        auto* block = state_.mutable_blocks(static_cast<int>(position));
        block->set_last_error_kind(static_cast<uint32_t>(failure.type));
        block->set_last_error(FailureText(failure));
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    Result<Unit, TransferFailure> TransferSession::ReturnToPending(const size_t position) {
        std::lock_guard<std::mutex> guard(lock_);
        return MoveBlock(position, BlockStatus::Pending);
    }

    // ========================================================================
    // Queries
    // ========================================================================

    uint32_t TransferSession::CompletedBlocksLocked() const {
        uint32_t completed = 0;
        for (const auto& block : state_.blocks()) {
            if (block.status() == proto::transfer::BLOCK_COMPLETED) {
                ++completed;
            }
        }
        return completed;
    }

    bool TransferSession::AllBlocksCompleted() const {
        std::lock_guard<std::mutex> guard(lock_);
        return CompletedBlocksLocked() == block_count_;
    }

    double TransferSession::Progress() const {
        std::lock_guard<std::mutex> guard(lock_);
        return static_cast<double>(CompletedBlocksLocked()) * 100.0 / static_cast<double>(block_count_);
    }

    BlockTransferInfo TransferSession::GetBlock(const size_t position) const {
        std::lock_guard<std::mutex> guard(lock_);
        return ToInfo(state_.blocks(static_cast<int>(position)));
    }

    std::vector<BlockTransferInfo> TransferSession::GetBlocks() const {
        std::lock_guard<std::mutex> guard(lock_);
        std::vector<BlockTransferInfo> blocks;
        blocks.reserve(block_count_);
        for (const auto& block : state_.blocks()) {
            blocks.push_back(ToInfo(block));
        }
        return blocks;
    }

    SessionReport TransferSession::Report() const {
        std::lock_guard<std::mutex> guard(lock_);
        SessionReport report;
        report.session_id = state_.session_id();
        report.artifact_id = state_.artifact_id();
        report.source_id = state_.source_id();
        report.sink_id = state_.sink_id();
        report.key_id = state_.key_id();
        report.status = FromProto(state_.status());
        report.failure = LoadFailure(state_.failure_kind(), state_.failure_message());
        report.total_blocks = static_cast<uint32_t>(block_count_);
        for (const auto& block : state_.blocks()) {
            report.total_bytes += block.size();
            if (block.status() == proto::transfer::BLOCK_COMPLETED) {
                ++report.completed_blocks;
                report.completed_bytes += block.size();
            }
        }
        report.resume_count = state_.resume_count();
        report.created_at = FromTimestamp(state_.created_at());
        report.started_at = FromOptionalTimestamp(state_.has_started_at(), state_.started_at());
        report.completed_at = FromOptionalTimestamp(state_.has_completed_at(), state_.completed_at());
        return report;
    }

}
