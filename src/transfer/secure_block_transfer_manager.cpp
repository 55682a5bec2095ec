#include "blockvault/transfer/secure_block_transfer_manager.hpp"
#include "blockvault/core/logging.hpp"
#include "blockvault/crypto/sodium_interop.hpp"
#include "blockvault/transfer/block_codec.hpp"
#include "blockvault/transfer/constants.hpp"

#include <algorithm>
#include <thread>

namespace blockvault::transfer {
    using crypto::SodiumInterop;

    namespace {
        constexpr const char* kComponent = "TransferManager";

        /// nullopt for ACCEPTED and DUPLICATE.
        std::optional<TransferFailure> FailureFromAck(const proto::transfer::DeliveryAck& ack) {
            const std::string detail = ack.detail().empty() ? std::string("no detail") : ack.detail();
            switch (ack.status()) {
                case proto::transfer::ACK_ACCEPTED:
                case proto::transfer::ACK_DUPLICATE:
                    return std::nullopt;
                case proto::transfer::ACK_INTEGRITY_FAILURE:
                    return TransferFailure::IntegrityError("Sink rejected block: " + detail);
                case proto::transfer::ACK_KEY_REJECTED: {
                    const auto kind = FailureTypeFromWire(ack.failure_kind());
                    if (kind.has_value() && IsKeyLifecycleFailure(*kind)) {
                        return TransferFailure(*kind, "Sink rejected key: " + detail);
                    }
                    return TransferFailure::InvalidState("Sink cannot use the session key: " + detail);
                }
                case proto::transfer::ACK_UNKNOWN_SESSION:
                case proto::transfer::ACK_BUSY:
                    return TransferFailure::TransportError(detail);
                case proto::transfer::ACK_REJECTED:
                default:
                    break;
            }
            return TransferFailure::InvalidState("Sink rejected message: " + detail);
        }
    }

    SecureBlockTransferManager::SecureBlockTransferManager(
        configuration::TransferConfig config,
        std::shared_ptr<keys::KeyManager> key_manager,
        std::shared_ptr<interfaces::IBlockTransport> transport,
        std::unique_ptr<SessionStore> store,
        std::shared_ptr<interfaces::IDelayScheduler> delay_scheduler,
        std::shared_ptr<interfaces::IClock> clock)
        : config_(std::move(config))
        , key_manager_(std::move(key_manager))
        , transport_(std::move(transport))
        , store_(std::move(store))
        , scheduler_(std::move(delay_scheduler))
        , clock_(std::move(clock))
        , dispatcher_(std::make_unique<ProgressDispatcher>())
        , pool_(std::make_unique<SessionWorkerPool>(config_.GetMaxConcurrentSessions())) {}

    SecureBlockTransferManager::~SecureBlockTransferManager() {
        Shutdown();
    }

    Result<std::unique_ptr<SecureBlockTransferManager>, TransferFailure> SecureBlockTransferManager::Create(
        configuration::TransferConfig config,
        std::shared_ptr<keys::KeyManager> key_manager,
        std::shared_ptr<interfaces::IBlockTransport> transport,
        std::filesystem::path session_directory,
        std::shared_ptr<interfaces::IDelayScheduler> delay_scheduler,
        std::shared_ptr<interfaces::IClock> clock) {
        if (auto valid = config.Validate(); valid.IsErr()) {
            return Result<std::unique_ptr<SecureBlockTransferManager>, TransferFailure>::Err(valid.UnwrapErr());
        }
        if (!key_manager || !transport) {
            return Result<std::unique_ptr<SecureBlockTransferManager>, TransferFailure>::Err(
                TransferFailure::InvalidInput("Key manager and transport are required"));
        }
        auto store_result = SessionStore::Open(std::move(session_directory));
        if (store_result.IsErr()) {
            return Result<std::unique_ptr<SecureBlockTransferManager>, TransferFailure>::Err(
                store_result.UnwrapErr());
        }
        if (!delay_scheduler) {
            delay_scheduler = std::make_shared<interfaces::ConditionDelayScheduler>();
        }
        if (!clock) {
            clock = std::make_shared<interfaces::SystemClock>();
        }
        BLOCKVAULT_LOG_INFO(kComponent,
            "Transfer manager ready: {} concurrent sessions, window {}, {} attempts per block",
            config.GetMaxConcurrentSessions(), config.GetBlockWindow(), config.GetMaxRetries());
        return Result<std::unique_ptr<SecureBlockTransferManager>, TransferFailure>::Ok(
            std::unique_ptr<SecureBlockTransferManager>(new SecureBlockTransferManager(
                std::move(config),
                std::move(key_manager),
                std::move(transport),
                std::move(store_result).Unwrap(),
                std::move(delay_scheduler),
                std::move(clock))));
    }

    // ========================================================================
    // Session control
    // ========================================================================

    Result<std::string, TransferFailure> SecureBlockTransferManager::StartSession(StartSessionRequest request) {
        if (shutdown_.load()) {
            return Result<std::string, TransferFailure>::Err(
                TransferFailure::InvalidState("Transfer manager is shut down"));
        }
        if (!request.block_source) {
            return Result<std::string, TransferFailure>::Err(
                TransferFailure::InvalidInput("A block source is required"));
        }
        if (request.artifact_id.empty() || request.blocks.empty()) {
            return Result<std::string, TransferFailure>::Err(
                TransferFailure::InvalidInput("Artifact id and at least one block are required"));
        }

        const std::string session_id = SodiumInterop::GetRandomHex(kSessionIdBytes);
        std::string key_id = request.key_id;
        bool generated_key = false;
        if (key_id.empty()) {
            keys::KeyContext context;
            context.model_id = request.artifact_id;
            context.labels["purpose"] = "block-transfer";
            context.labels["session"] = session_id;
            auto key_result = key_manager_->GenerateRandomKey(context);
            if (key_result.IsErr()) {
                return Result<std::string, TransferFailure>::Err(key_result.UnwrapErr());
            }
            key_id = key_result.Unwrap().key_id;
            generated_key = true;
        } else {
            const auto key = key_manager_->GetKey(key_id);
            if (!key.has_value()) {
                return Result<std::string, TransferFailure>::Err(
                    TransferFailure::NotFound("Unknown key " + key_id));
            }
            if (key->status != keys::KeyStatus::Active) {
                return Result<std::string, TransferFailure>::Err(
                    TransferFailure::InvalidState(compat::format(
                        "Key {} is {}; new sessions need an Active key", key_id, keys::ToString(key->status))));
            }
        }

        TransferSession::Parameters parameters;
        parameters.session_id = session_id;
        parameters.artifact_id = std::move(request.artifact_id);
        parameters.source_id = std::move(request.source_id);
        parameters.sink_id = std::move(request.sink_id);
        parameters.key_id = key_id;
        parameters.blocks = std::move(request.blocks);
        parameters.max_resume_attempts = config_.GetMaxResumeAttempts();
        auto session_result = TransferSession::Create(std::move(parameters), clock_->Now());
        if (session_result.IsErr()) {
            if (generated_key) {
                key_manager_->RevokeKey(key_id, "session could not be created");
            }
            return Result<std::string, TransferFailure>::Err(session_result.UnwrapErr());
        }

        auto runtime = std::make_shared<SessionRuntime>();
        runtime->session = std::shared_ptr<TransferSession>(std::move(session_result).Unwrap());
        runtime->source = std::move(request.block_source);
        if (auto saved = Persist(*runtime); saved.IsErr()) {
            if (generated_key) {
                key_manager_->RevokeKey(key_id, "session could not be persisted");
            }
            return Result<std::string, TransferFailure>::Err(saved.UnwrapErr());
        }

        {
            std::unique_lock lock(sessions_lock_);
            sessions_.emplace(session_id, runtime);
        }
        counters_.sessions_started.fetch_add(1);
        {
            std::lock_guard<std::mutex> control(runtime->control);
            Schedule(runtime);
        }
        BLOCKVAULT_LOG_INFO(kComponent, "Session {} queued: {} blocks with key {}",
            session_id, runtime->session->BlockCount(), key_id);
        return Result<std::string, TransferFailure>::Ok(session_id);
    }

    bool SecureBlockTransferManager::ResumeTransfer(const std::string& session_id) {
        const auto runtime = FindRuntime(session_id);
        if (!runtime || shutdown_.load()) {
            return false;
        }
        bool cancelled = false;
        {
            std::lock_guard<std::mutex> control(runtime->control);
            auto& session = *runtime->session;
            const auto status = session.Status();
            if (runtime->running || (status != SessionStatus::Paused && status != SessionStatus::Failed)) {
                BLOCKVAULT_LOG_DEBUG(kComponent, "Session {} is {}; nothing to resume",
                    session_id, ToString(status));
                return false;
            }
            if (!runtime->source) {
                BLOCKVAULT_LOG_WARN(kComponent, "Session {} has no block source attached", session_id);
                return false;
            }
            if (status == SessionStatus::Failed && session.ResumeCount() >= session.MaxResumeAttempts()) {
                if (session.Transition(SessionStatus::Cancelled, clock_->Now()).IsOk()) {
                    counters_.sessions_cancelled.fetch_add(1);
                    cancelled = true;
                }
                ++runtime->generation;
                PersistOrLog(*runtime);
                BLOCKVAULT_LOG_WARN(kComponent, "Session {} used all {} resumes and is cancelled",
                    session_id, session.MaxResumeAttempts());
            } else {
                auto prepared = session.PrepareResume();
                if (prepared.IsErr()) {
                    BLOCKVAULT_LOG_WARN(kComponent, "Cannot resume {}: {}", session_id, prepared.UnwrapErr().message);
                    return false;
                }
                if (auto moved = session.Transition(SessionStatus::Active, clock_->Now()); moved.IsErr()) {
                    BLOCKVAULT_LOG_WARN(kComponent, "Cannot resume {}: {}", session_id, moved.UnwrapErr().message);
                    return false;
                }
                runtime->stop.store(StopRequest::None);
                runtime->halted.store(false);
                runtime->needs_open.store(true);
                PersistOrLog(*runtime);
                Schedule(runtime);
                BLOCKVAULT_LOG_INFO(kComponent, "Session {} resumed ({} failed blocks reset, resume {})",
                    session_id, prepared.Unwrap(), session.ResumeCount());
            }
        }
        if (cancelled) {
            SendCancel(*runtime, "resume budget exhausted");
        }
        NotifyStateChanged();
        return !cancelled;
    }

    bool SecureBlockTransferManager::PauseSession(const std::string& session_id) {
        const auto runtime = FindRuntime(session_id);
        if (!runtime) {
            return false;
        }
        {
            std::lock_guard<std::mutex> control(runtime->control);
            const auto status = runtime->session->Status();
            if (runtime->running) {
                if (status != SessionStatus::Active) {
                    return false;
                }
                runtime->stop.store(StopRequest::Pause);
                scheduler_->WakeAll();
                BLOCKVAULT_LOG_INFO(kComponent, "Pausing session {}", session_id);
                return true;
            }
            if (status != SessionStatus::Created && status != SessionStatus::Active) {
                return false;
            }
            ++runtime->generation;
            if (auto moved = runtime->session->Transition(SessionStatus::Paused, clock_->Now()); moved.IsErr()) {
                BLOCKVAULT_LOG_WARN(kComponent, "Cannot pause {}: {}", session_id, moved.UnwrapErr().message);
                return false;
            }
            PersistOrLog(*runtime);
        }
        BLOCKVAULT_LOG_INFO(kComponent, "Session {} paused before it started", session_id);
        NotifyStateChanged();
        return true;
    }

    bool SecureBlockTransferManager::CancelSession(const std::string& session_id, const std::string& reason) {
        const auto runtime = FindRuntime(session_id);
        if (!runtime) {
            return false;
        }
        {
            std::lock_guard<std::mutex> control(runtime->control);
            const auto status = runtime->session->Status();
            if (IsTerminal(status)) {
                return false;
            }
            if (runtime->running) {
                runtime->cancel_reason = reason;
                runtime->stop.store(StopRequest::Cancel);
                scheduler_->WakeAll();
                BLOCKVAULT_LOG_INFO(kComponent, "Cancelling session {}: {}", session_id, reason);
                return true;
            }
            ++runtime->generation;
            if (auto moved = runtime->session->Transition(SessionStatus::Cancelled, clock_->Now()); moved.IsErr()) {
                BLOCKVAULT_LOG_WARN(kComponent, "Cannot cancel {}: {}", session_id, moved.UnwrapErr().message);
                return false;
            }
            counters_.sessions_cancelled.fetch_add(1);
            PersistOrLog(*runtime);
        }
        SendCancel(*runtime, reason);
        BLOCKVAULT_LOG_INFO(kComponent, "Session {} cancelled: {}", session_id, reason);
        NotifyStateChanged();
        return true;
    }

    Result<Unit, TransferFailure> SecureBlockTransferManager::AttachBlockSource(
        const std::string& session_id,
        std::shared_ptr<interfaces::IBlockSource> source) {
        if (!source) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("Block source is required"));
        }
        const auto runtime = FindRuntime(session_id);
        if (!runtime) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::NotFound("Unknown session " + session_id));
        }
        std::lock_guard<std::mutex> control(runtime->control);
        if (runtime->running) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidState("Session " + session_id + " is running"));
        }
        runtime->source = std::move(source);
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    Result<Unit, TransferFailure> SecureBlockTransferManager::ReplaceSessionKey(
        const std::string& session_id,
        const std::string& key_id) {
        const auto runtime = FindRuntime(session_id);
        if (!runtime) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::NotFound("Unknown session " + session_id));
        }
        const auto key = key_manager_->GetKey(key_id);
        if (!key.has_value()) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::NotFound("Unknown key " + key_id));
        }
        if (key->status != keys::KeyStatus::Active) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidState(compat::format(
                    "Key {} is {}; only Active keys can be assigned", key_id, keys::ToString(key->status))));
        }
        std::lock_guard<std::mutex> control(runtime->control);
        if (runtime->running) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidState("Session " + session_id + " is running"));
        }
        const std::string previous = runtime->session->KeyId();
        auto replaced = runtime->session->ReplaceKey(key_id);
        if (replaced.IsErr()) {
            return replaced;
        }
        runtime->needs_open.store(true);
        if (auto saved = Persist(*runtime); saved.IsErr()) {
            return saved;
        }
        BLOCKVAULT_LOG_INFO(kComponent, "Session {} switched from key {} to {}", session_id, previous, key_id);
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    // ========================================================================
    // Observation
    // ========================================================================

    std::optional<double> SecureBlockTransferManager::GetProgress(const std::string& session_id) const {
        const auto runtime = FindRuntime(session_id);
        if (!runtime) {
            return std::nullopt;
        }
        return runtime->session->Progress();
    }

    std::optional<SessionReport> SecureBlockTransferManager::GetSessionReport(const std::string& session_id) const {
        const auto runtime = FindRuntime(session_id);
        if (!runtime) {
            return std::nullopt;
        }
        return runtime->session->Report();
    }

    std::vector<BlockTransferInfo> SecureBlockTransferManager::GetBlocks(const std::string& session_id) const {
        const auto runtime = FindRuntime(session_id);
        if (!runtime) {
            return {};
        }
        return runtime->session->GetBlocks();
    }

    std::vector<SessionReport> SecureBlockTransferManager::ListSessions() const {
        std::vector<SessionReport> reports;
        {
            std::shared_lock lock(sessions_lock_);
            reports.reserve(sessions_.size());
            for (const auto& [id, runtime] : sessions_) {
                reports.push_back(runtime->session->Report());
            }
        }
        std::sort(reports.begin(), reports.end(), [](const SessionReport& a, const SessionReport& b) {
            return a.created_at < b.created_at;
        });
        return reports;
    }

    void SecureBlockTransferManager::AddProgressCallback(ProgressCallback callback) {
        dispatcher_->AddCallback(std::move(callback));
    }

    void SecureBlockTransferManager::AddEventHandler(std::shared_ptr<interfaces::ITransferEventHandler> handler) {
        if (!handler) {
            return;
        }
        std::lock_guard<std::mutex> guard(handlers_lock_);
        handlers_.push_back(std::move(handler));
    }

    std::optional<SessionStatus> SecureBlockTransferManager::WaitForSession(
        const std::string& session_id,
        const std::chrono::milliseconds timeout) {
        const auto runtime = FindRuntime(session_id);
        if (!runtime) {
            return std::nullopt;
        }
        std::optional<SessionStatus> settled;
        std::unique_lock<std::mutex> lock(state_mutex_);
        const bool done = state_cv_.wait_for(lock, timeout, [&] {
            std::lock_guard<std::mutex> control(runtime->control);
            const auto status = runtime->session->Status();
            const bool queued = status == SessionStatus::Created || status == SessionStatus::Active;
            if (runtime->running || queued) {
                return false;
            }
            settled = status;
            return true;
        });
        if (!done) {
            return std::nullopt;
        }
        return settled;
    }

    void SecureBlockTransferManager::FlushNotifications() {
        dispatcher_->Flush();
    }

    TransferStatistics SecureBlockTransferManager::GetStatistics() const {
        TransferStatistics stats;
        stats.sessions_started = counters_.sessions_started.load();
        stats.sessions_completed = counters_.sessions_completed.load();
        stats.sessions_failed = counters_.sessions_failed.load();
        stats.sessions_cancelled = counters_.sessions_cancelled.load();
        stats.blocks_transferred = counters_.blocks_transferred.load();
        stats.bytes_transferred = counters_.bytes_transferred.load();
        stats.retry_attempts = counters_.retry_attempts.load();
        stats.integrity_failures = counters_.integrity_failures.load();
        return stats;
    }

    // ========================================================================
    // Housekeeping
    // ========================================================================

    size_t SecureBlockTransferManager::EvictExpiredSessions() {
        const auto now = clock_->Now();
        const auto retention = config_.GetSessionRetention();
        std::vector<std::string> expired;
        {
            std::shared_lock lock(sessions_lock_);
            for (const auto& [id, runtime] : sessions_) {
                std::lock_guard<std::mutex> control(runtime->control);
                if (runtime->running || !IsTerminal(runtime->session->Status())) {
                    continue;
                }
                const auto finished_at = runtime->session->FinishedAt();
                if (finished_at.has_value() && *finished_at + retention <= now) {
                    expired.push_back(id);
                }
            }
        }
        for (const auto& id : expired) {
            {
                std::unique_lock lock(sessions_lock_);
                sessions_.erase(id);
            }
            if (auto removed = store_->Remove(id); removed.IsErr()) {
                BLOCKVAULT_LOG_WARN(kComponent, "Evicted session {} but its file remains: {}",
                    id, removed.UnwrapErr().message);
            }
        }
        if (!expired.empty()) {
            BLOCKVAULT_LOG_INFO(kComponent, "Evicted {} finished sessions", expired.size());
        }
        return expired.size();
    }

    Result<size_t, TransferFailure> SecureBlockTransferManager::LoadPersistedSessions() {
        auto records = store_->LoadAll();
        if (records.IsErr()) {
            return Result<size_t, TransferFailure>::Err(records.UnwrapErr());
        }
        size_t loaded = 0;
        for (const auto& record : records.Unwrap()) {
            if (FindRuntime(record.session_id())) {
                continue;
            }
            auto session_result = TransferSession::FromState(record);
            if (session_result.IsErr()) {
                BLOCKVAULT_LOG_WARN(kComponent, "Skipping persisted session {}: {}",
                    record.session_id(), session_result.UnwrapErr().message);
                continue;
            }
            auto runtime = std::make_shared<SessionRuntime>();
            runtime->session = std::shared_ptr<TransferSession>(std::move(session_result).Unwrap());
            if (runtime->session->RecoverAfterRestart()) {
                PersistOrLog(*runtime);
            }
            {
                std::unique_lock lock(sessions_lock_);
                sessions_.emplace(record.session_id(), std::move(runtime));
            }
            ++loaded;
        }
        BLOCKVAULT_LOG_INFO(kComponent, "Recovered {} persisted sessions", loaded);
        return Result<size_t, TransferFailure>::Ok(loaded);
    }

    void SecureBlockTransferManager::Shutdown() {
        if (shutdown_.exchange(true)) {
            return;
        }
        {
            std::shared_lock lock(sessions_lock_);
            for (const auto& [id, runtime] : sessions_) {
                std::lock_guard<std::mutex> control(runtime->control);
                if (runtime->running) {
                    runtime->stop.store(StopRequest::Shutdown);
                }
            }
        }
        scheduler_->WakeAll();
        pool_->Shutdown();
        dispatcher_->Stop();
        NotifyStateChanged();
        BLOCKVAULT_LOG_INFO(kComponent, "Transfer manager stopped");
    }

    // ========================================================================
    // Session execution
    // ========================================================================

    std::shared_ptr<SecureBlockTransferManager::SessionRuntime> SecureBlockTransferManager::FindRuntime(
        const std::string& session_id) const {
        std::shared_lock lock(sessions_lock_);
        const auto it = sessions_.find(session_id);
        return it == sessions_.end() ? nullptr : it->second;
    }

    void SecureBlockTransferManager::Schedule(const std::shared_ptr<SessionRuntime>& runtime) {
        const uint64_t generation = ++runtime->generation;
        const bool queued = pool_->Submit([this, runtime, generation] {
            RunSession(runtime, generation);
        });
        if (!queued) {
            BLOCKVAULT_LOG_WARN(kComponent, "Session {} not queued: manager is shutting down",
                runtime->session->Id());
        }
    }

    bool SecureBlockTransferManager::StopRequested(const SessionRuntime& runtime) noexcept {
        return runtime.stop.load() != StopRequest::None || runtime.halted.load();
    }

    void SecureBlockTransferManager::RunSession(const std::shared_ptr<SessionRuntime>& runtime, const uint64_t generation) {
        auto& session = *runtime->session;
        {
            std::lock_guard<std::mutex> control(runtime->control);
            if (generation != runtime->generation || shutdown_.load() ||
                runtime->stop.load() != StopRequest::None) {
                return;
            }
            if (session.Status() == SessionStatus::Created) {
                if (auto moved = session.Transition(SessionStatus::Active, clock_->Now()); moved.IsErr()) {
                    BLOCKVAULT_LOG_ERROR(kComponent, "Cannot start {}: {}", session.Id(), moved.UnwrapErr().message);
                    return;
                }
            }
            runtime->running = true;
            runtime->halted.store(false);
            runtime->failure.reset();
        }
        PersistOrLog(*runtime);
        BLOCKVAULT_LOG_INFO(kComponent, "Session {} running", session.Id());

        const size_t lanes = std::max<size_t>(1, std::min<size_t>(config_.GetBlockWindow(), session.BlockCount()));
        std::vector<std::thread> helpers;
        helpers.reserve(lanes - 1);
        for (size_t i = 1; i < lanes; ++i) {
            helpers.emplace_back([this, runtime] { RunLane(*runtime); });
        }
        RunLane(*runtime);
        for (auto& helper : helpers) {
            helper.join();
        }
        FinishRun(*runtime);
    }

    void SecureBlockTransferManager::RunLane(SessionRuntime& runtime) {
        auto& session = *runtime.session;
        while (!StopRequested(runtime)) {
            const auto position = session.ClaimNextBlock(clock_->Now());
            if (!position.has_value()) {
                return;
            }
            PublishProgress(session);
            auto transferred = TransferBlock(runtime, *position);
            if (transferred.IsOk()) {
                continue;
            }
            const auto& failure = transferred.UnwrapErr();
            if (failure.type == TransferFailureType::Cancelled) {
                if (auto returned = session.ReturnToPending(*position); returned.IsErr()) {
                    BLOCKVAULT_LOG_ERROR(kComponent, "{}", returned.UnwrapErr().message);
                }
                PublishProgress(session);
                return;
            }
            if (auto marked = session.MarkBlockFailed(*position, failure); marked.IsErr()) {
                BLOCKVAULT_LOG_ERROR(kComponent, "{}", marked.UnwrapErr().message);
            }
            PersistOrLog(runtime);
            PublishProgress(session);
            RecordFatalFailure(runtime, failure);
            return;
        }
    }

    Result<Unit, TransferFailure> SecureBlockTransferManager::TransferBlock(
        SessionRuntime& runtime,
        const size_t position) {
        auto& session = *runtime.session;
        const auto descriptor = session.Descriptor(position);
        const std::string key_id = session.KeyId();

        while (true) {
            if (StopRequested(runtime)) {
                return Result<Unit, TransferFailure>::Err(TransferFailure::Cancelled("Session stopped"));
            }
            auto attempt = AttemptBlock(runtime, position, descriptor, key_id);
            if (attempt.IsOk()) {
                return attempt;
            }
            const TransferFailure failure = attempt.UnwrapErr();
            if (failure.type == TransferFailureType::IntegrityError) {
                counters_.integrity_failures.fetch_add(1);
            }
            if (!IsRetryable(failure.type)) {
                if (IsKeyLifecycleFailure(failure.type)) {
                    BLOCKVAULT_LOG_ERROR(kComponent, "Block {} of {}: {} ({}), not retrying",
                        descriptor.index, session.Id(), ToString(failure.type), failure.message);
                }
                return Result<Unit, TransferFailure>::Err(failure);
            }

            auto retries = session.RecordAttemptFailure(position, failure, clock_->Now());
            if (retries.IsErr()) {
                return Result<Unit, TransferFailure>::Err(retries.UnwrapErr());
            }
            const uint32_t failed_attempts = retries.Unwrap();
            PersistOrLog(runtime);
            PublishProgress(session);
            if (failed_attempts >= config_.GetMaxRetries()) {
                BLOCKVAULT_LOG_ERROR(kComponent, "Block {} of {} failed {} times, giving up: {}",
                    descriptor.index, session.Id(), failed_attempts, failure.message);
                return Result<Unit, TransferFailure>::Err(TransferFailure::RetriesExhausted(compat::format(
                    "Block {} failed after {} attempts: {}", descriptor.index, failed_attempts, failure.message)));
            }

            counters_.retry_attempts.fetch_add(1);
            const auto delay = config_.BackoffDelay(failed_attempts);
            BLOCKVAULT_LOG_DEBUG(kComponent, "Block {} of {} attempt {} failed ({}); retrying in {} ms",
                descriptor.index, session.Id(), failed_attempts, failure.message, delay.count());
            PostToHandlers([id = session.Id(), index = descriptor.index, failed_attempts](
                               interfaces::ITransferEventHandler& handler) {
                handler.OnBlockRetry(id, index, failed_attempts);
            });
            if (!scheduler_->WaitFor(delay, [&runtime] { return StopRequested(runtime); })) {
                return Result<Unit, TransferFailure>::Err(
                    TransferFailure::Cancelled("Session stopped during backoff"));
            }
        }
    }

    Result<Unit, TransferFailure> SecureBlockTransferManager::AttemptBlock(
        SessionRuntime& runtime,
        const size_t position,
        const interfaces::BlockDescriptor& descriptor,
        const std::string& key_id) {
        auto& session = *runtime.session;

        if (auto opened = EnsureOpened(runtime); opened.IsErr()) {
            return opened;
        }

        std::shared_ptr<interfaces::IBlockSource> source;
        {
            std::lock_guard<std::mutex> control(runtime.control);
            source = runtime.source;
        }
        if (!source) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidState("No block source attached"));
        }
        auto plaintext = source->ReadBlock(descriptor);
        if (plaintext.IsErr()) {
            return Result<Unit, TransferFailure>::Err(plaintext.UnwrapErr());
        }
        if (auto verified = BlockCodec::VerifyDigest(plaintext.Unwrap(), descriptor.digest); verified.IsErr()) {
            return Result<Unit, TransferFailure>::Err(TransferFailure::IntegrityError(
                compat::format("Source block {} does not match its digest", descriptor.index)));
        }

        auto nonce = session.NextNonce(position);
        if (nonce.IsErr()) {
            return Result<Unit, TransferFailure>::Err(nonce.UnwrapErr());
        }
        auto sealed = BlockCodec::SealBlock(
            *key_manager_, session.Id(), key_id, descriptor.index, nonce.Unwrap(), plaintext.Unwrap());
        if (sealed.IsErr()) {
            return Result<Unit, TransferFailure>::Err(sealed.UnwrapErr());
        }
        if (auto verifying = session.MarkVerifying(position); verifying.IsErr()) {
            return verifying;
        }

        proto::transfer::TransferMessage message;
        *message.mutable_block() = std::move(sealed).Unwrap();
        auto ack = transport_->Deliver(message, config_.GetAckTimeout());
        if (ack.IsErr()) {
            return Result<Unit, TransferFailure>::Err(ack.UnwrapErr());
        }
        if (ack.Unwrap().status() == proto::transfer::ACK_UNKNOWN_SESSION) {
            runtime.needs_open.store(true);
        }
        if (auto rejected = FailureFromAck(ack.Unwrap()); rejected.has_value()) {
            return Result<Unit, TransferFailure>::Err(*rejected);
        }

        if (auto completed = session.MarkCompleted(position, clock_->Now()); completed.IsErr()) {
            return completed;
        }
        counters_.blocks_transferred.fetch_add(1);
        counters_.bytes_transferred.fetch_add(descriptor.size);
        PersistOrLog(runtime);
        PublishProgress(session);
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    Result<Unit, TransferFailure> SecureBlockTransferManager::EnsureOpened(SessionRuntime& runtime) {
        if (!runtime.needs_open.load()) {
            return Result<Unit, TransferFailure>::Ok(unit);
        }
        std::lock_guard<std::mutex> guard(runtime.open_lock);
        if (!runtime.needs_open.load()) {
            return Result<Unit, TransferFailure>::Ok(unit);
        }

        const auto record = runtime.session->ExportState();
        proto::transfer::TransferMessage message;
        auto* open = message.mutable_open();
        open->set_session_id(record.session_id());
        open->set_artifact_id(record.artifact_id());
        open->set_source_id(record.source_id());
        open->set_sink_id(record.sink_id());
        open->set_key_id(record.key_id());
        for (const auto& block : record.blocks()) {
            auto* entry = open->add_blocks();
            entry->set_index(block.index());
            entry->set_size(block.size());
            entry->set_digest(block.digest());
        }

        auto ack = transport_->Deliver(message, config_.GetAckTimeout());
        if (ack.IsErr()) {
            return Result<Unit, TransferFailure>::Err(ack.UnwrapErr());
        }
        if (auto rejected = FailureFromAck(ack.Unwrap()); rejected.has_value()) {
            return Result<Unit, TransferFailure>::Err(*rejected);
        }
        runtime.needs_open.store(false);
        BLOCKVAULT_LOG_DEBUG(kComponent, "Sink acknowledged session {}", record.session_id());
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    void SecureBlockTransferManager::SendClose(const SessionRuntime& runtime) {
        proto::transfer::TransferMessage message;
        message.mutable_close()->set_session_id(runtime.session->Id());
        auto ack = transport_->Deliver(message, config_.GetAckTimeout());
        if (ack.IsErr()) {
            BLOCKVAULT_LOG_WARN(kComponent, "Close of {} not delivered: {}",
                runtime.session->Id(), ack.UnwrapErr().message);
            return;
        }
        if (auto rejected = FailureFromAck(ack.Unwrap()); rejected.has_value()) {
            BLOCKVAULT_LOG_WARN(kComponent, "Sink refused to close {}: {}", runtime.session->Id(), rejected->message);
        }
    }

    void SecureBlockTransferManager::SendCancel(const SessionRuntime& runtime, const std::string& reason) {
        proto::transfer::TransferMessage message;
        auto* cancel = message.mutable_cancel();
        cancel->set_session_id(runtime.session->Id());
        cancel->set_reason(reason);
        auto ack = transport_->Deliver(message, config_.GetAckTimeout());
        if (ack.IsErr()) {
            BLOCKVAULT_LOG_WARN(kComponent, "Cancel of {} not delivered: {}",
                runtime.session->Id(), ack.UnwrapErr().message);
        }
    }

    void SecureBlockTransferManager::RecordFatalFailure(SessionRuntime& runtime, const TransferFailure& failure) {
        {
            std::lock_guard<std::mutex> guard(runtime.failure_lock);
            if (!runtime.failure.has_value()) {
                runtime.failure = failure;
            }
        }
        runtime.halted.store(true);
        scheduler_->WakeAll();
    }

    void SecureBlockTransferManager::FinishRun(SessionRuntime& runtime) {
        auto& session = *runtime.session;
        const auto now = clock_->Now();
        std::optional<TransferFailure> failure;
        {
            std::lock_guard<std::mutex> guard(runtime.failure_lock);
            failure = std::move(runtime.failure);
            runtime.failure.reset();
        }
        const StopRequest stop = runtime.stop.load();

        std::string cancel_reason;
        bool completed = false;
        if (failure.has_value()) {
            if (auto failed = session.Fail(*failure, now); failed.IsErr()) {
                BLOCKVAULT_LOG_ERROR(kComponent, "{}", failed.UnwrapErr().message);
            }
            counters_.sessions_failed.fetch_add(1);
            BLOCKVAULT_LOG_ERROR(kComponent, "Session {} failed: {} ({})",
                session.Id(), ToString(failure->type), failure->message);
            PostToHandlers([id = session.Id(), reason = *failure](interfaces::ITransferEventHandler& handler) {
                handler.OnSessionFailed(id, reason);
            });
        } else if (session.AllBlocksCompleted()) {
            SendClose(runtime);
            if (auto done = session.Transition(SessionStatus::Completed, now); done.IsErr()) {
                BLOCKVAULT_LOG_ERROR(kComponent, "{}", done.UnwrapErr().message);
            } else {
                completed = true;
                counters_.sessions_completed.fetch_add(1);
            }
        } else if (stop == StopRequest::Cancel) {
            {
                std::lock_guard<std::mutex> control(runtime.control);
                cancel_reason = runtime.cancel_reason;
            }
            if (auto cancelled = session.Transition(SessionStatus::Cancelled, now); cancelled.IsOk()) {
                counters_.sessions_cancelled.fetch_add(1);
            }
            SendCancel(runtime, cancel_reason);
            BLOCKVAULT_LOG_INFO(kComponent, "Session {} cancelled: {}", session.Id(), cancel_reason);
        } else {
            if (auto paused = session.Transition(SessionStatus::Paused, now); paused.IsErr()) {
                BLOCKVAULT_LOG_ERROR(kComponent, "{}", paused.UnwrapErr().message);
            }
            BLOCKVAULT_LOG_INFO(kComponent, "Session {} paused at {:.1f}%", session.Id(), session.Progress());
        }

        if (completed) {
            const std::string key_id = session.KeyId();
            if (config_.ShouldRetireKeyOnCompletion()) {
                if (auto retired = key_manager_->RetireKey(key_id); retired.IsErr()) {
                    BLOCKVAULT_LOG_WARN(kComponent, "Key {} not retired: {}", key_id, retired.UnwrapErr().message);
                }
            }
            BLOCKVAULT_LOG_INFO(kComponent, "Session {} completed ({} blocks)", session.Id(), session.BlockCount());
            PostToHandlers([id = session.Id()](interfaces::ITransferEventHandler& handler) {
                handler.OnSessionCompleted(id);
            });
        }

        PersistOrLog(runtime);
        PublishProgress(session);
        {
            std::lock_guard<std::mutex> control(runtime.control);
            runtime.running = false;
            runtime.stop.store(StopRequest::None);
            runtime.halted.store(false);
        }
        NotifyStateChanged();
    }

    // ========================================================================
    // Persistence and notification
    // ========================================================================

    Result<Unit, TransferFailure> SecureBlockTransferManager::Persist(SessionRuntime& runtime) {
        std::lock_guard<std::mutex> guard(runtime.persist_lock);
        return store_->Save(runtime.session->ExportState());
    }

    void SecureBlockTransferManager::PersistOrLog(SessionRuntime& runtime) {
        if (auto saved = Persist(runtime); saved.IsErr()) {
            BLOCKVAULT_LOG_ERROR(kComponent, "Cannot persist session {}: {}",
                runtime.session->Id(), saved.UnwrapErr().message);
        }
    }

    void SecureBlockTransferManager::PublishProgress(const TransferSession& session) {
        dispatcher_->Publish(session.Id(), session.Progress());
    }

    void SecureBlockTransferManager::PostToHandlers(std::function<void(interfaces::ITransferEventHandler&)> event) {
        std::vector<std::shared_ptr<interfaces::ITransferEventHandler>> handlers;
        {
            std::lock_guard<std::mutex> guard(handlers_lock_);
            if (handlers_.empty()) {
                return;
            }
            handlers = handlers_;
        }
        dispatcher_->PostEvent([handlers = std::move(handlers), event = std::move(event)] {
            for (const auto& handler : handlers) {
                event(*handler);
            }
        });
    }

    void SecureBlockTransferManager::NotifyStateChanged() {
        { std::lock_guard<std::mutex> guard(state_mutex_); }
        state_cv_.notify_all();
    }

}
