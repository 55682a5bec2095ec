#pragma once
#include "blockvault/configuration/transfer_config.hpp"
#include "blockvault/core/failures.hpp"
#include "blockvault/core/result.hpp"
#include "blockvault/interfaces/i_block_io.hpp"
#include "blockvault/interfaces/i_block_transport.hpp"
#include "blockvault/interfaces/i_clock.hpp"
#include "blockvault/interfaces/i_delay_scheduler.hpp"
#include "blockvault/interfaces/i_transfer_event_handler.hpp"
#include "blockvault/keys/key_manager.hpp"
#include "blockvault/transfer/progress_dispatcher.hpp"
#include "blockvault/transfer/session_store.hpp"
#include "blockvault/transfer/session_worker_pool.hpp"
#include "blockvault/transfer/transfer_session.hpp"
#include "blockvault/transfer/transfer_types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace blockvault::transfer {

struct StartSessionRequest {
    std::string artifact_id;
    std::string source_id;
    std::string sink_id;
    std::vector<interfaces::BlockDescriptor> blocks;
    std::shared_ptr<interfaces::IBlockSource> block_source;
    /// Existing Active key to encrypt with. Empty: a transfer-scoped random
    /// key is generated for the session.
    std::string key_id;
};

/**
 * @brief Moves artifacts block by block to a sink, encrypted and resumable
 *
 * Sessions run on a SessionWorkerPool sized to the concurrent session
 * ceiling; a queued session makes no transport call until a worker frees
 * up. Inside a session up to `block_window` lanes claim blocks in
 * ascending index order, each block going
 * @code
 *   Pending -> InFlight -> Verifying -> Completed
 *                 ^            |
 *                 +-- retry ---+          (TransportError, IntegrityError)
 * @endcode
 * with at most `max_retries` attempts and exponential backoff in between.
 * Key lifecycle failures (revoked, expired, hardware mismatch) are never
 * retried and fail the session at once.
 *
 * Every block transition is persisted, so LoadPersistedSessions() after a
 * restart finds each session Paused with its Completed blocks intact, and
 * ResumeTransfer() sends only what is missing.
 *
 * Thread Safety: all public methods are thread-safe. Progress callbacks
 * and event handlers run on a dedicated dispatcher thread.
 */
class SecureBlockTransferManager {
public:
    [[nodiscard]] static Result<std::unique_ptr<SecureBlockTransferManager>, TransferFailure> Create(
        configuration::TransferConfig config,
        std::shared_ptr<keys::KeyManager> key_manager,
        std::shared_ptr<interfaces::IBlockTransport> transport,
        std::filesystem::path session_directory,
        std::shared_ptr<interfaces::IDelayScheduler> delay_scheduler = nullptr,
        std::shared_ptr<interfaces::IClock> clock = nullptr);

    ~SecureBlockTransferManager();

    SecureBlockTransferManager(const SecureBlockTransferManager&) = delete;
    SecureBlockTransferManager& operator=(const SecureBlockTransferManager&) = delete;

    // ========================================================================
    // Session control
    // ========================================================================

    /// Persists a new session and queues it. Returns the session id.
    [[nodiscard]] Result<std::string, TransferFailure> StartSession(StartSessionRequest request);

    /**
     * @brief Continue a Paused or Failed session
     *
     * Completed blocks are skipped, Failed blocks get a fresh retry budget.
     * A Failed session whose resume budget is spent moves to Cancelled.
     *
     * @return false for unknown, running, terminal or budget-exhausted sessions
     */
    bool ResumeTransfer(const std::string& session_id);

    /// Stops a queued or running session after its in-flight attempts.
    bool PauseSession(const std::string& session_id);

    /// Cooperative: backoff waits end at once, in-flight attempts finish,
    /// and the sink is told to drop the session.
    bool CancelSession(const std::string& session_id, const std::string& reason = "cancelled by caller");

    /// Block source for a session loaded from disk.
    [[nodiscard]] Result<Unit, TransferFailure> AttachBlockSource(
        const std::string& session_id,
        std::shared_ptr<interfaces::IBlockSource> source);

    /// Switches a stopped session to another Active key, e.g. after its key
    /// was revoked. Completed blocks stay completed.
    [[nodiscard]] Result<Unit, TransferFailure> ReplaceSessionKey(
        const std::string& session_id,
        const std::string& key_id);

    // ========================================================================
    // Observation
    // ========================================================================

    [[nodiscard]] std::optional<double> GetProgress(const std::string& session_id) const;
    [[nodiscard]] std::optional<SessionReport> GetSessionReport(const std::string& session_id) const;
    [[nodiscard]] std::vector<BlockTransferInfo> GetBlocks(const std::string& session_id) const;
    [[nodiscard]] std::vector<SessionReport> ListSessions() const;

    void AddProgressCallback(ProgressCallback callback);
    void AddEventHandler(std::shared_ptr<interfaces::ITransferEventHandler> handler);

    /// Waits until the session is neither queued nor running.
    /// nullopt on timeout or for an unknown session.
    [[nodiscard]] std::optional<SessionStatus> WaitForSession(
        const std::string& session_id,
        std::chrono::milliseconds timeout);

    /// Blocks until callbacks for everything published so far have run.
    void FlushNotifications();

    [[nodiscard]] TransferStatistics GetStatistics() const;

    [[nodiscard]] const configuration::TransferConfig& GetConfig() const noexcept { return config_; }

    // ========================================================================
    // Housekeeping
    // ========================================================================

    /// Drops Completed and Cancelled sessions older than the retention window.
    size_t EvictExpiredSessions();

    /// Restart recovery from the session directory.
    /// @return Number of sessions loaded
    [[nodiscard]] Result<size_t, TransferFailure> LoadPersistedSessions();

    /// Running sessions stop after their current attempts and are persisted
    /// as Paused. Idempotent.
    void Shutdown();

private:
    enum class StopRequest : uint8_t { None, Pause, Cancel, Shutdown };

    struct SessionRuntime {
        std::shared_ptr<TransferSession> session;

        std::mutex control;
        std::shared_ptr<interfaces::IBlockSource> source;
        bool running = false;
        uint64_t generation = 0;
        std::string cancel_reason;

        std::atomic<StopRequest> stop{StopRequest::None};
        std::atomic<bool> halted{false};
        std::atomic<bool> needs_open{true};

        std::mutex failure_lock;
        std::optional<TransferFailure> failure;

        std::mutex open_lock;
        std::mutex persist_lock;
    };

    struct Counters {
        std::atomic<uint64_t> sessions_started{0};
        std::atomic<uint64_t> sessions_completed{0};
        std::atomic<uint64_t> sessions_failed{0};
        std::atomic<uint64_t> sessions_cancelled{0};
        std::atomic<uint64_t> blocks_transferred{0};
        std::atomic<uint64_t> bytes_transferred{0};
        std::atomic<uint64_t> retry_attempts{0};
        std::atomic<uint64_t> integrity_failures{0};
    };

    SecureBlockTransferManager(
        configuration::TransferConfig config,
        std::shared_ptr<keys::KeyManager> key_manager,
        std::shared_ptr<interfaces::IBlockTransport> transport,
        std::unique_ptr<SessionStore> store,
        std::shared_ptr<interfaces::IDelayScheduler> delay_scheduler,
        std::shared_ptr<interfaces::IClock> clock);

    [[nodiscard]] std::shared_ptr<SessionRuntime> FindRuntime(const std::string& session_id) const;

    /// Caller holds runtime.control.
    void Schedule(const std::shared_ptr<SessionRuntime>& runtime);

    void RunSession(const std::shared_ptr<SessionRuntime>& runtime, uint64_t generation);
    void RunLane(SessionRuntime& runtime);
    void FinishRun(SessionRuntime& runtime);

    [[nodiscard]] Result<Unit, TransferFailure> TransferBlock(SessionRuntime& runtime, size_t position);
    [[nodiscard]] Result<Unit, TransferFailure> AttemptBlock(
        SessionRuntime& runtime,
        size_t position,
        const interfaces::BlockDescriptor& descriptor,
        const std::string& key_id);
    [[nodiscard]] Result<Unit, TransferFailure> EnsureOpened(SessionRuntime& runtime);

    void SendCancel(const SessionRuntime& runtime, const std::string& reason);
    void SendClose(const SessionRuntime& runtime);

    void RecordFatalFailure(SessionRuntime& runtime, const TransferFailure& failure);

    [[nodiscard]] static bool StopRequested(const SessionRuntime& runtime) noexcept;

    [[nodiscard]] Result<Unit, TransferFailure> Persist(SessionRuntime& runtime);
    void PersistOrLog(SessionRuntime& runtime);

    void PublishProgress(const TransferSession& session);
    void PostToHandlers(std::function<void(interfaces::ITransferEventHandler&)> event);
    void NotifyStateChanged();

    configuration::TransferConfig config_;
    std::shared_ptr<keys::KeyManager> key_manager_;
    std::shared_ptr<interfaces::IBlockTransport> transport_;
    std::unique_ptr<SessionStore> store_;
    std::shared_ptr<interfaces::IDelayScheduler> scheduler_;
    std::shared_ptr<interfaces::IClock> clock_;

    mutable std::shared_mutex sessions_lock_;
    std::unordered_map<std::string, std::shared_ptr<SessionRuntime>> sessions_;

    std::mutex handlers_lock_;
    std::vector<std::shared_ptr<interfaces::ITransferEventHandler>> handlers_;

    std::mutex state_mutex_;
    std::condition_variable state_cv_;

    Counters counters_;
    std::atomic<bool> shutdown_{false};

    std::unique_ptr<ProgressDispatcher> dispatcher_;
    std::unique_ptr<SessionWorkerPool> pool_;
};

}  // namespace blockvault::transfer
