#pragma once

#include "blockvault/core/failures.hpp"
#include "blockvault/core/result.hpp"
#include "blockvault/transfer/constants.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>

namespace blockvault::configuration {

/// Tuning knobs for the block transfer engine.
///
/// Retry schedule for attempt n (1-based) that failed:
/// ```
/// delay(n) = min(retry_base_delay * 2^(n-1), retry_max_delay)
/// ```
/// A block is attempted at most `max_retries` times; the wait follows
/// every failed attempt except the last.
///
/// @example
/// ```cpp
/// auto config = TransferConfig::Default()
///     .WithMaxConcurrentSessions(1)
///     .WithRetryDelays(std::chrono::milliseconds(10), std::chrono::milliseconds(40));
/// ```
class TransferConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// 3 attempts, 1 s base, 30 s cap, 3 concurrent sessions, 4 blocks in flight.
    [[nodiscard]] static TransferConfig Default() noexcept {
        return TransferConfig();
    }

    /// Wider pipelines for fast local links.
    [[nodiscard]] static TransferConfig HighThroughput() noexcept {
        return TransferConfig()
            .WithMaxConcurrentSessions(6)
            .WithBlockWindow(16);
    }

    /// One session, one block at a time, longer waits. For flaky links.
    [[nodiscard]] static TransferConfig Conservative() noexcept {
        return TransferConfig()
            .WithMaxConcurrentSessions(1)
            .WithBlockWindow(1)
            .WithRetryDelays(std::chrono::milliseconds(2000), std::chrono::milliseconds(60'000));
    }

    // =========================================================================
    // Modifiers
    // =========================================================================

    [[nodiscard]] TransferConfig WithMaxRetries(const uint32_t value) const noexcept {
        TransferConfig copy = *this;
        copy.max_retries_ = value;
        return copy;
    }

    [[nodiscard]] TransferConfig WithRetryDelays(
        const std::chrono::milliseconds base,
        const std::chrono::milliseconds max) const noexcept {
        TransferConfig copy = *this;
        copy.retry_base_delay_ = base;
        copy.retry_max_delay_ = max;
        return copy;
    }

    [[nodiscard]] TransferConfig WithAckTimeout(const std::chrono::milliseconds value) const noexcept {
        TransferConfig copy = *this;
        copy.ack_timeout_ = value;
        return copy;
    }

    [[nodiscard]] TransferConfig WithMaxConcurrentSessions(const uint32_t value) const noexcept {
        TransferConfig copy = *this;
        copy.max_concurrent_sessions_ = value;
        return copy;
    }

    [[nodiscard]] TransferConfig WithBlockWindow(const uint32_t value) const noexcept {
        TransferConfig copy = *this;
        copy.block_window_ = value;
        return copy;
    }

    [[nodiscard]] TransferConfig WithBlockSize(const size_t value) const noexcept {
        TransferConfig copy = *this;
        copy.block_size_ = value;
        return copy;
    }

    [[nodiscard]] TransferConfig WithSessionRetention(const std::chrono::milliseconds value) const noexcept {
        TransferConfig copy = *this;
        copy.session_retention_ = value;
        return copy;
    }

    [[nodiscard]] TransferConfig WithMaxResumeAttempts(const uint32_t value) const noexcept {
        TransferConfig copy = *this;
        copy.max_resume_attempts_ = value;
        return copy;
    }

    [[nodiscard]] TransferConfig WithRetireKeyOnCompletion(const bool value) const noexcept {
        TransferConfig copy = *this;
        copy.retire_key_on_completion_ = value;
        return copy;
    }

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] uint32_t GetMaxRetries() const noexcept { return max_retries_; }
    [[nodiscard]] std::chrono::milliseconds GetRetryBaseDelay() const noexcept { return retry_base_delay_; }
    [[nodiscard]] std::chrono::milliseconds GetRetryMaxDelay() const noexcept { return retry_max_delay_; }
    [[nodiscard]] std::chrono::milliseconds GetAckTimeout() const noexcept { return ack_timeout_; }
    [[nodiscard]] uint32_t GetMaxConcurrentSessions() const noexcept { return max_concurrent_sessions_; }
    [[nodiscard]] uint32_t GetBlockWindow() const noexcept { return block_window_; }
    [[nodiscard]] size_t GetBlockSize() const noexcept { return block_size_; }
    [[nodiscard]] std::chrono::milliseconds GetSessionRetention() const noexcept { return session_retention_; }
    [[nodiscard]] uint32_t GetMaxResumeAttempts() const noexcept { return max_resume_attempts_; }
    [[nodiscard]] bool ShouldRetireKeyOnCompletion() const noexcept { return retire_key_on_completion_; }

    /// Wait after the @p failed_attempts-th failure (1-based).
    [[nodiscard]] std::chrono::milliseconds BackoffDelay(const uint32_t failed_attempts) const noexcept {
        if (failed_attempts == 0) {
            return std::chrono::milliseconds(0);
        }
        const uint32_t shift = std::min<uint32_t>(failed_attempts - 1, 30);
        const auto base = retry_base_delay_.count();
        if (base > 0 && (retry_max_delay_.count() >> shift) < base) {
            return retry_max_delay_;
        }
        return std::min(std::chrono::milliseconds(base << shift), retry_max_delay_);
    }

    [[nodiscard]] Result<Unit, TransferFailure> Validate() const {
        if (max_retries_ == 0) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("max_retries must be at least 1"));
        }
        if (retry_base_delay_.count() < 0 || retry_max_delay_ < retry_base_delay_) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("retry delays must satisfy 0 <= base <= max"));
        }
        if (max_concurrent_sessions_ == 0) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("max_concurrent_sessions must be at least 1"));
        }
        if (block_window_ == 0) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("block_window must be at least 1"));
        }
        if (block_size_ == 0) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("block_size must be positive"));
        }
        if (ack_timeout_.count() <= 0) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("ack_timeout must be positive"));
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }

private:
    TransferConfig() noexcept = default;

    uint32_t max_retries_ = kDefaultMaxRetries;
    std::chrono::milliseconds retry_base_delay_ = kDefaultRetryBaseDelay;
    std::chrono::milliseconds retry_max_delay_ = kDefaultRetryMaxDelay;
    std::chrono::milliseconds ack_timeout_ = kDefaultAckTimeout;
    uint32_t max_concurrent_sessions_ = kDefaultMaxConcurrentSessions;
    uint32_t block_window_ = kDefaultBlockWindow;
    size_t block_size_ = kDefaultBlockSize;
    std::chrono::milliseconds session_retention_ = kDefaultSessionRetention;
    uint32_t max_resume_attempts_ = kDefaultMaxResumeAttempts;
    bool retire_key_on_completion_ = false;
};

} // namespace blockvault::configuration
