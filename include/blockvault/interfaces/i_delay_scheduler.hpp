#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace blockvault::interfaces {

/// Backoff waits. WaitFor returns false when @p cancelled became true
/// before the delay elapsed.
class IDelayScheduler {
public:
    virtual ~IDelayScheduler() = default;

    virtual bool WaitFor(
        std::chrono::milliseconds delay,
        const std::function<bool()>& cancelled) = 0;

    /// Wakes every pending wait so it re-checks its predicate.
    virtual void WakeAll() = 0;
};

class ConditionDelayScheduler final : public IDelayScheduler {
public:
    bool WaitFor(
        const std::chrono::milliseconds delay,
        const std::function<bool()>& cancelled) override {
        std::unique_lock lock(mutex_);
        const bool woken = cv_.wait_for(lock, delay, cancelled);
        return !woken;
    }

    void WakeAll() override {
        { std::lock_guard lock(mutex_); }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
};

}
