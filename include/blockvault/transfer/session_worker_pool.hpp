#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace blockvault::transfer {

/// Fixed set of threads draining a FIFO job queue. The thread count is the
/// number of sessions allowed to run at once; queued jobs wait untouched
/// until a thread frees up.
class SessionWorkerPool {
public:
    explicit SessionWorkerPool(uint32_t thread_count);
    ~SessionWorkerPool();

    SessionWorkerPool(const SessionWorkerPool&) = delete;
    SessionWorkerPool& operator=(const SessionWorkerPool&) = delete;

    /// False once Shutdown() has begun.
    bool Submit(std::function<void()> job);

    [[nodiscard]] size_t QueuedJobs() const;
    [[nodiscard]] size_t RunningJobs() const;

    /// Drops queued jobs, waits for running ones and joins the threads.
    void Shutdown();

private:
    void WorkerLoop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> jobs_;
    size_t running_ = 0;
    bool stopping_ = false;
    std::vector<std::thread> threads_;
};

}  // namespace blockvault::transfer
