#include "blockvault/transfer/session_worker_pool.hpp"
#include "blockvault/core/logging.hpp"

#include <algorithm>
#include <exception>

namespace blockvault::transfer {

    namespace {
        constexpr const char* kComponent = "SessionWorkerPool";
    }

    SessionWorkerPool::SessionWorkerPool(const uint32_t thread_count) {
        const uint32_t count = std::max<uint32_t>(thread_count, 1);
        threads_.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            threads_.emplace_back([this] { WorkerLoop(); });
        }
        BLOCKVAULT_LOG_DEBUG(kComponent, "Started {} session workers", count);
    }

    SessionWorkerPool::~SessionWorkerPool() {
        Shutdown();
    }

    bool SessionWorkerPool::Submit(std::function<void()> job) {
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (stopping_) {
                return false;
            }
            jobs_.push_back(std::move(job));
        }
        cv_.notify_one();
        return true;
    }

    size_t SessionWorkerPool::QueuedJobs() const {
        std::lock_guard<std::mutex> guard(mutex_);
        return jobs_.size();
    }

    size_t SessionWorkerPool::RunningJobs() const {
        std::lock_guard<std::mutex> guard(mutex_);
        return running_;
    }

    void SessionWorkerPool::Shutdown() {
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (stopping_ && threads_.empty()) {
                return;
            }
            stopping_ = true;
            if (!jobs_.empty()) {
                BLOCKVAULT_LOG_DEBUG(kComponent, "Dropping {} queued jobs", jobs_.size());
            }
            jobs_.clear();
        }
        cv_.notify_all();
        for (auto& thread : threads_) {
            if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
                thread.join();
            }
        }
        std::lock_guard<std::mutex> guard(mutex_);
        threads_.clear();
    }

    void SessionWorkerPool::WorkerLoop() {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
                if (stopping_) {
                    return;
                }
                job = std::move(jobs_.front());
                jobs_.pop_front();
                ++running_;
            }
            try {
                job();
            } catch (const std::exception& ex) {
                BLOCKVAULT_LOG_ERROR(kComponent, "Session job threw: {}", ex.what());
            }
            std::lock_guard<std::mutex> guard(mutex_);
            --running_;
        }
    }

}
