#include "blockvault/transfer/progress_dispatcher.hpp"
#include "blockvault/core/logging.hpp"

#include <exception>

namespace blockvault::transfer {

    namespace {
        constexpr const char* kComponent = "ProgressDispatcher";
    }

    ProgressDispatcher::ProgressDispatcher()
        : thread_([this] { Run(); }) {}

    ProgressDispatcher::~ProgressDispatcher() {
        Stop();
    }

    void ProgressDispatcher::AddCallback(ProgressCallback callback) {
        if (!callback) {
            return;
        }
        std::lock_guard<std::mutex> guard(mutex_);
        callbacks_.push_back(std::move(callback));
    }

    void ProgressDispatcher::Publish(const std::string& session_id, const double percentage) {
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (stopping_) {
                return;
            }
            auto [it, inserted] = latest_.try_emplace(session_id, percentage);
            if (!inserted) {
                it->second = percentage;
                return;
            }
            queue_.push_back(Pending{false, session_id, {}});
        }
        work_cv_.notify_one();
    }

    void ProgressDispatcher::PostEvent(std::function<void()> event) {
        if (!event) {
            return;
        }
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (stopping_) {
                return;
            }
            queue_.push_back(Pending{true, {}, std::move(event)});
        }
        work_cv_.notify_one();
    }

    void ProgressDispatcher::Flush() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (std::this_thread::get_id() == thread_.get_id()) {
            return;
        }
        idle_cv_.wait(lock, [this] { return queue_.empty() && !busy_; });
    }

    void ProgressDispatcher::Stop() {
        {
            std::lock_guard<std::mutex> guard(mutex_);
            stopping_ = true;
        }
        work_cv_.notify_all();
        if (thread_.joinable() && std::this_thread::get_id() != thread_.get_id()) {
            thread_.join();
        }
        idle_cv_.notify_all();
    }

    void ProgressDispatcher::Run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;
            }
            Pending next = std::move(queue_.front());
            queue_.pop_front();
            double percentage = 0.0;
            if (!next.is_event) {
                const auto it = latest_.find(next.session_id);
                percentage = it->second;
                latest_.erase(it);
            }
            busy_ = true;
            lock.unlock();

            if (next.is_event) {
                Deliver(next.event);
            } else {
                Deliver(next.session_id, percentage);
            }

            lock.lock();
            busy_ = false;
            if (queue_.empty()) {
                idle_cv_.notify_all();
            }
        }
        idle_cv_.notify_all();
    }

    void ProgressDispatcher::Deliver(const std::string& session_id, const double percentage) {
        std::vector<ProgressCallback> callbacks;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            callbacks = callbacks_;
        }
        for (const auto& callback : callbacks) {
            try {
                callback(session_id, percentage);
            } catch (const std::exception& ex) {
                BLOCKVAULT_LOG_WARN(kComponent, "Progress callback for session {} threw: {}",
                    session_id, ex.what());
            }
        }
    }

    void ProgressDispatcher::Deliver(const std::function<void()>& event) {
        try {
            event();
        } catch (const std::exception& ex) {
            BLOCKVAULT_LOG_WARN(kComponent, "Event handler threw: {}", ex.what());
        }
    }

}
