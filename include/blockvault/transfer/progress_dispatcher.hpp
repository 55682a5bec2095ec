#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace blockvault::transfer {

using ProgressCallback = std::function<void(const std::string& session_id, double percentage)>;

/**
 * @brief Background thread that runs progress callbacks and session events
 *
 * Publish() never blocks on a callback. The manager publishes after every
 * block state transition. Progress publications coalesce per session: while
 * an update for a session is queued, newer percentages replace it, so a
 * slow callback sees the latest value rather than every transition. Events (completion, failure, retry notices) are delivered
 * in order and never coalesced.
 *
 * Exceptions escaping a callback are logged and dropped.
 */
class ProgressDispatcher {
public:
    ProgressDispatcher();
    ~ProgressDispatcher();

    ProgressDispatcher(const ProgressDispatcher&) = delete;
    ProgressDispatcher& operator=(const ProgressDispatcher&) = delete;

    void AddCallback(ProgressCallback callback);

    void Publish(const std::string& session_id, double percentage);

    void PostEvent(std::function<void()> event);

    /// Blocks until everything published so far has been delivered.
    void Flush();

    /// Delivers what is queued, then stops the thread. Idempotent.
    void Stop();

private:
    struct Pending {
        bool is_event = false;
        std::string session_id;
        std::function<void()> event;
    };

    void Run();
    void Deliver(const std::string& session_id, double percentage);
    void Deliver(const std::function<void()>& event);

    std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<Pending> queue_;
    std::unordered_map<std::string, double> latest_;
    std::vector<ProgressCallback> callbacks_;
    bool busy_ = false;
    bool stopping_ = false;
    std::thread thread_;
};

}  // namespace blockvault::transfer
