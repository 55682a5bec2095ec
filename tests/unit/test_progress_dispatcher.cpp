#include <catch2/catch_test_macros.hpp>
#include "blockvault/transfer/progress_dispatcher.hpp"
#include "blockvault/transfer/session_worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
using namespace blockvault::transfer;

TEST_CASE("ProgressDispatcher - Delivery", "[transfer][progress]") {
    ProgressDispatcher dispatcher;

    SECTION("Callbacks see the latest percentage") {
        std::mutex lock;
        std::vector<double> seen;
        std::vector<std::string> sessions;
        dispatcher.AddCallback([&](const std::string& session_id, const double percentage) {
            std::lock_guard<std::mutex> guard(lock);
            sessions.push_back(session_id);
            seen.push_back(percentage);
        });
        for (int i = 1; i <= 10; ++i) {
            dispatcher.Publish("s1", i * 10.0);
        }
        dispatcher.Flush();
        std::lock_guard<std::mutex> guard(lock);
        REQUIRE_FALSE(seen.empty());
        REQUIRE(seen.size() <= 10);
        REQUIRE(seen.back() == 100.0);
        REQUIRE(sessions.front() == "s1");
    }
    SECTION("A slow callback does not block the publisher") {
        std::promise<void> release;
        auto released = release.get_future().share();
        dispatcher.AddCallback([released](const std::string&, double) {
            released.wait();
        });
        const auto start = std::chrono::steady_clock::now();
        dispatcher.Publish("s1", 10.0);
        dispatcher.Publish("s1", 20.0);
        dispatcher.Publish("s2", 5.0);
        REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(1));
        release.set_value();
        dispatcher.Flush();
    }
    SECTION("A throwing callback does not stop the others") {
        std::atomic<int> calls{0};
        dispatcher.AddCallback([](const std::string&, double) {
            throw std::runtime_error("observer failure");
        });
        dispatcher.AddCallback([&calls](const std::string&, double) {
            ++calls;
        });
        dispatcher.Publish("s1", 50.0);
        dispatcher.Flush();
        REQUIRE(calls.load() == 1);
    }
    SECTION("Events run in order") {
        std::vector<int> order;
        for (int i = 0; i < 20; ++i) {
            dispatcher.PostEvent([&order, i] { order.push_back(i); });
        }
        dispatcher.Flush();
        REQUIRE(order.size() == 20);
        for (int i = 0; i < 20; ++i) {
            REQUIRE(order[static_cast<size_t>(i)] == i);
        }
    }
    SECTION("Stop delivers what was queued and is idempotent") {
        std::atomic<int> events{0};
        dispatcher.PostEvent([&events] { ++events; });
        dispatcher.Stop();
        dispatcher.Stop();
        REQUIRE(events.load() == 1);
    }
}

TEST_CASE("SessionWorkerPool - Concurrency ceiling", "[transfer][pool][concurrency]") {
    SECTION("Never more jobs at once than threads") {
        SessionWorkerPool pool(2);
        std::atomic<int> active{0};
        std::atomic<int> peak{0};
        std::atomic<int> done{0};
        for (int i = 0; i < 8; ++i) {
            REQUIRE(pool.Submit([&] {
                const int now = ++active;
                int expected = peak.load();
                while (now > expected && !peak.compare_exchange_weak(expected, now)) {
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                --active;
                ++done;
            }));
        }
        while (done.load() < 8) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        REQUIRE(peak.load() <= 2);
        REQUIRE(pool.QueuedJobs() == 0);
    }
    SECTION("Queued jobs start in submission order") {
        SessionWorkerPool pool(1);
        std::mutex lock;
        std::vector<int> order;
        std::promise<void> all_done;
        for (int i = 0; i < 5; ++i) {
            REQUIRE(pool.Submit([&, i] {
                std::lock_guard<std::mutex> guard(lock);
                order.push_back(i);
                if (order.size() == 5) {
                    all_done.set_value();
                }
            }));
        }
        all_done.get_future().wait();
        REQUIRE(order == std::vector<int>{0, 1, 2, 3, 4});
    }
    SECTION("Submit after shutdown is refused") {
        SessionWorkerPool pool(1);
        pool.Shutdown();
        REQUIRE_FALSE(pool.Submit([] {}));
        pool.Shutdown();
    }
}
