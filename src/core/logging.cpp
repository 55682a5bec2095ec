#include "blockvault/core/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>

namespace blockvault::logging {

namespace {
    Level InitialLevel() noexcept {
        const char* env = std::getenv("BLOCKVAULT_LOG_LEVEL");
        if (env == nullptr) {
            return Level::Info;
        }
        return Logger::ParseLevel(env, Level::Info);
    }

    std::atomic<Level>& CurrentLevel() noexcept {
        static std::atomic<Level> level{InitialLevel()};
        return level;
    }

    std::mutex& OutputLock() noexcept {
        static std::mutex lock;
        return lock;
    }

    bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) !=
                std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }
}

Level Logger::GetLevel() noexcept {
    return CurrentLevel().load(std::memory_order_relaxed);
}

void Logger::SetLevel(const Level level) noexcept {
    CurrentLevel().store(level, std::memory_order_relaxed);
}

bool Logger::IsEnabled(const Level level) noexcept {
    return level != Level::Off && level >= GetLevel();
}

void Logger::Write(const Level level, std::string_view component, std::string_view message) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &utc);

    std::lock_guard lock(OutputLock());
    fprintf(stderr, "%s.%03dZ [BLOCKVAULT] %s %.*s: %.*s\n",
        stamp,
        static_cast<int>(millis),
        LevelToString(level),
        static_cast<int>(component.size()), component.data(),
        static_cast<int>(message.size()), message.data());
    fflush(stderr);
}

Level Logger::ParseLevel(std::string_view name, const Level fallback) noexcept {
    if (EqualsIgnoreCase(name, "trace")) return Level::Trace;
    if (EqualsIgnoreCase(name, "debug")) return Level::Debug;
    if (EqualsIgnoreCase(name, "info")) return Level::Info;
    if (EqualsIgnoreCase(name, "warn") || EqualsIgnoreCase(name, "warning")) return Level::Warning;
    if (EqualsIgnoreCase(name, "error")) return Level::Error;
    if (EqualsIgnoreCase(name, "off")) return Level::Off;
    return fallback;
}

const char* Logger::LevelToString(const Level level) noexcept {
    switch (level) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warning: return "WARN";
        case Level::Error: return "ERROR";
        case Level::Off: return "OFF";
    }
    return "UNKNOWN";
}

} // namespace blockvault::logging
