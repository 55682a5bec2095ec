#pragma once

/**
 * @file logging.hpp
 * @brief Leveled diagnostic logging for the key manager and transfer engine.
 *
 * Records go to stderr, one line each:
 *   [BLOCKVAULT] <LEVEL> <component>: <message>
 *
 * The threshold defaults to Info and can be changed at runtime with
 * Logger::SetLevel() or at startup through the BLOCKVAULT_LOG_LEVEL
 * environment variable (trace, debug, info, warn, error, off).
 *
 * SECURITY: never pass key material to these macros. Log key ids and
 * fingerprint prefixes (ShortHex) only.
 */

#include "blockvault/core/format.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace blockvault::logging {

enum class Level : uint8_t {
    Trace = 0,
    Debug,
    Info,
    Warning,
    Error,
    Off
};

class Logger {
public:
    [[nodiscard]] static Level GetLevel() noexcept;
    static void SetLevel(Level level) noexcept;

    [[nodiscard]] static bool IsEnabled(Level level) noexcept;

    static void Write(Level level, std::string_view component, std::string_view message);

    [[nodiscard]] static Level ParseLevel(std::string_view name, Level fallback) noexcept;
    [[nodiscard]] static const char* LevelToString(Level level) noexcept;

private:
    Logger() = delete;
};

/**
 * @brief Converts bytes to lowercase hex string.
 */
inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

/**
 * @brief First @p max_chars characters of an identifier, for log lines.
 */
inline std::string ShortHex(std::string_view hex, size_t max_chars = 8) {
    if (hex.size() <= max_chars) {
        return std::string(hex);
    }
    return std::string(hex.substr(0, max_chars)) + "...";
}

} // namespace blockvault::logging

#define BLOCKVAULT_LOG(level, component, ...) \
    do { \
        if (::blockvault::logging::Logger::IsEnabled(level)) { \
            ::blockvault::logging::Logger::Write( \
                level, component, ::blockvault::compat::format(__VA_ARGS__)); \
        } \
    } while(0)

#define BLOCKVAULT_LOG_TRACE(component, ...) \
    BLOCKVAULT_LOG(::blockvault::logging::Level::Trace, component, __VA_ARGS__)
#define BLOCKVAULT_LOG_DEBUG(component, ...) \
    BLOCKVAULT_LOG(::blockvault::logging::Level::Debug, component, __VA_ARGS__)
#define BLOCKVAULT_LOG_INFO(component, ...) \
    BLOCKVAULT_LOG(::blockvault::logging::Level::Info, component, __VA_ARGS__)
#define BLOCKVAULT_LOG_WARN(component, ...) \
    BLOCKVAULT_LOG(::blockvault::logging::Level::Warning, component, __VA_ARGS__)
#define BLOCKVAULT_LOG_ERROR(component, ...) \
    BLOCKVAULT_LOG(::blockvault::logging::Level::Error, component, __VA_ARGS__)
