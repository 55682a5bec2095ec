#pragma once
#include <google/protobuf/timestamp.pb.h>
#include <chrono>
#include <optional>

namespace blockvault {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline void SetTimestamp(google::protobuf::Timestamp* timestamp, const TimePoint point) {
    const auto epoch = point.time_since_epoch();
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(epoch);
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(epoch - seconds);
    timestamp->set_seconds(seconds.count());
    timestamp->set_nanos(static_cast<int32_t>(nanos.count()));
}

inline void SetOptionalTimestamp(
    google::protobuf::Timestamp* timestamp,
    const std::optional<TimePoint>& point) {
    if (point.has_value()) {
        SetTimestamp(timestamp, *point);
    }
}

[[nodiscard]] inline TimePoint FromTimestamp(const google::protobuf::Timestamp& timestamp) {
    const auto duration = std::chrono::seconds(timestamp.seconds()) +
                          std::chrono::nanoseconds(timestamp.nanos());
    return TimePoint(std::chrono::duration_cast<Clock::duration>(duration));
}

/// Unset (all-zero) timestamps read back as nullopt.
[[nodiscard]] inline std::optional<TimePoint> FromOptionalTimestamp(
    const bool present,
    const google::protobuf::Timestamp& timestamp) {
    if (!present) {
        return std::nullopt;
    }
    return FromTimestamp(timestamp);
}

}  // namespace blockvault
