#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace chronoid::core {

using Clock = std::chrono::system_clock;

// Millisecond resolution keeps the whole 48-bit UUIDv7 range representable;
// Clock::duration (nanoseconds on libstdc++) overflows after the year 2262.
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

// Largest Unix millisecond value representable in the 48-bit UUIDv7 timestamp field.
inline constexpr std::uint64_t kMaxTimestampMs = (std::uint64_t{1} << 48) - 1;

inline Timestamp now_utc() { return std::chrono::floor<std::chrono::milliseconds>(Clock::now()); }

inline std::int64_t to_unix_millis(const Timestamp ts) { return ts.time_since_epoch().count(); }

inline Timestamp from_unix_millis(const std::uint64_t millis) {
  return Timestamp{std::chrono::milliseconds{static_cast<std::int64_t>(millis)}};
}

// format_iso8601 renders ts in UTC with millisecond precision,
// e.g. "2025-02-07T13:22:58.991Z". Years past 9999 print with extra digits.
[[nodiscard]] std::string format_iso8601(Timestamp ts);

}  // namespace chronoid::core
