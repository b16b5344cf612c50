#include "chronoid/core/clock.h"

#include "chronoid/core/errors.h"
#include "chronoid/core/time.h"

#include <string>

namespace chronoid::core {

std::uint64_t SystemClock::now_ms() {
  const auto millis = to_unix_millis(now_utc());
  if (millis < 0) {
    throw ClockError("system clock reports a time before the Unix epoch: " +
                     std::to_string(millis) + "ms");
  }
  const auto value = static_cast<std::uint64_t>(millis);
  if (value > kMaxTimestampMs) {
    throw ClockError("system clock exceeds the 48-bit millisecond range: " +
                     std::to_string(value) + "ms");
  }
  return value;
}

std::uint64_t FixedClock::now_ms() {
  std::lock_guard<std::mutex> lock(mutex_);
  return fixed_ms_;
}

void FixedClock::set(std::uint64_t fixed_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  fixed_ms_ = fixed_ms;
}

void FixedClock::advance(std::uint64_t delta_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  fixed_ms_ += delta_ms;
}

}  // namespace chronoid::core
