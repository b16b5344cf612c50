#pragma once

#include <cstdint>
#include <mutex>

namespace chronoid::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests feed arbitrary
// (including decreasing) millisecond sequences.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current Unix time in whole milliseconds.
  // Contract: not assumed monotone. Throws ClockError if no usable time is available.
  virtual std::uint64_t now_ms() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: reads std::chrono::system_clock.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::uint64_t now_ms() override;
};

// Fixed clock: returns a settable timestamp for deterministic tests.
// Thread-safe.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::uint64_t fixed_ms) : fixed_ms_(fixed_ms) {}
  ~FixedClock() override = default;

  // Not copyable or movable (contains mutex)
  FixedClock(const FixedClock&) = delete;
  FixedClock& operator=(const FixedClock&) = delete;
  FixedClock(FixedClock&&) = delete;
  FixedClock& operator=(FixedClock&&) = delete;

  std::uint64_t now_ms() override;

  void set(std::uint64_t fixed_ms);
  void advance(std::uint64_t delta_ms);

 private:
  std::mutex mutex_;
  std::uint64_t fixed_ms_;
};

}  // namespace chronoid::core
