#include "chronoid/generator/state_machine.h"

#include "chronoid/core/time.h"

#include <array>
#include <stdexcept>
#include <string>

namespace chronoid::generator {

namespace {

constexpr std::uint64_t kLoModulus = std::uint64_t{1} << 32;
constexpr std::uint64_t kHiModulus = std::uint64_t{1} << 30;
constexpr std::uint64_t kAModulus = std::uint64_t{1} << 12;

template <std::size_t N>
constexpr std::uint32_t be32(const std::array<std::uint8_t, N>& r, std::size_t at) {
  return (static_cast<std::uint32_t>(r[at]) << 24) | (static_cast<std::uint32_t>(r[at + 1]) << 16) |
         (static_cast<std::uint32_t>(r[at + 2]) << 8) | static_cast<std::uint32_t>(r[at + 3]);
}

}  // namespace

GeneratorState reseed(std::uint64_t timestamp_ms, core::IEntropySource& entropy) {
  std::array<std::uint8_t, kReseedBytes> r{};
  entropy.fill(r);

  GeneratorState next;
  next.timestamp_ms = timestamp_ms;
  next.counter_a = static_cast<std::uint16_t>(((r[0] << 8) | r[1]) & codec::kCounterAMax);
  next.counter_b_hi = be32(r, 2) & codec::kCounterBHiMax;
  next.counter_b_lo = be32(r, 6);
  return next;
}

std::uint32_t draw_increment(core::IEntropySource& entropy) {
  std::array<std::uint8_t, kIncrementBytes> r{};
  entropy.fill(r);
  return (be32(r, 0) & 0x7FFFFFFFu) + 1u;
}

std::optional<GeneratorState> add_increment(const GeneratorState& state, std::uint32_t d) {
  const std::uint64_t sum_lo = std::uint64_t{state.counter_b_lo} + d;
  const std::uint64_t carry1 = sum_lo / kLoModulus;

  const std::uint64_t sum_hi = std::uint64_t{state.counter_b_hi} + carry1;
  const std::uint64_t carry2 = sum_hi / kHiModulus;

  const std::uint64_t sum_a = std::uint64_t{state.counter_a} + carry2;
  if (sum_a >= kAModulus) {
    return std::nullopt;
  }

  GeneratorState next = state;
  next.counter_b_lo = static_cast<std::uint32_t>(sum_lo % kLoModulus);
  next.counter_b_hi = static_cast<std::uint32_t>(sum_hi % kHiModulus);
  next.counter_a = static_cast<std::uint16_t>(sum_a);
  return next;
}

GeneratorState transition(const GeneratorState& state, std::uint64_t now_ms,
                          core::IEntropySource& entropy) {
  if (now_ms > state.timestamp_ms) {
    return reseed(now_ms, entropy);
  }

  auto incremented = add_increment(state, draw_increment(entropy));
  if (incremented.has_value()) {
    return *incremented;
  }

  // 74-bit counter exhausted within this millisecond: borrow the next one.
  if (state.timestamp_ms >= core::kMaxTimestampMs) {
    throw std::overflow_error("UUIDv7 timestamp exhausted at " +
                              std::to_string(state.timestamp_ms) + "ms");
  }
  return reseed(state.timestamp_ms + 1, entropy);
}

}  // namespace chronoid::generator
