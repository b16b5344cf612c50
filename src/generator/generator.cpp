#include "chronoid/generator/generator.h"

#include "chronoid/codec/bit_codec.h"
#include "chronoid/core/errors.h"
#include "chronoid/core/time.h"

#include <string>

namespace chronoid::generator {

namespace {

// Both are stateless and thread-safe, so every system generator shares them.
core::SystemClock& system_clock() {
  static core::SystemClock clock;
  return clock;
}

core::OpenSslEntropySource& system_entropy() {
  static core::OpenSslEntropySource entropy;
  return entropy;
}

}  // namespace

Generator::Generator(core::IClock& clock, core::IEntropySource& entropy)
    : clock_(clock), entropy_(entropy), state_(std::make_shared<const GeneratorState>()) {}

codec::Uuid Generator::generate() {
  auto current = state_.load(std::memory_order_acquire);
  for (;;) {
    const auto now = clock_.now_ms();
    if (now > core::kMaxTimestampMs) {
      throw core::ClockError("clock value exceeds the 48-bit millisecond range: " +
                             std::to_string(now) + "ms");
    }

    auto next = std::make_shared<const GeneratorState>(transition(*current, now, entropy_));

    // Strong CAS: a retry draws fresh entropy, so it must only happen on real contention.
    // On failure current is reloaded with the state another caller published.
    if (state_.compare_exchange_strong(current, next, std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
      return codec::pack(*next);
    }
  }
}

std::string Generator::generate_string() {
  return codec::format(generate());
}

GeneratorState Generator::state() const {
  return *state_.load(std::memory_order_acquire);
}

std::unique_ptr<Generator> make_generator() {
  return std::make_unique<Generator>(system_clock(), system_entropy());
}

Generator& default_generator() {
  static Generator generator(system_clock(), system_entropy());
  return generator;
}

codec::Uuid generate() {
  return default_generator().generate();
}

}  // namespace chronoid::generator
