#pragma once

#include "chronoid/codec/uuid.h"
#include "chronoid/core/clock.h"
#include "chronoid/core/entropy.h"
#include "chronoid/generator/state_machine.h"

#include <atomic>
#include <memory>
#include <string>

namespace chronoid::generator {

// Generator produces strictly increasing UUIDv7 values (RFC 9562 Method 3).
//
// The state cell is published with compare-and-swap: generate() reads the
// current state, computes the successor from a fresh clock reading and swaps
// it in, retrying on contention. No caller waits on a lock held by another
// generate() call. Ordering is guaranteed per generator only.
//
// The generator holds references (not ownership) to its clock and entropy
// source; both must outlive it and must be safe to call from every thread
// that calls generate().
class Generator {
 public:
  Generator(core::IClock& clock, core::IEntropySource& entropy);
  ~Generator() = default;

  // Not copyable or movable (contains atomic state)
  Generator(const Generator&) = delete;
  Generator& operator=(const Generator&) = delete;
  Generator(Generator&&) = delete;
  Generator& operator=(Generator&&) = delete;

  // Returns an identifier strictly greater than every earlier result of this generator.
  // Throws ClockError or EntropyError; the state is left unchanged on failure.
  [[nodiscard]] codec::Uuid generate();

  // generate() rendered in canonical text form.
  [[nodiscard]] std::string generate_string();

  // Snapshot of the last published state.
  [[nodiscard]] GeneratorState state() const;

 private:
  core::IClock& clock_;
  core::IEntropySource& entropy_;
  std::atomic<std::shared_ptr<const GeneratorState>> state_;
};

// make_generator returns a new independent generator on the system clock and
// OpenSSL entropy, starting from the zero state.
[[nodiscard]] std::unique_ptr<Generator> make_generator();

// default_generator returns the process-wide generator, constructed on first use.
[[nodiscard]] Generator& default_generator();

// generate draws from default_generator().
[[nodiscard]] codec::Uuid generate();

}  // namespace chronoid::generator
