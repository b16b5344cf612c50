#pragma once

#include "chronoid/codec/uuid.h"
#include "chronoid/core/entropy.h"

#include <cstdint>
#include <optional>

namespace chronoid::generator {

// GeneratorState is the only mutable entity of a generator: the last used
// millisecond and the 74-bit counter split as (counter_a, counter_b_hi, counter_b_lo).
// The initial state is all zeros.
using GeneratorState = codec::CompositeKey;

// Number of entropy bytes consumed by a reseed and by an increment draw.
inline constexpr std::size_t kReseedBytes = 10;
inline constexpr std::size_t kIncrementBytes = 4;

// Largest increment; increments are uniform in [1, kMaxIncrement].
inline constexpr std::uint32_t kMaxIncrement = std::uint32_t{1} << 31;

// reseed returns a state at timestamp_ms with a fresh uniformly random counter.
// Draws 10 bytes r[0..9]:
//   counter_a    = be16(r[0..1]) & 0x0FFF
//   counter_b_hi = be32(r[2..5]) & 0x3FFFFFFF
//   counter_b_lo = be32(r[6..9])
[[nodiscard]] GeneratorState reseed(std::uint64_t timestamp_ms, core::IEntropySource& entropy);

// draw_increment returns (be32(r[0..3]) & 0x7FFFFFFF) + 1, uniform in [1, 2^31].
[[nodiscard]] std::uint32_t draw_increment(core::IEntropySource& entropy);

// add_increment adds d to the 74-bit counter of state with explicit carry
// propagation across the three fields. The timestamp is left untouched.
// Returns nullopt if the sum does not fit in 74 bits.
[[nodiscard]] std::optional<GeneratorState> add_increment(const GeneratorState& state,
                                                          std::uint32_t d);

// transition computes the successor of state for the wall-clock value now_ms.
//
// now_ms > state.timestamp_ms: reseed at now_ms.
// otherwise (same millisecond or clock rollback): advance the counter by a
//   random increment, keeping the stored timestamp. On 74-bit overflow the
//   timestamp is bumped by one and the counter reseeded.
//
// The result is always strictly greater than state.
// Throws std::overflow_error if the bumped timestamp leaves the 48-bit range,
// and propagates EntropyError from entropy.
[[nodiscard]] GeneratorState transition(const GeneratorState& state, std::uint64_t now_ms,
                                        core::IEntropySource& entropy);

}  // namespace chronoid::generator
