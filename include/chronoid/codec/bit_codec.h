#pragma once

#include "chronoid/codec/uuid.h"
#include "chronoid/core/result.h"

#include <string>
#include <string_view>

namespace chronoid::codec {

// UUIDv7 bit layout (RFC 9562 §5.7), most significant bit first:
//
//   [48 timestamp_ms][4 ver=0111][12 counter_a][2 var=10][30 counter_b_hi][32 counter_b_lo]
//
// Version and variant are constants injected here; they never come from the
// counter or from entropy.
inline constexpr unsigned kVersion = 7;
inline constexpr unsigned kVariant = 0b10;

// Canonical text is 36 characters: 8-4-4-4-12 lowercase hex digits.
inline constexpr std::size_t kTextLength = 36;

// Validation selects whether parse() checks version and variant bits.
// kNone accepts any well-formed 128-bit text (reading embedded data only).
enum class Validation {
  kNone,    // NOLINT(readability-identifier-naming)
  kStrict,  // NOLINT(readability-identifier-naming)
};

// pack encodes key into a UUIDv7.
// Precondition: every field lies within its declared width; excess high bits are masked off.
[[nodiscard]] Uuid pack(const CompositeKey& key);

// unpack is the inverse of pack. Version and variant bits are discarded.
[[nodiscard]] CompositeKey unpack(const Uuid& id);

// check_version_variant returns ok(true) if id carries version 7 and variant 0b10.
[[nodiscard]] core::Result<bool, core::ParseError> check_version_variant(const Uuid& id);

// parse decodes canonical text (hex digits in either case).
// Rejects wrong length, misplaced hyphens and non-hex digits; with
// Validation::kStrict additionally rejects non-v7 versions and foreign variants.
[[nodiscard]] core::Result<Uuid, core::ParseError> parse(std::string_view text,
                                                         Validation validation = Validation::kNone);

// format renders id in canonical lowercase 8-4-4-4-12 form.
[[nodiscard]] std::string format(const Uuid& id);

}  // namespace chronoid::codec
