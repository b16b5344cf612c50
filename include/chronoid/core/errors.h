#pragma once

#include "chronoid/core/result.h"

#include <stdexcept>
#include <string>

namespace chronoid::core {

// FormatError is thrown by the text overloads of the extraction API when the
// input cannot be parsed. The caller can always recover by rejecting the input.
class FormatError : public std::invalid_argument {
 public:
  explicit FormatError(ParseError reason)
      : std::invalid_argument(std::string(to_string(reason))), reason_(reason) {}

  [[nodiscard]] ParseError reason() const noexcept { return reason_; }

 private:
  ParseError reason_;
};

// ClockError: the time source could not produce a usable millisecond value.
// Fatal for the generate() call that observed it.
class ClockError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// EntropyError: the randomness source is unavailable or exhausted.
// No lower-quality fallback is ever substituted.
class EntropyError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace chronoid::core
