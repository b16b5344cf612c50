#pragma once

#include <cstddef>
#include <string_view>
#include <utility>
#include <variant>

namespace chronoid::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).

// ParseError describes why a textual identifier was rejected.
enum class ParseError {
  kInvalidLength,     // not exactly 36 characters
  kInvalidCharacter,  // non-hex character in a digit position
  kMisplacedHyphen,   // hyphen missing at offset 8, 13, 18 or 23
  kInvalidVersion,    // version nibble is not 7 (strict validation only)
  kInvalidVariant,    // variant prefix is not 0b10 (strict validation only)
};

// to_string returns a stable, human-readable description of a ParseError.
[[nodiscard]] constexpr std::string_view to_string(ParseError error) {
  switch (error) {
    case ParseError::kInvalidLength:
      return "identifier must be 36 characters";
    case ParseError::kInvalidCharacter:
      return "identifier contains a non-hex digit";
    case ParseError::kMisplacedHyphen:
      return "identifier hyphens must be at offsets 8, 13, 18 and 23";
    case ParseError::kInvalidVersion:
      return "identifier version is not 7";
    case ParseError::kInvalidVariant:
      return "identifier variant is not RFC 9562";
  }
  return "unknown parse error";
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace chronoid::core
