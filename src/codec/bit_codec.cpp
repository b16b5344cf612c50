#include "chronoid/codec/bit_codec.h"

#include "chronoid/core/time.h"

#include <array>
#include <cstdint>

namespace chronoid::codec {

namespace {

using ParseResult = core::Result<Uuid, core::ParseError>;
using CheckResult = core::Result<bool, core::ParseError>;

constexpr std::uint64_t kVersionBits = std::uint64_t{kVersion} << 12;
constexpr std::uint64_t kVariantBits = std::uint64_t{kVariant} << 62;

constexpr std::array<char, 16> kHexDigits = {'0', '1', '2', '3', '4', '5', '6', '7',
                                             '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

constexpr bool is_hyphen_offset(std::size_t i) {
  return i == 8 || i == 13 || i == 18 || i == 23;
}

// Returns the nibble value of c, or -1 if c is not a hex digit.
constexpr int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

Uuid pack(const CompositeKey& key) {
  const std::uint64_t high = ((key.timestamp_ms & core::kMaxTimestampMs) << 16) | kVersionBits |
                             (key.counter_a & kCounterAMax);
  const std::uint64_t low = kVariantBits |
                            (static_cast<std::uint64_t>(key.counter_b_hi & kCounterBHiMax) << 32) |
                            key.counter_b_lo;
  return Uuid::from_halves(high, low);
}

CompositeKey unpack(const Uuid& id) {
  const std::uint64_t high = id.high();
  const std::uint64_t low = id.low();

  CompositeKey key;
  key.timestamp_ms = high >> 16;
  key.counter_a = static_cast<std::uint16_t>(high & kCounterAMax);
  key.counter_b_hi = static_cast<std::uint32_t>((low >> 32) & kCounterBHiMax);
  key.counter_b_lo = static_cast<std::uint32_t>(low & kCounterBLoMax);
  return key;
}

CheckResult check_version_variant(const Uuid& id) {
  if (((id.high() >> 12) & 0xF) != kVersion) {
    return CheckResult::err(core::ParseError::kInvalidVersion);
  }
  if ((id.low() >> 62) != kVariant) {
    return CheckResult::err(core::ParseError::kInvalidVariant);
  }
  return CheckResult::ok(true);
}

ParseResult parse(std::string_view text, Validation validation) {
  if (text.size() != kTextLength) {
    return ParseResult::err(core::ParseError::kInvalidLength);
  }

  Uuid id;
  std::size_t nibble = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (is_hyphen_offset(i)) {
      if (c != '-') {
        return ParseResult::err(core::ParseError::kMisplacedHyphen);
      }
      continue;
    }
    const int v = hex_value(c);
    if (v < 0) {
      return ParseResult::err(c == '-' ? core::ParseError::kMisplacedHyphen
                                       : core::ParseError::kInvalidCharacter);
    }
    auto& byte = id.bytes[nibble / 2];
    byte = static_cast<std::uint8_t>((nibble % 2 == 0) ? (v << 4) : (byte | v));
    ++nibble;
  }

  if (validation == Validation::kStrict) {
    auto check = check_version_variant(id);
    if (!check.has_value()) {
      return ParseResult::err(check.error());
    }
  }
  return ParseResult::ok(id);
}

std::string format(const Uuid& id) {
  std::string out;
  out.reserve(kTextLength);
  for (std::size_t i = 0; i < id.bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(kHexDigits[id.bytes[i] >> 4]);
    out.push_back(kHexDigits[id.bytes[i] & 0x0F]);
  }
  return out;
}

}  // namespace chronoid::codec
