#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>

namespace chronoid::codec {

// Uuid is an immutable 128-bit identifier stored big-endian.
// Byte-wise ordering equals numeric ordering equals canonical-text ordering.
struct Uuid {
  std::array<std::uint8_t, 16> bytes{};

  // high() returns bits 127..64, low() returns bits 63..0.
  [[nodiscard]] constexpr std::uint64_t high() const {
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < 8; ++i) {
      v = (v << 8) | bytes[i];
    }
    return v;
  }

  [[nodiscard]] constexpr std::uint64_t low() const {
    std::uint64_t v = 0;
    for (std::size_t i = 8; i < 16; ++i) {
      v = (v << 8) | bytes[i];
    }
    return v;
  }

  static constexpr Uuid from_halves(std::uint64_t high, std::uint64_t low) {
    Uuid id;
    for (std::size_t i = 0; i < 8; ++i) {
      id.bytes[7 - i] = static_cast<std::uint8_t>(high >> (8 * i));
      id.bytes[15 - i] = static_cast<std::uint8_t>(low >> (8 * i));
    }
    return id;
  }

  auto operator<=>(const Uuid&) const = default;
};

// CounterFields is the 74-bit monotonic counter, most significant field first.
struct CounterFields {
  std::uint16_t counter_a{0};     // 12 bits, UUID rand_a
  std::uint32_t counter_b_hi{0};  // 30 bits
  std::uint32_t counter_b_lo{0};  // 32 bits
  auto operator<=>(const CounterFields&) const = default;
};

// CompositeKey is the full sortable content of a UUIDv7: every bit except
// version and variant. Tuple order equals identifier order.
struct CompositeKey {
  std::uint64_t timestamp_ms{0};  // 48 bits
  std::uint16_t counter_a{0};
  std::uint32_t counter_b_hi{0};
  std::uint32_t counter_b_lo{0};

  [[nodiscard]] constexpr CounterFields counter() const {
    return CounterFields{counter_a, counter_b_hi, counter_b_lo};
  }

  auto operator<=>(const CompositeKey&) const = default;
};

inline constexpr std::uint16_t kCounterAMax = 0x0FFF;
inline constexpr std::uint32_t kCounterBHiMax = 0x3FFFFFFF;
inline constexpr std::uint32_t kCounterBLoMax = 0xFFFFFFFF;

}  // namespace chronoid::codec
