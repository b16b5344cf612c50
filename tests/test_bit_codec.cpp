#include "chronoid/codec/bit_codec.h"
#include "chronoid/codec/uuid.h"
#include "chronoid/core/result.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace chronoid;

namespace {

// {ts=1738934578991, a=2844, b_hi=14925, b_lo=1058348430}
constexpr codec::CompositeKey kKnownKey{1738934578991ULL, 2844, 14925, 1058348430};
constexpr const char* kKnownText = "0194e093-ef2f-7b1c-8000-3a4d3f151d8e";

}  // namespace

TEST_CASE("pack places fields around version and variant", "[codec]") {
  const auto id = codec::pack(kKnownKey);

  SECTION("high word: 48-bit timestamp, version nibble 0111, 12-bit counter_a") {
    CHECK(id.high() >> 16 == 1738934578991ULL);
    CHECK(((id.high() >> 12) & 0xF) == 0b0111);
    CHECK((id.high() & 0xFFF) == 2844);
  }

  SECTION("low word: variant 10, 30-bit counter_b_hi, 32-bit counter_b_lo") {
    CHECK((id.low() >> 62) == 0b10);
    CHECK(((id.low() >> 32) & 0x3FFFFFFF) == 14925);
    CHECK((id.low() & 0xFFFFFFFF) == 1058348430);
  }

  SECTION("canonical text") {
    CHECK(codec::format(id) == kKnownText);
  }
}

TEST_CASE("unpack reproduces the packed tuple", "[codec]") {
  const auto key = codec::unpack(codec::pack(kKnownKey));
  CHECK(key == kKnownKey);

  const auto parsed = codec::parse(kKnownText, codec::Validation::kStrict);
  REQUIRE(parsed.has_value());
  CHECK(codec::unpack(parsed.value()) == kKnownKey);
}

TEST_CASE("pack keeps version and variant when fields are at their maxima", "[codec]") {
  const codec::CompositeKey max_key{(1ULL << 48) - 1, codec::kCounterAMax, codec::kCounterBHiMax,
                                    codec::kCounterBLoMax};
  const auto id = codec::pack(max_key);
  CHECK(codec::format(id) == "ffffffff-ffff-7fff-bfff-ffffffffffff");
  CHECK(codec::unpack(id) == max_key);

  const auto zero = codec::pack(codec::CompositeKey{});
  CHECK(codec::format(zero) == "00000000-0000-7000-8000-000000000000");
}

TEST_CASE("pack masks out-of-range high bits instead of corrupting version/variant", "[codec]") {
  const codec::CompositeKey wide{1ULL << 50, 0xFFFF, 0xFFFFFFFF, 0};
  const auto id = codec::pack(wide);
  REQUIRE(codec::check_version_variant(id).has_value());
  CHECK(codec::unpack(id).counter_a == codec::kCounterAMax);
  CHECK(codec::unpack(id).counter_b_hi == codec::kCounterBHiMax);
}

TEST_CASE("parse accepts upper-case hex and formats lower-case", "[codec]") {
  const auto parsed = codec::parse("0194E093-EF2F-7B1C-8000-3A4D3F151D8E");
  REQUIRE(parsed.has_value());
  CHECK(codec::format(parsed.value()) == kKnownText);
}

TEST_CASE("parse rejects malformed text", "[codec][errors]") {
  SECTION("wrong length") {
    auto r = codec::parse("0194e093-ef2f-7b1c-8000-3a4d3f151d8");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == core::ParseError::kInvalidLength);

    auto empty = codec::parse("");
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error() == core::ParseError::kInvalidLength);
  }

  SECTION("non-hex digit") {
    auto r = codec::parse("0194e093-ef2f-7b1c-8000-3a4d3f151dxe");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == core::ParseError::kInvalidCharacter);
  }

  SECTION("hyphen in the wrong place") {
    auto r = codec::parse("0194e0930-ef2-7b1c-8000-3a4d3f151d8e");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == core::ParseError::kMisplacedHyphen);

    auto no_hyphens = codec::parse("0194e093eef2f07b1c080003a4d3f151d8e0");
    REQUIRE_FALSE(no_hyphens.has_value());
    CHECK(no_hyphens.error() == core::ParseError::kMisplacedHyphen);
  }
}

TEST_CASE("strict validation checks version and variant", "[codec][errors]") {
  // Version 4 identifier with RFC variant.
  const std::string v4 = "0194e093-ef2f-4b1c-8000-3a4d3f151d8e";
  // Version 7 identifier with Microsoft variant (110x).
  const std::string bad_variant = "0194e093-ef2f-7b1c-c000-3a4d3f151d8e";

  SECTION("lenient parse reads them anyway") {
    CHECK(codec::parse(v4).has_value());
    CHECK(codec::parse(bad_variant).has_value());
  }

  SECTION("strict parse rejects them") {
    auto r1 = codec::parse(v4, codec::Validation::kStrict);
    REQUIRE_FALSE(r1.has_value());
    CHECK(r1.error() == core::ParseError::kInvalidVersion);

    auto r2 = codec::parse(bad_variant, codec::Validation::kStrict);
    REQUIRE_FALSE(r2.has_value());
    CHECK(r2.error() == core::ParseError::kInvalidVariant);
  }

  SECTION("every accepted variant nibble") {
    for (const char c : std::string("89ab")) {
      std::string text = kKnownText;
      text[19] = c;
      CHECK(codec::parse(text, codec::Validation::kStrict).has_value());
    }
  }
}

TEST_CASE("Uuid ordering matches canonical text ordering", "[codec]") {
  const auto a = codec::pack({1000, 1, 0, 0});
  const auto b = codec::pack({1000, 1, 0, 1});
  const auto c = codec::pack({1001, 0, 0, 0});

  CHECK(a < b);
  CHECK(b < c);
  CHECK(codec::format(a) < codec::format(b));
  CHECK(codec::format(b) < codec::format(c));
  CHECK(codec::Uuid::from_halves(a.high(), a.low()) == a);
}
