#pragma once

#include "chronoid/codec/bit_codec.h"
#include "chronoid/codec/uuid.h"
#include "chronoid/core/time.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace chronoid::extract {

// Pure readers for identifiers that already exist. None of them touch generator state.
//
// The std::string_view overloads accept canonical text and throw core::FormatError
// when it is malformed. Version and variant are checked only when validation is
// Validation::kStrict.

[[nodiscard]] std::uint64_t extract_timestamp(const codec::Uuid& id);
[[nodiscard]] std::uint64_t extract_timestamp(
    std::string_view text, codec::Validation validation = codec::Validation::kNone);

// Counter fields in significance order; tuple order matches identifier order
// whenever timestamps are equal.
[[nodiscard]] codec::CounterFields extract_counter(const codec::Uuid& id);
[[nodiscard]] codec::CounterFields extract_counter(
    std::string_view text, codec::Validation validation = codec::Validation::kNone);

// 19 lowercase hex digits: 3 for counter_a, 8 for counter_b_hi, 8 for counter_b_lo.
// String order matches identifier order whenever timestamps are equal.
[[nodiscard]] std::string extract_counter_hex(const codec::Uuid& id);
[[nodiscard]] std::string extract_counter_hex(
    std::string_view text, codec::Validation validation = codec::Validation::kNone);

[[nodiscard]] codec::CompositeKey extract_composite_key(const codec::Uuid& id);
[[nodiscard]] codec::CompositeKey extract_composite_key(
    std::string_view text, codec::Validation validation = codec::Validation::kNone);

[[nodiscard]] core::Timestamp extract_datetime(const codec::Uuid& id);
[[nodiscard]] core::Timestamp extract_datetime(
    std::string_view text, codec::Validation validation = codec::Validation::kNone);

// to_json renders every extracted field of id:
// {"uuid", "timestamp_ms", "datetime", "counter": [a, b_hi, b_lo], "counter_hex",
//  "key": [ts, a, b_hi, b_lo]}
[[nodiscard]] nlohmann::json to_json(const codec::Uuid& id);

}  // namespace chronoid::extract
