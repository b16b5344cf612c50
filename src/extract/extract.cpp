#include "chronoid/extract/extract.h"

#include "chronoid/core/errors.h"

#include <iomanip>
#include <sstream>

namespace chronoid::extract {

namespace {

codec::Uuid parse_or_throw(std::string_view text, codec::Validation validation) {
  auto result = codec::parse(text, validation);
  if (!result.has_value()) {
    throw core::FormatError(result.error());
  }
  return result.value();
}

}  // namespace

std::uint64_t extract_timestamp(const codec::Uuid& id) {
  return id.high() >> 16;
}

std::uint64_t extract_timestamp(std::string_view text, codec::Validation validation) {
  return extract_timestamp(parse_or_throw(text, validation));
}

codec::CounterFields extract_counter(const codec::Uuid& id) {
  return codec::unpack(id).counter();
}

codec::CounterFields extract_counter(std::string_view text, codec::Validation validation) {
  return extract_counter(parse_or_throw(text, validation));
}

std::string extract_counter_hex(const codec::Uuid& id) {
  const auto counter = extract_counter(id);
  std::ostringstream oss;
  oss << std::hex << std::setfill('0') << std::setw(3) << counter.counter_a << std::setw(8)
      << counter.counter_b_hi << std::setw(8) << counter.counter_b_lo;
  return oss.str();
}

std::string extract_counter_hex(std::string_view text, codec::Validation validation) {
  return extract_counter_hex(parse_or_throw(text, validation));
}

codec::CompositeKey extract_composite_key(const codec::Uuid& id) {
  return codec::unpack(id);
}

codec::CompositeKey extract_composite_key(std::string_view text, codec::Validation validation) {
  return extract_composite_key(parse_or_throw(text, validation));
}

core::Timestamp extract_datetime(const codec::Uuid& id) {
  return core::from_unix_millis(extract_timestamp(id));
}

core::Timestamp extract_datetime(std::string_view text, codec::Validation validation) {
  return extract_datetime(parse_or_throw(text, validation));
}

nlohmann::json to_json(const codec::Uuid& id) {
  const auto key = extract_composite_key(id);
  return nlohmann::json{
      {"uuid", codec::format(id)},
      {"timestamp_ms", key.timestamp_ms},
      {"datetime", core::format_iso8601(extract_datetime(id))},
      {"counter", nlohmann::json::array({key.counter_a, key.counter_b_hi, key.counter_b_lo})},
      {"counter_hex", extract_counter_hex(id)},
      {"key", nlohmann::json::array(
                  {key.timestamp_ms, key.counter_a, key.counter_b_hi, key.counter_b_lo})},
  };
}

}  // namespace chronoid::extract
