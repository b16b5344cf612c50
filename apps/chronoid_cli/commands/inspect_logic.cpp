#include "inspect_logic.h"

#include "chronoid/core/result.h"
#include "chronoid/core/time.h"
#include "chronoid/extract/extract.h"

#include <nlohmann/json.hpp>

int execute_inspect(const std::vector<std::string>& identifiers, chronoid::codec::Validation validation,
                    bool json, std::ostream& out, std::ostream& err) {
  namespace codec = chronoid::codec;
  namespace extract = chronoid::extract;

  int status = 0;
  auto results = nlohmann::json::array();

  for (const auto& text : identifiers) {
    auto parsed = codec::parse(text, validation);
    if (!parsed.has_value()) {
      err << "Invalid identifier " << text << ": " << chronoid::core::to_string(parsed.error())
          << "\n";
      status = 1;
      continue;
    }

    const auto& id = parsed.value();
    if (json) {
      results.push_back(extract::to_json(id));
      continue;
    }

    const auto key = extract::extract_composite_key(id);
    out << codec::format(id) << "\n"
        << "  timestamp_ms: " << key.timestamp_ms << "\n"
        << "  datetime:     " << chronoid::core::format_iso8601(extract::extract_datetime(id))
        << "\n"
        << "  counter:      " << key.counter_a << " " << key.counter_b_hi << " "
        << key.counter_b_lo << "\n"
        << "  counter_hex:  " << extract::extract_counter_hex(id) << "\n";
  }

  if (json) {
    out << results.dump(2) << "\n";
  }
  return status;
}
