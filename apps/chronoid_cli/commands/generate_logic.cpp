#include "generate_logic.h"

#include "chronoid/codec/bit_codec.h"

#include <nlohmann/json.hpp>

int execute_generate(chronoid::generator::Generator& generator, std::size_t count, bool json,
                     std::ostream& out) {
  if (json) {
    auto ids = nlohmann::json::array();
    for (std::size_t i = 0; i < count; ++i) {
      ids.push_back(generator.generate_string());
    }
    out << ids.dump(2) << "\n";
    return 0;
  }

  for (std::size_t i = 0; i < count; ++i) {
    out << generator.generate_string() << "\n";
  }
  return 0;
}
