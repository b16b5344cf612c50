#include "inspect.h"

#include "chronoid/codec/bit_codec.h"

#include "inspect_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct InspectCliConfig {
  chronoid::codec::Validation validation{chronoid::codec::Validation::kNone};
  bool json{false};
  bool help{false};
};

std::vector<chronoid::apps::Option<InspectCliConfig>> build_option_registry() {
  return {
      {"--strict", false, "Reject identifiers that are not version 7 / RFC 9562 variant",
       [](InspectCliConfig& c, const std::string&) {
         c.validation = chronoid::codec::Validation::kStrict;
         return true;
       }},
      {"--json", false, "Print a JSON array of decoded fields",
       [](InspectCliConfig& c, const std::string&) {
         c.json = true;
         return true;
       }},
      {"--help", false, "Show this help",
       [](InspectCliConfig& c, const std::string&) {
         c.help = true;
         return true;
       }},
  };
}

}  // namespace

int cmd_inspect(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = build_option_registry();
  auto parsed = chronoid::apps::parse_options(argc, argv, options, 2);

  if (parsed.config.help) {
    chronoid::apps::print_usage(std::cout, "chronoid inspect [options] <uuid>...", options);
    return 0;
  }
  if (!parsed.ok) {
    return 1;
  }
  if (parsed.positionals.empty()) {
    std::cerr << "Error: inspect requires at least one <uuid>\n";
    return 1;
  }

  return execute_inspect(parsed.positionals, parsed.config.validation, parsed.config.json,
                         std::cout, std::cerr);
}
