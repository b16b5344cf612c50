#include "generate.h"

#include "chronoid/generator/generator.h"

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include <cstddef>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct GenerateCliConfig {
  std::size_t count{1};
  bool json{false};
  bool help{false};
};

// Accepts 1..1000000; anything else is a usage error.
bool handle_count(GenerateCliConfig& config, const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos ||
      value.size() > 7) {
    std::cerr << "Invalid --count: " << value << " (valid: 1..1000000)\n";
    return false;
  }
  const auto count = std::stoul(value);
  if (count < 1 || count > 1000000) {
    std::cerr << "Invalid --count: " << value << " (valid: 1..1000000)\n";
    return false;
  }
  config.count = count;
  return true;
}

std::vector<chronoid::apps::Option<GenerateCliConfig>> build_option_registry() {
  return {
      {"--count", true, "Number of identifiers to generate (default 1)", handle_count},
      {"--json", false, "Print a JSON array instead of one identifier per line",
       [](GenerateCliConfig& c, const std::string&) {
         c.json = true;
         return true;
       }},
      {"--help", false, "Show this help",
       [](GenerateCliConfig& c, const std::string&) {
         c.help = true;
         return true;
       }},
  };
}

}  // namespace

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = build_option_registry();
  auto parsed = chronoid::apps::parse_options(argc, argv, options, 2);

  if (parsed.config.help) {
    chronoid::apps::print_usage(std::cout, "chronoid generate [options]", options);
    return 0;
  }
  if (!parsed.ok) {
    return 1;
  }
  if (!parsed.positionals.empty()) {
    std::cerr << "Error: generate takes no arguments, got: " << parsed.positionals.front()
              << "\n";
    return 1;
  }

  try {
    auto generator = chronoid::generator::make_generator();
    return execute_generate(*generator, parsed.config.count, parsed.config.json, std::cout);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
