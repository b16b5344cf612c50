#include "chronoid/core/version.h"

#include "commands/generate.h"
#include "commands/inspect.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cout << "chronoid v" << chronoid::core::kBuildVersion << "\n"
            << "Usage: chronoid <command> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  generate   Generate UUIDv7 identifiers\n"
            << "  inspect    Decode the timestamp and counter of UUIDv7 identifiers\n"
            << "\n"
            << "Run 'chronoid <command> --help' for command options.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "inspect") {
    return cmd_inspect(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << "chronoid " << chronoid::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand == "--help" || subcommand == "help") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
