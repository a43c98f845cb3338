#include "cli/common.hpp"
#include "cli/registry.hpp"

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

int main(int argc, char **argv) {
  using namespace redline::cli;
  register_all_commands(); // defined in register_commands.cpp

  if (argc < 2) {
    print_usage(std::cerr);
    return kExitUsage;
  }
  const std::string_view name = argv[1];
  if (name == "help" || name == "-h" || name == "--help") {
    print_usage(std::cout);
    return kExitOk;
  }

  const Command *cmd = find_command(name);
  if (!cmd) {
    std::cerr << "unknown command: " << name << "\n";
    print_usage(std::cerr);
    return kExitUsage;
  }
  return run_command(*cmd, std::vector<std::string>(argv + 2, argv + argc));
}
