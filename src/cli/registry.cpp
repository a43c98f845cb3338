#include "cli/registry.hpp"

#include "cli/common.hpp"

#include <functional>
#include <iostream>
#include <map>

namespace redline::cli {

namespace {

std::map<std::string, Command, std::less<>> &table() {
  static std::map<std::string, Command, std::less<>> t;
  return t;
}

void print_synopsis(std::ostream &out, const Command &cmd) {
  out << "redline " << cmd.name;
  if (!cmd.usage.empty())
    out << ' ' << cmd.usage;
}

} // namespace

void register_command(const Command &cmd) { table()[std::string(cmd.name)] = cmd; }

const Command *find_command(std::string_view name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : &it->second;
}

void print_usage(std::ostream &out) {
  out << "usage: redline <command> [args]\n\n";
  out << "commands:\n";
  for (const auto &[name, cmd] : table()) {
    out << "  " << name << "  " << cmd.summary << "\n      ";
    print_synopsis(out, cmd);
    out << "\n";
  }
  out << "\nexit status: " << kExitOk << " ok, " << kExitFailure << " failure or not found, "
      << kExitUsage << " usage or validation error, " << kExitLimit << " input too large\n";
}

int run_command(const Command &cmd, const std::vector<std::string> &args) {
  try {
    const Settings settings = workspace_settings();
    return cmd.fn(settings, args);
  } catch (const UsageError &e) {
    std::cerr << cmd.name << ": " << e.what() << "\nusage: ";
    print_synopsis(std::cerr, cmd);
    std::cerr << "\n";
    return kExitUsage;
  } catch (const std::exception &e) {
    return report(cmd.name, e);
  }
}

} // namespace redline::cli
