#pragma once
#include "redline/config.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace redline::cli {

// Subcommand handler. args holds everything after the subcommand name.
// Returns the exit status; failures are thrown and mapped by the dispatcher.
using command_fn = int (*)(const Settings &settings, const std::vector<std::string> &args);

struct Command {
  std::string_view name;
  std::string_view usage; // argument synopsis, may be empty
  std::string_view summary;
  command_fn fn = nullptr;
};

} // namespace redline::cli
