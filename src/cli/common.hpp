#pragma once
#include "redline/config.hpp"
#include "redline/diff.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace redline::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1; // persistence fault, not found, other runtime error
inline constexpr int kExitUsage = 2;   // bad arguments or validation error
inline constexpr int kExitLimit = 3;   // comparison input over the configured cap

// Bad command-line arguments; the dispatcher prints the command's synopsis.
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Settings of the workspace rooted at the current directory; also applies its log level.
Settings workspace_settings();

// Whole file as bytes, or all of stdin for "-".
std::string read_input(const std::string &path);

// Arguments of compare and diff: positionals plus --lines / --html.
struct DiffArgs {
  std::vector<std::string> positional;
  diff::Granularity granularity = diff::Granularity::Char;
  bool html = false;
};
DiffArgs parse_diff_args(const std::vector<std::string> &args, std::size_t positional_count);

// Print "<cmd>: <kind>: <message>" and pick the exit status for the exception.
int report(std::string_view cmd, const std::exception &e);

} // namespace redline::cli
