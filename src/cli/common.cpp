#include "cli/common.hpp"

#include "redline/errors.hpp"
#include "redline/fs.hpp"
#include "redline/log.hpp"

#include <filesystem>
#include <iostream>
#include <iterator>

namespace redline::cli {

Settings workspace_settings() {
  Settings s = load_settings(std::filesystem::current_path());
  log::set_level(s.log_level);
  return s;
}

std::string read_input(const std::string &path) {
  if (path == "-") {
    return std::string{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
  }
  return fs::read_text(path);
}

DiffArgs parse_diff_args(const std::vector<std::string> &args, std::size_t positional_count) {
  DiffArgs out;
  for (const auto &a : args) {
    if (a == "--lines")
      out.granularity = diff::Granularity::Line;
    else if (a == "--html")
      out.html = true;
    else if (a.size() > 2 && a.starts_with("--"))
      throw UsageError("unknown option " + a);
    else
      out.positional.push_back(a);
  }
  if (out.positional.size() != positional_count)
    throw UsageError("expected " + std::to_string(positional_count) + " arguments, got " +
                     std::to_string(out.positional.size()));
  return out;
}

int report(std::string_view cmd, const std::exception &e) {
  const auto *err = dynamic_cast<const Error *>(&e);
  if (!err) {
    std::cerr << cmd << ": " << e.what() << "\n";
    return kExitFailure;
  }
  std::cerr << cmd << ": " << to_string(err->kind()) << ": " << e.what() << "\n";
  switch (err->kind()) {
  case ErrorKind::Validation:
    return kExitUsage;
  case ErrorKind::ResourceLimit:
    return kExitLimit;
  case ErrorKind::Persistence:
    return kExitFailure;
  }
  return kExitFailure;
}

} // namespace redline::cli
