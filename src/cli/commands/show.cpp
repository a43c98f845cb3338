#include "cli/common.hpp"
#include "redline/records.hpp"
#include "redline/version_store.hpp"

#include <iostream>

int cmd_show(const redline::Settings &settings, const std::vector<std::string> &args) {
  if (args.size() != 2)
    throw redline::cli::UsageError("expected a document id and a version id");

  redline::VersionStore store{settings};
  const auto version = store.get(args[0], args[1]);
  if (!version) {
    std::cerr << "show: no version " << args[1] << " in " << args[0] << "\n";
    return redline::cli::kExitFailure;
  }
  std::cout << nlohmann::json(*version).dump(2) << "\n";
  return redline::cli::kExitOk;
}
