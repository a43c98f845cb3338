#include "cli/common.hpp"
#include "redline/version_store.hpp"

#include <iostream>

int cmd_clear(const redline::Settings &settings, const std::vector<std::string> &args) {
  if (args.size() != 1)
    throw redline::cli::UsageError("expected a document id");

  redline::VersionStore store{settings};
  store.clear(args[0]);
  std::cout << "Cleared history of " << args[0] << "\n";
  return redline::cli::kExitOk;
}
