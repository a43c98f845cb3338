#include "cli/common.hpp"
#include "redline/version_store.hpp"

#include <iostream>
#include <string>

int cmd_log(const redline::Settings &settings, const std::vector<std::string> &args) {
  if (args.size() != 1)
    throw redline::cli::UsageError("expected a document id");

  redline::VersionStore store{settings};
  const auto history = store.list(args[0]);
  if (history.empty()) {
    std::cout << "(no versions)\n";
    return redline::cli::kExitOk;
  }
  for (const auto &v : history) {
    std::cout << v.version_id << "  " << v.timestamp;
    if (v.label)
      std::cout << "  [" << *v.label << "]";
    if (v.style)
      std::cout << "  (" << *v.style << ")";
    std::cout << "\n";
  }
  return redline::cli::kExitOk;
}
