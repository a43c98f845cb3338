#include "cli/common.hpp"
#include "redline/records.hpp"
#include "redline/version_store.hpp"

#include <iostream>

int cmd_diff(const redline::Settings &settings, const std::vector<std::string> &args) {
  const auto parsed = redline::cli::parse_diff_args(args, 3);
  const auto &doc = parsed.positional[0];

  redline::VersionStore store{settings};
  const auto result =
      store.compare_versions(doc, parsed.positional[1], parsed.positional[2], parsed.granularity);
  if (!result) {
    std::cerr << "diff: version not found in " << doc << "\n";
    return redline::cli::kExitFailure;
  }
  if (parsed.html)
    std::cout << result->html_diff << "\n";
  else
    std::cout << nlohmann::json(*result).dump(2) << "\n";
  return redline::cli::kExitOk;
}
