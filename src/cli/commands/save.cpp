#include "cli/common.hpp"
#include "redline/records.hpp"
#include "redline/version_store.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

int cmd_save(const redline::Settings &settings, const std::vector<std::string> &args) {
  std::vector<std::string> positional;
  std::optional<std::string> label;
  std::optional<std::string> style;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string &a = args[i];
    if (a == "-l" || a == "--label" || a == "-s" || a == "--style") {
      if (i + 1 == args.size())
        throw redline::cli::UsageError(a + " needs a value");
      (a == "-l" || a == "--label" ? label : style) = args[++i];
    } else {
      positional.push_back(a);
    }
  }
  if (positional.size() != 2)
    throw redline::cli::UsageError("expected a document id and a file");

  redline::VersionStore store{settings};
  const std::string content = redline::cli::read_input(positional[1]);
  const auto version = store.save(positional[0], content, std::move(label), std::move(style));
  std::cout << nlohmann::json(version).dump(2) << "\n";
  return redline::cli::kExitOk;
}
