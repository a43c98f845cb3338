#include "cli/common.hpp"
#include "redline/config.hpp"
#include "redline/fs.hpp"

#include <filesystem>
#include <iostream>

int cmd_init(const redline::Settings &settings, const std::vector<std::string> &args) {
  if (!args.empty())
    throw redline::cli::UsageError("init takes no arguments");

  const std::filesystem::path root = std::filesystem::current_path();
  const auto cfg = redline::config_path(root);
  if (redline::fs::exists(cfg)) {
    std::cerr << "init: already initialized (" << cfg << ")\n";
    return redline::cli::kExitFailure;
  }
  redline::save_settings(root, redline::default_settings(root));
  // settings may point elsewhere through REDLINE_VERSIONS_DIR
  redline::fs::ensure_dir(settings.versions_dir);
  std::cout << "Initialized redline workspace in " << cfg.parent_path() << "\n";
  return redline::cli::kExitOk;
}
