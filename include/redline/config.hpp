#pragma once
#include "redline/log.hpp"

#include <cstddef>
#include <filesystem>

namespace redline {

struct Settings {
  std::filesystem::path versions_dir;  // one <document_id>.json per document
  std::size_t max_input_chars = 0;     // per-input cap for comparisons
  bool autojunk = true;
  log::Level log_level = log::Level::Warn;
};

// Defaults for a workspace rooted at `root` (versions under root/.redline/versions).
Settings default_settings(const std::filesystem::path& root);

// root/.redline/config
std::filesystem::path config_path(const std::filesystem::path& root);

// Read root/.redline/config (defaults if missing), then apply REDLINE_* environment overrides.
// Throws ValidationError on a malformed value.
Settings load_settings(const std::filesystem::path& root);

// Overwrite root/.redline/config with the given settings
void save_settings(const std::filesystem::path& root, const Settings& settings);

} // namespace redline
