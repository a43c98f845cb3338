#include "redline/config.hpp"

#include "redline/consts.hpp"
#include "redline/errors.hpp"
#include "redline/fs.hpp"
#include "redline/util.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>
#include <string>
#include <string_view>

namespace {

std::size_t parse_size(std::string_view key, std::string_view value) {
  std::size_t out = 0;
  const auto *first = value.data();
  const auto *last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, out);
  if (value.empty() || ec != std::errc{} || ptr != last || out == 0)
    throw redline::ValidationError("config: " + std::string(key) +
                                   " must be a positive integer, got '" + std::string(value) + "'");
  return out;
}

bool parse_bool(std::string_view key, std::string_view value) {
  const std::string v = redline::strutil::to_lower(value);
  if (v == "true" || v == "yes" || v == "on" || v == "1")
    return true;
  if (v == "false" || v == "no" || v == "off" || v == "0")
    return false;
  throw redline::ValidationError("config: " + std::string(key) + " must be true or false, got '" +
                                 std::string(value) + "'");
}

redline::log::Level parse_log_level(std::string_view key, std::string_view value) {
  if (auto lvl = redline::log::parse_level(value))
    return *lvl;
  throw redline::ValidationError("config: unknown " + std::string(key) + " '" +
                                 std::string(value) + "'");
}

std::filesystem::path resolve(const std::filesystem::path &root, std::string_view value) {
  std::filesystem::path p{std::string(value)};
  return p.is_absolute() ? p : root / p;
}

const char *env(std::string_view name) { return std::getenv(std::string(name).c_str()); }

} // namespace

namespace redline {

std::filesystem::path config_path(const std::filesystem::path &root) {
  return root / consts::kWorkDir / consts::kConfigFile;
}

Settings default_settings(const std::filesystem::path &root) {
  return Settings{.versions_dir = root / consts::kWorkDir / consts::kVersionsDir,
                  .max_input_chars = consts::kDefaultMaxInputChars,
                  .autojunk = true,
                  .log_level = log::Level::Warn};
}

auto load_settings(const std::filesystem::path &root) -> Settings {
  Settings out = default_settings(root);
  const auto path = config_path(root);

  if (fs::exists(path)) {
    std::istringstream iss(fs::read_text(path));

    constexpr std::string_view k_versions = "versions_dir";
    constexpr std::string_view k_max = "max_input_chars";
    constexpr std::string_view k_autojunk = "autojunk";
    constexpr std::string_view k_log = "log_level";

    std::string line;
    while (std::getline(iss, line)) {
      std::string_view sv{line};
      if (sv.empty() || sv[0] == '#')
        continue; // allow comments
      const auto colon = sv.find(':');
      if (colon == std::string_view::npos)
        continue;
      const std::string key = strutil::trim(sv.substr(0, colon));
      const std::string value = strutil::trim(sv.substr(colon + 1));
      if (key == k_versions) {
        if (value.empty())
          throw ValidationError("config: versions_dir is empty");
        out.versions_dir = resolve(root, value);
      } else if (key == k_max) {
        out.max_input_chars = parse_size(key, value);
      } else if (key == k_autojunk) {
        out.autojunk = parse_bool(key, value);
      } else if (key == k_log) {
        out.log_level = parse_log_level(key, value);
      }
    }
  }

  if (const char *v = env(consts::kEnvVersionsDir); v && *v)
    out.versions_dir = resolve(root, v);
  if (const char *v = env(consts::kEnvMaxInputChars); v && *v)
    out.max_input_chars = parse_size(consts::kEnvMaxInputChars, v);
  if (const char *v = env(consts::kEnvLogLevel); v && *v)
    out.log_level = parse_log_level(consts::kEnvLogLevel, v);
  return out;
}

void save_settings(const std::filesystem::path &root, const Settings &s) {
  std::ostringstream os;
  os << "# redline workspace settings\n"
     << "versions_dir: " << s.versions_dir.string() << '\n'
     << "max_input_chars: " << s.max_input_chars << '\n'
     << "autojunk: " << (s.autojunk ? "true" : "false") << '\n'
     << "log_level: " << log::to_string(s.log_level) << '\n';

  fs::write_text_atomic(config_path(root), os.str());
}

} // namespace redline
