#pragma once
#include <optional>
#include <string>

namespace redline {

// One immutable saved state of a document.
struct TextVersion {
  std::string version_id;
  std::string content;
  std::string timestamp; // ISO-8601, local time
  std::optional<std::string> label;
  std::optional<std::string> style;

  bool operator==(const TextVersion &) const = default;
};

} // namespace redline
