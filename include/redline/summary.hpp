#pragma once
#include "redline/diff.hpp"

#include <cstddef>
#include <vector>

namespace redline {

// Counts are in characters, except `replacements` which counts runs.
struct ChangeSummary {
  std::size_t insertions = 0;
  std::size_t deletions = 0;
  std::size_t replacements = 0;
  std::size_t unchanged_chars = 0;
  std::size_t total_changes = 0;

  bool operator==(const ChangeSummary &) const = default;
};

ChangeSummary summarize(const std::vector<diff::DiffSegment> &segments);

} // namespace redline
