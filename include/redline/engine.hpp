#pragma once
#include "redline/consts.hpp"
#include "redline/diff.hpp"
#include "redline/summary.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace redline {

struct CompareOptions {
  diff::Granularity granularity = diff::Granularity::Char;
  std::size_t max_input_chars = consts::kDefaultMaxInputChars;
  bool autojunk = true;
};

struct DiffResult {
  std::string version_a_preview;
  std::string version_b_preview;
  std::vector<diff::DiffSegment> segments;
  double similarity = 0.0;
  std::string html_diff;
  ChangeSummary summary;
};

// First 50 characters, with "..." appended when the text is longer.
std::string preview(std::string_view text);

// Throw ResourceLimitExceeded if `text` has more than `max_chars` characters.
void check_input_size(std::string_view text, std::size_t max_chars);

// Align, score, render and summarize `a` against `b`.
// Throws ResourceLimitExceeded when either input is over the cap.
DiffResult compare(std::string_view a, std::string_view b, const CompareOptions &options = {});

} // namespace redline
