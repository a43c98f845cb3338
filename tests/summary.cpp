#include "redline/diff.hpp"
#include "redline/summary.hpp"

#include <iostream>
#include <string>
#include <vector>

using redline::ChangeSummary;
using redline::diff::DiffSegment;
using redline::diff::SegmentKind;

int main() {
  // kitten -> sitting: two one-char replacements, one insertion, four unchanged
  {
    const auto s = redline::summarize(redline::diff::compare("kitten", "sitting"));
    const ChangeSummary want{
        .insertions = 3, .deletions = 2, .replacements = 2, .unchanged_chars = 4, .total_changes = 5};
    if (!(s == want)) {
      std::cerr << "kitten/sitting summary: ins=" << s.insertions << " del=" << s.deletions
                << " rep=" << s.replacements << " eq=" << s.unchanged_chars << "\n";
      return 1;
    }
  }

  // Replacement counts runs, not characters.
  {
    const std::vector<DiffSegment> segs = {
        {SegmentKind::Replace, "abc", "wxyz", 0, 3},
        {SegmentKind::Delete, "de", "", 3, 5},
        {SegmentKind::Insert, "", "q", 5, 5},
        {SegmentKind::Equal, "f", "f", 5, 6},
    };
    const auto s = redline::summarize(segs);
    if (s.replacements != 1 || s.insertions != 5 || s.deletions != 5 || s.unchanged_chars != 1 ||
        s.total_changes != 10) {
      std::cerr << "mixed summary mismatch\n";
      return 1;
    }
  }

  // Lengths are characters.
  {
    const std::vector<DiffSegment> segs = {
        {SegmentKind::Insert, "", "\xE4\xBD\xA0\xE5\xA5\xBD", 0, 0}};
    if (redline::summarize(segs).insertions != 2) {
      std::cerr << "two CJK characters should count as 2\n";
      return 1;
    }
  }

  if (!(redline::summarize({}) == ChangeSummary{})) {
    std::cerr << "empty summary should be all zero\n";
    return 1;
  }

  {
    const auto s = redline::summarize(redline::diff::compare("same", "same"));
    if (s.total_changes != 0 || s.unchanged_chars != 4) {
      std::cerr << "identical texts should have no changes\n";
      return 1;
    }
  }

  std::cout << "OK\n";
  return 0;
}
