#include "redline/summary.hpp"

#include "redline/text.hpp"

namespace redline {

ChangeSummary summarize(const std::vector<diff::DiffSegment> &segments) {
  ChangeSummary s;
  for (const auto &seg : segments) {
    switch (seg.kind) {
    case diff::SegmentKind::Insert:
      s.insertions += text::char_count(seg.modified);
      break;
    case diff::SegmentKind::Delete:
      s.deletions += text::char_count(seg.original);
      break;
    case diff::SegmentKind::Replace:
      s.replacements += 1;
      s.deletions += text::char_count(seg.original);
      s.insertions += text::char_count(seg.modified);
      break;
    case diff::SegmentKind::Equal:
      s.unchanged_chars += text::char_count(seg.original);
      break;
    }
  }
  s.total_changes = s.insertions + s.deletions;
  return s;
}

} // namespace redline
