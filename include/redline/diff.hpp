#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace redline::diff {

enum class SegmentKind : std::uint8_t { Equal, Insert, Delete, Replace };

enum class Granularity : std::uint8_t { Char, Line };

// "equal" | "insert" | "delete" | "replace"
std::string_view to_string(SegmentKind kind);

// One run of the alignment between A (original) and B (modified).
// Positions are character offsets into A; an Insert has start_pos == end_pos.
struct DiffSegment {
  SegmentKind kind;
  std::string original; // empty for Insert
  std::string modified; // empty for Delete
  std::size_t start_pos;
  std::size_t end_pos;

  bool operator==(const DiffSegment &) const = default;
};

// Segments plus the unit counts the similarity ratio is computed from.
struct Alignment {
  std::vector<DiffSegment> segments;
  std::size_t matched_units = 0; // units covered by matching blocks
  std::size_t total_units = 0;   // units in A + units in B
};

// Align `a` against `b`. Concatenating segment.original gives `a` back and
// concatenating segment.modified gives `b` back.
Alignment align(std::string_view a, std::string_view b, Granularity granularity,
                bool autojunk = true);

// Segments only.
std::vector<DiffSegment> compare(std::string_view a, std::string_view b,
                                 Granularity granularity = Granularity::Char);

} // namespace redline::diff
