#include "redline/diff.hpp"

#include "redline/matcher.hpp"
#include "redline/text.hpp"

#include <string_view>
#include <unordered_map>

namespace redline::diff {

std::string_view to_string(SegmentKind kind) {
  switch (kind) {
  case SegmentKind::Equal:
    return "equal";
  case SegmentKind::Insert:
    return "insert";
  case SegmentKind::Delete:
    return "delete";
  case SegmentKind::Replace:
    return "replace";
  }
  return "equal";
}

namespace {

// A text cut into comparison units.
//   ids[k]       unit k as an integer (code point, or interned line id)
//   bytes[k]     byte offset where unit k starts; bytes[size] == text.size()
//   chars[k]     character offset where unit k starts; chars[size] == char count
struct Sequence {
  std::string_view text;
  std::vector<std::uint32_t> ids;
  std::vector<std::size_t> bytes;
  std::vector<std::size_t> chars;

  std::string slice(std::size_t lo, std::size_t hi) const {
    return std::string(text.substr(bytes[lo], bytes[hi] - bytes[lo]));
  }
};

Sequence char_units(std::string_view s) {
  text::Units u = text::decode_utf8(s);
  Sequence seq{.text = s, .ids = std::move(u.codes), .bytes = std::move(u.offsets), .chars = {}};
  seq.chars.resize(seq.bytes.size());
  for (std::size_t k = 0; k < seq.chars.size(); ++k)
    seq.chars[k] = k;
  return seq;
}

using LineTable = std::unordered_map<std::string_view, std::uint32_t>;

Sequence line_units(std::string_view s, LineTable &table) {
  Sequence seq{.text = s, .ids = {}, .bytes = {}, .chars = {}};
  std::size_t byte = 0;
  std::size_t chr = 0;
  for (const std::string_view line : text::split_lines(s)) {
    const auto [it, inserted] =
        table.try_emplace(line, static_cast<std::uint32_t>(table.size()));
    seq.ids.push_back(it->second);
    seq.bytes.push_back(byte);
    seq.chars.push_back(chr);
    byte += line.size();
    chr += text::char_count(line);
  }
  seq.bytes.push_back(byte);
  seq.chars.push_back(chr);
  return seq;
}

SegmentKind kind_of(OpTag tag) {
  switch (tag) {
  case OpTag::Equal:
    return SegmentKind::Equal;
  case OpTag::Replace:
    return SegmentKind::Replace;
  case OpTag::Delete:
    return SegmentKind::Delete;
  case OpTag::Insert:
    return SegmentKind::Insert;
  }
  return SegmentKind::Equal;
}

} // namespace

Alignment align(std::string_view a, std::string_view b, Granularity granularity,
                bool autojunk) {
  Sequence sa;
  Sequence sb;
  if (granularity == Granularity::Line) {
    LineTable table;
    sa = line_units(a, table);
    sb = line_units(b, table);
  } else {
    sa = char_units(a);
    sb = char_units(b);
  }

  const SequenceMatcher matcher(sa.ids, sb.ids, autojunk);

  Alignment out;
  out.matched_units = matcher.matched_units();
  out.total_units = sa.ids.size() + sb.ids.size();
  for (const Opcode &op : matcher.opcodes()) {
    const SegmentKind kind = kind_of(op.tag);
    out.segments.push_back(DiffSegment{
        .kind = kind,
        .original = kind == SegmentKind::Insert ? std::string() : sa.slice(op.a1, op.a2),
        .modified = kind == SegmentKind::Delete ? std::string() : sb.slice(op.b1, op.b2),
        .start_pos = sa.chars[op.a1],
        .end_pos = sa.chars[op.a2],
    });
  }
  return out;
}

std::vector<DiffSegment> compare(std::string_view a, std::string_view b, Granularity granularity) {
  return align(a, b, granularity).segments;
}

} // namespace redline::diff
