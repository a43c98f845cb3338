#include "redline/render.hpp"

#include "redline/consts.hpp"

namespace redline::render {

std::string escape_html(std::string_view text) {
  std::string out;
  out.reserve(text.size() + text.size() / 8);
  for (const char c : text) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&#39;";
      break;
    case '\n':
      out += consts::kLineBreak;
      break;
    default:
      out.push_back(c);
    }
  }
  return out;
}

namespace {

void append_deleted(std::string &out, std::string_view text) {
  out += consts::kDeleteOpen;
  out += escape_html(text);
  out += consts::kSpanClose;
}

void append_inserted(std::string &out, std::string_view text) {
  out += consts::kInsertOpen;
  out += escape_html(text);
  out += consts::kSpanClose;
}

} // namespace

std::string render_html(const std::vector<diff::DiffSegment> &segments) {
  std::string out;
  for (const auto &seg : segments) {
    switch (seg.kind) {
    case diff::SegmentKind::Equal:
      out += escape_html(seg.original);
      break;
    case diff::SegmentKind::Delete:
      append_deleted(out, seg.original);
      break;
    case diff::SegmentKind::Insert:
      append_inserted(out, seg.modified);
      break;
    case diff::SegmentKind::Replace:
      append_deleted(out, seg.original);
      append_inserted(out, seg.modified);
      break;
    }
  }
  return out;
}

} // namespace redline::render
