#include "redline/engine.hpp"

#include "redline/errors.hpp"
#include "redline/render.hpp"
#include "redline/similarity.hpp"
#include "redline/text.hpp"

namespace redline {

std::string preview(std::string_view text) {
  const std::string_view head = text::prefix_chars(text, consts::kPreviewChars);
  if (head.size() == text.size())
    return std::string(text);
  std::string out(head);
  out += consts::kPreviewEllipsis;
  return out;
}

void check_input_size(std::string_view text, std::size_t max_chars) {
  // Every character takes at least one byte, so short inputs need no count.
  if (text.size() <= max_chars)
    return;
  if (const std::size_t n = text::char_count(text); n > max_chars)
    throw ResourceLimitExceeded(max_chars, n);
}

DiffResult compare(std::string_view a, std::string_view b, const CompareOptions &options) {
  check_input_size(a, options.max_input_chars);
  check_input_size(b, options.max_input_chars);

  diff::Alignment alignment = diff::align(a, b, options.granularity, options.autojunk);

  DiffResult out;
  out.version_a_preview = preview(a);
  out.version_b_preview = preview(b);
  out.similarity = diff::similarity(alignment);
  out.html_diff = render::render_html(alignment.segments);
  out.summary = summarize(alignment.segments);
  out.segments = std::move(alignment.segments);
  return out;
}

} // namespace redline
