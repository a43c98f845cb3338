#pragma once
#include "redline/diff.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace redline::render {

// Escape & < > " ' and turn '\n' into <br>.
std::string escape_html(std::string_view text);

// Highlighted markup: deletions struck through, insertions marked as added,
// a replacement as its deletion followed by its insertion.
std::string render_html(const std::vector<diff::DiffSegment> &segments);

} // namespace redline::render
