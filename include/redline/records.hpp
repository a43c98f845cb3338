#pragma once
#include "redline/engine.hpp"
#include "redline/version.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace redline {

// nlohmann::json conversions, found by ADL.
void to_json(nlohmann::json &j, const TextVersion &v);
void from_json(const nlohmann::json &j, TextVersion &v);

void to_json(nlohmann::json &j, const ChangeSummary &s);
void to_json(nlohmann::json &j, const DiffResult &r);

namespace diff {
void to_json(nlohmann::json &j, const DiffSegment &seg);
} // namespace diff

// History file text: a pretty-printed array in insertion order.
std::string dump_history(const std::vector<TextVersion> &history);

// Parse history file text. Throws nlohmann::json::exception on bad input.
std::vector<TextVersion> parse_history(std::string_view text);

} // namespace redline
