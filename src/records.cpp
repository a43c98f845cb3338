#include "redline/records.hpp"

#include "redline/consts.hpp"

#include <string>

namespace redline {

using json = nlohmann::json;

namespace {

json nullable(const std::optional<std::string> &v) { return v ? json(*v) : json(nullptr); }

std::optional<std::string> optional_string(const json &j, const char *key) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return std::nullopt;
  return it->get<std::string>();
}

} // namespace

void to_json(json &j, const TextVersion &v) {
  j = json{{consts::kKeyVersionId, v.version_id},
           {consts::kKeyContent, v.content},
           {consts::kKeyTimestamp, v.timestamp},
           {consts::kKeyLabel, nullable(v.label)},
           {consts::kKeyStyle, nullable(v.style)}};
}

void from_json(const json &j, TextVersion &v) {
  j.at(consts::kKeyVersionId).get_to(v.version_id);
  j.at(consts::kKeyContent).get_to(v.content);
  j.at(consts::kKeyTimestamp).get_to(v.timestamp);
  v.label = optional_string(j, consts::kKeyLabel);
  v.style = optional_string(j, consts::kKeyStyle);
}

void to_json(json &j, const ChangeSummary &s) {
  j = json{{"insertions", s.insertions},
           {"deletions", s.deletions},
           {"replacements", s.replacements},
           {"unchanged_chars", s.unchanged_chars},
           {"total_changes", s.total_changes}};
}

namespace diff {

void to_json(json &j, const DiffSegment &seg) {
  j = json{{"type", std::string(to_string(seg.kind))},
           {"original", seg.original},
           {"modified", seg.modified},
           {"position", {{"start", seg.start_pos}, {"end", seg.end_pos}}}};
}

} // namespace diff

void to_json(json &j, const DiffResult &r) {
  j = json{{"version_a_preview", r.version_a_preview},
           {"version_b_preview", r.version_b_preview},
           {"similarity", r.similarity},
           {"html_diff", r.html_diff},
           {"summary", r.summary},
           {"segments", r.segments}};
}

std::string dump_history(const std::vector<TextVersion> &history) {
  const json arr = history;
  return arr.dump(consts::kJsonIndent);
}

std::vector<TextVersion> parse_history(std::string_view text) {
  const json j = json::parse(text);
  return j.get<std::vector<TextVersion>>();
}

} // namespace redline
