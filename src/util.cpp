// Identifier helpers and version-id derivation
#include "redline/util.hpp"

#include "redline/consts.hpp"
#include "redline/errors.hpp"
#include "redline/hash.hpp"

#include <algorithm>
#include <cctype>

namespace redline {

bool looks_version_id(std::string_view str) {
  if (str.empty() || str.size() > consts::kMaxVersionIdLen) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isalnum(static_cast<unsigned char>(c)); });
}

bool looks_document_id(std::string_view str) {
  if (str.empty() || str.size() > consts::kMaxDocumentIdLen || str.front() == '.') {
    return false;
  }
  return std::ranges::all_of(str, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
  });
}

void validate_document_id(std::string_view str) {
  if (!looks_document_id(str))
    throw ValidationError("invalid document id: '" + std::string(str) + "'");
}

void validate_version_id(std::string_view str) {
  if (!looks_version_id(str))
    throw ValidationError("invalid version id: '" + std::string(str) + "'");
}

std::string make_version_id(std::string_view content, std::string_view timestamp) {
  std::string input;
  input.reserve(content.size() + timestamp.size());
  input.append(content);
  input.append(timestamp);
  return to_hex(md5(input)).substr(0, consts::kVersionIdLen);
}

namespace strutil {

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::string to_lower(std::string_view sv) {
  std::string out(sv);
  std::ranges::transform(out, out.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace strutil

} // namespace redline
