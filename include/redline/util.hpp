#pragma once
#include <string>
#include <string_view>

namespace redline {

// Version ids: 1..64 ASCII alphanumerics. Freshly derived ids are 12 lowercase hex chars.
auto looks_version_id(std::string_view str) -> bool;

// Document ids name a file: 1..128 chars of [A-Za-z0-9._-], not starting with '.'.
auto looks_document_id(std::string_view str) -> bool;

// Throw ValidationError unless the id is well formed.
void validate_document_id(std::string_view str);
void validate_version_id(std::string_view str);

// First 12 hex chars of MD5(content + timestamp).
auto make_version_id(std::string_view content, std::string_view timestamp) -> std::string;

// String helpers
namespace strutil {
  // Strip spaces, tabs and CR from both ends
  auto trim(std::string_view sv) -> std::string;
  auto to_lower(std::string_view sv) -> std::string;
}

}
