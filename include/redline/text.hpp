#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace redline::text {

// A string decoded into one unit per character.
// Valid UTF-8 sequences become their code point; each byte of an invalid
// sequence becomes its own unit in the U+DC80..U+DCFF range, which valid
// UTF-8 never produces. Every byte belongs to exactly one unit.
struct Units {
  std::vector<std::uint32_t> codes;
  std::vector<std::size_t> offsets; // byte offset of each unit, plus one trailing end offset

  [[nodiscard]] std::size_t size() const { return codes.size(); }
};

Units decode_utf8(std::string_view s);

bool is_valid_utf8(std::string_view s);

// Number of characters, counted the same way decode_utf8 counts units.
std::size_t char_count(std::string_view s);

// First `n` characters of `s` (whole string if shorter).
std::string_view prefix_chars(std::string_view s, std::size_t n);

// Split into lines, each keeping its terminator, so joining them gives `text` back.
// Terminators: \r\n \n \r \v \f \x1c \x1d \x1e U+0085 U+2028 U+2029.
std::vector<std::string_view> split_lines(std::string_view text);

} // namespace redline::text
