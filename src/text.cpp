#include "redline/text.hpp"

namespace redline::text {

namespace {

constexpr std::uint32_t kEscapeBase = 0xDC00; // invalid byte b -> U+DC00 + b

bool is_cont(unsigned char c) { return (c & 0xC0) == 0x80; }

// Decode the character starting at s[i]; `len` receives its byte length.
std::uint32_t decode_one(std::string_view s, std::size_t i, std::size_t &len) {
  const auto b0 = static_cast<unsigned char>(s[i]);
  const std::size_t left = s.size() - i;
  auto at = [&](std::size_t k) { return static_cast<unsigned char>(s[i + k]); };

  if (b0 < 0x80) {
    len = 1;
    return b0;
  }
  if (b0 >= 0xC2 && b0 <= 0xDF && left >= 2 && is_cont(at(1))) {
    len = 2;
    return ((b0 & 0x1Fu) << 6) | (at(1) & 0x3Fu);
  }
  if (b0 >= 0xE0 && b0 <= 0xEF && left >= 3) {
    const unsigned char b1 = at(1);
    const bool second_ok = b0 == 0xE0   ? (b1 >= 0xA0 && b1 <= 0xBF)
                           : b0 == 0xED ? (b1 >= 0x80 && b1 <= 0x9F)
                                        : is_cont(b1);
    if (second_ok && is_cont(at(2))) {
      len = 3;
      return ((b0 & 0x0Fu) << 12) | ((b1 & 0x3Fu) << 6) | (at(2) & 0x3Fu);
    }
  }
  if (b0 >= 0xF0 && b0 <= 0xF4 && left >= 4) {
    const unsigned char b1 = at(1);
    const bool second_ok = b0 == 0xF0   ? (b1 >= 0x90 && b1 <= 0xBF)
                           : b0 == 0xF4 ? (b1 >= 0x80 && b1 <= 0x8F)
                                        : is_cont(b1);
    if (second_ok && is_cont(at(2)) && is_cont(at(3))) {
      len = 4;
      return ((b0 & 0x07u) << 18) | ((b1 & 0x3Fu) << 12) | ((at(2) & 0x3Fu) << 6) |
             (at(3) & 0x3Fu);
    }
  }
  len = 1;
  return kEscapeBase + b0;
}

// Byte length of the line terminator at s[i], or 0 if there is none.
std::size_t terminator_len(std::string_view s, std::size_t i) {
  const auto c = static_cast<unsigned char>(s[i]);
  switch (c) {
  case '\r':
    return (i + 1 < s.size() && s[i + 1] == '\n') ? 2 : 1;
  case '\n':
  case '\v':
  case '\f':
  case 0x1C:
  case 0x1D:
  case 0x1E:
    return 1;
  case 0xC2: // U+0085
    return (i + 1 < s.size() && static_cast<unsigned char>(s[i + 1]) == 0x85) ? 2 : 0;
  case 0xE2: // U+2028, U+2029
    if (i + 2 < s.size() && static_cast<unsigned char>(s[i + 1]) == 0x80) {
      const auto c2 = static_cast<unsigned char>(s[i + 2]);
      if (c2 == 0xA8 || c2 == 0xA9)
        return 3;
    }
    return 0;
  default:
    return 0;
  }
}

} // namespace

Units decode_utf8(std::string_view s) {
  Units out;
  out.codes.reserve(s.size());
  out.offsets.reserve(s.size() + 1);
  std::size_t i = 0;
  while (i < s.size()) {
    std::size_t len = 0;
    out.offsets.push_back(i);
    out.codes.push_back(decode_one(s, i, len));
    i += len;
  }
  out.offsets.push_back(s.size());
  return out;
}

bool is_valid_utf8(std::string_view s) {
  std::size_t i = 0;
  while (i < s.size()) {
    std::size_t len = 0;
    const std::uint32_t cp = decode_one(s, i, len);
    if (len == 1 && cp >= kEscapeBase + 0x80)
      return false;
    i += len;
  }
  return true;
}

std::size_t char_count(std::string_view s) {
  std::size_t n = 0;
  std::size_t i = 0;
  while (i < s.size()) {
    std::size_t len = 0;
    decode_one(s, i, len);
    i += len;
    ++n;
  }
  return n;
}

std::string_view prefix_chars(std::string_view s, std::size_t n) {
  std::size_t i = 0;
  for (std::size_t taken = 0; taken < n && i < s.size(); ++taken) {
    std::size_t len = 0;
    decode_one(s, i, len);
    i += len;
  }
  return s.substr(0, i);
}

std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  std::size_t i = 0;
  while (i < text.size()) {
    if (const std::size_t t = terminator_len(text, i); t > 0) {
      i += t;
      out.push_back(text.substr(start, i - start));
      start = i;
    } else {
      ++i;
    }
  }
  if (start < text.size()) {
    out.push_back(text.substr(start));
  }
  return out;
}

} // namespace redline::text
