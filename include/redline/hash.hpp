#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace redline {

// Raw 16-byte MD5 digest (binary, not hex)
using digest = std::array<std::uint8_t, 16>;

/**
 * Compute MD5 of arbitrary bytes.
 * Used only to derive short version ids; it is not a security boundary.
 */
digest md5(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline digest md5(std::string_view s) {
  return md5(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Convert binary digest to 32-char lowercase hex. */
std::string to_hex(const digest &d);

} // namespace redline
