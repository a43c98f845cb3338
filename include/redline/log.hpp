#pragma once
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

namespace redline::log {

enum class Level : std::uint8_t { Debug, Info, Warn, Error, Off };

std::string_view to_string(Level level);

// Parse "debug" | "info" | "warn" | "error" | "off" (case-insensitive).
std::optional<Level> parse_level(std::string_view text);

void set_level(Level level);
Level level();

// Redirect output; nullptr restores stderr. The stream must outlive its use.
void set_sink(std::ostream *sink);

// Emit "<level>: <component>: <message>\n" when `lvl` passes the threshold.
void write(Level lvl, std::string_view component, std::string_view message);

inline void debug(std::string_view component, std::string_view message) {
  write(Level::Debug, component, message);
}
inline void info(std::string_view component, std::string_view message) {
  write(Level::Info, component, message);
}
inline void warn(std::string_view component, std::string_view message) {
  write(Level::Warn, component, message);
}
inline void error(std::string_view component, std::string_view message) {
  write(Level::Error, component, message);
}

} // namespace redline::log
