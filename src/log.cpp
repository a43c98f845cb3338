#include "redline/log.hpp"

#include "redline/util.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace redline::log {

namespace {

std::atomic<Level> g_level{Level::Warn};

std::mutex &sink_mutex() {
  static std::mutex mu;
  return mu;
}

std::ostream *&sink() {
  static std::ostream *s = nullptr; // nullptr => std::cerr
  return s;
}

} // namespace

std::string_view to_string(Level level) {
  switch (level) {
  case Level::Debug:
    return "debug";
  case Level::Info:
    return "info";
  case Level::Warn:
    return "warn";
  case Level::Error:
    return "error";
  case Level::Off:
    return "off";
  }
  return "off";
}

std::optional<Level> parse_level(std::string_view text) {
  const std::string s = strutil::to_lower(strutil::trim(text));
  if (s == "debug")
    return Level::Debug;
  if (s == "info")
    return Level::Info;
  if (s == "warn" || s == "warning")
    return Level::Warn;
  if (s == "error")
    return Level::Error;
  if (s == "off" || s == "none")
    return Level::Off;
  return std::nullopt;
}

void set_level(Level level) { g_level.store(level); }

Level level() { return g_level.load(); }

void set_sink(std::ostream *s) {
  std::lock_guard lock(sink_mutex());
  sink() = s;
}

void write(Level lvl, std::string_view component, std::string_view message) {
  if (lvl == Level::Off || lvl < g_level.load())
    return;
  std::lock_guard lock(sink_mutex());
  std::ostream &out = sink() ? *sink() : std::cerr;
  out << to_string(lvl) << ": " << component << ": " << message << '\n';
  out.flush();
}

} // namespace redline::log
