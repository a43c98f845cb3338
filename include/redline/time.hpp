#pragma once
#include <chrono>
#include <string>

namespace redline::timeutil {

// Local wall-clock time as "YYYY-MM-DDTHH:MM:SS.ffffff" (no zone suffix).
auto iso8601_local(std::chrono::system_clock::time_point when) -> std::string;

// iso8601_local(system_clock::now())
auto iso8601_now() -> std::string;

} // namespace redline::timeutil
