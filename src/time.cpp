#include "redline/time.hpp"

#include <cstdio>
#include <ctime>

namespace redline::timeutil {

std::string iso8601_local(std::chrono::system_clock::time_point when) {
  using namespace std::chrono;
  const auto since_epoch = when.time_since_epoch();
  auto secs = duration_cast<seconds>(since_epoch);
  auto micros = duration_cast<microseconds>(since_epoch - secs).count();
  if (micros < 0) { // pre-epoch instants round toward the earlier second
    secs -= seconds(1);
    micros += 1000000;
  }
  const std::time_t t = static_cast<std::time_t>(secs.count());

  std::tm lt{};
#if defined(_WIN32)
  localtime_s(&lt, &t);
#else
  localtime_r(&t, &lt);
#endif
  char buf[96];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld", lt.tm_year + 1900,
                lt.tm_mon + 1, lt.tm_mday, lt.tm_hour, lt.tm_min, lt.tm_sec,
                static_cast<long long>(micros));
  return std::string(buf);
}

std::string iso8601_now() { return iso8601_local(std::chrono::system_clock::now()); }

} // namespace redline::timeutil
