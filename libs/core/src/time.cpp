#include "keyward/core/time.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <kj/common.h>
#include <kj/string.h>

namespace keyward::core {

std::int64_t now_unix_seconds() {
  const auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

kj::String format_utc_iso8601(std::int64_t unix_seconds) {
  const auto time = static_cast<std::time_t>(unix_seconds);

  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &time);
#else
  gmtime_r(&time, &tm);
#endif

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
  return kj::str(buf);
}

Clock& system_clock() {
  static SystemClock clock;
  return clock;
}

} // namespace keyward::core
