#include "time.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace swarm::util {

TimePoint Now() {
  return std::chrono::system_clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string FormatIso8601(int64_t unix_ms) {
  int64_t secs   = unix_ms / 1000;
  int64_t millis = unix_ms % 1000;
  if (millis < 0) {
    millis += 1000;
    secs -= 1;
  }

  std::time_t t = static_cast<std::time_t>(secs);
  std::tm     tm{};
  gmtime_r(&t, &tm);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                tm.tm_min, tm.tm_sec, static_cast<int>(millis));
  return buf;
}

int64_t ParseIso8601(const std::string& text) {
  std::tm tm{};
  int     millis   = 0;
  int     consumed = 0;

  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon, &tm.tm_mday, &tm.tm_hour, &tm.tm_min,
                  &tm.tm_sec, &consumed) != 6) {
    throw std::invalid_argument("invalid ISO-8601 timestamp: " + text);
  }

  std::size_t pos = static_cast<std::size_t>(consumed);
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 3) millis = millis * 10 + (text[pos] - '0');
      ++digits;
      ++pos;
    }
    for (; digits < 3; ++digits) millis *= 10;
  }
  if (pos < text.size() && text[pos] != 'Z') {
    throw std::invalid_argument("only UTC timestamps are supported: " + text);
  }

  tm.tm_year -= 1900;
  tm.tm_mon -= 1;
  return static_cast<int64_t>(timegm(&tm)) * 1000 + millis;
}

} // namespace swarm::util
