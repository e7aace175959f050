#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace swarm::util {

/*
  Time utilities. Storage keeps unix milliseconds; the export file keeps
  ISO-8601 UTC with millisecond precision.
*/

using TimePoint = std::chrono::system_clock::time_point;

TimePoint Now();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// 2024-05-01T12:30:00.250Z
std::string FormatIso8601(int64_t unix_ms);

// Accepts the format above, with or without fractional seconds.
// Throws std::invalid_argument on malformed input.
int64_t ParseIso8601(const std::string& text);

} // namespace swarm::util
