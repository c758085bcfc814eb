#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace buildq::util {

/*
  Time utilities. Single place to swap the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::int64_t ToUnixMillis(TimePoint tp);
std::int64_t ToUnixSeconds(TimePoint tp);
TimePoint    FromUnixMillis(std::int64_t ms);

// RFC 3339 / ISO 8601 in UTC, millisecond precision.
std::string FormatTimestamp(TimePoint tp);

} // namespace buildq::util
