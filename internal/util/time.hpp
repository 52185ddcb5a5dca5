#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace sealer::util {

/*
  Time utilities — single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// "2024-05-01T09:30:00.123Z"
std::string ToIso8601(TimePoint tp);

} // namespace sealer::util
