#include "time.hpp"

#include <ctime>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

namespace sealer::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string ToIso8601(TimePoint tp) {
  const auto ms      = std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
  auto       seconds = std::chrono::time_point_cast<std::chrono::seconds>(ms);
  auto       millis  = (ms - seconds).count();
  if (millis < 0) {
    seconds -= std::chrono::seconds(1);
    millis += 1000;
  }

  const std::time_t t = Clock::to_time_t(seconds);
  std::tm           utc{};
  if (gmtime_r(&t, &utc) == nullptr) {
    throw std::runtime_error("gmtime_r failed");
  }

  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                     utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
}

} // namespace sealer::util
