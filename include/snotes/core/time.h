#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace snotes::core {

// All timestamps in the system are UTC wall-clock instants at millisecond precision.
// Millisecond precision is the durable backend's storage unit, so a record read back
// from SQLite compares equal to the one create() returned.
using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock, std::chrono::milliseconds>;

inline Timestamp now_utc() {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
}

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return ts.time_since_epoch().count();
}

inline Timestamp from_unix_millis(const std::int64_t millis) {
  return Timestamp{std::chrono::milliseconds{millis}};
}

// format_iso8601 renders ts as "YYYY-MM-DDTHH:MM:SS.mmmZ".
[[nodiscard]] std::string format_iso8601(Timestamp ts);

}  // namespace snotes::core
