#pragma once

#include <cstdint>
#include <limits>

namespace futmon {
namespace domain {

// -----------------------------------------------------------------------------
// TimeRange: half-open [start_ms, end_ms) window on the epoch-ms timeline
// -----------------------------------------------------------------------------
//
// @brief  Caller-specified window for trade statistics and income history.
//
// @details
// Half-open so that adjacent ranges (e.g. consecutive days) never count the
// same record twice. A default-constructed range covers all of time.
// -----------------------------------------------------------------------------
struct TimeRange {
  std::int64_t start_ms{0};
  std::int64_t end_ms{std::numeric_limits<std::int64_t>::max()};

  bool contains(std::int64_t ms) const { return ms >= start_ms && ms < end_ms; }

  bool valid() const { return start_ms < end_ms; }

  static TimeRange all() { return TimeRange{}; }

  // The last `duration_ms` milliseconds ending at `now_ms` (exclusive end is
  // pushed one past now so a record stamped exactly `now_ms` is included).
  static TimeRange lastMillis(std::int64_t now_ms, std::int64_t duration_ms) {
    return TimeRange{now_ms - duration_ms, now_ms + 1};
  }
};

}  // namespace domain
}  // namespace futmon
