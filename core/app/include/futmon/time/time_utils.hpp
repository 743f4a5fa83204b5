#pragma once

#include <cstdint>
#include <string>

namespace futmon {

// -----------------------------------------------------------------------------
// Time helpers
// -----------------------------------------------------------------------------
//
// @brief  Small conversions around the int64 epoch-millisecond timeline.
//
// Thread-safety: Stateless; safe from any thread.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMillisPerSecond = 1000;
constexpr std::int64_t kMillisPerMinute = 60 * kMillisPerSecond;
constexpr std::int64_t kMillisPerHour = 60 * kMillisPerMinute;
constexpr std::int64_t kMillisPerDay = 24 * kMillisPerHour;

// -------------------------------------------------------------------------
// start_of_day_ms
// -------------------------------------------------------------------------
// @brief  Truncates epoch ms to 00:00:00 UTC of the same day. Used as the
//         bucket key for per-day trade and income aggregates.
// -------------------------------------------------------------------------
inline std::int64_t start_of_day_ms(std::int64_t ms) {
  std::int64_t day = ms / kMillisPerDay;
  if (ms < 0 && ms % kMillisPerDay != 0) {
    --day;
  }
  return day * kMillisPerDay;
}

// -------------------------------------------------------------------------
// format_age
// -------------------------------------------------------------------------
// @brief  Human-readable age for "as of 47s ago" labels: "850ms", "47s",
//         "3m12s", "2h05m". Negative ages render as "0ms".
// -------------------------------------------------------------------------
std::string format_age(std::int64_t age_ms);

// -------------------------------------------------------------------------
// format_utc_date
// -------------------------------------------------------------------------
// @brief  Formats epoch ms as "YYYY-MM-DD" (UTC).
// -------------------------------------------------------------------------
std::string format_utc_date(std::int64_t ms);

}  // namespace futmon
