#include "futmon/time/time_utils.hpp"

#include <cstdio>
#include <ctime>

namespace futmon {

// -----------------------------------------------------------------------------
// format_age(): compact two-unit rendering
// -----------------------------------------------------------------------------
std::string format_age(std::int64_t age_ms) {
  if (age_ms < 0) {
    age_ms = 0;
  }

  char buf[32];
  if (age_ms < kMillisPerSecond) {
    std::snprintf(buf, sizeof(buf), "%lldms", static_cast<long long>(age_ms));
  } else if (age_ms < kMillisPerMinute) {
    std::snprintf(buf, sizeof(buf), "%llds",
                  static_cast<long long>(age_ms / kMillisPerSecond));
  } else if (age_ms < kMillisPerHour) {
    std::snprintf(buf, sizeof(buf), "%lldm%02llds",
                  static_cast<long long>(age_ms / kMillisPerMinute),
                  static_cast<long long>((age_ms % kMillisPerMinute) /
                                         kMillisPerSecond));
  } else {
    std::snprintf(buf, sizeof(buf), "%lldh%02lldm",
                  static_cast<long long>(age_ms / kMillisPerHour),
                  static_cast<long long>((age_ms % kMillisPerHour) /
                                         kMillisPerMinute));
  }
  return buf;
}

// -----------------------------------------------------------------------------
// format_utc_date(): gmtime_r is the reentrant variant; plain gmtime shares
// a static buffer between threads.
// -----------------------------------------------------------------------------
std::string format_utc_date(std::int64_t ms) {
  std::time_t seconds = static_cast<std::time_t>(start_of_day_ms(ms) / 1000);
  std::tm parts{};
  gmtime_r(&seconds, &parts);

  char buf[16];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d", &parts);
  return buf;
}

}  // namespace futmon
