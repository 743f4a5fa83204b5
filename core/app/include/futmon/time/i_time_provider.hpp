#pragma once

#include <cstdint>

namespace futmon {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract clock interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" and "wait for
//         a while" away from std::chrono.
//
// @details
// Every time-dependent decision in the monitor goes through this interface:
// cache freshness (fetched_at + ttl), rate-limit windows, retry backoff,
// rate-limit cooldowns and the refresh scheduler's due times. If components
// called std::chrono::system_clock::now() or std::this_thread::sleep_for()
// directly, a test for "no gateway call within the next 5 seconds" would
// need to actually wait 5 seconds.
//
//   - LiveTimeProvider       → system_clock and a real sleep.
//   - SimulationTimeProvider → a clock driven by the test; sleeping advances
//                              the clock instead of blocking.
//
// Time is int64_t epoch milliseconds because the exchange speaks epoch
// milliseconds on the wire (timestamp, time, updateTime, startTime).
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent calls from multiple threads.
//
// Ownership:
//   Components hold a reference; they do NOT own the provider. The provider
//   must outlive every component that references it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;

  // -------------------------------------------------------------------------
  // sleep_for_ms(duration_ms)
  // -------------------------------------------------------------------------
  // @brief  Suspends the caller for duration_ms on this clock's timeline.
  //
  // @details
  // Used by the gateway for retry backoff and for waiting out the rate-limit
  // window. Non-positive durations return immediately.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  LiveTimeProvider blocks the calling thread.
  //                SimulationTimeProvider moves its clock forward.
  // -------------------------------------------------------------------------
  virtual void sleep_for_ms(std::int64_t duration_ms) = 0;
};

}  // namespace futmon
