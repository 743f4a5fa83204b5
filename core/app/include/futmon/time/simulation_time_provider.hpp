#pragma once

#include "futmon/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace futmon {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock for tests and replays
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider implementation whose "current time" is set
//         explicitly rather than read from the system clock.
//
// @details
// Tests drive the clock with advance_time() / advance_by() to make cache
// entries expire, to step through a rate-limit window, or to prove that a
// 5 second cooldown suppresses calls for exactly 5 simulated seconds.
//
// sleep_for_ms() does not block: it adds the duration to the clock. A
// gateway that backs off 500 ms, 1 s and 2 s under this provider finishes
// instantly and leaves the clock 3.5 s later, which is what the tests
// assert on.
//
// Internal storage:
//   std::atomic<int64_t> current_time_ms_. Lock-free on 64-bit platforms;
//   advance_by uses fetch_add so concurrent sleepers never lose an update.
//
// Thread model:
//   All operations are atomic; no additional synchronization is needed.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Starts the clock at start_time_ms (default 0).
  // -------------------------------------------------------------------------
  explicit SimulationTimeProvider(std::int64_t start_time_ms = 0)
      : current_time_ms_(start_time_ms) {}

  // -------------------------------------------------------------------------
  // now_ms() override
  // -------------------------------------------------------------------------
  // @brief  Returns the last time set by advance_time()/advance_by()/sleep.
  // -------------------------------------------------------------------------
  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // sleep_for_ms() override
  // -------------------------------------------------------------------------
  // @brief  Moves the clock forward by duration_ms and returns immediately.
  //         Non-positive durations are ignored.
  // -------------------------------------------------------------------------
  void sleep_for_ms(std::int64_t duration_ms) override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to an absolute epoch millisecond value.
  //
  // @details
  // Monotonicity is not enforced. Being able to set arbitrary times is
  // useful in tests.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // -------------------------------------------------------------------------
  // advance_by(delta_ms)
  // -------------------------------------------------------------------------
  // @brief  Moves the clock by delta_ms relative to its current value.
  // -------------------------------------------------------------------------
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace futmon
