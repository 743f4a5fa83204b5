// =============================================================================
// refresh_scheduler_test.cpp
// =============================================================================
// Unit tests for futmon::RefreshScheduler.
//
// Validates:
//   - Every task runs on the first tick
//   - A task does not run again until its interval has passed on the clock
//   - A throwing task is logged and does not stop the others
//   - stop() is idempotent and joins the worker
//
// Threading model:
//   The scheduler ticks on its own thread in real time; due-ness is judged by
//   the simulated clock. Assertions poll with a bounded deadline.
// =============================================================================

#include "futmon/refresh/refresh_scheduler.hpp"
#include "futmon/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <thread>

class RefreshSchedulerTest : public ::testing::Test {
 protected:
  futmon::SimulationTimeProvider clock{1'000'000};

  static bool waitUntil(const std::function<bool()>& condition) {
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!condition()) {
      if (std::chrono::steady_clock::now() >= deadline) {
        return false;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
  }
};

// -----------------------------------------------------------------------------
// 1. First tick runs everything
// -----------------------------------------------------------------------------
TEST_F(RefreshSchedulerTest, RunsEveryTaskOnFirstTick) {
  futmon::RefreshScheduler scheduler(clock);
  std::atomic<int> account{0};
  std::atomic<int> income{0};
  scheduler.addTask("account", 30'000, [&account] { account.fetch_add(1); });
  scheduler.addTask("income", 300'000, [&income] { income.fetch_add(1); });

  scheduler.start();
  EXPECT_TRUE(scheduler.running());
  ASSERT_TRUE(waitUntil([&] { return account.load() == 1 && income.load() == 1; }));

  EXPECT_EQ(scheduler.taskCount(), 2u);
  EXPECT_EQ(scheduler.runCount("account"), 1u);
  EXPECT_EQ(scheduler.runCount("unknown"), 0u);
}

// -----------------------------------------------------------------------------
// 2. Interval is measured on the injected clock
// Why: Refresh cadence is what keeps the account under its request weight
//      budget; a task that re-ran every tick would burn it in seconds.
// -----------------------------------------------------------------------------
TEST_F(RefreshSchedulerTest, WaitsForIntervalOnClock) {
  futmon::RefreshScheduler scheduler(clock);
  std::atomic<int> runs{0};
  scheduler.addTask("positions", 30'000, [&runs] { runs.fetch_add(1); });

  scheduler.start();
  ASSERT_TRUE(waitUntil([&] { return runs.load() == 1; }));

  // Several real ticks pass without the simulated clock moving.
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(runs.load(), 1);

  clock.advance_by(29'999);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(runs.load(), 1);

  clock.advance_by(1);
  ASSERT_TRUE(waitUntil([&] { return runs.load() == 2; }));
  EXPECT_EQ(scheduler.runCount("positions"), 2u);
}

// -----------------------------------------------------------------------------
// 3. A failing task does not take the loop down
// -----------------------------------------------------------------------------
TEST_F(RefreshSchedulerTest, ThrowingTaskDoesNotStopOthers) {
  futmon::RefreshScheduler scheduler(clock);
  std::atomic<int> healthy{0};
  scheduler.addTask("broken", 1'000,
                    [] { throw std::runtime_error("gateway exploded"); });
  scheduler.addTask("healthy", 1'000, [&healthy] { healthy.fetch_add(1); });

  scheduler.start();
  ASSERT_TRUE(waitUntil([&] { return healthy.load() == 1; }));

  clock.advance_by(1'000);
  ASSERT_TRUE(waitUntil([&] { return healthy.load() == 2; }));
  EXPECT_EQ(scheduler.runCount("broken"), 2u);
}

// -----------------------------------------------------------------------------
// 4. Lifecycle
// -----------------------------------------------------------------------------
TEST_F(RefreshSchedulerTest, StopIsIdempotent) {
  futmon::RefreshScheduler scheduler(clock);
  scheduler.addTask("account", 30'000, [] {});

  scheduler.stop();
  scheduler.start();
  scheduler.stop();
  scheduler.stop();

  EXPECT_FALSE(scheduler.running());
}
