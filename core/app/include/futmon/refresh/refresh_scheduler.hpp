#pragma once

#include "futmon/time/i_time_provider.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace futmon {

// -----------------------------------------------------------------------------
// RefreshScheduler: background refresh on per-dataset cadences
// -----------------------------------------------------------------------------
//
// @brief  One worker thread that runs named actions every interval_ms.
//
// @details
// Each task's action is a plain monitor read (e.g. getPositions()). The read
// goes through the RefreshCoordinator, so a tick only costs an API call when
// the cached value has actually expired, and it shares single-flight with
// any reader that happens to ask at the same moment.
//
// Due times are measured on the injected ITimeProvider; the worker itself
// wakes every 10 ms of real time to check them, the same idle-wait the
// event loops use. A task added before start() runs on the first tick.
//
// Due tasks run one after another on the worker thread. Readers are not
// affected by this: they call the monitor directly and refresh in parallel.
//
// Thread model:
//   addTask/start/stop from any thread; start/stop idempotent. Actions run
//   on the worker thread and must not call stop().
// -----------------------------------------------------------------------------
class RefreshScheduler {
 public:
  using Action = std::function<void()>;

  explicit RefreshScheduler(const ITimeProvider& clock);

  ~RefreshScheduler();

  RefreshScheduler(const RefreshScheduler&) = delete;
  RefreshScheduler& operator=(const RefreshScheduler&) = delete;

  void addTask(std::string name, std::int64_t interval_ms, Action action);

  void start();

  void stop();

  bool running() const { return running_.load(); }

  // How many times the named task has run (0 for unknown names).
  std::size_t runCount(const std::string& name) const;

  std::size_t taskCount() const;

 private:
  struct Task {
    std::string name;
    std::int64_t interval_ms{0};
    std::int64_t next_due_ms{0};
    Action action;
    std::size_t runs{0};
  };

  void run();
  void runDueTasks();

  const ITimeProvider& clock_;

  mutable std::mutex tasks_mutex_;
  std::vector<Task> tasks_;

  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace futmon
