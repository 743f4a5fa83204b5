#include "futmon/refresh/refresh_scheduler.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace futmon {

namespace {

constexpr auto kTickInterval = std::chrono::milliseconds(10);

}  // namespace

RefreshScheduler::RefreshScheduler(const ITimeProvider& clock)
    : clock_(clock) {}

RefreshScheduler::~RefreshScheduler() { stop(); }

void RefreshScheduler::addTask(std::string name, std::int64_t interval_ms,
                               Action action) {
  std::lock_guard lock(tasks_mutex_);
  Task task;
  task.name = std::move(name);
  task.interval_ms = interval_ms;
  task.action = std::move(action);
  tasks_.push_back(std::move(task));
}

void RefreshScheduler::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  std::cout << "[RefreshScheduler] started with " << taskCount()
            << " tasks\n";
}

void RefreshScheduler::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  stop_cv_.notify_all();
  thread_.join();
  std::cout << "[RefreshScheduler] stopped\n";
}

std::size_t RefreshScheduler::runCount(const std::string& name) const {
  std::lock_guard lock(tasks_mutex_);
  for (const auto& task : tasks_) {
    if (task.name == name) {
      return task.runs;
    }
  }
  return 0;
}

std::size_t RefreshScheduler::taskCount() const {
  std::lock_guard lock(tasks_mutex_);
  return tasks_.size();
}

void RefreshScheduler::run() {
  while (running_.load()) {
    runDueTasks();

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kTickInterval, [this] { return !running_.load(); });
  }
}

// -----------------------------------------------------------------------------
// runDueTasks(): pick due tasks under the lock, run them without it
// -----------------------------------------------------------------------------
void RefreshScheduler::runDueTasks() {
  const std::int64_t now = clock_.now_ms();

  std::vector<std::pair<std::string, Action>> due;
  {
    std::lock_guard lock(tasks_mutex_);
    for (auto& task : tasks_) {
      if (now >= task.next_due_ms) {
        task.next_due_ms = now + task.interval_ms;
        ++task.runs;
        due.emplace_back(task.name, task.action);
      }
    }
  }

  for (const auto& [name, action] : due) {
    if (!running_.load()) {
      return;
    }
    try {
      action();
    } catch (const std::exception& e) {
      std::cerr << "[RefreshScheduler] task " << name << " threw: " << e.what()
                << "\n";
    }
  }
}

}  // namespace futmon
