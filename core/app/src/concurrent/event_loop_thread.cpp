#include "futmon/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace futmon {

namespace {

// How long the worker waits on an empty queue before re-checking running_.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name, std::size_t capacity)
    : name_(std::move(name)), queue_(capacity) {}

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  std::cout << "[EventLoopThread] " << name_ << " started\n";
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();
  std::cout << "[EventLoopThread] " << name_ << " stopped";
  if (queue_.dropped() > 0) {
    std::cout << " (" << queue_.dropped() << " events dropped)";
  }
  std::cout << "\n";
}

// -----------------------------------------------------------------------------
// run(): pop with timeout, publish, repeat; drain on exit
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    if (auto event = queue_.pop_for(kIdleWaitTimeout)) {
      bus_.publish(*event);
    }
  }

  while (auto event = queue_.try_pop()) {
    bus_.publish(*event);
  }
}

}  // namespace futmon
