#pragma once

#include "futmon/concurrent/thread_safe_queue.hpp"
#include "futmon/eventbus/event_bus.hpp"
#include "futmon/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <thread>

namespace futmon {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its own EventBus. Producers (refresh threads,
// reader threads) call push() and return immediately; observers subscribed
// to eventBus() all run on the loop thread, one event at a time.
//
// The queue is bounded (drop-oldest). Notifications are best-effort, and a
// stalled observer must not grow memory without limit.
//
// Thread model: start()/stop() from any thread, idempotent. push() from any
// thread. Events pushed before start() are delivered once it runs; events
// still queued at stop() are delivered before the worker exits.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name, std::size_t capacity = 1024);

  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  void start();

  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool running() const { return running_.load(); }

  std::size_t droppedEvents() const { return queue_.dropped(); }

 private:
  void run();

  const std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace futmon
