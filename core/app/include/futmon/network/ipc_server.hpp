#pragma once

#include "futmon/concurrent/thread_safe_queue.hpp"
#include "futmon/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace futmon {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ bridge between the monitor and dashboard clients
// -----------------------------------------------------------------------------
//
// @brief  One worker thread serving commands on a REP socket and
//         broadcasting monitor events on a PUB socket.
//
// @details
//   1. PUB socket (default port 5557):
//      JSON telemetry for every monitor event (refreshes, failures,
//      credential changes, margin alerts). Events arrive through a bounded
//      ThreadSafeQueue filled from the monitor's event loop, so a slow
//      subscriber never blocks that loop.
//
//   2. REP socket (default port 5556):
//      Command strings ("ACCOUNT", "TRADES BTCUSDT 50", ...) forwarded to
//      the command handler, normally AccountMonitor::executeCommand(). The
//      handler may trigger a refresh, so a command can take as long as one
//      exchange round trip. ZMQ_RCVTIMEO keeps the loop alternating between
//      commands and telemetry.
//
// Thread model:
//   start()/stop() from the owning thread (main). pushTelemetry() from any
//   thread. The command handler runs on the IPC thread.
//
// Ownership:
//   Owns the ZMQ context, both sockets, the telemetry queue and the thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Binds both sockets and spawns the worker thread. No-op if
  //         already running.
  //
  // @throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker and joins it. Idempotent.
  void stop();

  void pushTelemetry(Event event);

 private:
  static constexpr int kPollTimeoutMs = 50;
  static constexpr std::size_t kTelemetryCapacity = 1024;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_{kTelemetryCapacity};
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace futmon
