// -----------------------------------------------------------------------------
// futures_monitor: single executable entry point.
//
//   1) Load MonitorConfig (JSON file if given, then environment overrides).
//   2) Build the live stack: LiveTimeProvider → CurlHttpTransport →
//      BinanceFuturesGateway → AccountMonitor.
//   3) Subscribe logging callbacks to the monitor's event bus.
//   4) Start the IpcServer (commands + telemetry) and bridge monitor events
//      into its telemetry queue.
//   5) Start the monitor (event loop + background refresh) and idle on the
//      main thread until Ctrl-C.
//   6) Shut down cleanly.
//
// Usage:
//   futures_monitor [config.json] [--once]
//
// --once prints the account, positions and derived metrics as JSON and exits
// without starting any thread.
//
// Thread layout:
//   main thread         → idle wait for SIGINT
//   monitor_events      → EventBus callbacks (logging, IPC bridge)
//   refresh scheduler   → periodic getters (refresh only what expired)
//   IPC thread          → REP commands → AccountMonitor::executeCommand()
// -----------------------------------------------------------------------------

#include "futmon/config/config_loader.hpp"
#include "futmon/engine/account_monitor.hpp"
#include "futmon/events/monitor_events.hpp"
#include "futmon/gateway/binance_futures_gateway.hpp"
#include "futmon/gateway/curl_http_transport.hpp"
#include "futmon/network/ipc_server.hpp"
#include "futmon/presentation/presenters.hpp"
#include "futmon/time/live_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// Set by the SIGINT handler, polled by main(). Lock-free atomic store is
// async-signal-safe.
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) { g_shutdown_requested.store(true); }

static futmon::MonitorConfig loadConfig(const std::string& path) {
  if (!path.empty()) {
    return futmon::ConfigLoader::loadFile(path);
  }
  futmon::MonitorConfig config =
      futmon::ConfigLoader::fromJson(nlohmann::json::object());
  futmon::ConfigLoader::applyEnvironment(
      config, futmon::ConfigLoader::processEnvironment());
  futmon::ConfigLoader::validate(config);
  return config;
}

static void subscribeLogging(futmon::AccountMonitor& monitor) {
  auto& bus = monitor.eventBus();

  bus.subscribe<futmon::DatasetRefreshedEvent>(
      [](const futmon::DatasetRefreshedEvent& e) {
        std::cout << "[Monitor] refreshed " << e.key << " in " << e.duration_ms
                  << "ms\n";
      });

  bus.subscribe<futmon::RefreshFailedEvent>(
      [](const futmon::RefreshFailedEvent& e) {
        std::cerr << "[Monitor] refresh of " << e.key << " failed ("
                  << futmon::errorKindToString(e.error.kind)
                  << "): " << e.error.message << "\n";
      });

  bus.subscribe<futmon::CredentialsRejectedEvent>(
      [](const futmon::CredentialsRejectedEvent& e) {
        std::cerr << "[Monitor] API key " << e.masked_key
                  << " rejected: " << e.reason
                  << ". Rotate credentials to resume.\n";
      });

  bus.subscribe<futmon::MarginRatioAlertEvent>(
      [](const futmon::MarginRatioAlertEvent& e) {
        std::cerr << "[Monitor] MARGIN ALERT ratio=" << e.margin_ratio
                  << " threshold=" << e.threshold
                  << " equity=" << e.total_equity << "\n";
      });
}

int main(int argc, char** argv) {
  std::string config_path;
  bool once = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--once") {
      once = true;
    } else {
      config_path = arg;
    }
  }

  // -------------------------------------------------------------------------
  // 1) Configuration. Missing or short credentials stop here.
  // -------------------------------------------------------------------------
  futmon::MonitorConfig config;
  try {
    config = loadConfig(config_path);
  } catch (const futmon::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Live stack. The clock outlives everything declared after it.
  // -------------------------------------------------------------------------
  futmon::LiveTimeProvider clock;
  auto transport = std::make_shared<futmon::CurlHttpTransport>();
  auto gateway = std::make_shared<futmon::BinanceFuturesGateway>(
      config, transport, clock);

  futmon::AccountMonitor monitor(gateway, config, clock);

  if (once) {
    nlohmann::json out;
    out["account"] = futmon::presentation::present(monitor.getAccountSnapshot());
    out["positions"] = futmon::presentation::present(monitor.getPositions());
    out["metrics"] = futmon::presentation::present(monitor.getDerivedMetrics());
    std::cout << out.dump(2) << "\n";
    return monitor.credentialsRejected() ? 2 : 0;
  }

  subscribeLogging(monitor);

  // -------------------------------------------------------------------------
  // 3) IPC bridge. Telemetry subscription is registered before start() so
  //    the first refresh is already broadcast.
  // -------------------------------------------------------------------------
  std::unique_ptr<futmon::IpcServer> ipc;
  if (config.ipc.enabled) {
    ipc = std::make_unique<futmon::IpcServer>(
        [&monitor](const std::string& cmd) {
          return monitor.executeCommand(cmd);
        },
        config.ipc.cmd_endpoint, config.ipc.pub_endpoint);
    monitor.eventBus().subscribe([&ipc](const futmon::Event& e) {
      ipc->pushTelemetry(e);
    });
    ipc->start();
  }

  // -------------------------------------------------------------------------
  // 4) Run until Ctrl-C.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);
  monitor.start();

  std::cout << "[main] monitoring " << gateway->baseUrl()
            << ". Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  // -------------------------------------------------------------------------
  // 5) Shutdown: stop refresh and event delivery first, then IPC (its
  //    command handler calls into the monitor).
  // -------------------------------------------------------------------------
  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  monitor.stop();
  if (ipc) {
    ipc->stop();
  }

  return 0;
}
