#pragma once

#include "futmon/cache/cache_store.hpp"
#include "futmon/concurrent/event_loop_thread.hpp"
#include "futmon/config/monitor_config.hpp"
#include "futmon/domain/account_snapshot.hpp"
#include "futmon/domain/income_record.hpp"
#include "futmon/domain/metrics.hpp"
#include "futmon/domain/position.hpp"
#include "futmon/domain/time_range.hpp"
#include "futmon/domain/trade.hpp"
#include "futmon/errors/fetch_result.hpp"
#include "futmon/gateway/i_exchange_gateway.hpp"
#include "futmon/refresh/refresh_coordinator.hpp"
#include "futmon/refresh/refresh_scheduler.hpp"
#include "futmon/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace futmon {

// What invalidate() drops. History covers trades and income together.
enum class InvalidateScope { All, Account, Positions, Trades, Income, History };

const char* invalidateScopeToString(InvalidateScope scope);

// Case-insensitive: "all", "account", "positions", "trades", "income",
// "history". nullopt for anything else.
std::optional<InvalidateScope> invalidateScopeFromString(
    const std::string& text);

// -----------------------------------------------------------------------------
// AccountMonitor
// -----------------------------------------------------------------------------
//
// @brief  The read API a dashboard talks to: account, positions, trades,
//         income and everything derived from them, each returned as a
//         FetchResult (data, stale, fetchedAt, error).
//
// @details
// Every getter reads through the RefreshCoordinator. A fresh cache entry is
// returned without touching the exchange; an expired one is refreshed once
// no matter how many threads ask, and a failed refresh falls back to the
// last good value marked stale.
//
// Cache layout:
//
//   key                    value                          ttl
//   account                AccountSnapshot                cache.account_ttl_ms
//   positions              vector<Position>               cache.positions_ttl_ms
//   trades:<SYMBOL>        vector<Trade>, ascending id    cache.trades_ttl_ms
//   income                 vector<IncomeRecord>, by time  cache.income_ttl_ms
//   income:<start>:<end>   vector<IncomeRecord>           cache.income_ttl_ms
//
// Trades and the rolling income window are append-only: a refresh asks the
// exchange only for what came after the newest record already held and
// merges it in. A refresh after invalidation starts over.
//
// Derived values (metrics, statistics, summaries) are recomputed on every
// read and never cached. They are stale if any input is stale and carry the
// error of the first input that failed.
//
// Credential rotation:
//   rotateCredentials() swaps the gateway, clears the whole cache and
//   detaches running refreshes. A refresh that was started with the old
//   gateway finishes but cannot store its result.
//
// Notifications:
//   Refresh outcomes, credential changes and margin alerts are published on
//   eventBus() from the "monitor_events" loop. Delivery is best-effort: the
//   queue is bounded and drops the oldest event when full.
//
// Thread model:
//   All getters, invalidate() and rotateCredentials() are safe from any
//   thread. start()/stop() from one thread (main).
//
// Ownership:
//   AccountMonitor
//    ├── gateway_       (shared_ptr<IExchangeGateway>, swapped on rotation)
//    ├── store_         (CacheStore, value member)
//    ├── coordinator_   (RefreshCoordinator, value member, borrows store_)
//    ├── events_        (EventLoopThread, value member)
//    └── scheduler_     (unique_ptr<RefreshScheduler>, created in start())
//   The clock is borrowed and must outlive the monitor.
// -----------------------------------------------------------------------------
class AccountMonitor {
 public:
  // ---------------------------------------------------------------------------
  // Constructor
  // ---------------------------------------------------------------------------
  // @param  gateway  Exchange access. Must not be null.
  // @param  config   Copied; TTLs, history windows and refresh cadences.
  // @param  clock    Drives cache freshness and the scheduler.
  //
  // No threads are started. Getters work immediately; start() adds event
  // delivery and background refresh.
  //
  // @throws std::invalid_argument if gateway is null.
  // ---------------------------------------------------------------------------
  AccountMonitor(std::shared_ptr<IExchangeGateway> gateway,
                 MonitorConfig config, const ITimeProvider& clock);

  ~AccountMonitor();

  AccountMonitor(const AccountMonitor&) = delete;
  AccountMonitor& operator=(const AccountMonitor&) = delete;
  AccountMonitor(AccountMonitor&&) = delete;
  AccountMonitor& operator=(AccountMonitor&&) = delete;

  // ---------------------------------------------------------------------------
  // start() / stop()
  // ---------------------------------------------------------------------------
  // start() begins event delivery and, when refresh.enabled, the background
  // scheduler: one task per dataset at its configured interval, plus a
  // margin-ratio check at the account interval. Both are idempotent.
  // ---------------------------------------------------------------------------
  void start();

  void stop();

  FetchResult<domain::AccountSnapshot> getAccountSnapshot();

  FetchResult<std::vector<domain::Position>> getPositions(
      const domain::PositionFilter& filter = {});

  // ---------------------------------------------------------------------------
  // getRecentTrades(symbol, limit)
  // ---------------------------------------------------------------------------
  // @brief  The newest `limit` trades, newest first.
  //
  // @details
  // With a symbol, reads that symbol's trade window. Without one, reads the
  // window of every symbol that has an open position or is listed in
  // refresh.watched_symbols, and merges them. A merged result is stale if
  // any part is stale or failed, and unavailable only when every part
  // failed (or the positions needed to pick symbols are unavailable).
  // ---------------------------------------------------------------------------
  FetchResult<std::vector<domain::Trade>> getRecentTrades(
      const std::optional<std::string>& symbol = std::nullopt,
      std::size_t limit = 100);

  // ---------------------------------------------------------------------------
  // getIncomeHistory(range)
  // ---------------------------------------------------------------------------
  // @brief  Income records with time in [range.start_ms, range.end_ms),
  //         ascending by time.
  //
  // @details
  // Ranges starting inside the rolling window (now - history.
  // income_lookback_ms) are answered from the window. Older ranges are
  // fetched and cached under their own key.
  // ---------------------------------------------------------------------------
  FetchResult<std::vector<domain::IncomeRecord>> getIncomeHistory(
      const domain::TimeRange& range);

  FetchResult<domain::DerivedMetrics> getDerivedMetrics();

  FetchResult<domain::TradingStatistics> getTradingStatistics(
      const std::optional<std::string>& symbol, const domain::TimeRange& range);

  FetchResult<domain::PerformanceMetrics> getPerformanceMetrics(
      const std::optional<std::string>& symbol, const domain::TimeRange& range);

  FetchResult<domain::IncomeSummary> getIncomeSummary(
      const domain::TimeRange& range);

  void invalidate(InvalidateScope scope);

  // ---------------------------------------------------------------------------
  // rotateCredentials(gateway, masked_key)
  // ---------------------------------------------------------------------------
  // @brief  Replaces the gateway and drops every cached value.
  //
  // @param  gateway     Built from the new credentials. Must not be null.
  // @param  masked_key  For the CredentialsRotatedEvent; never the raw key.
  //
  // @throws std::invalid_argument if gateway is null (nothing is changed).
  // ---------------------------------------------------------------------------
  void rotateCredentials(std::shared_ptr<IExchangeGateway> gateway,
                         std::string masked_key);

  // Publishes MarginRatioAlertEvent when the margin ratio is elevated and
  // the data behind it is fresh. Returns whether an alert was published.
  bool checkMarginAlert();

  // ---------------------------------------------------------------------------
  // executeCommand(cmd)
  // ---------------------------------------------------------------------------
  //
  // @brief  Answers one IPC command with a JSON string.
  //
  // @details
  // Supported commands (case-insensitive verb, whitespace separated):
  //   PING                          → {"status":"ok","response":"PONG"}
  //   ACCOUNT                       → account snapshot result
  //   POSITIONS [SYMBOL]            → positions result
  //   TRADES [SYMBOL] [LIMIT]       → recent trades result (limit 100)
  //   INCOME <startMs> <endMs>      → income history result
  //   METRICS                       → derived metrics result
  //   STATS <startMs> <endMs> [SYM] → trading, performance and income
  //   CACHE                         → cache stats, credential state
  //   INVALIDATE <scope>            → all|account|positions|trades|
  //                                   income|history
  //   other                         → {"status":"error","response":...}
  //
  // Results use the presentation envelope (state, age, error, data).
  //
  // Thread-safety: Safe to call from any thread (the IPC server thread).
  // ---------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  CacheStats cacheStats() const;

  bool credentialsRejected() const;

  EventBus& eventBus() { return events_.eventBus(); }

  const MonitorConfig& config() const { return config_; }

 private:
  using TradeWindow = std::vector<domain::Trade>;
  using IncomeWindow = std::vector<domain::IncomeRecord>;

  std::shared_ptr<IExchangeGateway> gateway() const;

  FetchResult<TradeWindow> tradeWindow(const std::string& symbol);
  FetchResult<TradeWindow> collectTrades(
      const std::optional<std::string>& symbol);
  FetchResult<IncomeWindow> incomeWindow();

  TradeWindow fetchTrades(const std::string& symbol);
  IncomeWindow fetchIncomeWindow();
  IncomeWindow fetchIncomeRange(const domain::TimeRange& range);
  std::vector<domain::IncomeRecord> fetchIncomePages(std::int64_t start_ms,
                                                     std::int64_t end_ms);

  void onRefreshed(const RefreshOutcome& outcome);
  void scheduleRefreshTasks();

  const MonitorConfig config_;
  const ITimeProvider& clock_;

  mutable std::mutex gateway_mutex_;
  std::shared_ptr<IExchangeGateway> gateway_;
  std::string masked_key_;

  CacheStore store_;
  RefreshCoordinator coordinator_;

  EventLoopThread events_;
  std::unique_ptr<RefreshScheduler> scheduler_;
  bool running_{false};
};

}  // namespace futmon
