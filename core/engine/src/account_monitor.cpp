#include "futmon/engine/account_monitor.hpp"

#include "futmon/aggregator/aggregator.hpp"
#include "futmon/domain/dataset.hpp"
#include "futmon/events/monitor_events.hpp"
#include "futmon/gateway/endpoint.hpp"
#include "futmon/gateway/payload_parser.hpp"
#include "futmon/presentation/presenters.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace futmon {

namespace {

constexpr const char* kAccountKey = "account";
constexpr const char* kPositionsKey = "positions";
constexpr const char* kIncomeKey = "income";
constexpr const char* kTradesPrefix = "trades:";
constexpr const char* kIncomePrefix = "income";

std::string toUpper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return text;
}

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

std::string tradesKey(const std::string& symbol) {
  return kTradesPrefix + symbol;
}

std::string incomeRangeKey(const domain::TimeRange& range) {
  return std::string(kIncomePrefix) + ":" + std::to_string(range.start_ms) +
         ":" + std::to_string(range.end_ms);
}

std::shared_ptr<IExchangeGateway> requireGateway(
    std::shared_ptr<IExchangeGateway> gateway) {
  if (!gateway) {
    throw std::invalid_argument("AccountMonitor: gateway must not be null");
  }
  return gateway;
}

// -----------------------------------------------------------------------------
// ResultMerger: provenance of a value built from several reads
// -----------------------------------------------------------------------------
// Stale if any part is stale or missing; fetched_at is the oldest part's,
// age the largest. The error is that of the first missing part, or else the
// first error carried by a stale part.
// -----------------------------------------------------------------------------
class ResultMerger {
 public:
  template <typename U>
  void add(const FetchResult<U>& part) {
    if (!part.ok()) {
      if (!missing_error_ && part.error) {
        missing_error_ = part.error;
      }
      stale_ = true;
      missing_ = true;
      return;
    }
    if (!stale_error_ && part.error) {
      stale_error_ = part.error;
    }
    stale_ = stale_ || part.stale;
    if (!have_time_ || part.fetched_at_ms < fetched_at_ms_) {
      fetched_at_ms_ = part.fetched_at_ms;
      have_time_ = true;
    }
    age_ms_ = std::max(age_ms_, part.age_ms);
  }

  bool missing() const { return missing_; }

  template <typename T>
  FetchResult<T> build(T value, std::int64_t now_ms) const {
    FetchResult<T> result;
    result.data = std::move(value);
    result.stale = stale_;
    result.fetched_at_ms = have_time_ ? fetched_at_ms_ : now_ms;
    result.age_ms = age_ms_;
    result.error = error();
    return result;
  }

  template <typename T>
  FetchResult<T> unavailable() const {
    const std::optional<FetchError> cause = error();
    return FetchResult<T>::unavailable(
        cause ? *cause
              : FetchError{ErrorKind::Transient, "no data available", 0});
  }

 private:
  bool stale_{false};
  bool missing_{false};
  bool have_time_{false};
  std::int64_t fetched_at_ms_{0};
  std::int64_t age_ms_{0};
  std::optional<FetchError> missing_error_;
  std::optional<FetchError> stale_error_;

  std::optional<FetchError> error() const {
    return missing_error_ ? missing_error_ : stale_error_;
  }
};

// Same provenance as input, different value.
template <typename T, typename U>
FetchResult<T> derivedFrom(const FetchResult<U>& input, T value) {
  FetchResult<T> result;
  result.data = std::move(value);
  result.stale = input.stale;
  result.fetched_at_ms = input.fetched_at_ms;
  result.age_ms = input.age_ms;
  result.error = input.error;
  return result;
}

bool isNumber(const std::string& text) {
  return !text.empty() &&
         std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

nlohmann::json errorResponse(const std::string& message) {
  nlohmann::json response;
  response["status"] = "error";
  response["response"] = message;
  return response;
}

template <typename T, typename U>
FetchResult<T> unavailableFrom(const FetchResult<U>& input) {
  ResultMerger merger;
  merger.add(input);
  return merger.unavailable<T>();
}

}  // namespace

const char* invalidateScopeToString(InvalidateScope scope) {
  switch (scope) {
    case InvalidateScope::All:
      return "all";
    case InvalidateScope::Account:
      return "account";
    case InvalidateScope::Positions:
      return "positions";
    case InvalidateScope::Trades:
      return "trades";
    case InvalidateScope::Income:
      return "income";
    case InvalidateScope::History:
      return "history";
  }
  return "unknown";
}

std::optional<InvalidateScope> invalidateScopeFromString(
    const std::string& text) {
  const std::string lower = toLower(text);
  for (InvalidateScope scope :
       {InvalidateScope::All, InvalidateScope::Account,
        InvalidateScope::Positions, InvalidateScope::Trades,
        InvalidateScope::Income, InvalidateScope::History}) {
    if (lower == invalidateScopeToString(scope)) {
      return scope;
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
AccountMonitor::AccountMonitor(std::shared_ptr<IExchangeGateway> gateway,
                               MonitorConfig config,
                               const ITimeProvider& clock)
    : config_(std::move(config)),
      clock_(clock),
      gateway_(requireGateway(std::move(gateway))),
      masked_key_(config_.exchange.credentials.maskedKey()),
      store_(clock),
      coordinator_(store_, clock),
      events_("monitor_events") {
  coordinator_.setRefreshListener(
      [this](const RefreshOutcome& outcome) { onRefreshed(outcome); });
}

AccountMonitor::~AccountMonitor() { stop(); }

// -----------------------------------------------------------------------------
// start() / stop()
// -----------------------------------------------------------------------------
void AccountMonitor::start() {
  if (running_) {
    return;
  }

  events_.start();

  if (config_.refresh.enabled) {
    scheduler_ = std::make_unique<RefreshScheduler>(clock_);
    scheduleRefreshTasks();
    scheduler_->start();
  }

  running_ = true;
  std::cout << "[AccountMonitor] started for key " << masked_key_
            << (config_.refresh.enabled ? " with background refresh" : "")
            << "\n";
}

void AccountMonitor::stop() {
  if (!running_) {
    return;
  }

  // Scheduler first: its tasks publish onto the event loop.
  scheduler_.reset();
  events_.stop();

  running_ = false;
  std::cout << "[AccountMonitor] stopped\n";
}

void AccountMonitor::scheduleRefreshTasks() {
  const RefreshConfig& refresh = config_.refresh;

  scheduler_->addTask("account", refresh.account_interval_ms,
                      [this] { getAccountSnapshot(); });
  scheduler_->addTask("positions", refresh.positions_interval_ms,
                      [this] { getPositions(); });
  scheduler_->addTask("trades", refresh.trades_interval_ms,
                      [this] { collectTrades(std::nullopt); });
  scheduler_->addTask("income", refresh.income_interval_ms,
                      [this] { incomeWindow(); });
  scheduler_->addTask("margin_alert", refresh.account_interval_ms,
                      [this] { checkMarginAlert(); });
}

std::shared_ptr<IExchangeGateway> AccountMonitor::gateway() const {
  std::lock_guard lock(gateway_mutex_);
  return gateway_;
}

// -----------------------------------------------------------------------------
// Account and positions
// -----------------------------------------------------------------------------
FetchResult<domain::AccountSnapshot> AccountMonitor::getAccountSnapshot() {
  return coordinator_.getOrRefresh<domain::AccountSnapshot>(
      kAccountKey,
      [this] {
        RawPayload raw = gateway()->fetch(endpoints::account(), {});
        return payload::parseAccountSnapshot(raw, clock_.now_ms());
      },
      config_.cache.account_ttl_ms);
}

FetchResult<std::vector<domain::Position>> AccountMonitor::getPositions(
    const domain::PositionFilter& filter) {
  auto result = coordinator_.getOrRefresh<std::vector<domain::Position>>(
      kPositionsKey,
      [this] {
        RawPayload raw = gateway()->fetch(endpoints::positionRisk(), {});
        return payload::parsePositions(raw);
      },
      config_.cache.positions_ttl_ms);

  if (result.data) {
    auto& positions = *result.data;
    positions.erase(std::remove_if(positions.begin(), positions.end(),
                                   [&filter](const domain::Position& p) {
                                     return !filter.matches(p);
                                   }),
                    positions.end());
  }
  return result;
}

// -----------------------------------------------------------------------------
// Trades
// -----------------------------------------------------------------------------
FetchResult<std::vector<domain::Trade>> AccountMonitor::getRecentTrades(
    const std::optional<std::string>& symbol, std::size_t limit) {
  auto result = collectTrades(symbol);
  if (!result.data) {
    return result;
  }

  auto& trades = *result.data;
  std::sort(trades.begin(), trades.end(),
            [](const domain::Trade& a, const domain::Trade& b) {
              if (a.time_ms != b.time_ms) {
                return a.time_ms > b.time_ms;
              }
              return a.id > b.id;
            });
  if (trades.size() > limit) {
    trades.resize(limit);
  }
  return result;
}

FetchResult<AccountMonitor::TradeWindow> AccountMonitor::tradeWindow(
    const std::string& symbol) {
  return coordinator_.getOrRefresh<TradeWindow>(
      tradesKey(symbol), [this, symbol] { return fetchTrades(symbol); },
      config_.cache.trades_ttl_ms);
}

FetchResult<AccountMonitor::TradeWindow> AccountMonitor::collectTrades(
    const std::optional<std::string>& symbol) {
  if (symbol) {
    return tradeWindow(toUpper(*symbol));
  }

  auto positions = getPositions();
  if (!positions.data) {
    return unavailableFrom<TradeWindow>(positions);
  }

  std::set<std::string> symbols;
  for (const auto& position : *positions.data) {
    symbols.insert(position.symbol);
  }
  for (const auto& watched : config_.refresh.watched_symbols) {
    symbols.insert(toUpper(watched));
  }

  ResultMerger merger;
  merger.add(positions);

  TradeWindow merged;
  bool any_window = symbols.empty();
  for (const auto& sym : symbols) {
    auto part = tradeWindow(sym);
    merger.add(part);
    if (part.data) {
      any_window = true;
      merged.insert(merged.end(), part.data->begin(), part.data->end());
    }
  }

  if (!any_window) {
    return merger.unavailable<TradeWindow>();
  }
  return merger.build(std::move(merged), clock_.now_ms());
}

// -----------------------------------------------------------------------------
// fetchTrades(): extend the symbol's window with trades after its last id
// -----------------------------------------------------------------------------
AccountMonitor::TradeWindow AccountMonitor::fetchTrades(
    const std::string& symbol) {
  const std::string key = tradesKey(symbol);

  TradeWindow window;
  if (auto prior = store_.get<TradeWindow>(key)) {
    window = std::move(prior->value);
  }

  QueryParams params{
      {"symbol", symbol},
      {"limit", std::to_string(config_.history.trade_fetch_limit)}};
  if (!window.empty()) {
    params.emplace_back("fromId", std::to_string(window.back().id + 1));
  }

  RawPayload raw = gateway()->fetch(endpoints::userTrades(), params);
  std::vector<domain::Trade> fetched = payload::parseTrades(raw);

  const std::int64_t last_id = window.empty() ? -1 : window.back().id;
  const std::size_t before = window.size();
  for (auto& trade : fetched) {
    if (trade.id > last_id) {
      window.push_back(std::move(trade));
    }
  }
  std::sort(window.begin() + static_cast<std::ptrdiff_t>(before), window.end(),
            [](const domain::Trade& a, const domain::Trade& b) {
              return a.id < b.id;
            });

  const std::size_t cap = config_.history.max_trades_per_symbol;
  if (window.size() > cap) {
    window.erase(window.begin(),
                 window.begin() + static_cast<std::ptrdiff_t>(window.size() - cap));
  }
  return window;
}

// -----------------------------------------------------------------------------
// Income
// -----------------------------------------------------------------------------
FetchResult<std::vector<domain::IncomeRecord>> AccountMonitor::getIncomeHistory(
    const domain::TimeRange& range) {
  if (!range.valid()) {
    return FetchResult<IncomeWindow>::unavailable(FetchError{
        ErrorKind::Protocol,
        "invalid time range [" + std::to_string(range.start_ms) + ", " +
            std::to_string(range.end_ms) + ")",
        0});
  }

  const std::int64_t horizon =
      clock_.now_ms() - config_.history.income_lookback_ms;

  if (range.start_ms < horizon) {
    return coordinator_.getOrRefresh<IncomeWindow>(
        incomeRangeKey(range), [this, range] { return fetchIncomeRange(range); },
        config_.cache.income_ttl_ms);
  }

  auto window = incomeWindow();
  if (!window.data) {
    return window;
  }

  IncomeWindow selected;
  for (const auto& record : *window.data) {
    if (range.contains(record.time_ms)) {
      selected.push_back(record);
    }
  }
  return derivedFrom(window, std::move(selected));
}

FetchResult<AccountMonitor::IncomeWindow> AccountMonitor::incomeWindow() {
  return coordinator_.getOrRefresh<IncomeWindow>(
      kIncomeKey, [this] { return fetchIncomeWindow(); },
      config_.cache.income_ttl_ms);
}

// -----------------------------------------------------------------------------
// fetchIncomeWindow(): append records newer than the window, drop the ones
// that fell out of the lookback
// -----------------------------------------------------------------------------
AccountMonitor::IncomeWindow AccountMonitor::fetchIncomeWindow() {
  const std::int64_t now = clock_.now_ms();
  const std::int64_t horizon = now - config_.history.income_lookback_ms;

  IncomeWindow window;
  if (auto prior = store_.get<IncomeWindow>(kIncomeKey)) {
    window = std::move(prior->value);
  }

  // Restart at the newest held timestamp, not after it: several records
  // can share one millisecond. Duplicates are dropped by tran_id.
  const std::int64_t start =
      window.empty() ? horizon : std::max(horizon, window.back().time_ms);

  std::unordered_set<std::int64_t> seen;
  for (const auto& record : window) {
    seen.insert(record.tran_id);
  }
  for (auto& record : fetchIncomePages(start, now)) {
    if (seen.insert(record.tran_id).second) {
      window.push_back(std::move(record));
    }
  }

  std::stable_sort(window.begin(), window.end(),
                   [](const domain::IncomeRecord& a,
                      const domain::IncomeRecord& b) {
                     return a.time_ms < b.time_ms;
                   });
  window.erase(window.begin(),
               std::find_if(window.begin(), window.end(),
                            [horizon](const domain::IncomeRecord& r) {
                              return r.time_ms >= horizon;
                            }));
  return window;
}

AccountMonitor::IncomeWindow AccountMonitor::fetchIncomeRange(
    const domain::TimeRange& range) {
  // endTime is inclusive on the exchange side.
  const std::int64_t end = std::min(range.end_ms - 1, clock_.now_ms());

  IncomeWindow records;
  for (auto& record : fetchIncomePages(range.start_ms, end)) {
    if (range.contains(record.time_ms)) {
      records.push_back(std::move(record));
    }
  }
  std::stable_sort(records.begin(), records.end(),
                   [](const domain::IncomeRecord& a,
                      const domain::IncomeRecord& b) {
                     return a.time_ms < b.time_ms;
                   });
  return records;
}

// -----------------------------------------------------------------------------
// fetchIncomePages(start, end)
// -----------------------------------------------------------------------------
// Pages forward by startTime. A full page means there may be more; the next
// page starts at the newest timestamp seen so far. Stops at
// history.income_max_pages, or when a full page does not move the cursor.
// -----------------------------------------------------------------------------
std::vector<domain::IncomeRecord> AccountMonitor::fetchIncomePages(
    std::int64_t start_ms, std::int64_t end_ms) {
  const HistoryConfig& history = config_.history;
  std::shared_ptr<IExchangeGateway> gw = gateway();

  std::vector<domain::IncomeRecord> records;
  std::unordered_set<std::int64_t> seen;
  std::int64_t cursor = start_ms;

  for (int page = 0; page < history.income_max_pages; ++page) {
    QueryParams params{{"startTime", std::to_string(cursor)},
                       {"endTime", std::to_string(end_ms)},
                       {"limit", std::to_string(history.income_page_limit)}};
    std::vector<domain::IncomeRecord> batch =
        payload::parseIncome(gw->fetch(endpoints::income(), params));

    const bool full =
        batch.size() >= static_cast<std::size_t>(history.income_page_limit);
    std::int64_t newest = cursor;
    for (auto& record : batch) {
      newest = std::max(newest, record.time_ms);
      if (seen.insert(record.tran_id).second) {
        records.push_back(std::move(record));
      }
    }

    if (!full || newest == cursor) {
      return records;
    }
    cursor = newest;
  }

  std::cerr << "[AccountMonitor] income paging stopped after "
            << history.income_max_pages << " pages at " << cursor << "\n";
  return records;
}

// -----------------------------------------------------------------------------
// Derived values
// -----------------------------------------------------------------------------
FetchResult<domain::DerivedMetrics> AccountMonitor::getDerivedMetrics() {
  auto account = getAccountSnapshot();
  auto positions = getPositions();

  ResultMerger merger;
  merger.add(account);
  merger.add(positions);
  if (merger.missing()) {
    return merger.unavailable<domain::DerivedMetrics>();
  }

  return merger.build(
      aggregator::computeDerivedMetrics(
          *account.data, *positions.data,
          config_.alerts.margin_ratio_alert_threshold),
      clock_.now_ms());
}

FetchResult<domain::TradingStatistics> AccountMonitor::getTradingStatistics(
    const std::optional<std::string>& symbol, const domain::TimeRange& range) {
  auto trades = collectTrades(symbol);
  if (!trades.data) {
    return unavailableFrom<domain::TradingStatistics>(trades);
  }
  return derivedFrom(trades, aggregator::tradingStatistics(*trades.data, range));
}

FetchResult<domain::PerformanceMetrics> AccountMonitor::getPerformanceMetrics(
    const std::optional<std::string>& symbol, const domain::TimeRange& range) {
  auto trades = collectTrades(symbol);
  if (!trades.data) {
    return unavailableFrom<domain::PerformanceMetrics>(trades);
  }
  return derivedFrom(trades,
                     aggregator::performanceMetrics(*trades.data, range));
}

FetchResult<domain::IncomeSummary> AccountMonitor::getIncomeSummary(
    const domain::TimeRange& range) {
  auto income = getIncomeHistory(range);
  if (!income.data) {
    return unavailableFrom<domain::IncomeSummary>(income);
  }
  return derivedFrom(income, aggregator::summarizeIncome(*income.data, range));
}

bool AccountMonitor::checkMarginAlert() {
  auto metrics = getDerivedMetrics();
  if (metrics.state() != DataState::Fresh ||
      !metrics.data->margin_ratio_elevated) {
    return false;
  }

  const double threshold = config_.alerts.margin_ratio_alert_threshold;
  std::cerr << "[AccountMonitor] margin ratio " << metrics.data->margin_ratio
            << " above threshold " << threshold << "\n";
  events_.push(MarginRatioAlertEvent{metrics.data->margin_ratio, threshold,
                                     metrics.data->total_equity,
                                     clock_.now_ms()});
  return true;
}

// -----------------------------------------------------------------------------
// Cache control and credentials
// -----------------------------------------------------------------------------
void AccountMonitor::invalidate(InvalidateScope scope) {
  switch (scope) {
    case InvalidateScope::All:
      // Running refreshes still land; only rotation discards them.
      store_.clear();
      break;
    case InvalidateScope::Account:
      store_.invalidate(kAccountKey);
      break;
    case InvalidateScope::Positions:
      store_.invalidate(kPositionsKey);
      break;
    case InvalidateScope::Trades:
      store_.invalidatePrefix(kTradesPrefix);
      break;
    case InvalidateScope::Income:
      store_.invalidatePrefix(kIncomePrefix);
      break;
    case InvalidateScope::History:
      store_.invalidatePrefix(kTradesPrefix);
      store_.invalidatePrefix(kIncomePrefix);
      break;
  }
  std::cout << "[AccountMonitor] invalidated " << invalidateScopeToString(scope)
            << "\n";
}

void AccountMonitor::rotateCredentials(
    std::shared_ptr<IExchangeGateway> gateway, std::string masked_key) {
  if (!gateway) {
    throw std::invalid_argument(
        "AccountMonitor: rotated gateway must not be null");
  }

  {
    std::lock_guard lock(gateway_mutex_);
    gateway_ = std::move(gateway);
    masked_key_ = masked_key;
  }

  // Generation bump first: a refresh still running on the old gateway can
  // no longer store its result.
  store_.invalidateAll();
  coordinator_.reset();

  std::cout << "[AccountMonitor] credentials rotated to " << masked_key
            << "; cache cleared\n";
  events_.push(CredentialsRotatedEvent{std::move(masked_key), clock_.now_ms()});
}

CacheStats AccountMonitor::cacheStats() const { return store_.stats(); }

bool AccountMonitor::credentialsRejected() const {
  return gateway()->credentialsRejected();
}

// -----------------------------------------------------------------------------
// onRefreshed(): coordinator listener → monitor events
// -----------------------------------------------------------------------------
void AccountMonitor::onRefreshed(const RefreshOutcome& outcome) {
  const std::optional<domain::Dataset> dataset =
      domain::datasetForKey(outcome.key);
  if (!dataset) {
    return;
  }

  if (outcome.success) {
    events_.push(DatasetRefreshedEvent{
        *dataset, outcome.key, outcome.completed_at_ms,
        outcome.completed_at_ms - outcome.started_at_ms});
    return;
  }

  const FetchError error =
      outcome.error ? *outcome.error
                    : FetchError{ErrorKind::Transient, "refresh failed", 0};
  events_.push(
      RefreshFailedEvent{*dataset, outcome.key, error, outcome.completed_at_ms});

  if (error.kind == ErrorKind::Auth) {
    std::string masked;
    {
      std::lock_guard lock(gateway_mutex_);
      masked = masked_key_;
    }
    events_.push(CredentialsRejectedEvent{std::move(masked), error.message,
                                          outcome.completed_at_ms});
  }
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string AccountMonitor::executeCommand(const std::string& cmd) {
  std::istringstream in(cmd);
  std::vector<std::string> args;
  for (std::string token; in >> token;) {
    args.push_back(std::move(token));
  }
  if (args.empty()) {
    return errorResponse("Empty command").dump();
  }

  const std::string verb = toUpper(args[0]);
  nlohmann::json response;
  response["status"] = "ok";

  try {
    if (verb == "PING") {
      response["response"] = "PONG";
    } else if (verb == "ACCOUNT") {
      response["result"] = presentation::present(getAccountSnapshot());
    } else if (verb == "POSITIONS") {
      domain::PositionFilter filter;
      if (args.size() > 1) {
        filter.symbol = toUpper(args[1]);
      }
      response["result"] = presentation::present(getPositions(filter));
    } else if (verb == "TRADES") {
      std::optional<std::string> symbol;
      std::size_t limit = 100;
      for (std::size_t i = 1; i < args.size(); ++i) {
        if (isNumber(args[i])) {
          limit = static_cast<std::size_t>(std::stoull(args[i]));
        } else {
          symbol = toUpper(args[i]);
        }
      }
      response["result"] = presentation::present(getRecentTrades(symbol, limit));
    } else if (verb == "INCOME") {
      if (args.size() < 3) {
        return errorResponse("Usage: INCOME <startMs> <endMs>").dump();
      }
      const domain::TimeRange range{std::stoll(args[1]), std::stoll(args[2])};
      response["result"] = presentation::present(getIncomeHistory(range));
    } else if (verb == "METRICS") {
      response["result"] = presentation::present(getDerivedMetrics());
    } else if (verb == "STATS") {
      if (args.size() < 3) {
        return errorResponse("Usage: STATS <startMs> <endMs> [SYMBOL]").dump();
      }
      const domain::TimeRange range{std::stoll(args[1]), std::stoll(args[2])};
      std::optional<std::string> symbol;
      if (args.size() > 3) {
        symbol = toUpper(args[3]);
      }
      nlohmann::json result;
      result["trading"] =
          presentation::present(getTradingStatistics(symbol, range));
      result["performance"] =
          presentation::present(getPerformanceMetrics(symbol, range));
      result["income"] = presentation::present(getIncomeSummary(range));
      response["result"] = std::move(result);
    } else if (verb == "CACHE") {
      nlohmann::json result = presentation::toJson(cacheStats());
      result["credentials_rejected"] = credentialsRejected();
      response["result"] = std::move(result);
    } else if (verb == "INVALIDATE") {
      const auto scope = args.size() > 1
                             ? invalidateScopeFromString(args[1])
                             : std::optional<InvalidateScope>{};
      if (!scope) {
        return errorResponse(
                   "Usage: INVALIDATE "
                   "<all|account|positions|trades|income|history>")
            .dump();
      }
      invalidate(*scope);
      response["response"] =
          std::string("Invalidated ") + invalidateScopeToString(*scope);
    } else {
      return errorResponse("Unknown command: " + args[0]).dump();
    }
  } catch (const std::invalid_argument&) {
    return errorResponse("Malformed number in: " + cmd).dump();
  } catch (const std::out_of_range&) {
    return errorResponse("Number out of range in: " + cmd).dump();
  }

  return response.dump();
}

}  // namespace futmon
