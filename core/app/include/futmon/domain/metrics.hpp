#pragma once

#include "futmon/domain/position.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace futmon {
namespace domain {

// -----------------------------------------------------------------------------
// Derived value types produced by the aggregator
// -----------------------------------------------------------------------------
//
// None of these are stored in the cache. They are recomputed from the
// cached inputs on every read, so they can never drift from the data they
// describe.
// -----------------------------------------------------------------------------

// Leverage buckets with inclusive upper bounds: 2x falls in UpTo2x,
// 2.5x in UpTo5x, 25x in Above20x.
enum class LeverageBucket { UpTo2x, UpTo5x, UpTo10x, UpTo20x, Above20x };

enum class RiskLevel { Low, Medium, High, VeryHigh };

struct PositionsSummary {
  std::size_t count{0};
  std::size_t long_count{0};
  std::size_t short_count{0};
  double total_notional{0.0};        // Sum of |notional|
  double total_unrealized_pnl{0.0};
  double average_leverage{0.0};
};

struct TradingStatistics {
  double volume{0.0};                // Sum of quote quantity
  double commission{0.0};
  std::size_t count{0};
  double realized_pnl{0.0};
  std::size_t buy_count{0};
  std::size_t sell_count{0};
  double average_trade_size{0.0};    // volume / count, 0 when empty
};

struct SymbolTradeStats {
  std::size_t count{0};
  double volume{0.0};
  double commission{0.0};
  double realized_pnl{0.0};
};

struct DailyTradeStats {
  std::size_t count{0};
  double volume{0.0};
  double commission{0.0};
  double realized_pnl{0.0};
};

struct PerformanceMetrics {
  std::size_t closed_trades{0};      // Trades with non-zero realized P&L
  std::size_t winning_trades{0};
  std::size_t losing_trades{0};
  double win_rate{0.0};              // Percent, 0..100
  double average_win{0.0};
  double average_loss{0.0};          // Negative or 0
  double largest_win{0.0};
  double largest_loss{0.0};          // Negative or 0
  double profit_factor{0.0};         // gross win / |gross loss|; 0 if no loss
  double sharpe_ratio{0.0};          // mean / stddev of per-trade P&L
};

struct IncomeSummary {
  double total{0.0};
  std::size_t count{0};
  std::map<std::string, double> by_type;          // Raw type string → sum
  std::map<std::int64_t, double> by_day;          // UTC day start ms → sum
};

struct PositionMetrics {
  std::string symbol;
  PositionSide side{PositionSide::Long};
  double roe_percent{0.0};
  double pnl_percent{0.0};
  double initial_margin{0.0};
  RiskLevel leverage_risk{RiskLevel::Low};
};

// -----------------------------------------------------------------------------
// DerivedMetrics: the account-level risk picture
// -----------------------------------------------------------------------------
// margin_ratio_elevated is only surfaced, never acted on. When the inputs
// were served stale, the result is stale too (see FetchResult) and must not
// drive liquidation alerts without the caller checking that flag.
// -----------------------------------------------------------------------------
struct DerivedMetrics {
  double total_equity{0.0};
  double total_unrealized_pnl{0.0};
  double margin_ratio{0.0};
  bool margin_ratio_elevated{false};
  std::vector<PositionMetrics> positions;
  std::map<LeverageBucket, double> leverage_distribution;
  PositionsSummary summary;
};

const char* leverageBucketToString(LeverageBucket bucket);
const char* riskLevelToString(RiskLevel level);

}  // namespace domain
}  // namespace futmon
