#pragma once

#include "futmon/domain/account_snapshot.hpp"
#include "futmon/domain/income_record.hpp"
#include "futmon/domain/metrics.hpp"
#include "futmon/domain/position.hpp"
#include "futmon/domain/time_range.hpp"
#include "futmon/domain/trade.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace futmon {
namespace aggregator {

// -----------------------------------------------------------------------------
// Aggregator: derived account metrics as pure functions
// -----------------------------------------------------------------------------
//
// @brief  Turns already-fetched snapshots, positions, trades and income into
//         presentation-ready numbers.
//
// @details
// No I/O, no clock, no caching. Same inputs, same outputs, on any thread.
// The monitor calls these on every read so derived values never outlive
// the inputs they were computed from.
//
// Degenerate inputs return zeros rather than errors or NaN: a position
// with zero margin has ROE 0, an empty trade set has zeroed statistics.
// The one deliberate exception is marginRatio(), see below.
// -----------------------------------------------------------------------------

// Sum of unrealized P&L over positions.
double totalUnrealizedPnl(const std::vector<domain::Position>& positions);

// wallet balance + sum of unrealized P&L across all open positions.
double totalEquity(double wallet_balance,
                   const std::vector<domain::Position>& positions);

// -------------------------------------------------------------------------
// marginRatio
// -------------------------------------------------------------------------
// @brief  maintenance margin required / margin balance.
//
// @details
//   maint_margin <= 0                     → 0 (nothing at risk)
//   margin_balance <= 0 with margin owed  → +infinity (at or past
//                                           liquidation; always elevated)
// -------------------------------------------------------------------------
double marginRatio(double maint_margin, double margin_balance);

// ratio > threshold. Only computed and surfaced; nothing acts on it here.
bool isMarginRatioElevated(double ratio, double threshold);

// entry price × |amount| / leverage. 0 when leverage <= 0.
double positionInitialMargin(const domain::Position& position);

// -------------------------------------------------------------------------
// positionRoePercent
// -------------------------------------------------------------------------
// @brief  unrealized P&L / initial margin × 100.
//
// @details
// The exchange reports unrealized P&L already signed for the side (a short
// that gained has positive P&L), so the sign of the result follows the
// position side without further adjustment. Example: entry 100, size 10,
// leverage 5 → margin 200; P&L −20 → −10.0.
// -------------------------------------------------------------------------
double positionRoePercent(const domain::Position& position);

// (mark − entry) / entry × 100, negated for shorts. 0 when entry is 0.
double positionPnlPercent(const domain::Position& position);

// |notional|, falling back to |amount| × mark when notional is not reported.
double positionAbsNotional(const domain::Position& position);

domain::LeverageBucket leverageBucketFor(double leverage);

// Bucket → aggregate |notional|. Every bucket is present (possibly 0).
std::map<domain::LeverageBucket, double> leverageDistribution(
    const std::vector<domain::Position>& positions);

// <=2 Low, <=5 Medium, <=10 High, else VeryHigh.
domain::RiskLevel leverageRiskLevel(double leverage);

domain::PositionsSummary summarizePositions(
    const std::vector<domain::Position>& positions);

// -------------------------------------------------------------------------
// Trade aggregates over range
// -------------------------------------------------------------------------
// All of these consider only trades whose time falls in `range`. An empty
// selection yields zeroed results, never an error.
// -------------------------------------------------------------------------
domain::TradingStatistics tradingStatistics(
    const std::vector<domain::Trade>& trades, const domain::TimeRange& range);

std::map<std::string, domain::SymbolTradeStats> tradesBySymbol(
    const std::vector<domain::Trade>& trades, const domain::TimeRange& range);

// Keyed by UTC day start (epoch ms).
std::map<std::int64_t, domain::DailyTradeStats> dailyTradeStats(
    const std::vector<domain::Trade>& trades, const domain::TimeRange& range);

// Win/loss statistics over trades with non-zero realized P&L (closing
// fills). Sharpe is the simplified per-trade mean / population stddev,
// 0 when fewer than two closed trades or zero dispersion.
domain::PerformanceMetrics performanceMetrics(
    const std::vector<domain::Trade>& trades, const domain::TimeRange& range);

domain::IncomeSummary summarizeIncome(
    const std::vector<domain::IncomeRecord>& records,
    const domain::TimeRange& range);

// -------------------------------------------------------------------------
// computeDerivedMetrics
// -------------------------------------------------------------------------
// @brief  The account-level risk picture from one snapshot and one
//         position set.
//
// @details
// Equity uses the snapshot's wallet balance plus the positions' unrealized
// P&L. Margin ratio is recomputed from the snapshot's maintenance margin
// and margin balance rather than copied.
// -------------------------------------------------------------------------
domain::DerivedMetrics computeDerivedMetrics(
    const domain::AccountSnapshot& snapshot,
    const std::vector<domain::Position>& positions,
    double margin_ratio_threshold);

}  // namespace aggregator
}  // namespace futmon
