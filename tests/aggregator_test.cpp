// =============================================================================
// aggregator_test.cpp
// =============================================================================
// Unit tests for the futmon::aggregator free functions.
//
// Validates:
//   - Equity = wallet + sum of unrealized P&L
//   - ROE sign and magnitude against initial margin
//   - Margin ratio degenerate cases (no margin owed, non-positive balance)
//   - Leverage buckets use inclusive upper bounds
//   - Empty trade selections give zeroed statistics, never errors
//   - Performance metrics (win rate, profit factor, Sharpe)
//   - Income grouped by type and by UTC day
// =============================================================================

#include "futmon/aggregator/aggregator.hpp"
#include "futmon/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

using futmon::domain::IncomeRecord;
using futmon::domain::LeverageBucket;
using futmon::domain::Position;
using futmon::domain::PositionSide;
using futmon::domain::RiskLevel;
using futmon::domain::TimeRange;
using futmon::domain::Trade;
using futmon::domain::TradeSide;

namespace agg = futmon::aggregator;

class AggregatorTest : public ::testing::Test {
 protected:
  static Position makePosition(const std::string& symbol, double amount,
                               double entry, double mark, double unrealized,
                               double leverage) {
    Position p;
    p.symbol = symbol;
    p.amount = amount;
    p.side = amount > 0 ? PositionSide::Long : PositionSide::Short;
    p.entry_price = entry;
    p.mark_price = mark;
    p.unrealized_pnl = unrealized;
    p.leverage = leverage;
    p.notional = amount * mark;
    return p;
  }

  static Trade makeTrade(std::int64_t id, const std::string& symbol,
                         TradeSide side, double quote_qty, double pnl,
                         std::int64_t time_ms) {
    Trade t;
    t.id = id;
    t.symbol = symbol;
    t.side = side;
    t.quote_quantity = quote_qty;
    t.commission = 0.5;
    t.realized_pnl = pnl;
    t.time_ms = time_ms;
    return t;
  }
};

// -----------------------------------------------------------------------------
// 1. Equity and ROE
// -----------------------------------------------------------------------------
TEST_F(AggregatorTest, EquityAddsUnrealizedPnl) {
  std::vector<Position> positions{
      makePosition("BTCUSDT", 0.1, 30000, 30500, 50.0, 10)};

  EXPECT_DOUBLE_EQ(agg::totalEquity(1000.0, positions), 1050.0);
  EXPECT_DOUBLE_EQ(agg::totalEquity(1000.0, {}), 1000.0);
}

TEST_F(AggregatorTest, EquityNetsMixedPnl) {
  std::vector<Position> positions{
      makePosition("BTCUSDT", 0.1, 30000, 30500, 50.0, 10),
      makePosition("ETHUSDT", -2.0, 2000, 2030, -60.0, 5)};

  EXPECT_DOUBLE_EQ(agg::totalUnrealizedPnl(positions), -10.0);
  EXPECT_DOUBLE_EQ(agg::totalEquity(500.0, positions), 490.0);
}

TEST_F(AggregatorTest, RoeIsPnlOverInitialMargin) {
  // entry 100, size 10, leverage 5 → margin 200; P&L −20 → −10 %.
  Position p = makePosition("SOLUSDT", 10, 100, 98, -20.0, 5);

  EXPECT_DOUBLE_EQ(agg::positionInitialMargin(p), 200.0);
  EXPECT_DOUBLE_EQ(agg::positionRoePercent(p), -10.0);
}

TEST_F(AggregatorTest, RoeOfProfitableShortIsPositive) {
  Position p = makePosition("SOLUSDT", -10, 100, 95, 50.0, 5);

  EXPECT_DOUBLE_EQ(agg::positionRoePercent(p), 25.0);
  EXPECT_DOUBLE_EQ(agg::positionPnlPercent(p), 5.0);
}

TEST_F(AggregatorTest, RoeIsZeroWithoutMargin) {
  Position p = makePosition("SOLUSDT", 10, 0, 0, 5.0, 5);
  EXPECT_DOUBLE_EQ(agg::positionRoePercent(p), 0.0);
  EXPECT_DOUBLE_EQ(agg::positionPnlPercent(p), 0.0);
}

// -----------------------------------------------------------------------------
// 2. Margin ratio
// Why: A ratio near 1 means liquidation. The degenerate cases must never
//      read as "safe" when margin is actually owed.
// -----------------------------------------------------------------------------
TEST_F(AggregatorTest, MarginRatioDividesMaintenanceByBalance) {
  EXPECT_DOUBLE_EQ(agg::marginRatio(25.0, 1000.0), 0.025);
}

TEST_F(AggregatorTest, MarginRatioIsZeroWhenNothingOwed) {
  EXPECT_DOUBLE_EQ(agg::marginRatio(0.0, 1000.0), 0.0);
  EXPECT_DOUBLE_EQ(agg::marginRatio(0.0, 0.0), 0.0);
}

TEST_F(AggregatorTest, MarginRatioIsInfiniteWithoutBalance) {
  double ratio = agg::marginRatio(10.0, 0.0);
  EXPECT_TRUE(std::isinf(ratio));
  EXPECT_TRUE(agg::isMarginRatioElevated(ratio, 0.8));
  EXPECT_TRUE(std::isinf(agg::marginRatio(10.0, -5.0)));
}

TEST_F(AggregatorTest, ElevatedIsStrictlyAboveThreshold) {
  EXPECT_FALSE(agg::isMarginRatioElevated(0.8, 0.8));
  EXPECT_TRUE(agg::isMarginRatioElevated(0.81, 0.8));
}

// -----------------------------------------------------------------------------
// 3. Leverage buckets
// -----------------------------------------------------------------------------
TEST_F(AggregatorTest, BucketUpperBoundsAreInclusive) {
  EXPECT_EQ(agg::leverageBucketFor(1), LeverageBucket::UpTo2x);
  EXPECT_EQ(agg::leverageBucketFor(2), LeverageBucket::UpTo2x);
  EXPECT_EQ(agg::leverageBucketFor(2.5), LeverageBucket::UpTo5x);
  EXPECT_EQ(agg::leverageBucketFor(5), LeverageBucket::UpTo5x);
  EXPECT_EQ(agg::leverageBucketFor(10), LeverageBucket::UpTo10x);
  EXPECT_EQ(agg::leverageBucketFor(20), LeverageBucket::UpTo20x);
  EXPECT_EQ(agg::leverageBucketFor(25), LeverageBucket::Above20x);
}

TEST_F(AggregatorTest, DistributionSumsAbsoluteNotional) {
  std::vector<Position> positions{
      makePosition("BTCUSDT", 0.1, 30000, 30000, 0, 10),   // 3000
      makePosition("ETHUSDT", -1.0, 2000, 2000, 0, 10),    // 2000
      makePosition("XRPUSDT", 100, 0.5, 0.5, 0, 50)};      // 50

  auto dist = agg::leverageDistribution(positions);

  ASSERT_EQ(dist.size(), 5u);
  EXPECT_DOUBLE_EQ(dist[LeverageBucket::UpTo10x], 5000.0);
  EXPECT_DOUBLE_EQ(dist[LeverageBucket::Above20x], 50.0);
  EXPECT_DOUBLE_EQ(dist[LeverageBucket::UpTo2x], 0.0);
}

TEST_F(AggregatorTest, RiskLevelFollowsLeverage) {
  EXPECT_EQ(agg::leverageRiskLevel(2), RiskLevel::Low);
  EXPECT_EQ(agg::leverageRiskLevel(3), RiskLevel::Medium);
  EXPECT_EQ(agg::leverageRiskLevel(10), RiskLevel::High);
  EXPECT_EQ(agg::leverageRiskLevel(11), RiskLevel::VeryHigh);
}

TEST_F(AggregatorTest, SummaryCountsSides) {
  std::vector<Position> positions{
      makePosition("BTCUSDT", 0.1, 30000, 30000, 10, 10),
      makePosition("ETHUSDT", -1.0, 2000, 2000, -4, 20)};

  auto summary = agg::summarizePositions(positions);

  EXPECT_EQ(summary.count, 2u);
  EXPECT_EQ(summary.long_count, 1u);
  EXPECT_EQ(summary.short_count, 1u);
  EXPECT_DOUBLE_EQ(summary.total_notional, 5000.0);
  EXPECT_DOUBLE_EQ(summary.total_unrealized_pnl, 6.0);
  EXPECT_DOUBLE_EQ(summary.average_leverage, 15.0);
}

// -----------------------------------------------------------------------------
// 4. Trade statistics
// -----------------------------------------------------------------------------
TEST_F(AggregatorTest, EmptyTradesGiveZeroedStatistics) {
  auto stats = agg::tradingStatistics({}, TimeRange::all());

  EXPECT_EQ(stats.count, 0u);
  EXPECT_DOUBLE_EQ(stats.volume, 0.0);
  EXPECT_DOUBLE_EQ(stats.commission, 0.0);
  EXPECT_DOUBLE_EQ(stats.realized_pnl, 0.0);
  EXPECT_DOUBLE_EQ(stats.average_trade_size, 0.0);

  auto perf = agg::performanceMetrics({}, TimeRange::all());
  EXPECT_EQ(perf.closed_trades, 0u);
  EXPECT_DOUBLE_EQ(perf.win_rate, 0.0);
  EXPECT_DOUBLE_EQ(perf.sharpe_ratio, 0.0);
}

TEST_F(AggregatorTest, StatisticsRespectHalfOpenRange) {
  std::vector<Trade> trades{
      makeTrade(1, "BTCUSDT", TradeSide::Buy, 100, 0, 1000),
      makeTrade(2, "BTCUSDT", TradeSide::Sell, 300, 20, 2000),
      makeTrade(3, "ETHUSDT", TradeSide::Buy, 500, 0, 3000)};

  auto stats = agg::tradingStatistics(trades, TimeRange{1000, 3000});

  EXPECT_EQ(stats.count, 2u);
  EXPECT_DOUBLE_EQ(stats.volume, 400.0);
  EXPECT_DOUBLE_EQ(stats.commission, 1.0);
  EXPECT_DOUBLE_EQ(stats.realized_pnl, 20.0);
  EXPECT_EQ(stats.buy_count, 1u);
  EXPECT_EQ(stats.sell_count, 1u);
  EXPECT_DOUBLE_EQ(stats.average_trade_size, 200.0);
}

TEST_F(AggregatorTest, GroupsTradesBySymbolAndDay) {
  const std::int64_t day = 1'700'000'000'000;
  std::vector<Trade> trades{
      makeTrade(1, "BTCUSDT", TradeSide::Buy, 100, 0, day),
      makeTrade(2, "ETHUSDT", TradeSide::Buy, 50, 0, day + 1),
      makeTrade(3, "BTCUSDT", TradeSide::Sell, 100, 5,
                day + futmon::kMillisPerDay)};

  auto by_symbol = agg::tradesBySymbol(trades, TimeRange::all());
  ASSERT_EQ(by_symbol.size(), 2u);
  EXPECT_EQ(by_symbol["BTCUSDT"].count, 2u);
  EXPECT_DOUBLE_EQ(by_symbol["ETHUSDT"].volume, 50.0);

  auto by_day = agg::dailyTradeStats(trades, TimeRange::all());
  ASSERT_EQ(by_day.size(), 2u);
  EXPECT_EQ(by_day.begin()->first, futmon::start_of_day_ms(day));
  EXPECT_EQ(by_day.begin()->second.count, 2u);
}

TEST_F(AggregatorTest, PerformanceCountsOnlyClosingFills) {
  std::vector<Trade> trades{
      makeTrade(1, "BTCUSDT", TradeSide::Buy, 100, 0, 1),     // opening
      makeTrade(2, "BTCUSDT", TradeSide::Sell, 100, 30, 2),
      makeTrade(3, "BTCUSDT", TradeSide::Sell, 100, 10, 3),
      makeTrade(4, "BTCUSDT", TradeSide::Sell, 100, -20, 4)};

  auto m = agg::performanceMetrics(trades, TimeRange::all());

  EXPECT_EQ(m.closed_trades, 3u);
  EXPECT_EQ(m.winning_trades, 2u);
  EXPECT_EQ(m.losing_trades, 1u);
  EXPECT_NEAR(m.win_rate, 66.6667, 1e-3);
  EXPECT_DOUBLE_EQ(m.average_win, 20.0);
  EXPECT_DOUBLE_EQ(m.average_loss, -20.0);
  EXPECT_DOUBLE_EQ(m.largest_win, 30.0);
  EXPECT_DOUBLE_EQ(m.largest_loss, -20.0);
  EXPECT_DOUBLE_EQ(m.profit_factor, 2.0);
  // mean 20/3, population stddev sqrt(1400/3 - 400/9)
  const double mean = 20.0 / 3.0;
  const double stddev = std::sqrt(1400.0 / 3.0 - mean * mean);
  EXPECT_NEAR(m.sharpe_ratio, mean / stddev, 1e-9);
}

TEST_F(AggregatorTest, ProfitFactorZeroWithoutLosses) {
  std::vector<Trade> trades{
      makeTrade(1, "BTCUSDT", TradeSide::Sell, 100, 10, 1)};

  auto m = agg::performanceMetrics(trades, TimeRange::all());

  EXPECT_DOUBLE_EQ(m.win_rate, 100.0);
  EXPECT_DOUBLE_EQ(m.profit_factor, 0.0);
  EXPECT_DOUBLE_EQ(m.sharpe_ratio, 0.0);
}

// -----------------------------------------------------------------------------
// 5. Income summary
// -----------------------------------------------------------------------------
TEST_F(AggregatorTest, IncomeGroupedByTypeAndDay) {
  const std::int64_t day = futmon::start_of_day_ms(1'700'000'000'000);
  auto record = [](std::int64_t id, const std::string& type, double amount,
                   std::int64_t t) {
    IncomeRecord r;
    r.tran_id = id;
    r.raw_type = type;
    r.amount = amount;
    r.time_ms = t;
    return r;
  };
  std::vector<IncomeRecord> records{
      record(1, "FUNDING_FEE", -1.5, day + 10),
      record(2, "REALIZED_PNL", 20.0, day + 20),
      record(3, "FUNDING_FEE", -0.5, day + futmon::kMillisPerDay),
      record(4, "COMMISSION", -0.2, day - 1)};

  auto summary = agg::summarizeIncome(records, TimeRange{day, day * 2});

  EXPECT_EQ(summary.count, 3u);
  EXPECT_DOUBLE_EQ(summary.total, 18.0);
  EXPECT_DOUBLE_EQ(summary.by_type["FUNDING_FEE"], -2.0);
  EXPECT_DOUBLE_EQ(summary.by_type["REALIZED_PNL"], 20.0);
  EXPECT_EQ(summary.by_type.count("COMMISSION"), 0u);
  ASSERT_EQ(summary.by_day.size(), 2u);
  EXPECT_DOUBLE_EQ(summary.by_day[day], 18.5);
}

// -----------------------------------------------------------------------------
// 6. computeDerivedMetrics
// -----------------------------------------------------------------------------
TEST_F(AggregatorTest, DerivedMetricsCombineSnapshotAndPositions) {
  futmon::domain::AccountSnapshot snapshot;
  snapshot.wallet_balance = 1000.0;
  snapshot.margin_balance = 1050.0;
  snapshot.maint_margin = 945.0;
  std::vector<Position> positions{
      makePosition("BTCUSDT", 0.1, 30000, 30500, 50.0, 10)};

  auto metrics = agg::computeDerivedMetrics(snapshot, positions, 0.8);

  EXPECT_DOUBLE_EQ(metrics.total_equity, 1050.0);
  EXPECT_DOUBLE_EQ(metrics.total_unrealized_pnl, 50.0);
  EXPECT_DOUBLE_EQ(metrics.margin_ratio, 0.9);
  EXPECT_TRUE(metrics.margin_ratio_elevated);
  ASSERT_EQ(metrics.positions.size(), 1u);
  EXPECT_EQ(metrics.positions[0].symbol, "BTCUSDT");
  EXPECT_DOUBLE_EQ(metrics.positions[0].initial_margin, 300.0);
  EXPECT_EQ(metrics.positions[0].leverage_risk, RiskLevel::High);
  EXPECT_EQ(metrics.summary.count, 1u);
}
