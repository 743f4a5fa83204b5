#include "futmon/aggregator/aggregator.hpp"

#include "futmon/time/time_utils.hpp"

#include <cmath>
#include <limits>

namespace futmon {
namespace aggregator {

using domain::LeverageBucket;
using domain::Position;
using domain::PositionSide;
using domain::Trade;

double totalUnrealizedPnl(const std::vector<Position>& positions) {
  double total = 0.0;
  for (const auto& p : positions) {
    total += p.unrealized_pnl;
  }
  return total;
}

double totalEquity(double wallet_balance,
                   const std::vector<Position>& positions) {
  return wallet_balance + totalUnrealizedPnl(positions);
}

double marginRatio(double maint_margin, double margin_balance) {
  if (maint_margin <= 0.0) {
    return 0.0;
  }
  if (margin_balance <= 0.0) {
    return std::numeric_limits<double>::infinity();
  }
  return maint_margin / margin_balance;
}

bool isMarginRatioElevated(double ratio, double threshold) {
  return ratio > threshold;
}

double positionInitialMargin(const Position& position) {
  if (position.leverage <= 0.0) {
    return 0.0;
  }
  return position.entry_price * std::fabs(position.amount) / position.leverage;
}

double positionRoePercent(const Position& position) {
  const double margin = positionInitialMargin(position);
  if (margin <= 0.0) {
    return 0.0;
  }
  return position.unrealized_pnl / margin * 100.0;
}

double positionPnlPercent(const Position& position) {
  if (position.entry_price == 0.0) {
    return 0.0;
  }
  const double sign = position.side == PositionSide::Long ? 1.0 : -1.0;
  return (position.mark_price - position.entry_price) / position.entry_price *
         100.0 * sign;
}

double positionAbsNotional(const Position& position) {
  if (position.notional != 0.0) {
    return std::fabs(position.notional);
  }
  return std::fabs(position.amount * position.mark_price);
}

LeverageBucket leverageBucketFor(double leverage) {
  if (leverage <= 2.0) {
    return LeverageBucket::UpTo2x;
  }
  if (leverage <= 5.0) {
    return LeverageBucket::UpTo5x;
  }
  if (leverage <= 10.0) {
    return LeverageBucket::UpTo10x;
  }
  if (leverage <= 20.0) {
    return LeverageBucket::UpTo20x;
  }
  return LeverageBucket::Above20x;
}

std::map<LeverageBucket, double> leverageDistribution(
    const std::vector<Position>& positions) {
  std::map<LeverageBucket, double> distribution{
      {LeverageBucket::UpTo2x, 0.0},
      {LeverageBucket::UpTo5x, 0.0},
      {LeverageBucket::UpTo10x, 0.0},
      {LeverageBucket::UpTo20x, 0.0},
      {LeverageBucket::Above20x, 0.0},
  };
  for (const auto& p : positions) {
    distribution[leverageBucketFor(p.leverage)] += positionAbsNotional(p);
  }
  return distribution;
}

domain::RiskLevel leverageRiskLevel(double leverage) {
  if (leverage <= 2.0) {
    return domain::RiskLevel::Low;
  }
  if (leverage <= 5.0) {
    return domain::RiskLevel::Medium;
  }
  if (leverage <= 10.0) {
    return domain::RiskLevel::High;
  }
  return domain::RiskLevel::VeryHigh;
}

domain::PositionsSummary summarizePositions(
    const std::vector<Position>& positions) {
  domain::PositionsSummary summary;
  double leverage_sum = 0.0;
  for (const auto& p : positions) {
    ++summary.count;
    if (p.side == PositionSide::Long) {
      ++summary.long_count;
    } else {
      ++summary.short_count;
    }
    summary.total_notional += positionAbsNotional(p);
    summary.total_unrealized_pnl += p.unrealized_pnl;
    leverage_sum += p.leverage;
  }
  if (summary.count > 0) {
    summary.average_leverage = leverage_sum / static_cast<double>(summary.count);
  }
  return summary;
}

// -----------------------------------------------------------------------------
// Trade aggregates
// -----------------------------------------------------------------------------
domain::TradingStatistics tradingStatistics(const std::vector<Trade>& trades,
                                            const domain::TimeRange& range) {
  domain::TradingStatistics stats;
  for (const auto& t : trades) {
    if (!range.contains(t.time_ms)) {
      continue;
    }
    ++stats.count;
    stats.volume += t.quote_quantity;
    stats.commission += t.commission;
    stats.realized_pnl += t.realized_pnl;
    if (t.side == domain::TradeSide::Buy) {
      ++stats.buy_count;
    } else {
      ++stats.sell_count;
    }
  }
  if (stats.count > 0) {
    stats.average_trade_size = stats.volume / static_cast<double>(stats.count);
  }
  return stats;
}

std::map<std::string, domain::SymbolTradeStats> tradesBySymbol(
    const std::vector<Trade>& trades, const domain::TimeRange& range) {
  std::map<std::string, domain::SymbolTradeStats> by_symbol;
  for (const auto& t : trades) {
    if (!range.contains(t.time_ms)) {
      continue;
    }
    auto& s = by_symbol[t.symbol];
    ++s.count;
    s.volume += t.quote_quantity;
    s.commission += t.commission;
    s.realized_pnl += t.realized_pnl;
  }
  return by_symbol;
}

std::map<std::int64_t, domain::DailyTradeStats> dailyTradeStats(
    const std::vector<Trade>& trades, const domain::TimeRange& range) {
  std::map<std::int64_t, domain::DailyTradeStats> by_day;
  for (const auto& t : trades) {
    if (!range.contains(t.time_ms)) {
      continue;
    }
    auto& d = by_day[start_of_day_ms(t.time_ms)];
    ++d.count;
    d.volume += t.quote_quantity;
    d.commission += t.commission;
    d.realized_pnl += t.realized_pnl;
  }
  return by_day;
}

domain::PerformanceMetrics performanceMetrics(const std::vector<Trade>& trades,
                                              const domain::TimeRange& range) {
  domain::PerformanceMetrics m;
  double gross_win = 0.0;
  double gross_loss = 0.0;
  double sum = 0.0;
  double sum_sq = 0.0;

  for (const auto& t : trades) {
    if (!range.contains(t.time_ms) || t.realized_pnl == 0.0) {
      continue;
    }
    const double pnl = t.realized_pnl;
    ++m.closed_trades;
    sum += pnl;
    sum_sq += pnl * pnl;
    if (pnl > 0.0) {
      ++m.winning_trades;
      gross_win += pnl;
      if (pnl > m.largest_win) {
        m.largest_win = pnl;
      }
    } else {
      ++m.losing_trades;
      gross_loss += pnl;
      if (pnl < m.largest_loss) {
        m.largest_loss = pnl;
      }
    }
  }

  if (m.closed_trades == 0) {
    return m;
  }

  const double n = static_cast<double>(m.closed_trades);
  m.win_rate = static_cast<double>(m.winning_trades) / n * 100.0;
  if (m.winning_trades > 0) {
    m.average_win = gross_win / static_cast<double>(m.winning_trades);
  }
  if (m.losing_trades > 0) {
    m.average_loss = gross_loss / static_cast<double>(m.losing_trades);
    m.profit_factor = gross_win / std::fabs(gross_loss);
  }
  if (m.closed_trades > 1) {
    const double mean = sum / n;
    const double variance = sum_sq / n - mean * mean;
    if (variance > 0.0) {
      m.sharpe_ratio = mean / std::sqrt(variance);
    }
  }
  return m;
}

domain::IncomeSummary summarizeIncome(
    const std::vector<domain::IncomeRecord>& records,
    const domain::TimeRange& range) {
  domain::IncomeSummary summary;
  for (const auto& r : records) {
    if (!range.contains(r.time_ms)) {
      continue;
    }
    ++summary.count;
    summary.total += r.amount;
    summary.by_type[r.raw_type] += r.amount;
    summary.by_day[start_of_day_ms(r.time_ms)] += r.amount;
  }
  return summary;
}

// -----------------------------------------------------------------------------
// computeDerivedMetrics()
// -----------------------------------------------------------------------------
domain::DerivedMetrics computeDerivedMetrics(
    const domain::AccountSnapshot& snapshot,
    const std::vector<Position>& positions, double margin_ratio_threshold) {
  domain::DerivedMetrics metrics;
  metrics.total_unrealized_pnl = totalUnrealizedPnl(positions);
  metrics.total_equity = snapshot.wallet_balance + metrics.total_unrealized_pnl;
  metrics.margin_ratio =
      marginRatio(snapshot.maint_margin, snapshot.margin_balance);
  metrics.margin_ratio_elevated =
      isMarginRatioElevated(metrics.margin_ratio, margin_ratio_threshold);

  metrics.positions.reserve(positions.size());
  for (const auto& p : positions) {
    domain::PositionMetrics pm;
    pm.symbol = p.symbol;
    pm.side = p.side;
    pm.roe_percent = positionRoePercent(p);
    pm.pnl_percent = positionPnlPercent(p);
    pm.initial_margin = positionInitialMargin(p);
    pm.leverage_risk = leverageRiskLevel(p.leverage);
    metrics.positions.push_back(std::move(pm));
  }

  metrics.leverage_distribution = leverageDistribution(positions);
  metrics.summary = summarizePositions(positions);
  return metrics;
}

}  // namespace aggregator
}  // namespace futmon
