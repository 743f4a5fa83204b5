#include "futmon/presentation/presenters.hpp"

#include "futmon/domain/dataset.hpp"
#include "futmon/events/monitor_events.hpp"

#include <string>
#include <variant>

namespace futmon {
namespace presentation {

nlohmann::json toJson(const domain::AccountSnapshot& snapshot) {
  nlohmann::json j;
  j["wallet_balance"] = snapshot.wallet_balance;
  j["available_balance"] = snapshot.available_balance;
  j["unrealized_pnl"] = snapshot.unrealized_pnl;
  j["margin_balance"] = snapshot.margin_balance;
  j["maint_margin"] = snapshot.maint_margin;
  j["initial_margin"] = snapshot.initial_margin;
  j["max_withdraw_amount"] = snapshot.max_withdraw_amount;
  j["margin_ratio"] = snapshot.margin_ratio;
  j["as_of"] = snapshot.as_of_ms;

  nlohmann::json assets = nlohmann::json::array();
  for (const auto& asset : snapshot.assets) {
    nlohmann::json a;
    a["asset"] = asset.asset;
    a["wallet_balance"] = asset.wallet_balance;
    a["unrealized_pnl"] = asset.unrealized_pnl;
    a["margin_balance"] = asset.margin_balance;
    a["maint_margin"] = asset.maint_margin;
    a["initial_margin"] = asset.initial_margin;
    a["available_balance"] = asset.available_balance;
    assets.push_back(std::move(a));
  }
  j["assets"] = std::move(assets);
  return j;
}

nlohmann::json toJson(const domain::Position& position) {
  nlohmann::json j;
  j["symbol"] = position.symbol;
  j["side"] = domain::positionSideToString(position.side);
  j["hedge_mode"] = position.hedge_mode;
  j["amount"] = position.amount;
  j["entry_price"] = position.entry_price;
  j["mark_price"] = position.mark_price;
  j["leverage"] = position.leverage;
  j["liquidation_price"] = position.liquidation_price;
  j["unrealized_pnl"] = position.unrealized_pnl;
  j["margin_mode"] = domain::marginModeToString(position.margin_mode);
  j["isolated_margin"] = position.isolated_margin;
  j["notional"] = position.notional;
  j["update_time"] = position.update_time_ms;
  return j;
}

nlohmann::json toJson(const domain::Trade& trade) {
  nlohmann::json j;
  j["id"] = trade.id;
  j["order_id"] = trade.order_id;
  j["symbol"] = trade.symbol;
  j["side"] = domain::tradeSideToString(trade.side);
  j["price"] = trade.price;
  j["quantity"] = trade.quantity;
  j["quote_quantity"] = trade.quote_quantity;
  j["commission"] = trade.commission;
  j["commission_asset"] = trade.commission_asset;
  j["realized_pnl"] = trade.realized_pnl;
  j["maker"] = trade.maker;
  j["time"] = trade.time_ms;
  return j;
}

nlohmann::json toJson(const domain::IncomeRecord& record) {
  nlohmann::json j;
  j["tran_id"] = record.tran_id;
  j["type"] = record.raw_type;
  j["symbol"] = record.symbol;
  j["amount"] = record.amount;
  j["asset"] = record.asset;
  j["info"] = record.info;
  j["trade_id"] = record.trade_id;
  j["time"] = record.time_ms;
  return j;
}

nlohmann::json toJson(const domain::DerivedMetrics& metrics) {
  nlohmann::json j;
  j["total_equity"] = metrics.total_equity;
  j["total_unrealized_pnl"] = metrics.total_unrealized_pnl;
  j["margin_ratio"] = metrics.margin_ratio;
  j["margin_ratio_elevated"] = metrics.margin_ratio_elevated;

  nlohmann::json positions = nlohmann::json::array();
  for (const auto& p : metrics.positions) {
    nlohmann::json pj;
    pj["symbol"] = p.symbol;
    pj["side"] = domain::positionSideToString(p.side);
    pj["roe_percent"] = p.roe_percent;
    pj["pnl_percent"] = p.pnl_percent;
    pj["initial_margin"] = p.initial_margin;
    pj["leverage_risk"] = domain::riskLevelToString(p.leverage_risk);
    positions.push_back(std::move(pj));
  }
  j["positions"] = std::move(positions);

  nlohmann::json distribution = nlohmann::json::object();
  for (const auto& [bucket, notional] : metrics.leverage_distribution) {
    distribution[domain::leverageBucketToString(bucket)] = notional;
  }
  j["leverage_distribution"] = std::move(distribution);

  nlohmann::json summary;
  summary["count"] = metrics.summary.count;
  summary["long_count"] = metrics.summary.long_count;
  summary["short_count"] = metrics.summary.short_count;
  summary["total_notional"] = metrics.summary.total_notional;
  summary["total_unrealized_pnl"] = metrics.summary.total_unrealized_pnl;
  summary["average_leverage"] = metrics.summary.average_leverage;
  j["summary"] = std::move(summary);
  return j;
}

nlohmann::json toJson(const domain::TradingStatistics& stats) {
  nlohmann::json j;
  j["volume"] = stats.volume;
  j["commission"] = stats.commission;
  j["count"] = stats.count;
  j["realized_pnl"] = stats.realized_pnl;
  j["buy_count"] = stats.buy_count;
  j["sell_count"] = stats.sell_count;
  j["average_trade_size"] = stats.average_trade_size;
  return j;
}

nlohmann::json toJson(const domain::PerformanceMetrics& metrics) {
  nlohmann::json j;
  j["closed_trades"] = metrics.closed_trades;
  j["winning_trades"] = metrics.winning_trades;
  j["losing_trades"] = metrics.losing_trades;
  j["win_rate"] = metrics.win_rate;
  j["average_win"] = metrics.average_win;
  j["average_loss"] = metrics.average_loss;
  j["largest_win"] = metrics.largest_win;
  j["largest_loss"] = metrics.largest_loss;
  j["profit_factor"] = metrics.profit_factor;
  j["sharpe_ratio"] = metrics.sharpe_ratio;
  return j;
}

nlohmann::json toJson(const domain::IncomeSummary& summary) {
  nlohmann::json j;
  j["total"] = summary.total;
  j["count"] = summary.count;
  j["by_type"] = summary.by_type;

  nlohmann::json by_day = nlohmann::json::object();
  for (const auto& [day_ms, amount] : summary.by_day) {
    by_day[format_utc_date(day_ms)] = amount;
  }
  j["by_day"] = std::move(by_day);
  return j;
}

nlohmann::json toJson(const CacheStats& stats) {
  nlohmann::json j;
  j["total_entries"] = stats.total_entries;
  j["valid_entries"] = stats.valid_entries;
  j["expired_entries"] = stats.expired_entries;
  j["stale_entries"] = stats.stale_entries;
  return j;
}

nlohmann::json toJson(const FetchError& error) {
  nlohmann::json j;
  j["kind"] = errorKindToString(error.kind);
  j["message"] = error.message;
  if (error.kind == ErrorKind::RateLimit) {
    j["retry_after_ms"] = error.retry_after_ms;
  }
  return j;
}

nlohmann::json resultEnvelope(DataState state, bool stale,
                              std::int64_t fetched_at_ms, std::int64_t age_ms,
                              const std::optional<FetchError>& error) {
  nlohmann::json j;
  j["state"] = dataStateToString(state);
  j["stale"] = stale;
  if (state != DataState::Unavailable) {
    j["fetched_at"] = fetched_at_ms;
    j["age_ms"] = age_ms;
    j["age"] = format_age(age_ms);
  }
  if (error) {
    j["error"] = toJson(*error);
  }
  return j;
}

// -----------------------------------------------------------------------------
// formatEvent(): one telemetry message per monitor event
// -----------------------------------------------------------------------------
nlohmann::json formatEvent(const Event& event) {
  nlohmann::json j;
  if (const auto* e = std::get_if<DatasetRefreshedEvent>(&event)) {
    j["type"] = "dataset_refreshed";
    j["dataset"] = domain::datasetToString(e->dataset);
    j["key"] = e->key;
    j["fetched_at"] = e->fetched_at_ms;
    j["duration_ms"] = e->duration_ms;
  } else if (const auto* e = std::get_if<RefreshFailedEvent>(&event)) {
    j["type"] = "refresh_failed";
    j["dataset"] = domain::datasetToString(e->dataset);
    j["key"] = e->key;
    j["error"] = toJson(e->error);
    j["at"] = e->at_ms;
  } else if (const auto* e = std::get_if<CredentialsRejectedEvent>(&event)) {
    j["type"] = "credentials_rejected";
    j["api_key"] = e->masked_key;
    j["reason"] = e->reason;
    j["at"] = e->at_ms;
  } else if (const auto* e = std::get_if<CredentialsRotatedEvent>(&event)) {
    j["type"] = "credentials_rotated";
    j["api_key"] = e->masked_key;
    j["at"] = e->at_ms;
  } else if (const auto* e = std::get_if<MarginRatioAlertEvent>(&event)) {
    j["type"] = "margin_ratio_alert";
    j["margin_ratio"] = e->margin_ratio;
    j["threshold"] = e->threshold;
    j["total_equity"] = e->total_equity;
    j["at"] = e->at_ms;
  }
  return j;
}

}  // namespace presentation
}  // namespace futmon
