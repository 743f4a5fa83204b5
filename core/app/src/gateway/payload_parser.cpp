#include "futmon/gateway/payload_parser.hpp"

#include "futmon/aggregator/aggregator.hpp"
#include "futmon/errors/exchange_error.hpp"

#include <cmath>
#include <cstdlib>
#include <string>

namespace futmon {
namespace payload {

namespace {

using nlohmann::json;

// -----------------------------------------------------------------------------
// Field helpers
// -----------------------------------------------------------------------------
// Decimals arrive as strings ("1000.50"), occasionally as numbers. Both are
// accepted; anything else is a contract violation.
// -----------------------------------------------------------------------------
double toDecimal(const json& value, const char* key) {
  if (value.is_number()) {
    return value.get<double>();
  }
  if (value.is_string()) {
    const std::string& text = value.get_ref<const std::string&>();
    if (text.empty()) {
      return 0.0;
    }
    char* end = nullptr;
    double parsed = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || !std::isfinite(parsed)) {
      throw ProtocolError(std::string("field '") + key +
                          "' is not a decimal: " + text);
    }
    return parsed;
  }
  throw ProtocolError(std::string("field '") + key + "' has unexpected type " +
                      value.type_name());
}

double decimalField(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end()) {
    throw ProtocolError(std::string("missing field '") + key + "'");
  }
  return toDecimal(*it, key);
}

double optionalDecimal(const json& object, const char* key,
                       double fallback = 0.0) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return fallback;
  }
  return toDecimal(*it, key);
}

std::int64_t integerField(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end()) {
    throw ProtocolError(std::string("missing field '") + key + "'");
  }
  if (it->is_number_integer()) {
    return it->get<std::int64_t>();
  }
  if (it->is_string()) {
    const std::string& text = it->get_ref<const std::string&>();
    char* end = nullptr;
    long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (end != text.c_str() && *end == '\0') {
      return parsed;
    }
  }
  throw ProtocolError(std::string("field '") + key + "' is not an integer");
}

std::int64_t optionalInteger(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return 0;
  }
  return integerField(object, key);
}

std::string stringField(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    throw ProtocolError(std::string("missing or non-string field '") + key +
                        "'");
  }
  return it->get<std::string>();
}

std::string optionalString(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

const json& requireArray(const json& payload, const char* what) {
  if (!payload.is_array()) {
    throw ProtocolError(std::string(what) + " payload is not an array");
  }
  return payload;
}

void requireObject(const json& value, const char* what) {
  if (!value.is_object()) {
    throw ProtocolError(std::string(what) + " entry is not an object");
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// parseAccountSnapshot(): /fapi/v2/account
// -----------------------------------------------------------------------------
domain::AccountSnapshot parseAccountSnapshot(const RawPayload& payload,
                                             std::int64_t fetched_at_ms) {
  requireObject(payload, "account");

  domain::AccountSnapshot snapshot;
  snapshot.wallet_balance = decimalField(payload, "totalWalletBalance");
  snapshot.unrealized_pnl = decimalField(payload, "totalUnrealizedProfit");
  snapshot.margin_balance = decimalField(payload, "totalMarginBalance");
  snapshot.available_balance = decimalField(payload, "availableBalance");
  snapshot.maint_margin = optionalDecimal(payload, "totalMaintMargin");
  snapshot.initial_margin = optionalDecimal(payload, "totalInitialMargin");
  snapshot.max_withdraw_amount = optionalDecimal(payload, "maxWithdrawAmount");

  auto assets = payload.find("assets");
  if (assets != payload.end()) {
    if (!assets->is_array()) {
      throw ProtocolError("account 'assets' is not an array");
    }
    for (const auto& item : *assets) {
      requireObject(item, "asset");
      domain::AssetBalance asset;
      asset.asset = stringField(item, "asset");
      asset.wallet_balance = decimalField(item, "walletBalance");
      asset.unrealized_pnl = optionalDecimal(item, "unrealizedProfit");
      asset.margin_balance = optionalDecimal(item, "marginBalance");
      asset.maint_margin = optionalDecimal(item, "maintMargin");
      asset.initial_margin = optionalDecimal(item, "initialMargin");
      asset.available_balance = optionalDecimal(item, "availableBalance");
      snapshot.assets.push_back(std::move(asset));
    }
  }

  std::int64_t update_time = optionalInteger(payload, "updateTime");
  snapshot.as_of_ms = update_time > 0 ? update_time : fetched_at_ms;
  snapshot.margin_ratio =
      aggregator::marginRatio(snapshot.maint_margin, snapshot.margin_balance);
  return snapshot;
}

// -----------------------------------------------------------------------------
// parsePositions(): /fapi/v2/positionRisk
// -----------------------------------------------------------------------------
std::vector<domain::Position> parsePositions(const RawPayload& payload) {
  std::vector<domain::Position> positions;

  for (const auto& item : requireArray(payload, "positionRisk")) {
    requireObject(item, "position");

    double amount = decimalField(item, "positionAmt");
    if (amount == 0.0) {
      continue;
    }

    domain::Position p;
    p.symbol = stringField(item, "symbol");
    p.amount = amount;
    p.entry_price = decimalField(item, "entryPrice");
    p.mark_price = decimalField(item, "markPrice");
    p.unrealized_pnl = decimalField(item, "unRealizedProfit");
    p.leverage = optionalDecimal(item, "leverage", 1.0);
    p.liquidation_price = optionalDecimal(item, "liquidationPrice");
    p.isolated_margin = optionalDecimal(item, "isolatedMargin");
    p.notional = optionalDecimal(item, "notional", amount * p.mark_price);
    p.update_time_ms = optionalInteger(item, "updateTime");

    std::string margin_type = optionalString(item, "marginType");
    p.margin_mode = (margin_type == "isolated") ? domain::MarginMode::Isolated
                                                : domain::MarginMode::Cross;

    std::string side = optionalString(item, "positionSide");
    if (side == "LONG") {
      p.side = domain::PositionSide::Long;
      p.hedge_mode = true;
    } else if (side == "SHORT") {
      p.side = domain::PositionSide::Short;
      p.hedge_mode = true;
    } else if (side.empty() || side == "BOTH") {
      p.side = amount > 0 ? domain::PositionSide::Long
                          : domain::PositionSide::Short;
    } else {
      throw ProtocolError("unknown positionSide '" + side + "'");
    }

    if (p.leverage <= 0.0) {
      throw ProtocolError("non-positive leverage for " + p.symbol);
    }

    positions.push_back(std::move(p));
  }
  return positions;
}

// -----------------------------------------------------------------------------
// parseTrades(): /fapi/v1/userTrades
// -----------------------------------------------------------------------------
std::vector<domain::Trade> parseTrades(const RawPayload& payload) {
  std::vector<domain::Trade> trades;

  for (const auto& item : requireArray(payload, "userTrades")) {
    requireObject(item, "trade");

    domain::Trade t;
    t.id = integerField(item, "id");
    t.order_id = optionalInteger(item, "orderId");
    t.symbol = stringField(item, "symbol");
    t.price = decimalField(item, "price");
    t.quantity = decimalField(item, "qty");
    t.quote_quantity =
        optionalDecimal(item, "quoteQty", t.price * t.quantity);
    t.commission = optionalDecimal(item, "commission");
    t.commission_asset = optionalString(item, "commissionAsset");
    t.realized_pnl = optionalDecimal(item, "realizedPnl");
    t.time_ms = integerField(item, "time");

    auto maker = item.find("maker");
    t.maker = maker != item.end() && maker->is_boolean() && maker->get<bool>();

    std::string side = stringField(item, "side");
    if (side == "BUY") {
      t.side = domain::TradeSide::Buy;
    } else if (side == "SELL") {
      t.side = domain::TradeSide::Sell;
    } else {
      throw ProtocolError("unknown trade side '" + side + "'");
    }

    trades.push_back(std::move(t));
  }
  return trades;
}

// -----------------------------------------------------------------------------
// parseIncome(): /fapi/v1/income
// -----------------------------------------------------------------------------
std::vector<domain::IncomeRecord> parseIncome(const RawPayload& payload) {
  std::vector<domain::IncomeRecord> records;

  for (const auto& item : requireArray(payload, "income")) {
    requireObject(item, "income");

    domain::IncomeRecord r;
    r.tran_id = integerField(item, "tranId");
    r.raw_type = stringField(item, "incomeType");
    r.type = domain::incomeTypeFromString(r.raw_type);
    r.symbol = optionalString(item, "symbol");
    r.amount = decimalField(item, "income");
    r.asset = optionalString(item, "asset");
    r.info = optionalString(item, "info");
    r.time_ms = integerField(item, "time");

    // tradeId is "" for non-trade income.
    auto trade_id = item.find("tradeId");
    if (trade_id != item.end() && !(trade_id->is_string() &&
                                    trade_id->get_ref<const std::string&>()
                                        .empty())) {
      r.trade_id = integerField(item, "tradeId");
    }

    records.push_back(std::move(r));
  }
  return records;
}

std::int64_t parseServerTime(const RawPayload& payload) {
  requireObject(payload, "serverTime");
  return integerField(payload, "serverTime");
}

}  // namespace payload
}  // namespace futmon
