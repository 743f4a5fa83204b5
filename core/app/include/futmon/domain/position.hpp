#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace futmon {
namespace domain {

enum class PositionSide { Long, Short };

enum class MarginMode { Cross, Isolated };

// -----------------------------------------------------------------------------
// Position: one open futures position
// -----------------------------------------------------------------------------
//
// @brief  Exchange-reported state of an open position, keyed by
//         (symbol, side).
//
// @details
// In hedge mode an account can hold a LONG and a SHORT position on the same
// symbol at once; the exchange reports them as two rows with positionSide
// "LONG"/"SHORT". In one-way mode there is one row with positionSide "BOTH"
// and the direction is the sign of the amount. Either way `side` is always
// Long or Short here, and `hedge_mode` records which reporting style was used.
//
// Sign convention for amount:
//   positive → long, negative → short. Never zero: the payload parser prunes
//   zero-size rows, so every retained Position has |amount| > 0.
//
// Thread model:
//   Value type, freely copied between threads.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  PositionSide side{PositionSide::Long};
  bool hedge_mode{false};
  double entry_price{0.0};
  double mark_price{0.0};
  double amount{0.0};              // Signed positionAmt
  double leverage{1.0};
  double liquidation_price{0.0};   // 0 when the exchange reports none
  double unrealized_pnl{0.0};
  MarginMode margin_mode{MarginMode::Cross};
  double isolated_margin{0.0};
  double notional{0.0};            // Signed, as reported (amount * mark)
  std::int64_t update_time_ms{0};
};

// -----------------------------------------------------------------------------
// PositionFilter: optional predicate for getPositions()
// -----------------------------------------------------------------------------
// Every unset field matches everything; a default filter keeps all rows.
// -----------------------------------------------------------------------------
struct PositionFilter {
  std::optional<std::string> symbol;
  std::optional<PositionSide> side;
  std::optional<MarginMode> margin_mode;
  double min_abs_notional{0.0};

  bool matches(const Position& p) const;
};

const char* positionSideToString(PositionSide side);
const char* marginModeToString(MarginMode mode);

}  // namespace domain
}  // namespace futmon
