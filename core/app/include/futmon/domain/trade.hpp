#pragma once

#include <cstdint>
#include <string>

namespace futmon {
namespace domain {

enum class TradeSide { Buy, Sell };

// -----------------------------------------------------------------------------
// Trade: one account fill (userTrades row)
// -----------------------------------------------------------------------------
//
// @brief  Immutable historical record of a fill.
//
// @details
// Trade ids are unique and non-decreasing per symbol, which is what lets the
// monitor keep an append-only per-symbol window: a refresh only appends ids
// greater than the last one it already holds.
// -----------------------------------------------------------------------------
struct Trade {
  std::int64_t id{0};
  std::int64_t order_id{0};
  std::string symbol;
  TradeSide side{TradeSide::Buy};
  double price{0.0};
  double quantity{0.0};
  double quote_quantity{0.0};      // price * quantity in the quote asset
  double commission{0.0};
  std::string commission_asset;
  double realized_pnl{0.0};
  bool maker{false};
  std::int64_t time_ms{0};
};

const char* tradeSideToString(TradeSide side);

}  // namespace domain
}  // namespace futmon
