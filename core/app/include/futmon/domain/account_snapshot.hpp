#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace futmon {
namespace domain {

// -----------------------------------------------------------------------------
// AssetBalance: one margin asset inside the futures wallet (USDT, BNB, ...)
// -----------------------------------------------------------------------------
struct AssetBalance {
  std::string asset;
  double wallet_balance{0.0};
  double unrealized_pnl{0.0};
  double margin_balance{0.0};
  double maint_margin{0.0};
  double initial_margin{0.0};
  double available_balance{0.0};
};

// -----------------------------------------------------------------------------
// AccountSnapshot: account-level balances as of one fetch
// -----------------------------------------------------------------------------
//
// @brief  Wallet, available and margin balances of the futures account plus
//         the margin ratio derived from them.
//
// @details
// Plain value type. A refresh never edits a snapshot in place; it builds a
// new one and swaps it into the cache wholesale, so a reader holding a copy
// always sees one consistent set of balances.
//
// margin_ratio = maint_margin / margin_balance, filled in by the payload
// parser through aggregator::marginRatio() so the field can never disagree
// with the balances it was computed from.
//
// Thread model:
//   Value type, freely copied between threads.
// -----------------------------------------------------------------------------
struct AccountSnapshot {
  double wallet_balance{0.0};     // totalWalletBalance
  double available_balance{0.0};  // availableBalance
  double unrealized_pnl{0.0};     // totalUnrealizedProfit
  double margin_balance{0.0};     // totalMarginBalance (wallet + unrealized)
  double maint_margin{0.0};       // totalMaintMargin
  double initial_margin{0.0};     // totalInitialMargin
  double max_withdraw_amount{0.0};
  double margin_ratio{0.0};
  std::vector<AssetBalance> assets;
  std::int64_t as_of_ms{0};       // Exchange updateTime, or fetch time if 0
};

}  // namespace domain
}  // namespace futmon
