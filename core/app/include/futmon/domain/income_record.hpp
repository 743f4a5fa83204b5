#pragma once

#include <cstdint>
#include <string>

namespace futmon {
namespace domain {

// Income categories reported by /fapi/v1/income. Anything the exchange adds
// later lands in Other with the raw string preserved in IncomeRecord.
enum class IncomeType {
  Transfer,
  WelcomeBonus,
  RealizedPnl,
  FundingFee,
  Commission,
  InsuranceClear,
  ReferralKickback,
  CommissionRebate,
  ApiRebate,
  ContestReward,
  CrossCollateralTransfer,
  InternalTransfer,
  AutoExchange,
  Other,
};

// -----------------------------------------------------------------------------
// IncomeRecord: one entry of the account's income ledger
// -----------------------------------------------------------------------------
// Immutable once parsed. tran_id is unique per record and is used to
// de-duplicate when overlapping pages are merged into the income window.
// -----------------------------------------------------------------------------
struct IncomeRecord {
  std::int64_t tran_id{0};
  IncomeType type{IncomeType::Other};
  std::string raw_type;   // e.g. "FUNDING_FEE"
  std::string symbol;     // Empty for account-level entries (transfers)
  double amount{0.0};
  std::string asset;
  std::string info;
  std::int64_t trade_id{0};
  std::int64_t time_ms{0};
};

IncomeType incomeTypeFromString(const std::string& raw);
const char* incomeTypeToString(IncomeType type);

}  // namespace domain
}  // namespace futmon
