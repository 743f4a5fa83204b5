#include "futmon/domain/dataset.hpp"
#include "futmon/domain/income_record.hpp"
#include "futmon/domain/metrics.hpp"
#include "futmon/domain/position.hpp"
#include "futmon/domain/trade.hpp"

#include <cmath>
#include <unordered_map>

namespace futmon {
namespace domain {

// -----------------------------------------------------------------------------
// PositionFilter::matches()
// -----------------------------------------------------------------------------
bool PositionFilter::matches(const Position& p) const {
  if (symbol && *symbol != p.symbol) {
    return false;
  }
  if (side && *side != p.side) {
    return false;
  }
  if (margin_mode && *margin_mode != p.margin_mode) {
    return false;
  }
  return std::fabs(p.notional) >= min_abs_notional;
}

const char* positionSideToString(PositionSide side) {
  switch (side) {
    case PositionSide::Long:  return "LONG";
    case PositionSide::Short: return "SHORT";
  }
  return "UNKNOWN";
}

const char* marginModeToString(MarginMode mode) {
  switch (mode) {
    case MarginMode::Cross:    return "cross";
    case MarginMode::Isolated: return "isolated";
  }
  return "unknown";
}

const char* tradeSideToString(TradeSide side) {
  switch (side) {
    case TradeSide::Buy:  return "BUY";
    case TradeSide::Sell: return "SELL";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// incomeTypeFromString(): exchange incomeType → IncomeType
// -----------------------------------------------------------------------------
IncomeType incomeTypeFromString(const std::string& raw) {
  static const std::unordered_map<std::string, IncomeType> kTypes = {
      {"TRANSFER", IncomeType::Transfer},
      {"WELCOME_BONUS", IncomeType::WelcomeBonus},
      {"REALIZED_PNL", IncomeType::RealizedPnl},
      {"FUNDING_FEE", IncomeType::FundingFee},
      {"COMMISSION", IncomeType::Commission},
      {"INSURANCE_CLEAR", IncomeType::InsuranceClear},
      {"REFERRAL_KICKBACK", IncomeType::ReferralKickback},
      {"COMMISSION_REBATE", IncomeType::CommissionRebate},
      {"API_REBATE", IncomeType::ApiRebate},
      {"CONTEST_REWARD", IncomeType::ContestReward},
      {"CROSS_COLLATERAL_TRANSFER", IncomeType::CrossCollateralTransfer},
      {"INTERNAL_TRANSFER", IncomeType::InternalTransfer},
      {"AUTO_EXCHANGE", IncomeType::AutoExchange},
  };
  auto it = kTypes.find(raw);
  return it == kTypes.end() ? IncomeType::Other : it->second;
}

const char* incomeTypeToString(IncomeType type) {
  using T = IncomeType;
  switch (type) {
    case T::Transfer:                return "TRANSFER";
    case T::WelcomeBonus:            return "WELCOME_BONUS";
    case T::RealizedPnl:             return "REALIZED_PNL";
    case T::FundingFee:              return "FUNDING_FEE";
    case T::Commission:              return "COMMISSION";
    case T::InsuranceClear:          return "INSURANCE_CLEAR";
    case T::ReferralKickback:        return "REFERRAL_KICKBACK";
    case T::CommissionRebate:        return "COMMISSION_REBATE";
    case T::ApiRebate:               return "API_REBATE";
    case T::ContestReward:           return "CONTEST_REWARD";
    case T::CrossCollateralTransfer: return "CROSS_COLLATERAL_TRANSFER";
    case T::InternalTransfer:        return "INTERNAL_TRANSFER";
    case T::AutoExchange:            return "AUTO_EXCHANGE";
    case T::Other:                   return "OTHER";
  }
  return "OTHER";
}

const char* leverageBucketToString(LeverageBucket bucket) {
  switch (bucket) {
    case LeverageBucket::UpTo2x:   return "1-2x";
    case LeverageBucket::UpTo5x:   return "2-5x";
    case LeverageBucket::UpTo10x:  return "5-10x";
    case LeverageBucket::UpTo20x:  return "10-20x";
    case LeverageBucket::Above20x: return "20x+";
  }
  return "unknown";
}

const char* riskLevelToString(RiskLevel level) {
  switch (level) {
    case RiskLevel::Low:      return "Low";
    case RiskLevel::Medium:   return "Medium";
    case RiskLevel::High:     return "High";
    case RiskLevel::VeryHigh: return "Very High";
  }
  return "Unknown";
}

const char* datasetToString(Dataset dataset) {
  switch (dataset) {
    case Dataset::Account:   return "account";
    case Dataset::Positions: return "positions";
    case Dataset::Trades:    return "trades";
    case Dataset::Income:    return "income";
  }
  return "unknown";
}

std::optional<Dataset> datasetForKey(const std::string& key) {
  auto starts_with = [&key](const char* prefix) {
    return key.rfind(prefix, 0) == 0;
  };
  if (key == "account") {
    return Dataset::Account;
  }
  if (key == "positions") {
    return Dataset::Positions;
  }
  if (starts_with("trades:")) {
    return Dataset::Trades;
  }
  if (key == "income" || starts_with("income:")) {
    return Dataset::Income;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace futmon
