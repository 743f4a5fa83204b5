#pragma once

#include "futmon/domain/account_snapshot.hpp"
#include "futmon/domain/income_record.hpp"
#include "futmon/domain/position.hpp"
#include "futmon/domain/trade.hpp"
#include "futmon/gateway/i_exchange_gateway.hpp"

#include <cstdint>
#include <vector>

namespace futmon {
namespace payload {

// -----------------------------------------------------------------------------
// Payload parsers: exchange JSON → domain values
// -----------------------------------------------------------------------------
//
// @brief  One function per dataset. Each throws ProtocolError when the
//         payload does not have the expected shape.
//
// @details
// The exchange sends decimals as JSON strings ("walletBalance": "1000.50")
// to avoid float rounding on the wire; numbers are also accepted. A missing
// required field, a non-numeric decimal or a top-level type mismatch is a
// contract violation and becomes ProtocolError, which is never retried.
//
// fetched_at_ms is used as the snapshot time when the payload carries no
// updateTime of its own.
// -----------------------------------------------------------------------------

domain::AccountSnapshot parseAccountSnapshot(const RawPayload& payload,
                                             std::int64_t fetched_at_ms);

// Zero-size rows (positionAmt == 0) are dropped; the exchange lists every
// symbol the account ever touched.
std::vector<domain::Position> parsePositions(const RawPayload& payload);

std::vector<domain::Trade> parseTrades(const RawPayload& payload);

std::vector<domain::IncomeRecord> parseIncome(const RawPayload& payload);

// /fapi/v1/time → {"serverTime": 1499827319559}
std::int64_t parseServerTime(const RawPayload& payload);

}  // namespace payload
}  // namespace futmon
