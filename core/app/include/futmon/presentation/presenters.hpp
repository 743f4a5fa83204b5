#pragma once

#include "futmon/cache/cache_store.hpp"
#include "futmon/domain/account_snapshot.hpp"
#include "futmon/domain/income_record.hpp"
#include "futmon/domain/metrics.hpp"
#include "futmon/domain/position.hpp"
#include "futmon/domain/trade.hpp"
#include "futmon/errors/fetch_result.hpp"
#include "futmon/events/event.hpp"
#include "futmon/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <vector>

namespace futmon {
namespace presentation {

// -----------------------------------------------------------------------------
// Presenters: domain values and monitor results → JSON
// -----------------------------------------------------------------------------
//
// @brief  The JSON shapes served over IPC and printed by the CLI.
//
// @details
// Every monitor result is wrapped the same way:
//
//   {
//     "state": "fresh" | "stale" | "unavailable",
//     "stale": bool,
//     "fetched_at": <epoch ms>,          // absent when unavailable
//     "age_ms": <ms>, "age": "47s",      // absent when unavailable
//     "error": {"kind": "RateLimit", "message": "...", "retry_after_ms": n},
//     "data": ...                        // absent when unavailable
//   }
//
// so a client can show "balance as of 47s ago (stale)" without knowing
// which dataset it is looking at. Non-finite numbers (a margin ratio of +inf
// on a negative margin balance) serialize as null.
//
// Thread-safety: Stateless; safe from any thread.
// -----------------------------------------------------------------------------

nlohmann::json toJson(const domain::AccountSnapshot& snapshot);
nlohmann::json toJson(const domain::Position& position);
nlohmann::json toJson(const domain::Trade& trade);
nlohmann::json toJson(const domain::IncomeRecord& record);
nlohmann::json toJson(const domain::DerivedMetrics& metrics);
nlohmann::json toJson(const domain::TradingStatistics& stats);
nlohmann::json toJson(const domain::PerformanceMetrics& metrics);
nlohmann::json toJson(const domain::IncomeSummary& summary);
nlohmann::json toJson(const CacheStats& stats);
nlohmann::json toJson(const FetchError& error);

template <typename T>
nlohmann::json toJson(const std::vector<T>& values) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto& value : values) {
    array.push_back(toJson(value));
  }
  return array;
}

// Envelope fields shared by every result; "data" is filled by present().
nlohmann::json resultEnvelope(DataState state, bool stale,
                              std::int64_t fetched_at_ms, std::int64_t age_ms,
                              const std::optional<FetchError>& error);

template <typename T>
nlohmann::json present(const FetchResult<T>& result) {
  nlohmann::json j = resultEnvelope(result.state(), result.stale,
                                    result.fetched_at_ms, result.age_ms,
                                    result.error);
  if (result.data) {
    j["data"] = toJson(*result.data);
  }
  return j;
}

// Telemetry message for a monitor event, tagged with "type".
nlohmann::json formatEvent(const Event& event);

}  // namespace presentation
}  // namespace futmon
