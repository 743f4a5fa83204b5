#pragma once

#include "futmon/errors/exchange_error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace futmon {

// -----------------------------------------------------------------------------
// FetchError: typed error value returned to callers of the monitor
// -----------------------------------------------------------------------------
// The value form of ExchangeError. kind is the original kind raised below
// the coordinator, unchanged.
// -----------------------------------------------------------------------------
struct FetchError {
  ErrorKind kind{ErrorKind::Transient};
  std::string message;
  std::int64_t retry_after_ms{0};  // Only meaningful for RateLimit
};

// The three states a consumer must be able to tell apart.
enum class DataState { Fresh, Stale, Unavailable };

const char* dataStateToString(DataState state);

// -----------------------------------------------------------------------------
// FetchResult<T>: (data, stale, fetchedAt) plus the failure that caused it
// -----------------------------------------------------------------------------
//
// @brief  Outcome of every read on the monitor.
//
// @details
//   Fresh        data set, stale == false, error empty.
//   Stale        data set, stale == true. error is set when a refresh failed
//                and empty when the refresh is merely still in flight.
//   Unavailable  data empty, error set with the original ErrorKind.
//
// Caller contract: a stale result is NOT authoritative. Anything that fires
// alerts from these values (margin ratio, liquidation distance) must check
// `stale` first. The core does not enforce this.
//
// Thread model:
//   Value type. The data is a copy; it never aliases cache storage.
// -----------------------------------------------------------------------------
template <typename T>
struct FetchResult {
  std::optional<T> data;
  bool stale{false};
  std::int64_t fetched_at_ms{0};
  std::int64_t age_ms{0};
  std::optional<FetchError> error;

  DataState state() const {
    if (!data) {
      return DataState::Unavailable;
    }
    return stale ? DataState::Stale : DataState::Fresh;
  }

  bool ok() const { return data.has_value(); }

  static FetchResult fresh(T value, std::int64_t fetched_at_ms,
                           std::int64_t now_ms) {
    FetchResult result;
    result.data = std::move(value);
    result.fetched_at_ms = fetched_at_ms;
    result.age_ms = now_ms - fetched_at_ms;
    return result;
  }

  static FetchResult unavailable(FetchError error) {
    FetchResult result;
    result.error = std::move(error);
    return result;
  }
};

// -----------------------------------------------------------------------------
// describeResult
// -----------------------------------------------------------------------------
// One-line summary for logs: "fresh", "stale (age 47s, Transient: ...)",
// "unavailable (Auth: ...)".
// -----------------------------------------------------------------------------
std::string describeResult(DataState state, std::int64_t age_ms,
                           const std::optional<FetchError>& error);

template <typename T>
std::string describe(const FetchResult<T>& result) {
  return describeResult(result.state(), result.age_ms, result.error);
}

}  // namespace futmon
