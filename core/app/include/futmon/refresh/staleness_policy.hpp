#pragma once

#include "futmon/cache/cache_entry.hpp"
#include "futmon/errors/fetch_result.hpp"

#include <cstdint>
#include <optional>

namespace futmon {

// -----------------------------------------------------------------------------
// StalenessPolicy: fallback decision when a refresh cannot deliver
// -----------------------------------------------------------------------------
//
// @brief  Decides between "serve the last good value, marked stale" and
//         "propagate the error".
//
// @details
//   Failure, prior value present  → prior value, stale = true, its age, and
//                                   the error that caused the fallback. A
//                                   good value is never discarded because a
//                                   refresh failed.
//   Failure, no prior value       → no data, the original error kind
//                                   unchanged.
//   Refresh still in flight       → prior value, stale = true, no error.
//
// A stale result is not authoritative for alert thresholds. The consumer
// must check FetchResult::stale itself; this policy only marks it.
//
// Thread model:
//   Stateless; const member functions only.
// -----------------------------------------------------------------------------
class StalenessPolicy {
 public:
  template <typename T>
  FetchResult<T> onFailure(FetchError error,
                           const std::optional<CacheEntry<T>>& prior,
                           std::int64_t now_ms) const {
    if (!prior) {
      return FetchResult<T>::unavailable(std::move(error));
    }
    FetchResult<T> result = staleFrom(*prior, now_ms);
    result.error = std::move(error);
    return result;
  }

  template <typename T>
  FetchResult<T> onInFlight(const CacheEntry<T>& prior,
                            std::int64_t now_ms) const {
    return staleFrom(prior, now_ms);
  }

 private:
  template <typename T>
  static FetchResult<T> staleFrom(const CacheEntry<T>& prior,
                                  std::int64_t now_ms) {
    FetchResult<T> result;
    result.data = prior.value;
    result.stale = true;
    result.fetched_at_ms = prior.fetched_at_ms;
    result.age_ms = prior.ageAt(now_ms);
    return result;
  }
};

}  // namespace futmon
