#pragma once

#include <cstdint>

namespace futmon {

// -----------------------------------------------------------------------------
// CacheEntry<T>: one cached value and its freshness metadata
// -----------------------------------------------------------------------------
//
// @brief  (value, fetched_at, ttl, stale) as handed out by CacheStore::get.
//
// @details
// Always a copy. Holding a CacheEntry never pins or aliases store state,
// so a concurrent refresh cannot change it mid-read.
//
// `stale` is set once the value has been served past its TTL because the
// refresh that should have replaced it failed. A successful put clears it.
// -----------------------------------------------------------------------------
template <typename T>
struct CacheEntry {
  T value;
  std::int64_t fetched_at_ms{0};
  std::int64_t ttl_ms{0};
  bool stale{false};

  std::int64_t expiresAtMs() const { return fetched_at_ms + ttl_ms; }

  // Expired once ttl has fully elapsed: an entry put at t with ttl 1000 is
  // fresh at t+999 and expired at t+1000.
  bool isExpiredAt(std::int64_t now_ms) const {
    return now_ms >= expiresAtMs();
  }

  std::int64_t ageAt(std::int64_t now_ms) const {
    return now_ms - fetched_at_ms;
  }
};

}  // namespace futmon
