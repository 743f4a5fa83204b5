#pragma once

#include "futmon/cache/cache_store.hpp"
#include "futmon/errors/exchange_error.hpp"
#include "futmon/errors/fetch_result.hpp"
#include "futmon/refresh/staleness_policy.hpp"
#include "futmon/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <any>
#include <cstdint>
#include <functional>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace futmon {

// Per-key position in the refresh state machine.
//
//   Absent ──put──> Fresh ──ttl elapses──> ExpiredNoFlight
//                     ▲                         │ getOrRefresh
//                     │ fetch ok                ▼
//                     └──────────────── ExpiredInFlight
//                                               │ fetch failed
//                                               ▼
//                                        ExpiredNoFlight (value kept, stale)
//
// invalidate/clear/invalidateAll send any state back to Absent.
enum class KeyState { Absent, Fresh, ExpiredNoFlight, ExpiredInFlight };

const char* keyStateToString(KeyState state);

// Reported to the refresh listener after every completed remote fetch.
struct RefreshOutcome {
  std::string key;
  bool success{false};
  std::int64_t started_at_ms{0};
  std::int64_t completed_at_ms{0};
  std::optional<FetchError> error;
};

// -----------------------------------------------------------------------------
// RefreshCoordinator: fetch-if-stale-else-cached with single-flight per key
// -----------------------------------------------------------------------------
//
// @brief  getOrRefresh(key, fetcher, ttl) → FetchResult<T>.
//
// @details
// Paths through getOrRefresh, in order:
//
//   1. Fresh entry in the store → returned immediately. Only the store's
//      shared lock is taken; no coordinator lock, no fetch. This is the
//      dominant path.
//   2. Under the coordinator mutex, freshness is re-checked. A flight that
//      completed between step 1 and here has already stored its value, so
//      a late caller returns it instead of starting a second fetch.
//   3. A flight for this key is running:
//        - a prior (expired) value exists → return it stale at once, do not
//          wait;
//        - no prior value → wait on the flight's shared_future.
//   4. The key is in a rate-limit cooldown → no fetch; StalenessPolicy gets
//      a RateLimit error carrying the remaining wait.
//   5. Otherwise this caller becomes the initiator: it registers a flight,
//      runs the fetcher on its own thread to completion, stores the value,
//      removes the flight, fulfils the promise for any waiters and only then
//      notifies the refresh listener.
//
// Failures: every exception the fetcher throws is caught here and becomes a
// FetchError with the original ErrorKind (ExchangeError), or Protocol
// (malformed JSON and any other std::exception). StalenessPolicy then picks
// the stale value or the error. Nothing thrown below escapes.
//
// A RateLimitError with retry-after R starts a cooldown of R for that key:
// no fetcher call for the key until R has elapsed on the injected clock.
//
// Flights are never cancelled. If nobody is waiting any more, the fetch
// still completes and populates the cache for the next caller.
//
// Thread model:
//   Safe from any thread. Distinct keys refresh fully in parallel; mutex_
//   is held only for map bookkeeping, never across a fetch or a wait.
//
// Ownership:
//   Borrows the CacheStore and the clock; both must outlive it.
// -----------------------------------------------------------------------------
class RefreshCoordinator {
 public:
  using RefreshListener = std::function<void(const RefreshOutcome&)>;

  RefreshCoordinator(CacheStore& store, const ITimeProvider& clock,
                     StalenessPolicy policy = {});

  RefreshCoordinator(const RefreshCoordinator&) = delete;
  RefreshCoordinator& operator=(const RefreshCoordinator&) = delete;

  template <typename T>
  FetchResult<T> getOrRefresh(const std::string& key,
                              const std::function<T()>& fetcher,
                              std::int64_t ttl_ms);

  KeyState state(const std::string& key) const;

  std::size_t inFlightCount() const;

  // Remaining rate-limit cooldown for key in ms (0 if none).
  std::int64_t cooldownRemainingMs(const std::string& key) const;

  // Invoked on the initiating thread after each completed fetch, outside
  // any lock and after waiters have their result. An exception from the
  // listener is logged and dropped. Replaces any previous listener.
  void setRefreshListener(RefreshListener listener);

  // Forgets all flights and cooldowns. Running flights still complete and
  // wake their waiters, but new callers no longer join them. Used together
  // with CacheStore::invalidateAll() on credential rotation.
  void reset();

 private:
  struct FlightResult {
    std::any value;
    std::int64_t fetched_at_ms{0};
    std::optional<FetchError> error;
    bool superseded{false};  // Store generation moved during the fetch
  };

  struct Flight {
    std::uint64_t id{0};
    std::shared_future<FlightResult> future;
  };

  template <typename T>
  FlightResult runFetch(const std::string& key,
                        const std::function<T()>& fetcher, std::int64_t ttl_ms,
                        std::uint64_t generation);

  template <typename T>
  FetchResult<T> resolve(const std::string& key, const FlightResult& result,
                         const std::optional<CacheEntry<T>>& prior);

  // Returns the listener to notify once waiters have been released.
  RefreshListener finishFlight(const std::string& key, std::uint64_t flight_id,
                               const FlightResult& result);

  void notifyRefreshed(const RefreshListener& listener, const std::string& key,
                       const FlightResult& result,
                       std::int64_t started_at_ms) const;

  static FetchError toFetchError(const ExchangeError& error);

  CacheStore& store_;
  const ITimeProvider& clock_;
  const StalenessPolicy policy_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Flight> flights_;
  std::unordered_map<std::string, std::int64_t> cooldown_until_;
  std::uint64_t next_flight_id_{0};
  RefreshListener listener_;
};

// -----------------------------------------------------------------------------
// Template implementation
// -----------------------------------------------------------------------------
template <typename T>
FetchResult<T> RefreshCoordinator::getOrRefresh(
    const std::string& key, const std::function<T()>& fetcher,
    std::int64_t ttl_ms) {
  std::optional<CacheEntry<T>> prior = store_.get<T>(key);
  if (prior && !prior->isExpiredAt(clock_.now_ms())) {
    return FetchResult<T>::fresh(prior->value, prior->fetched_at_ms,
                                 clock_.now_ms());
  }

  std::shared_future<FlightResult> joined;
  std::promise<FlightResult> promise;
  std::uint64_t flight_id = 0;
  std::uint64_t generation = 0;

  {
    std::unique_lock lock(mutex_);
    const std::int64_t now = clock_.now_ms();

    prior = store_.get<T>(key);
    if (prior && !prior->isExpiredAt(now)) {
      return FetchResult<T>::fresh(prior->value, prior->fetched_at_ms, now);
    }

    auto flight = flights_.find(key);
    if (flight != flights_.end()) {
      if (prior) {
        return policy_.onInFlight(*prior, now);
      }
      joined = flight->second.future;
    } else {
      auto cooldown = cooldown_until_.find(key);
      if (cooldown != cooldown_until_.end() && cooldown->second > now) {
        const std::int64_t remaining = cooldown->second - now;
        lock.unlock();
        if (prior) {
          store_.markStale(key);
        }
        return policy_.onFailure(
            FetchError{ErrorKind::RateLimit,
                       "rate limited; next refresh allowed in " +
                           std::to_string(remaining) + "ms",
                       remaining},
            prior, now);
      }

      flight_id = ++next_flight_id_;
      generation = store_.generation();
      flights_[key] = Flight{flight_id, promise.get_future().share()};
    }
  }

  if (joined.valid()) {
    return resolve<T>(key, joined.get(), prior);
  }

  const std::int64_t started_at = clock_.now_ms();
  FlightResult result = runFetch<T>(key, fetcher, ttl_ms, generation);
  RefreshListener listener = finishFlight(key, flight_id, result);
  promise.set_value(result);
  notifyRefreshed(listener, key, result, started_at);
  return resolve<T>(key, result, prior);
}

template <typename T>
typename RefreshCoordinator::FlightResult RefreshCoordinator::runFetch(
    const std::string& key, const std::function<T()>& fetcher,
    std::int64_t ttl_ms, std::uint64_t generation) {
  FlightResult result;
  try {
    T value = fetcher();
    if (!store_.putIfGeneration<T>(key, value, ttl_ms, generation)) {
      result.superseded = true;
      result.error = FetchError{ErrorKind::Transient,
                                "cache invalidated during refresh of '" + key +
                                    "'; result discarded",
                                0};
      return result;
    }
    result.fetched_at_ms = clock_.now_ms();
    result.value = std::move(value);
  } catch (const ExchangeError& e) {
    result.error = toFetchError(e);
  } catch (const nlohmann::json::exception& e) {
    result.error = FetchError{ErrorKind::Protocol,
                              std::string("malformed payload: ") + e.what(), 0};
  } catch (const std::exception& e) {
    result.error = FetchError{ErrorKind::Protocol,
                              std::string("unexpected failure: ") + e.what(),
                              0};
  }
  return result;
}

template <typename T>
FetchResult<T> RefreshCoordinator::resolve(
    const std::string& key, const FlightResult& result,
    const std::optional<CacheEntry<T>>& prior) {
  const std::int64_t now = clock_.now_ms();

  if (!result.error) {
    return FetchResult<T>::fresh(std::any_cast<const T&>(result.value),
                                 result.fetched_at_ms, now);
  }

  // A superseded flight ran under rotated-away credentials; its prior value
  // belongs to the same old context and must not be served either.
  if (result.superseded || !prior) {
    return FetchResult<T>::unavailable(*result.error);
  }

  store_.markStale(key);
  std::cerr << "[RefreshCoordinator] " << key << ": serving stale value aged "
            << prior->ageAt(now) << "ms\n";
  return policy_.onFailure(*result.error, prior, now);
}

}  // namespace futmon
