#include "futmon/refresh/refresh_coordinator.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace futmon {

const char* keyStateToString(KeyState state) {
  switch (state) {
    case KeyState::Absent:          return "Absent";
    case KeyState::Fresh:           return "Fresh";
    case KeyState::ExpiredNoFlight: return "ExpiredNoFlight";
    case KeyState::ExpiredInFlight: return "ExpiredInFlight";
  }
  return "Unknown";
}

RefreshCoordinator::RefreshCoordinator(CacheStore& store,
                                       const ITimeProvider& clock,
                                       StalenessPolicy policy)
    : store_(store), clock_(clock), policy_(policy) {}

// -----------------------------------------------------------------------------
// state(): derived from store contents plus the flight table
// -----------------------------------------------------------------------------
KeyState RefreshCoordinator::state(const std::string& key) const {
  std::lock_guard lock(mutex_);
  const bool in_flight = flights_.count(key) > 0;
  if (store_.isFresh(key)) {
    return KeyState::Fresh;
  }
  if (in_flight) {
    return KeyState::ExpiredInFlight;
  }
  return store_.contains(key) ? KeyState::ExpiredNoFlight : KeyState::Absent;
}

std::size_t RefreshCoordinator::inFlightCount() const {
  std::lock_guard lock(mutex_);
  return flights_.size();
}

std::int64_t RefreshCoordinator::cooldownRemainingMs(
    const std::string& key) const {
  std::lock_guard lock(mutex_);
  auto it = cooldown_until_.find(key);
  if (it == cooldown_until_.end()) {
    return 0;
  }
  return std::max<std::int64_t>(0, it->second - clock_.now_ms());
}

void RefreshCoordinator::setRefreshListener(RefreshListener listener) {
  std::lock_guard lock(mutex_);
  listener_ = std::move(listener);
}

void RefreshCoordinator::reset() {
  std::lock_guard lock(mutex_);
  flights_.clear();
  cooldown_until_.clear();
}

// -----------------------------------------------------------------------------
// finishFlight(): bookkeeping after the initiator's fetch returned
// -----------------------------------------------------------------------------
// The flight entry is erased only if it is still ours; after reset() a newer
// flight for the same key may already be registered.
// -----------------------------------------------------------------------------
RefreshCoordinator::RefreshListener RefreshCoordinator::finishFlight(
    const std::string& key, std::uint64_t flight_id,
    const FlightResult& result) {
  const std::int64_t now = clock_.now_ms();
  RefreshListener listener;
  {
    std::lock_guard lock(mutex_);
    auto flight = flights_.find(key);
    if (flight != flights_.end() && flight->second.id == flight_id) {
      flights_.erase(flight);
    }

    if (result.error && result.error->kind == ErrorKind::RateLimit &&
        result.error->retry_after_ms > 0) {
      cooldown_until_[key] = now + result.error->retry_after_ms;
    } else if (!result.error) {
      cooldown_until_.erase(key);
    }
    listener = listener_;
  }

  if (result.error) {
    std::cerr << "[RefreshCoordinator] " << key << ": refresh failed ("
              << errorKindToString(result.error->kind)
              << "): " << result.error->message << "\n";
  }
  return listener;
}

// -----------------------------------------------------------------------------
// notifyRefreshed(): runs after the promise is fulfilled
// -----------------------------------------------------------------------------
// A listener failure must not reach the initiator; its fetch already
// succeeded or failed on its own terms.
// -----------------------------------------------------------------------------
void RefreshCoordinator::notifyRefreshed(const RefreshListener& listener,
                                         const std::string& key,
                                         const FlightResult& result,
                                         std::int64_t started_at_ms) const {
  if (!listener) {
    return;
  }

  RefreshOutcome outcome;
  outcome.key = key;
  outcome.success = !result.error.has_value();
  outcome.started_at_ms = started_at_ms;
  outcome.completed_at_ms = clock_.now_ms();
  outcome.error = result.error;

  try {
    listener(outcome);
  } catch (const std::exception& e) {
    std::cerr << "[RefreshCoordinator] refresh listener failed for " << key
              << ": " << e.what() << "\n";
  }
}

FetchError RefreshCoordinator::toFetchError(const ExchangeError& error) {
  FetchError out{error.kind(), error.what(), 0};
  if (const auto* rate_limited = dynamic_cast<const RateLimitError*>(&error)) {
    out.retry_after_ms = rate_limited->retry_after_ms();
  }
  return out;
}

}  // namespace futmon
