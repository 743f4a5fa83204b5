#include "futmon/gateway/rate_limiter.hpp"

#include <algorithm>
#include <utility>

namespace futmon {

SlidingWindowRateLimiter::SlidingWindowRateLimiter(RateLimitConfig config,
                                                   const ITimeProvider& clock)
    : config_(std::move(config)), clock_(clock) {}

// -----------------------------------------------------------------------------
// tryAcquire(): admit now or report the wait
// -----------------------------------------------------------------------------
std::int64_t SlidingWindowRateLimiter::tryAcquire(const std::string& endpoint,
                                                  int weight) {
  std::lock_guard lock(mutex_);
  const std::int64_t now = clock_.now_ms();

  Window& window = endpoint_windows_[endpoint];
  prune(window, now);
  prune(global_window_, now);

  std::int64_t delay = 0;

  auto blocked = blocked_until_.find(endpoint);
  if (blocked != blocked_until_.end()) {
    if (blocked->second > now) {
      delay = blocked->second - now;
    } else {
      blocked_until_.erase(blocked);
    }
  }

  delay = std::max(delay, delayFor(window, budgetFor(endpoint), weight, now));
  delay = std::max(delay, delayFor(global_window_,
                                   config_.global_weight_budget, weight, now));
  if (delay > 0) {
    return delay;
  }

  window.entries.push_back({now, weight});
  window.used += weight;
  global_window_.entries.push_back({now, weight});
  global_window_.used += weight;
  return 0;
}

void SlidingWindowRateLimiter::blockFor(const std::string& endpoint,
                                        std::int64_t duration_ms) {
  if (duration_ms <= 0) {
    return;
  }
  std::lock_guard lock(mutex_);
  std::int64_t until = clock_.now_ms() + duration_ms;
  auto& current = blocked_until_[endpoint];
  current = std::max(current, until);
}

int SlidingWindowRateLimiter::usedWeight(const std::string& endpoint) const {
  std::lock_guard lock(mutex_);
  auto it = endpoint_windows_.find(endpoint);
  if (it == endpoint_windows_.end()) {
    return 0;
  }
  const std::int64_t cutoff = clock_.now_ms() - config_.window_ms;
  int used = 0;
  for (const auto& entry : it->second.entries) {
    if (entry.at_ms > cutoff) {
      used += entry.weight;
    }
  }
  return used;
}

int SlidingWindowRateLimiter::usedGlobalWeight() const {
  std::lock_guard lock(mutex_);
  const std::int64_t cutoff = clock_.now_ms() - config_.window_ms;
  int used = 0;
  for (const auto& entry : global_window_.entries) {
    if (entry.at_ms > cutoff) {
      used += entry.weight;
    }
  }
  return used;
}

std::int64_t SlidingWindowRateLimiter::blockedUntil(
    const std::string& endpoint) const {
  std::lock_guard lock(mutex_);
  auto it = blocked_until_.find(endpoint);
  if (it == blocked_until_.end() || it->second <= clock_.now_ms()) {
    return 0;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// prune(): drop admissions older than one window
// -----------------------------------------------------------------------------
// An admission at t counts during (t - window, t], i.e. it stops counting
// at exactly t + window.
// -----------------------------------------------------------------------------
void SlidingWindowRateLimiter::prune(Window& window, std::int64_t now) const {
  const std::int64_t cutoff = now - config_.window_ms;
  while (!window.entries.empty() && window.entries.front().at_ms <= cutoff) {
    window.used -= window.entries.front().weight;
    window.entries.pop_front();
  }
}

// -----------------------------------------------------------------------------
// delayFor(): time until `weight` fits under `budget`
// -----------------------------------------------------------------------------
// Walks the admissions oldest-first and accumulates the weight that will
// have aged out; the answer is the expiry time of the admission that frees
// enough room. Assumes the window has been pruned at `now`.
// -----------------------------------------------------------------------------
std::int64_t SlidingWindowRateLimiter::delayFor(const Window& window,
                                                int budget, int weight,
                                                std::int64_t now) const {
  const int effective = std::min(weight, budget);
  const int excess = window.used + effective - budget;
  if (excess <= 0) {
    return 0;
  }

  int freed = 0;
  for (const auto& entry : window.entries) {
    freed += entry.weight;
    if (freed >= excess) {
      return entry.at_ms + config_.window_ms - now;
    }
  }
  return config_.window_ms;
}

int SlidingWindowRateLimiter::budgetFor(const std::string& endpoint) const {
  auto it = config_.endpoint_budgets.find(endpoint);
  return it == config_.endpoint_budgets.end() ? config_.endpoint_weight_budget
                                              : it->second;
}

}  // namespace futmon
