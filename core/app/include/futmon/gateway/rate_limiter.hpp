#pragma once

#include "futmon/time/i_time_provider.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace futmon {

// -----------------------------------------------------------------------------
// RateLimitConfig
// -----------------------------------------------------------------------------
// Binance USD-M futures allows 2400 request weight per minute per IP. The
// per-endpoint budget keeps one noisy dataset (income pages cost 30 each)
// from starving the others.
// -----------------------------------------------------------------------------
struct RateLimitConfig {
  std::int64_t window_ms{60000};
  int global_weight_budget{2400};
  int endpoint_weight_budget{1200};
  std::map<std::string, int> endpoint_budgets;  // Override by endpoint name
  std::int64_t default_retry_after_ms{1000};    // 429 without Retry-After
};

// -----------------------------------------------------------------------------
// SlidingWindowRateLimiter: request-weight budget per endpoint and global
// -----------------------------------------------------------------------------
//
// @brief  Decides whether a request of a given weight may go out now, and
//         if not, how long to wait.
//
// @details
// Sliding, not fixed: each admitted request is remembered with its own
// timestamp and counts against the budget for exactly window_ms after it
// was sent. A request at second 58 is still counted until second 118,
// regardless of any minute boundary.
//
//   tryAcquire(endpoint, weight)
//     → 0   admitted; the weight is recorded in the endpoint and global
//           windows.
//     → >0  not admitted; milliseconds until enough older weight has aged
//           out (or until an explicit cooldown ends). Nothing is recorded.
//
//   blockFor(endpoint, ms)
//     After the exchange answers 429/418, nothing more goes to that
//     endpoint until the hinted duration has passed.
//
// A single request heavier than its whole budget is admitted once the
// window is otherwise empty, so a misconfigured budget slows requests down
// but never wedges them.
//
// Thread model:
//   All methods lock mutex_. Safe from any thread.
// -----------------------------------------------------------------------------
class SlidingWindowRateLimiter {
 public:
  SlidingWindowRateLimiter(RateLimitConfig config, const ITimeProvider& clock);

  SlidingWindowRateLimiter(const SlidingWindowRateLimiter&) = delete;
  SlidingWindowRateLimiter& operator=(const SlidingWindowRateLimiter&) = delete;

  std::int64_t tryAcquire(const std::string& endpoint, int weight);

  void blockFor(const std::string& endpoint, std::int64_t duration_ms);

  // Weight currently counted against the endpoint / global window.
  int usedWeight(const std::string& endpoint) const;
  int usedGlobalWeight() const;

  // Epoch ms until which the endpoint is in a 429 cooldown (0 if none).
  std::int64_t blockedUntil(const std::string& endpoint) const;

  const RateLimitConfig& config() const { return config_; }

 private:
  struct Admission {
    std::int64_t at_ms;
    int weight;
  };

  struct Window {
    std::deque<Admission> entries;
    int used{0};
  };

  void prune(Window& window, std::int64_t now) const;
  std::int64_t delayFor(const Window& window, int budget, int weight,
                        std::int64_t now) const;
  int budgetFor(const std::string& endpoint) const;

  const RateLimitConfig config_;
  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Window> endpoint_windows_;
  Window global_window_;
  std::unordered_map<std::string, std::int64_t> blocked_until_;
};

}  // namespace futmon
