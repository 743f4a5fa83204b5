#pragma once

#include "futmon/errors/exchange_error.hpp"

#include <cstdint>

namespace futmon {

// -----------------------------------------------------------------------------
// RetryPolicyConfig: automatic retry ceilings per error kind
// -----------------------------------------------------------------------------
// Defaults:
//   Transient  3 retries, backoff 500 ms, 1 s, 2 s (x2, capped at 8 s).
//   RateLimit  1 retry after the exchange's hint, if the hint is <= 60 s.
//   Auth / Protocol are never retried; there is no knob for them.
// -----------------------------------------------------------------------------
struct RetryPolicyConfig {
  int max_transient_retries{3};
  int max_rate_limit_retries{1};
  std::int64_t initial_backoff_ms{500};
  double backoff_multiplier{2.0};
  std::int64_t max_backoff_ms{8000};
  std::int64_t max_retry_after_ms{60000};
};

struct RetryDecision {
  bool retry{false};
  std::int64_t delay_ms{0};
};

// -----------------------------------------------------------------------------
// RetryPolicy: the single retry/backoff decision point of the gateway
// -----------------------------------------------------------------------------
//
// @brief  decide(error, retries_so_far) → retry or give up, and how long to
//         wait first.
//
// @details
// retries_so_far counts earlier retries of the same ErrorKind only; a
// transient retry does not spend the rate-limit ceiling and a 429 does not
// move the transient backoff.
//
// Stateless apart from its config: the gateway keeps the counters per call,
// so one policy instance serves all concurrent requests.
//
// Backoff is deterministic (no jitter). The monitor issues at most one
// in-flight request per dataset, so there is no herd to de-synchronise.
// -----------------------------------------------------------------------------
class RetryPolicy {
 public:
  explicit RetryPolicy(RetryPolicyConfig config = {});

  RetryDecision decide(const ExchangeError& error, int retries_so_far) const;

  // Backoff before retry number (retries_so_far + 1) of a transient error.
  std::int64_t backoffFor(int retries_so_far) const;

  const RetryPolicyConfig& config() const { return config_; }

 private:
  RetryPolicyConfig config_;
};

}  // namespace futmon
