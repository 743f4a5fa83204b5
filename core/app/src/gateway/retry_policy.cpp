#include "futmon/gateway/retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace futmon {

RetryPolicy::RetryPolicy(RetryPolicyConfig config) : config_(config) {}

// -----------------------------------------------------------------------------
// decide(): one switch per error kind
// -----------------------------------------------------------------------------
RetryDecision RetryPolicy::decide(const ExchangeError& error,
                                  int retries_so_far) const {
  switch (error.kind()) {
    case ErrorKind::Auth:
    case ErrorKind::Protocol:
      return {};

    case ErrorKind::RateLimit: {
      std::int64_t hint = 0;
      if (const auto* rate_limited =
              dynamic_cast<const RateLimitError*>(&error)) {
        hint = std::max<std::int64_t>(rate_limited->retry_after_ms(), 0);
      }
      if (retries_so_far >= config_.max_rate_limit_retries ||
          hint > config_.max_retry_after_ms) {
        return {};
      }
      return {true, hint};
    }

    case ErrorKind::Transient:
      if (retries_so_far >= config_.max_transient_retries) {
        return {};
      }
      return {true, backoffFor(retries_so_far)};
  }
  return {};
}

std::int64_t RetryPolicy::backoffFor(int retries_so_far) const {
  double delay = static_cast<double>(config_.initial_backoff_ms) *
                 std::pow(config_.backoff_multiplier, retries_so_far);
  if (delay > static_cast<double>(config_.max_backoff_ms)) {
    return config_.max_backoff_ms;
  }
  return static_cast<std::int64_t>(delay);
}

}  // namespace futmon
