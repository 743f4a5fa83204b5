// =============================================================================
// retry_policy_test.cpp
// =============================================================================
// Unit tests for futmon::RetryPolicy.
//
// Validates:
//   - Auth and Protocol are never retried
//   - Transient retries follow exponential backoff up to the ceiling
//   - RateLimit honours the retry-after hint, once, and only when the hint
//     is within max_retry_after_ms
// =============================================================================

#include "futmon/gateway/retry_policy.hpp"

#include <gtest/gtest.h>

class RetryPolicyTest : public ::testing::Test {
 protected:
  futmon::RetryPolicy policy;
};

// -----------------------------------------------------------------------------
// 1. Terminal kinds
// -----------------------------------------------------------------------------
TEST_F(RetryPolicyTest, AuthAndProtocolAreTerminal) {
  EXPECT_FALSE(policy.decide(futmon::AuthError("-2015"), 0).retry);
  EXPECT_FALSE(policy.decide(futmon::ProtocolError("bad body"), 0).retry);
}

// -----------------------------------------------------------------------------
// 2. Transient backoff
// -----------------------------------------------------------------------------
TEST_F(RetryPolicyTest, TransientBacksOffExponentially) {
  futmon::TransientError error("HTTP 503");

  auto first = policy.decide(error, 0);
  auto second = policy.decide(error, 1);
  auto third = policy.decide(error, 2);

  EXPECT_TRUE(first.retry);
  EXPECT_EQ(first.delay_ms, 500);
  EXPECT_EQ(second.delay_ms, 1000);
  EXPECT_EQ(third.delay_ms, 2000);
  EXPECT_FALSE(policy.decide(error, 3).retry);
}

TEST_F(RetryPolicyTest, BackoffIsCapped) {
  futmon::RetryPolicyConfig config;
  config.max_transient_retries = 10;
  futmon::RetryPolicy long_policy(config);

  EXPECT_EQ(long_policy.backoffFor(4), 8000);
  EXPECT_EQ(long_policy.backoffFor(9), 8000);
}

TEST_F(RetryPolicyTest, ZeroCeilingDisablesRetries) {
  futmon::RetryPolicyConfig config;
  config.max_transient_retries = 0;
  config.max_rate_limit_retries = 0;
  futmon::RetryPolicy strict(config);

  EXPECT_FALSE(strict.decide(futmon::TransientError("reset"), 0).retry);
  EXPECT_FALSE(strict.decide(futmon::RateLimitError("429", 10), 0).retry);
}

// -----------------------------------------------------------------------------
// 3. RateLimit
// Why: Retrying sooner than the exchange asked risks an IP ban; waiting
//      longer than a minute inside one getter blocks the caller too long.
// -----------------------------------------------------------------------------
TEST_F(RetryPolicyTest, RateLimitWaitsForHintOnce) {
  futmon::RateLimitError error("HTTP 429", 2000);

  auto decision = policy.decide(error, 0);
  EXPECT_TRUE(decision.retry);
  EXPECT_EQ(decision.delay_ms, 2000);
  EXPECT_FALSE(policy.decide(error, 1).retry);
}

TEST_F(RetryPolicyTest, RateLimitHintAboveCeilingIsTerminal) {
  EXPECT_FALSE(
      policy.decide(futmon::RateLimitError("HTTP 418", 120'000), 0).retry);
}

TEST_F(RetryPolicyTest, NegativeHintTreatedAsZero) {
  auto decision = policy.decide(futmon::RateLimitError("HTTP 429", -5), 0);
  EXPECT_TRUE(decision.retry);
  EXPECT_EQ(decision.delay_ms, 0);
}
