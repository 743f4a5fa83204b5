// =============================================================================
// staleness_policy_test.cpp
// =============================================================================
// Unit tests for futmon::StalenessPolicy.
//
// Validates:
//   - Failure with a prior value → prior value, stale, age, error attached
//   - Failure without a prior value → no data, original ErrorKind unchanged
//   - In-flight with a prior value → prior value, stale, no error
// =============================================================================

#include "futmon/refresh/staleness_policy.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>

class StalenessPolicyTest : public ::testing::Test {
 protected:
  futmon::StalenessPolicy policy;

  static futmon::CacheEntry<double> entryAt(std::int64_t fetched_at_ms) {
    return futmon::CacheEntry<double>{1050.0, fetched_at_ms, 30'000, false};
  }
};

// -----------------------------------------------------------------------------
// 1. The last good value survives a failed refresh, marked stale.
// -----------------------------------------------------------------------------
TEST_F(StalenessPolicyTest, FailureWithPriorServesStaleValue) {
  std::optional<futmon::CacheEntry<double>> prior = entryAt(10'000);
  futmon::FetchError error{futmon::ErrorKind::Transient, "timeout", 0};

  auto result = policy.onFailure(error, prior, 57'000);

  ASSERT_TRUE(result.data.has_value());
  EXPECT_DOUBLE_EQ(*result.data, 1050.0);
  EXPECT_TRUE(result.stale);
  EXPECT_EQ(result.fetched_at_ms, 10'000);
  EXPECT_EQ(result.age_ms, 47'000);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->kind, futmon::ErrorKind::Transient);
  EXPECT_EQ(result.state(), futmon::DataState::Stale);
  EXPECT_EQ(futmon::describe(result), "stale (age 47s, Transient: timeout)");
}

// -----------------------------------------------------------------------------
// 2. Without a prior value the error kind is passed through untouched.
// Why: The UI shows a different message for Auth (reconfigure) than for
//      RateLimit (wait) or Transient (retrying).
// -----------------------------------------------------------------------------
TEST_F(StalenessPolicyTest, FailureWithoutPriorPropagatesOriginalKind) {
  for (auto kind : {futmon::ErrorKind::Auth, futmon::ErrorKind::RateLimit,
                    futmon::ErrorKind::Transient,
                    futmon::ErrorKind::Protocol}) {
    auto result = policy.onFailure<double>(
        futmon::FetchError{kind, "failed", 0}, std::nullopt, 1'000);

    EXPECT_FALSE(result.data.has_value());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, kind);
    EXPECT_EQ(result.state(), futmon::DataState::Unavailable);
  }
}

TEST_F(StalenessPolicyTest, InFlightServesStaleValueWithoutError) {
  auto result = policy.onInFlight(entryAt(0), 31'000);

  ASSERT_TRUE(result.data.has_value());
  EXPECT_TRUE(result.stale);
  EXPECT_EQ(result.age_ms, 31'000);
  EXPECT_FALSE(result.error.has_value());
}
