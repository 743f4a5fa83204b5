// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for futmon::ConfigLoader.
//
// Validates:
//   - Empty JSON yields the documented defaults
//   - "*_seconds" keys are converted to milliseconds
//   - Environment overrides win over the file
//   - Missing or malformed credentials and out-of-range values are rejected
//   - loadFile() reports unreadable and invalid files as ConfigError
// =============================================================================

#include "futmon/config/config_loader.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <vector>

using futmon::ConfigError;
using futmon::ConfigLoader;
using nlohmann::json;

class ConfigLoaderTest : public ::testing::Test {
 protected:
  std::map<std::string, std::string> env;

  ConfigLoader::EnvLookup lookup() {
    return [this](const std::string& name) -> std::optional<std::string> {
      auto it = env.find(name);
      if (it == env.end()) {
        return std::nullopt;
      }
      return it->second;
    };
  }

  static json withCredentials() {
    return json{{"exchange",
                 {{"api_key", "file-api-key-0123456789abcdef"},
                  {"api_secret", "file-api-secret-0123456789abcdef"}}}};
  }

  std::string writeTempFile(const std::string& content) {
    std::string path = ::testing::TempDir() + "futmon_config_test.json";
    std::ofstream out(path);
    out << content;
    temp_files_.push_back(path);
    return path;
  }

  void TearDown() override {
    for (const auto& path : temp_files_) {
      std::remove(path.c_str());
    }
  }

 private:
  std::vector<std::string> temp_files_;
};

// -----------------------------------------------------------------------------
// 1. Defaults
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, EmptyObjectGivesDefaults) {
  auto config = ConfigLoader::fromJson(json::object());

  EXPECT_FALSE(config.exchange.use_testnet);
  EXPECT_EQ(config.exchange.request_timeout_seconds, 30);
  EXPECT_EQ(config.exchange.recv_window_ms, 5000);
  EXPECT_EQ(config.cache.account_ttl_ms, 30'000);
  EXPECT_EQ(config.cache.positions_ttl_ms, 30'000);
  EXPECT_EQ(config.cache.trades_ttl_ms, 60'000);
  EXPECT_EQ(config.cache.income_ttl_ms, 300'000);
  EXPECT_EQ(config.retry.max_transient_retries, 3);
  EXPECT_EQ(config.retry.max_rate_limit_retries, 1);
  EXPECT_DOUBLE_EQ(config.alerts.margin_ratio_alert_threshold, 0.8);
  EXPECT_EQ(config.exchange.resolvedBaseUrl(), "https://fapi.binance.com");
}

TEST_F(ConfigLoaderTest, NonObjectRootIsRejected) {
  EXPECT_THROW(ConfigLoader::fromJson(json::array()), ConfigError);
}

// -----------------------------------------------------------------------------
// 2. File values
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, SecondsKeysBecomeMilliseconds) {
  json root = withCredentials();
  root["cache"] = {{"account_ttl_seconds", 12}, {"income_ttl_seconds", 0.5}};
  root["refresh"] = {{"trades_interval_seconds", 90},
                     {"watched_symbols", {"BTCUSDT", "ETHUSDT"}}};
  root["history"] = {{"income_lookback_seconds", 3600}};

  auto config = ConfigLoader::fromJson(root);

  EXPECT_EQ(config.cache.account_ttl_ms, 12'000);
  EXPECT_EQ(config.cache.income_ttl_ms, 500);
  EXPECT_EQ(config.refresh.trades_interval_ms, 90'000);
  EXPECT_EQ(config.history.income_lookback_ms, 3'600'000);
  ASSERT_EQ(config.refresh.watched_symbols.size(), 2u);
  EXPECT_EQ(config.refresh.watched_symbols[1], "ETHUSDT");
}

TEST_F(ConfigLoaderTest, RetryCeilingsAreConfigurable) {
  json root = withCredentials();
  root["retry"] = {{"max_transient_retries", 5},
                   {"max_rate_limit_retries", 0},
                   {"max_retry_after_ms", 10'000}};

  auto config = ConfigLoader::fromJson(root);

  EXPECT_EQ(config.retry.max_transient_retries, 5);
  EXPECT_EQ(config.retry.max_rate_limit_retries, 0);
  EXPECT_EQ(config.retry.max_retry_after_ms, 10'000);
  EXPECT_NO_THROW(ConfigLoader::validate(config));
}

TEST_F(ConfigLoaderTest, WrongValueTypeIsConfigError) {
  json root{{"cache", {{"account_ttl_seconds", "thirty"}}}};
  EXPECT_THROW(ConfigLoader::fromJson(root), ConfigError);

  json bad_section{{"retry", 3}};
  EXPECT_THROW(ConfigLoader::fromJson(bad_section), ConfigError);
}

// -----------------------------------------------------------------------------
// 3. Environment overrides
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, EnvironmentWinsOverFile) {
  auto config = ConfigLoader::fromJson(withCredentials());
  env["BINANCE_API_KEY"] = "env-api-key-0123456789abcdef";
  env["BINANCE_SECRET_KEY"] = "env-api-secret-0123456789abcdef";
  env["USE_TESTNET"] = "yes";
  env["REQUEST_TIMEOUT_SECONDS"] = "10";
  env["REFRESH_INTERVAL"] = "15";

  ConfigLoader::applyEnvironment(config, lookup());

  EXPECT_EQ(config.exchange.credentials.api_key,
            "env-api-key-0123456789abcdef");
  EXPECT_TRUE(config.exchange.use_testnet);
  EXPECT_EQ(config.exchange.request_timeout_seconds, 10);
  EXPECT_EQ(config.refresh.account_interval_ms, 15'000);
  EXPECT_EQ(config.refresh.income_interval_ms, 15'000);
  EXPECT_EQ(config.exchange.resolvedBaseUrl(),
            "https://testnet.binancefuture.com");
}

TEST_F(ConfigLoaderTest, MalformedEnvironmentValueIsConfigError) {
  auto config = ConfigLoader::fromJson(json::object());
  env["USE_TESTNET"] = "maybe";
  EXPECT_THROW(ConfigLoader::applyEnvironment(config, lookup()), ConfigError);

  env.clear();
  env["REFRESH_INTERVAL"] = "10s";
  EXPECT_THROW(ConfigLoader::applyEnvironment(config, lookup()), ConfigError);
}

// -----------------------------------------------------------------------------
// 4. Validation
// Why: Starting without usable credentials would only produce a stream of
//      Auth errors; failing at startup is clearer.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, MissingCredentialsRejected) {
  auto config = ConfigLoader::fromJson(json::object());
  EXPECT_THROW(ConfigLoader::validate(config), ConfigError);
}

TEST_F(ConfigLoaderTest, ShortCredentialsRejected) {
  json root{{"exchange", {{"api_key", "short"}, {"api_secret", "short"}}}};
  EXPECT_THROW(ConfigLoader::validate(ConfigLoader::fromJson(root)),
               ConfigError);
}

TEST_F(ConfigLoaderTest, OutOfRangeValuesRejected) {
  auto base = ConfigLoader::fromJson(withCredentials());
  EXPECT_NO_THROW(ConfigLoader::validate(base));

  auto recv = base;
  recv.exchange.recv_window_ms = 60'001;
  EXPECT_THROW(ConfigLoader::validate(recv), ConfigError);

  auto ttl = base;
  ttl.cache.trades_ttl_ms = 0;
  EXPECT_THROW(ConfigLoader::validate(ttl), ConfigError);

  auto retries = base;
  retries.retry.max_transient_retries = -1;
  EXPECT_THROW(ConfigLoader::validate(retries), ConfigError);

  auto limit = base;
  limit.history.trade_fetch_limit = 1001;
  EXPECT_THROW(ConfigLoader::validate(limit), ConfigError);

  auto threshold = base;
  threshold.alerts.margin_ratio_alert_threshold = 0.0;
  EXPECT_THROW(ConfigLoader::validate(threshold), ConfigError);
}

// -----------------------------------------------------------------------------
// 5. loadFile()
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, LoadFileReadsAndValidates) {
  json root = withCredentials();
  root["exchange"]["use_testnet"] = true;
  std::string path = writeTempFile(root.dump());

  auto config = ConfigLoader::loadFile(path);

  EXPECT_TRUE(config.exchange.use_testnet);
  EXPECT_EQ(config.exchange.credentials.maskedKey().rfind("****", 0), 0u);
}

TEST_F(ConfigLoaderTest, LoadFileErrors) {
  EXPECT_THROW(ConfigLoader::loadFile("/nonexistent/futmon.json"),
               ConfigError);
  EXPECT_THROW(ConfigLoader::loadFile(writeTempFile("{ not json")),
               ConfigError);
}
