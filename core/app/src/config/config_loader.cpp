#include "futmon/config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace futmon {

namespace {

using nlohmann::json;

// Minimum key/secret length; real keys are 64 characters, anything this
// short is a placeholder or a paste error.
constexpr std::size_t kMinCredentialLength = 20;

// -----------------------------------------------------------------------------
// readOptional(): overwrite `target` if `key` exists in `object`
// -----------------------------------------------------------------------------
template <typename T>
void readOptional(const json& object, const char* key, T& target) {
  auto it = object.find(key);
  if (it != object.end() && !it->is_null()) {
    target = it->get<T>();
  }
}

// "*_seconds" keys are stored as milliseconds.
void readSeconds(const json& object, const char* key, std::int64_t& target_ms) {
  auto it = object.find(key);
  if (it != object.end() && !it->is_null()) {
    target_ms = static_cast<std::int64_t>(it->get<double>() * 1000.0);
  }
}

const json* section(const json& root, const char* name) {
  auto it = root.find(name);
  if (it == root.end() || it->is_null()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("config section '") + name +
                      "' must be an object");
  }
  return &*it;
}

bool parseBool(const std::string& name, const std::string& raw) {
  std::string value = raw;
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (value == "true" || value == "1" || value == "yes") {
    return true;
  }
  if (value == "false" || value == "0" || value == "no" || value.empty()) {
    return false;
  }
  throw ConfigError(name + " must be a boolean, got '" + raw + "'");
}

long long parseInteger(const std::string& name, const std::string& raw) {
  char* end = nullptr;
  long long value = std::strtoll(raw.c_str(), &end, 10);
  if (raw.empty() || end == raw.c_str() || *end != '\0') {
    throw ConfigError(name + " must be an integer, got '" + raw + "'");
  }
  return value;
}

}  // namespace

// -----------------------------------------------------------------------------
// loadFile(): defaults → file → environment → validate
// -----------------------------------------------------------------------------
MonitorConfig ConfigLoader::loadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file '" + path + "'");
  }

  json root;
  try {
    root = json::parse(in);
  } catch (const json::parse_error& e) {
    throw ConfigError("config file '" + path + "' is not valid JSON: " +
                      e.what());
  }

  MonitorConfig config = fromJson(root);
  applyEnvironment(config, processEnvironment());
  validate(config);

  std::cout << "[ConfigLoader] loaded " << path << " (key "
            << config.exchange.credentials.maskedKey() << ", "
            << (config.exchange.use_testnet ? "testnet" : "mainnet") << ")\n";
  return config;
}

// -----------------------------------------------------------------------------
// fromJson(): every key optional; type mismatches become ConfigError
// -----------------------------------------------------------------------------
MonitorConfig ConfigLoader::fromJson(const nlohmann::json& root) {
  if (!root.is_object()) {
    throw ConfigError("config root must be a JSON object");
  }

  MonitorConfig config;
  try {
    if (const json* s = section(root, "exchange")) {
      ExchangeConfig& ex = config.exchange;
      readOptional(*s, "api_key", ex.credentials.api_key);
      readOptional(*s, "api_secret", ex.credentials.api_secret);
      readOptional(*s, "use_testnet", ex.use_testnet);
      readOptional(*s, "base_url", ex.base_url);
      readOptional(*s, "base_currency", ex.base_currency);
      readOptional(*s, "request_timeout_seconds", ex.request_timeout_seconds);
      readOptional(*s, "recv_window_ms", ex.recv_window_ms);
      readOptional(*s, "sync_server_time", ex.sync_server_time);
    }

    if (const json* s = section(root, "cache")) {
      readSeconds(*s, "account_ttl_seconds", config.cache.account_ttl_ms);
      readSeconds(*s, "positions_ttl_seconds", config.cache.positions_ttl_ms);
      readSeconds(*s, "trades_ttl_seconds", config.cache.trades_ttl_ms);
      readSeconds(*s, "income_ttl_seconds", config.cache.income_ttl_ms);
    }

    if (const json* s = section(root, "retry")) {
      RetryPolicyConfig& r = config.retry;
      readOptional(*s, "max_transient_retries", r.max_transient_retries);
      readOptional(*s, "max_rate_limit_retries", r.max_rate_limit_retries);
      readOptional(*s, "initial_backoff_ms", r.initial_backoff_ms);
      readOptional(*s, "backoff_multiplier", r.backoff_multiplier);
      readOptional(*s, "max_backoff_ms", r.max_backoff_ms);
      readOptional(*s, "max_retry_after_ms", r.max_retry_after_ms);
    }

    if (const json* s = section(root, "rate_limit")) {
      RateLimitConfig& rl = config.rate_limit;
      readOptional(*s, "window_ms", rl.window_ms);
      readOptional(*s, "global_weight_budget", rl.global_weight_budget);
      readOptional(*s, "endpoint_weight_budget", rl.endpoint_weight_budget);
      readOptional(*s, "endpoint_budgets", rl.endpoint_budgets);
      readOptional(*s, "default_retry_after_ms", rl.default_retry_after_ms);
    }

    if (const json* s = section(root, "refresh")) {
      RefreshConfig& rf = config.refresh;
      readOptional(*s, "enabled", rf.enabled);
      readSeconds(*s, "account_interval_seconds", rf.account_interval_ms);
      readSeconds(*s, "positions_interval_seconds", rf.positions_interval_ms);
      readSeconds(*s, "trades_interval_seconds", rf.trades_interval_ms);
      readSeconds(*s, "income_interval_seconds", rf.income_interval_ms);
      readOptional(*s, "watched_symbols", rf.watched_symbols);
    }

    if (const json* s = section(root, "history")) {
      HistoryConfig& h = config.history;
      readOptional(*s, "max_trades_per_symbol", h.max_trades_per_symbol);
      readOptional(*s, "trade_fetch_limit", h.trade_fetch_limit);
      readSeconds(*s, "income_lookback_seconds", h.income_lookback_ms);
      readOptional(*s, "income_page_limit", h.income_page_limit);
      readOptional(*s, "income_max_pages", h.income_max_pages);
    }

    if (const json* s = section(root, "alerts")) {
      readOptional(*s, "margin_ratio_alert_threshold",
                   config.alerts.margin_ratio_alert_threshold);
    }

    if (const json* s = section(root, "ipc")) {
      readOptional(*s, "enabled", config.ipc.enabled);
      readOptional(*s, "cmd_endpoint", config.ipc.cmd_endpoint);
      readOptional(*s, "pub_endpoint", config.ipc.pub_endpoint);
    }
  } catch (const json::exception& e) {
    throw ConfigError(std::string("invalid config value: ") + e.what());
  }
  return config;
}

// -----------------------------------------------------------------------------
// applyEnvironment(): environment wins over the file
// -----------------------------------------------------------------------------
void ConfigLoader::applyEnvironment(MonitorConfig& config,
                                   const EnvLookup& env) {
  if (auto v = env("BINANCE_API_KEY")) {
    config.exchange.credentials.api_key = *v;
  }
  if (auto v = env("BINANCE_SECRET_KEY")) {
    config.exchange.credentials.api_secret = *v;
  }
  if (auto v = env("USE_TESTNET")) {
    config.exchange.use_testnet = parseBool("USE_TESTNET", *v);
  }
  if (auto v = env("REQUEST_TIMEOUT_SECONDS")) {
    config.exchange.request_timeout_seconds =
        static_cast<int>(parseInteger("REQUEST_TIMEOUT_SECONDS", *v));
  }
  if (auto v = env("REFRESH_INTERVAL")) {
    std::int64_t interval_ms = parseInteger("REFRESH_INTERVAL", *v) * 1000;
    config.refresh.account_interval_ms = interval_ms;
    config.refresh.positions_interval_ms = interval_ms;
    config.refresh.trades_interval_ms = interval_ms;
    config.refresh.income_interval_ms = interval_ms;
  }
}

// -----------------------------------------------------------------------------
// validate()
// -----------------------------------------------------------------------------
void ConfigLoader::validate(const MonitorConfig& config) {
  const Credentials& creds = config.exchange.credentials;
  if (creds.api_key.empty() || creds.api_secret.empty()) {
    throw ConfigError(
        "API credentials missing; set exchange.api_key/api_secret or "
        "BINANCE_API_KEY/BINANCE_SECRET_KEY");
  }
  if (creds.api_key.size() < kMinCredentialLength ||
      creds.api_secret.size() < kMinCredentialLength) {
    throw ConfigError("API credentials look malformed (shorter than " +
                      std::to_string(kMinCredentialLength) + " characters)");
  }
  if (config.exchange.request_timeout_seconds <= 0) {
    throw ConfigError("request_timeout_seconds must be positive");
  }
  if (config.exchange.recv_window_ms <= 0 ||
      config.exchange.recv_window_ms > 60000) {
    throw ConfigError("recv_window_ms must be in (0, 60000]");
  }

  const CacheTtlConfig& ttl = config.cache;
  if (ttl.account_ttl_ms <= 0 || ttl.positions_ttl_ms <= 0 ||
      ttl.trades_ttl_ms <= 0 || ttl.income_ttl_ms <= 0) {
    throw ConfigError("cache TTLs must be positive");
  }

  const RetryPolicyConfig& retry = config.retry;
  if (retry.max_transient_retries < 0 || retry.max_rate_limit_retries < 0) {
    throw ConfigError("retry ceilings must not be negative");
  }
  if (retry.initial_backoff_ms < 0 || retry.max_backoff_ms < 0 ||
      retry.backoff_multiplier < 1.0) {
    throw ConfigError("backoff must be non-negative with multiplier >= 1");
  }

  const RateLimitConfig& rl = config.rate_limit;
  if (rl.window_ms <= 0 || rl.global_weight_budget <= 0 ||
      rl.endpoint_weight_budget <= 0) {
    throw ConfigError("rate-limit window and budgets must be positive");
  }

  if (config.history.trade_fetch_limit <= 0 ||
      config.history.trade_fetch_limit > 1000 ||
      config.history.income_page_limit <= 0 ||
      config.history.income_page_limit > 1000) {
    throw ConfigError("trade/income fetch limits must be in [1, 1000]");
  }
  if (config.history.max_trades_per_symbol == 0 ||
      config.history.income_max_pages <= 0 ||
      config.history.income_lookback_ms <= 0) {
    throw ConfigError("history window settings must be positive");
  }

  if (config.alerts.margin_ratio_alert_threshold <= 0.0) {
    throw ConfigError("margin_ratio_alert_threshold must be positive");
  }
}

ConfigLoader::EnvLookup ConfigLoader::processEnvironment() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

}  // namespace futmon
