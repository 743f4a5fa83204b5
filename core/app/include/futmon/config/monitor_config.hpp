#pragma once

#include "futmon/gateway/rate_limiter.hpp"
#include "futmon/gateway/retry_policy.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace futmon {

// -----------------------------------------------------------------------------
// Credentials: API key pair
// -----------------------------------------------------------------------------
// Read-only once loaded. Rotation builds a new gateway from a new
// MonitorConfig; nothing ever edits a live Credentials value.
// -----------------------------------------------------------------------------
struct Credentials {
  std::string api_key;
  std::string api_secret;

  // "****abcd": safe to log.
  std::string maskedKey() const;
};

struct ExchangeConfig {
  Credentials credentials;
  bool use_testnet{false};
  std::string base_url;            // Empty → mainnet/testnet default
  std::string base_currency{"USDT"};
  int request_timeout_seconds{30};
  std::int64_t recv_window_ms{5000};
  bool sync_server_time{true};

  std::string resolvedBaseUrl() const;
};

// Per-dataset TTLs. Account balances move with every mark price tick;
// income history changes a few times a day.
struct CacheTtlConfig {
  std::int64_t account_ttl_ms{30000};
  std::int64_t positions_ttl_ms{30000};
  std::int64_t trades_ttl_ms{60000};
  std::int64_t income_ttl_ms{300000};
};

struct RefreshConfig {
  bool enabled{true};
  std::int64_t account_interval_ms{30000};
  std::int64_t positions_interval_ms{30000};
  std::int64_t trades_interval_ms{60000};
  std::int64_t income_interval_ms{300000};
  std::vector<std::string> watched_symbols;  // Trades refreshed per symbol
};

struct HistoryConfig {
  std::size_t max_trades_per_symbol{1000};
  int trade_fetch_limit{500};                // userTrades limit (max 1000)
  std::int64_t income_lookback_ms{7LL * 24 * 60 * 60 * 1000};
  int income_page_limit{1000};               // income limit (max 1000)
  int income_max_pages{10};
};

struct AlertConfig {
  double margin_ratio_alert_threshold{0.8};
};

struct IpcConfig {
  bool enabled{true};
  std::string cmd_endpoint{"tcp://*:5556"};
  std::string pub_endpoint{"tcp://*:5557"};
};

// -----------------------------------------------------------------------------
// MonitorConfig: complete, immutable configuration of one monitor instance
// -----------------------------------------------------------------------------
//
// @brief  Built once by ConfigLoader and then passed by const reference.
//
// @details
// Nothing in the core mutates a MonitorConfig after construction. Changing
// credentials means loading a new MonitorConfig, building a new gateway from
// it and handing that gateway to AccountMonitor::rotateCredentials().
// -----------------------------------------------------------------------------
struct MonitorConfig {
  ExchangeConfig exchange;
  CacheTtlConfig cache;
  RetryPolicyConfig retry;
  RateLimitConfig rate_limit;
  RefreshConfig refresh;
  HistoryConfig history;
  AlertConfig alerts;
  IpcConfig ipc;
};

}  // namespace futmon
