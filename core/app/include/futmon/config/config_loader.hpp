#pragma once

#include "futmon/config/monitor_config.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace futmon {

class ConfigError final : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message)
      : std::runtime_error(message) {}
};

// -----------------------------------------------------------------------------
// ConfigLoader: JSON file + environment → validated MonitorConfig
// -----------------------------------------------------------------------------
//
// @brief  Reads the monitor's JSON configuration, applies environment
//         overrides and validates the result.
//
// @details
// Precedence, lowest to highest: built-in defaults, JSON file, environment.
// Every JSON key is optional; a missing key keeps its default. Durations in
// the file are in seconds (`*_seconds`) or milliseconds (`*_ms`) as named.
//
// Environment variables:
//   BINANCE_API_KEY, BINANCE_SECRET_KEY   credentials
//   USE_TESTNET                           "true"/"1"/"yes" (case-insensitive)
//   REQUEST_TIMEOUT_SECONDS               positive integer
//   REFRESH_INTERVAL                      seconds; sets every refresh cadence
//
// Every failure (unreadable file, bad JSON, wrong type, failed validation)
// throws ConfigError.
// -----------------------------------------------------------------------------
class ConfigLoader {
 public:
  using EnvLookup =
      std::function<std::optional<std::string>(const std::string& name)>;

  // File + process environment + validation.
  static MonitorConfig loadFile(const std::string& path);

  static MonitorConfig fromJson(const nlohmann::json& root);

  static void applyEnvironment(MonitorConfig& config, const EnvLookup& env);

  static void validate(const MonitorConfig& config);

  static EnvLookup processEnvironment();
};

}  // namespace futmon
