#pragma once

#include <string>
#include <utility>
#include <vector>

namespace futmon {

// Ordered query parameters. Order matters: the signature is computed over
// the exact query string that goes on the wire.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

// -----------------------------------------------------------------------------
// Endpoint: one REST resource of the exchange account API
// -----------------------------------------------------------------------------
//
// @brief  Path plus the request weight the exchange charges for it.
//
// @details
// weight feeds the sliding-window rate limiter. `signed_request` endpoints
// receive timestamp, recvWindow and signature parameters and the API-key
// header; unsigned ones (server time) receive none of them.
// -----------------------------------------------------------------------------
struct Endpoint {
  std::string name;     // Short label for logs and rate-limit buckets
  std::string path;     // e.g. "/fapi/v2/account"
  int weight{1};
  bool signed_request{true};
};

// -----------------------------------------------------------------------------
// Binance USD-M futures endpoints used by the monitor
// -----------------------------------------------------------------------------
namespace endpoints {

inline const Endpoint& account() {
  static const Endpoint kEndpoint{"account", "/fapi/v2/account", 5, true};
  return kEndpoint;
}

inline const Endpoint& positionRisk() {
  static const Endpoint kEndpoint{"positionRisk", "/fapi/v2/positionRisk", 5,
                                  true};
  return kEndpoint;
}

inline const Endpoint& userTrades() {
  static const Endpoint kEndpoint{"userTrades", "/fapi/v1/userTrades", 5,
                                  true};
  return kEndpoint;
}

inline const Endpoint& income() {
  static const Endpoint kEndpoint{"income", "/fapi/v1/income", 30, true};
  return kEndpoint;
}

inline const Endpoint& serverTime() {
  static const Endpoint kEndpoint{"serverTime", "/fapi/v1/time", 1, false};
  return kEndpoint;
}

}  // namespace endpoints

constexpr const char* kMainnetBaseUrl = "https://fapi.binance.com";
constexpr const char* kTestnetBaseUrl = "https://testnet.binancefuture.com";

}  // namespace futmon
