#pragma once

#include "futmon/gateway/endpoint.hpp"

#include <nlohmann/json.hpp>

namespace futmon {

// Decoded response body. Kept as JSON until payload_parser turns it into
// domain types.
using RawPayload = nlohmann::json;

// -----------------------------------------------------------------------------
// IExchangeGateway: abstract authenticated access to the account API
// -----------------------------------------------------------------------------
//
// @brief  fetch(endpoint, params) -> RawPayload, or throws an ExchangeError
//         subclass (AuthError, RateLimitError, TransientError, ProtocolError).
//
// @details
// Implementations own signing, transport retries and rate-limit compliance.
// Callers (the AccountMonitor's fetchers) see either a decoded payload or a
// typed exception once the retry policy has given up.
//
//   - BinanceFuturesGateway → real HTTPS calls through an IHttpTransport.
//   - FakeExchangeGateway   → scripted responses in tests.
//
// Thread model:
//   fetch() may be called concurrently from several threads (one refresh per
//   cache key can run in parallel). Implementations synchronize internally.
//
// Ownership:
//   Held by AccountMonitor through std::shared_ptr so a credential rotation
//   can swap in a new gateway while a refresh on the old one finishes.
// -----------------------------------------------------------------------------
class IExchangeGateway {
 public:
  virtual ~IExchangeGateway() = default;

  virtual RawPayload fetch(const Endpoint& endpoint,
                           const QueryParams& params) = 0;

  // True once the exchange has rejected the credentials. From then on every
  // fetch() throws AuthError without touching the network.
  virtual bool credentialsRejected() const = 0;
};

}  // namespace futmon
