#pragma once

#include "futmon/config/monitor_config.hpp"
#include "futmon/gateway/i_exchange_gateway.hpp"
#include "futmon/gateway/i_http_transport.hpp"
#include "futmon/gateway/rate_limiter.hpp"
#include "futmon/gateway/request_signer.hpp"
#include "futmon/gateway/retry_policy.hpp"
#include "futmon/time/i_time_provider.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace futmon {

// -----------------------------------------------------------------------------
// BinanceFuturesGateway: signed, rate-limited access to the USD-M account API
// -----------------------------------------------------------------------------
//
// @brief  IExchangeGateway over Binance USD-M futures REST.
//
// @details
// One fetch() call goes through these steps:
//
//   1. Auth latch: if credentials were rejected before, throw AuthError
//      immediately. No network traffic and no retry loop.
//   2. Server time sync (signed endpoints, first call only): /fapi/v1/time
//      sets the signer's clock offset.
//   3. Rate limiter: wait (via ITimeProvider::sleep_for_ms) until the
//      endpoint weight fits in its sliding window and any 429 cooldown has
//      passed. A wait longer than the retry policy's max_retry_after_ms is
//      not slept through; it is thrown as RateLimitError instead.
//   4. Sign (timestamp + recvWindow + signature) and send via IHttpTransport.
//   5. Classify the response into a payload or an ExchangeError:
//        2xx + JSON                      → payload
//        2xx + unparseable body          → ProtocolError
//        429 / 418 / code -1003          → RateLimitError(Retry-After)
//        401 / -2014 / -2015 / -1022     → AuthError
//        -1021 (timestamp outside recvWindow, i.e. clock skew) → AuthError
//        408 / 5xx / -1001 / -1007       → TransientError
//        anything else                   → ProtocolError
//   6. RetryPolicy decides whether to sleep and go back to step 3. A
//      RateLimitError also puts the endpoint into a limiter cooldown so that
//      other callers of the same endpoint back off too.
//
// Thread model:
//   fetch() is safe to call from several threads. The signer, the limiter
//   and the auth latch are internally synchronized; the HTTP transport must
//   be reentrant.
//
// Ownership:
//   Owns its signer, limiter and retry policy. Shares the transport
//   (shared_ptr). Borrows the clock, which must outlive the gateway.
//   Credentials are copied in at construction and never change; rotation
//   builds a new gateway.
// -----------------------------------------------------------------------------
class BinanceFuturesGateway final : public IExchangeGateway {
 public:
  BinanceFuturesGateway(const MonitorConfig& config,
                        std::shared_ptr<IHttpTransport> transport,
                        ITimeProvider& clock);

  BinanceFuturesGateway(const BinanceFuturesGateway&) = delete;
  BinanceFuturesGateway& operator=(const BinanceFuturesGateway&) = delete;

  RawPayload fetch(const Endpoint& endpoint,
                   const QueryParams& params) override;

  bool credentialsRejected() const override;

  // ---------------------------------------------------------------------------
  // syncServerTime()
  // ---------------------------------------------------------------------------
  // @brief  Measures the offset between the exchange clock and ours and hands
  //         it to the signer.
  //
  // @details
  // offset = serverTime - midpoint(request sent, response received).
  // Throws the same ExchangeError kinds as fetch().
  // ---------------------------------------------------------------------------
  void syncServerTime();

  const SlidingWindowRateLimiter& rateLimiter() const { return limiter_; }

  const std::string& baseUrl() const { return base_url_; }

 private:
  RawPayload sendOnce(const Endpoint& endpoint, const QueryParams& params);
  RawPayload classify(const Endpoint& endpoint, const HttpResponse& response);
  void waitForBudget(const Endpoint& endpoint);
  void ensureServerTime();
  void latchCredentials(const std::string& reason);
  std::int64_t retryAfterMs(const HttpResponse& response) const;

  const std::string api_key_;
  const std::string masked_key_;
  const std::string base_url_;
  const long timeout_ms_;
  const bool sync_server_time_;
  const std::int64_t default_retry_after_ms_;
  const std::int64_t max_budget_wait_ms_;

  std::shared_ptr<IHttpTransport> transport_;
  ITimeProvider& clock_;
  RequestSigner signer_;
  SlidingWindowRateLimiter limiter_;
  RetryPolicy retry_policy_;

  std::atomic<bool> credentials_rejected_{false};

  // Guards the two flags only; the sync request runs outside it.
  std::mutex time_sync_mutex_;
  bool time_synced_{false};
  bool time_sync_running_{false};
};

}  // namespace futmon
