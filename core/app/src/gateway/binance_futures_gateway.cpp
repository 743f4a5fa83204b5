#include "futmon/gateway/binance_futures_gateway.hpp"

#include "futmon/errors/exchange_error.hpp"
#include "futmon/gateway/payload_parser.hpp"

#include <cstdlib>
#include <iostream>
#include <map>
#include <utility>

namespace futmon {

namespace {

// Exchange error codes (the "code" field of an error body).
constexpr int kCodeDisconnected = -1001;
constexpr int kCodeTooManyRequests = -1003;
constexpr int kCodeTimeout = -1007;
constexpr int kCodeTimestampOutsideRecvWindow = -1021;
constexpr int kCodeInvalidSignature = -1022;
constexpr int kCodeBadApiKeyFormat = -2014;
constexpr int kCodeRejectedMbxKey = -2015;

bool isAuthCode(int code) {
  return code == kCodeTimestampOutsideRecvWindow ||
         code == kCodeInvalidSignature || code == kCodeBadApiKeyFormat ||
         code == kCodeRejectedMbxKey;
}

std::string describeFailure(const Endpoint& endpoint, long status, int code,
                            const std::string& msg) {
  std::string out = endpoint.name + ": HTTP " + std::to_string(status);
  if (code != 0) {
    out += " code " + std::to_string(code);
  }
  if (!msg.empty()) {
    out += " (" + msg + ")";
  }
  return out;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
BinanceFuturesGateway::BinanceFuturesGateway(
    const MonitorConfig& config, std::shared_ptr<IHttpTransport> transport,
    ITimeProvider& clock)
    : api_key_(config.exchange.credentials.api_key),
      masked_key_(config.exchange.credentials.maskedKey()),
      base_url_(config.exchange.resolvedBaseUrl()),
      timeout_ms_(static_cast<long>(config.exchange.request_timeout_seconds) *
                  1000L),
      sync_server_time_(config.exchange.sync_server_time),
      default_retry_after_ms_(config.rate_limit.default_retry_after_ms),
      max_budget_wait_ms_(config.retry.max_retry_after_ms),
      transport_(std::move(transport)),
      clock_(clock),
      signer_(config.exchange.credentials.api_secret,
              config.exchange.recv_window_ms, clock),
      limiter_(config.rate_limit, clock),
      retry_policy_(config.retry) {
  std::cout << "[BinanceGateway] created. base=" << base_url_
            << " key=" << masked_key_ << " timeout=" << timeout_ms_ << "ms\n";
}

bool BinanceFuturesGateway::credentialsRejected() const {
  return credentials_rejected_.load();
}

// -----------------------------------------------------------------------------
// fetch(): latch check, time sync, then the retry loop
// -----------------------------------------------------------------------------
RawPayload BinanceFuturesGateway::fetch(const Endpoint& endpoint,
                                        const QueryParams& params) {
  if (credentials_rejected_.load()) {
    throw AuthError("credentials for " + masked_key_ +
                    " were rejected; reconfigure credentials");
  }

  if (endpoint.signed_request) {
    ensureServerTime();
  }

  std::map<ErrorKind, int> retries;
  while (true) {
    try {
      waitForBudget(endpoint);
      return sendOnce(endpoint, params);
    } catch (const AuthError& e) {
      latchCredentials(e.what());
      throw;
    } catch (const ExchangeError& e) {
      if (const auto* rate_limited = dynamic_cast<const RateLimitError*>(&e)) {
        limiter_.blockFor(endpoint.name, rate_limited->retry_after_ms());
      }

      int& kind_retries = retries[e.kind()];
      RetryDecision decision = retry_policy_.decide(e, kind_retries);
      if (!decision.retry) {
        std::cerr << "[BinanceGateway] " << endpoint.name << " failed ("
                  << errorKindToString(e.kind()) << ", " << kind_retries
                  << " retries): " << e.what() << "\n";
        throw;
      }

      ++kind_retries;
      std::cerr << "[BinanceGateway] " << endpoint.name << " "
                << errorKindToString(e.kind()) << " error, retry "
                << kind_retries << " in " << decision.delay_ms
                << "ms: " << e.what() << "\n";
      clock_.sleep_for_ms(decision.delay_ms);
    }
  }
}

// -----------------------------------------------------------------------------
// syncServerTime(): offset = serverTime - midpoint of the round trip
// -----------------------------------------------------------------------------
void BinanceFuturesGateway::syncServerTime() {
  const Endpoint& endpoint = endpoints::serverTime();
  waitForBudget(endpoint);

  const std::int64_t sent_at = clock_.now_ms();
  RawPayload payload = sendOnce(endpoint, {});
  const std::int64_t received_at = clock_.now_ms();

  const std::int64_t server_time = payload::parseServerTime(payload);
  const std::int64_t offset = server_time - (sent_at + received_at) / 2;
  signer_.setServerOffsetMs(offset);

  std::cout << "[BinanceGateway] server time offset " << offset << "ms\n";
}

// -----------------------------------------------------------------------------
// ensureServerTime(): lazily sync once
// -----------------------------------------------------------------------------
// A failed sync is logged and retried on the next signed call; the request
// itself still goes out with offset 0. If our clock really is off, the
// exchange answers -1021 and that surfaces as AuthError.
//
// One thread syncs at a time. Other signed calls made meanwhile do not wait
// for it and sign with the current offset.
// -----------------------------------------------------------------------------
void BinanceFuturesGateway::ensureServerTime() {
  if (!sync_server_time_) {
    return;
  }
  {
    std::lock_guard lock(time_sync_mutex_);
    if (time_synced_ || time_sync_running_) {
      return;
    }
    time_sync_running_ = true;
  }

  bool synced = false;
  try {
    syncServerTime();
    synced = true;
  } catch (const ExchangeError& e) {
    std::cerr << "[BinanceGateway] server time sync failed ("
              << errorKindToString(e.kind()) << "): " << e.what() << "\n";
  }

  std::lock_guard lock(time_sync_mutex_);
  time_sync_running_ = false;
  time_synced_ = synced;
}

// -----------------------------------------------------------------------------
// waitForBudget(): sleep until the limiter admits the request
// -----------------------------------------------------------------------------
void BinanceFuturesGateway::waitForBudget(const Endpoint& endpoint) {
  while (true) {
    std::int64_t delay = limiter_.tryAcquire(endpoint.name, endpoint.weight);
    if (delay <= 0) {
      return;
    }
    if (delay > max_budget_wait_ms_) {
      throw RateLimitError(endpoint.name + ": request weight budget exhausted",
                           delay);
    }
    std::cout << "[BinanceGateway] " << endpoint.name << " waiting " << delay
              << "ms for rate-limit budget\n";
    clock_.sleep_for_ms(delay);
  }
}

// -----------------------------------------------------------------------------
// sendOnce(): sign, send, classify. No retries here.
// -----------------------------------------------------------------------------
RawPayload BinanceFuturesGateway::sendOnce(const Endpoint& endpoint,
                                           const QueryParams& params) {
  std::string query = endpoint.signed_request ? signer_.sign(params)
                                              : build_query_string(params);

  HttpRequest request;
  request.url = base_url_ + endpoint.path;
  if (!query.empty()) {
    request.url += "?" + query;
  }
  if (endpoint.signed_request) {
    request.headers.emplace_back("X-MBX-APIKEY", api_key_);
  }
  request.timeout_ms = timeout_ms_;

  HttpResponse response = transport_->get(request);
  return classify(endpoint, response);
}

// -----------------------------------------------------------------------------
// classify(): HTTP status + exchange error code → payload or ExchangeError
// -----------------------------------------------------------------------------
RawPayload BinanceFuturesGateway::classify(const Endpoint& endpoint,
                                           const HttpResponse& response) {
  // allow_exceptions = false: a non-JSON body becomes a discarded value
  // instead of throwing, so error pages from proxies can still be classified
  // by status code.
  RawPayload body = RawPayload::parse(response.body, nullptr, false);
  const bool is_json = !body.is_discarded();

  int code = 0;
  std::string msg;
  if (is_json && body.is_object()) {
    auto code_it = body.find("code");
    if (code_it != body.end() && code_it->is_number_integer()) {
      code = code_it->get<int>();
    }
    auto msg_it = body.find("msg");
    if (msg_it != body.end() && msg_it->is_string()) {
      msg = msg_it->get<std::string>();
    }
  }

  const long status = response.status;
  if (status >= 200 && status < 300 && code >= 0) {
    if (!is_json) {
      throw ProtocolError(endpoint.name + ": response body is not JSON");
    }
    return body;
  }

  const std::string what = describeFailure(endpoint, status, code, msg);

  if (status == 429 || status == 418 || code == kCodeTooManyRequests) {
    throw RateLimitError(what, retryAfterMs(response));
  }
  if (status == 401 || isAuthCode(code)) {
    if (code == kCodeTimestampOutsideRecvWindow) {
      throw AuthError(what + "; local clock is outside the recvWindow");
    }
    throw AuthError(what);
  }
  if (status == 408 || status >= 500 || code == kCodeDisconnected ||
      code == kCodeTimeout) {
    throw TransientError(what);
  }
  throw ProtocolError(what);
}

std::int64_t BinanceFuturesGateway::retryAfterMs(
    const HttpResponse& response) const {
  if (const std::string* value = response.header("retry-after")) {
    char* end = nullptr;
    long long seconds = std::strtoll(value->c_str(), &end, 10);
    if (end != value->c_str() && seconds >= 0) {
      return seconds * 1000;
    }
  }
  return default_retry_after_ms_;
}

void BinanceFuturesGateway::latchCredentials(const std::string& reason) {
  if (!credentials_rejected_.exchange(true)) {
    std::cerr << "[BinanceGateway] credentials " << masked_key_
              << " rejected, further calls disabled: " << reason << "\n";
  }
}

}  // namespace futmon
