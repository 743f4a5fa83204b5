#pragma once

#include "futmon/gateway/endpoint.hpp"
#include "futmon/time/i_time_provider.hpp"

#include <cstdint>
#include <mutex>
#include <string>

namespace futmon {

// -----------------------------------------------------------------------------
// hmac_sha256_hex
// -----------------------------------------------------------------------------
// @brief  Lower-case hex HMAC-SHA256 of message keyed with key (OpenSSL).
// -----------------------------------------------------------------------------
std::string hmac_sha256_hex(const std::string& key, const std::string& message);

// -----------------------------------------------------------------------------
// url_encode
// -----------------------------------------------------------------------------
// @brief  Percent-encodes everything except RFC 3986 unreserved characters.
// -----------------------------------------------------------------------------
std::string url_encode(const std::string& value);

// -----------------------------------------------------------------------------
// build_query_string
// -----------------------------------------------------------------------------
// @brief  "k1=v1&k2=v2" in parameter order with values url-encoded.
// -----------------------------------------------------------------------------
std::string build_query_string(const QueryParams& params);

// -----------------------------------------------------------------------------
// RequestSigner: signs account-API query strings
// -----------------------------------------------------------------------------
//
// @brief  Appends timestamp, recvWindow and signature to a query.
//
// @details
// Signature = hex(HMAC_SHA256(secret, query-including-timestamp-and-
// recvWindow)), added as the final `signature` parameter.
//
// The timestamp doubles as the anti-replay nonce, so it is strictly
// increasing per signer: max(now + server offset, last + 1). Two requests
// signed within the same millisecond still get distinct timestamps.
//
// The server offset is set by the gateway after a /fapi/v1/time round trip.
// A clock that drifts beyond recvWindow regardless is rejected by the
// exchange with -1021, which the gateway reports as AuthError.
//
// Thread model:
//   sign() is safe to call from multiple threads; the nonce is guarded by
//   a mutex.
//
// Ownership:
//   Owns a copy of the secret. The secret never leaves this class except
//   as HMAC output.
// -----------------------------------------------------------------------------
class RequestSigner {
 public:
  RequestSigner(std::string api_secret, std::int64_t recv_window_ms,
                const ITimeProvider& clock);

  RequestSigner(const RequestSigner&) = delete;
  RequestSigner& operator=(const RequestSigner&) = delete;

  // Returns the full signed query string for params.
  std::string sign(const QueryParams& params);

  void setServerOffsetMs(std::int64_t offset_ms);
  std::int64_t serverOffsetMs() const;

  // Timestamp used by the most recent sign() call (0 before the first).
  std::int64_t lastTimestampMs() const;

 private:
  std::int64_t nextTimestamp();

  const std::string api_secret_;
  const std::int64_t recv_window_ms_;
  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  std::int64_t server_offset_ms_{0};
  std::int64_t last_timestamp_ms_{0};
};

}  // namespace futmon
