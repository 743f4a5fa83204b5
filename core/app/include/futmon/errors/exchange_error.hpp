#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace futmon {

// -----------------------------------------------------------------------------
// ErrorKind: failure taxonomy of the exchange boundary
// -----------------------------------------------------------------------------
//
//   Auth       Bad, expired or revoked credentials, or a signature the
//              exchange refuses (including clock skew beyond recvWindow).
//              Fatal to further calls until credentials are replaced.
//   RateLimit  HTTP 429/418 or the exchange's "too many requests" code.
//              Carries a retry-after hint.
//   Transient  Network failure, timeout, 5xx. Retried with backoff.
//   Protocol   Response shape we do not understand. Never retried.
// -----------------------------------------------------------------------------
enum class ErrorKind { Auth, RateLimit, Transient, Protocol };

const char* errorKindToString(ErrorKind kind);

// -----------------------------------------------------------------------------
// ExchangeError: base of the exception hierarchy thrown below the
// RefreshCoordinator
// -----------------------------------------------------------------------------
//
// @brief  std::runtime_error tagged with an ErrorKind.
//
// @details
// The gateway, the HTTP transport and the payload parser throw these. The
// RefreshCoordinator is the single place that catches them and converts
// them into FetchError values; nothing above it sees an exception.
// -----------------------------------------------------------------------------
class ExchangeError : public std::runtime_error {
 public:
  ExchangeError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

class AuthError final : public ExchangeError {
 public:
  explicit AuthError(const std::string& message)
      : ExchangeError(ErrorKind::Auth, message) {}
};

class RateLimitError final : public ExchangeError {
 public:
  RateLimitError(const std::string& message, std::int64_t retry_after_ms)
      : ExchangeError(ErrorKind::RateLimit, message),
        retry_after_ms_(retry_after_ms) {}

  // Minimum back-off the exchange asked for before the same endpoint may be
  // called again.
  std::int64_t retry_after_ms() const noexcept { return retry_after_ms_; }

 private:
  std::int64_t retry_after_ms_;
};

class TransientError final : public ExchangeError {
 public:
  explicit TransientError(const std::string& message)
      : ExchangeError(ErrorKind::Transient, message) {}
};

class ProtocolError final : public ExchangeError {
 public:
  explicit ProtocolError(const std::string& message)
      : ExchangeError(ErrorKind::Protocol, message) {}
};

}  // namespace futmon
