#include "futmon/gateway/request_signer.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace futmon {

namespace {

std::string hex_encode(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(data[i]);
  }
  return oss.str();
}

bool is_unreserved(unsigned char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
         c == '~';
}

}  // namespace

// -----------------------------------------------------------------------------
// hmac_sha256_hex(): one-shot OpenSSL HMAC
// -----------------------------------------------------------------------------
std::string hmac_sha256_hex(const std::string& key, const std::string& message) {
  unsigned int out_len = 0;
  unsigned char out[EVP_MAX_MD_SIZE];
  HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
       reinterpret_cast<const unsigned char*>(message.data()), message.size(),
       out, &out_len);
  return hex_encode(out, out_len);
}

std::string url_encode(const std::string& value) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    if (is_unreserved(c)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

std::string build_query_string(const QueryParams& params) {
  std::string query;
  for (const auto& [key, value] : params) {
    if (!query.empty()) {
      query.push_back('&');
    }
    query += key;
    query.push_back('=');
    query += url_encode(value);
  }
  return query;
}

// -----------------------------------------------------------------------------
// RequestSigner
// -----------------------------------------------------------------------------
RequestSigner::RequestSigner(std::string api_secret,
                             std::int64_t recv_window_ms,
                             const ITimeProvider& clock)
    : api_secret_(std::move(api_secret)),
      recv_window_ms_(recv_window_ms),
      clock_(clock) {}

std::string RequestSigner::sign(const QueryParams& params) {
  QueryParams signed_params = params;
  signed_params.emplace_back("recvWindow", std::to_string(recv_window_ms_));
  signed_params.emplace_back("timestamp", std::to_string(nextTimestamp()));

  std::string query = build_query_string(signed_params);
  std::string signature = hmac_sha256_hex(api_secret_, query);
  return query + "&signature=" + signature;
}

// Strictly increasing even when the clock stands still (simulated time) or
// the offset is corrected backwards after a resync.
std::int64_t RequestSigner::nextTimestamp() {
  std::lock_guard lock(mutex_);
  std::int64_t candidate = clock_.now_ms() + server_offset_ms_;
  last_timestamp_ms_ = std::max(candidate, last_timestamp_ms_ + 1);
  return last_timestamp_ms_;
}

void RequestSigner::setServerOffsetMs(std::int64_t offset_ms) {
  std::lock_guard lock(mutex_);
  server_offset_ms_ = offset_ms;
}

std::int64_t RequestSigner::serverOffsetMs() const {
  std::lock_guard lock(mutex_);
  return server_offset_ms_;
}

std::int64_t RequestSigner::lastTimestampMs() const {
  std::lock_guard lock(mutex_);
  return last_timestamp_ms_;
}

}  // namespace futmon
