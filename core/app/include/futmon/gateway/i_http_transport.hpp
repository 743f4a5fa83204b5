#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace futmon {

struct HttpRequest {
  std::string url;  // Full URL including the query string
  std::vector<std::pair<std::string, std::string>> headers;
  long timeout_ms{30000};
};

struct HttpResponse {
  long status{0};
  std::string body;
  // Header names are lower-cased so lookups do not depend on the server's
  // capitalisation.
  std::map<std::string, std::string> headers;

  const std::string* header(const std::string& lower_name) const {
    auto it = headers.find(lower_name);
    return it == headers.end() ? nullptr : &it->second;
  }
};

// -----------------------------------------------------------------------------
// IHttpTransport: one blocking HTTPS GET
// -----------------------------------------------------------------------------
//
// @brief  Returns the response for any HTTP status; throws TransientError
//         only when no response was received at all (DNS, connect, TLS,
//         timeout).
//
// @details
// Status-code interpretation belongs to the gateway, not the transport, so a
// 429 or 500 is a normal return value here.
//
// Thread model:
//   get() must be safe to call from several threads at once.
// -----------------------------------------------------------------------------
class IHttpTransport {
 public:
  virtual ~IHttpTransport() = default;

  virtual HttpResponse get(const HttpRequest& request) = 0;
};

}  // namespace futmon
