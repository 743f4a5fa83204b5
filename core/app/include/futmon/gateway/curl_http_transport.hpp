#pragma once

#include "futmon/gateway/i_http_transport.hpp"

namespace futmon {

// -----------------------------------------------------------------------------
// CurlHttpTransport: libcurl implementation of IHttpTransport
// -----------------------------------------------------------------------------
//
// @brief  Performs one easy-handle GET per call with TLS verification on and
//         CURLOPT_TIMEOUT_MS bounding the whole exchange.
//
// @details
// A fresh easy handle per request keeps get() reentrant without a handle
// pool; the monitor issues a handful of requests per minute.
// curl_global_init runs once, from the first constructed instance.
//
// Timeouts (CURLE_OPERATION_TIMEDOUT) and every other curl failure throw
// TransientError with curl's message.
// -----------------------------------------------------------------------------
class CurlHttpTransport final : public IHttpTransport {
 public:
  CurlHttpTransport();

  CurlHttpTransport(const CurlHttpTransport&) = delete;
  CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

  HttpResponse get(const HttpRequest& request) override;
};

}  // namespace futmon
