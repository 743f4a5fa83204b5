// =============================================================================
// binance_gateway_test.cpp
// =============================================================================
// Unit tests for futmon::BinanceFuturesGateway over a scripted transport.
//
// Validates:
//   - Signed requests carry X-MBX-APIKEY and a signature
//   - 429 + Retry-After: waits the hinted time, then succeeds
//   - 401 / -2015 → AuthError, and the gateway stops calling out afterwards
//   - -1021 (timestamp outside recvWindow) → AuthError
//   - 5xx → Transient, retried with 500/1000/2000 ms backoff, then rethrown
//   - Retry budgets are per error kind: a 503 does not use up the 429 retry
//   - Non-JSON 200 body → ProtocolError, not retried
//   - Server time sync sets the signer offset
//   - Signed calls on other threads do not wait for a slow time sync
//
// Time is simulated: every retry sleep advances the clock instead of
// blocking, so the backoff schedule is asserted exactly.
// =============================================================================

#include "futmon/gateway/binance_futures_gateway.hpp"
#include "futmon/time/simulation_time_provider.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

bool waitUntil(const std::function<bool()>& condition) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (!condition()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

// Holds /fapi/v1/time until release(); every other path answers "[]".
class GatedTimeTransport final : public futmon::IHttpTransport {
 public:
  explicit GatedTimeTransport(std::int64_t server_time)
      : server_time_(server_time), gate_(release_.get_future().share()) {}

  futmon::HttpResponse get(const futmon::HttpRequest& request) override {
    const bool is_time =
        request.url.find("/fapi/v1/time") != std::string::npos;
    {
      std::lock_guard lock(mutex_);
      urls_.push_back(request.url);
    }

    futmon::HttpResponse response;
    response.status = 200;
    if (is_time) {
      gate_.wait();
      response.body =
          R"({"serverTime":)" + std::to_string(server_time_) + "}";
    } else {
      response.body = "[]";
    }
    return response;
  }

  void release() { release_.set_value(); }

  std::vector<std::string> urls() const {
    std::lock_guard lock(mutex_);
    return urls_;
  }

 private:
  const std::int64_t server_time_;
  std::promise<void> release_;
  std::shared_future<void> gate_;
  mutable std::mutex mutex_;
  std::vector<std::string> urls_;
};

}  // namespace

class BinanceGatewayTest : public ::testing::Test {
 protected:
  static constexpr std::int64_t kStart = 1'700'000'000'000;

  futmon::SimulationTimeProvider clock{kStart};
  std::shared_ptr<futmon_test::FakeHttpTransport> transport =
      std::make_shared<futmon_test::FakeHttpTransport>();
  futmon::MonitorConfig config = futmon_test::testConfig();

  std::unique_ptr<futmon::BinanceFuturesGateway> makeGateway() {
    return std::make_unique<futmon::BinanceFuturesGateway>(config, transport,
                                                           clock);
  }

  static std::string headerValue(const futmon::HttpRequest& request,
                                 const std::string& name) {
    for (const auto& [k, v] : request.headers) {
      if (k == name) {
        return v;
      }
    }
    return "";
  }
};

// -----------------------------------------------------------------------------
// 1. Request shape
// -----------------------------------------------------------------------------
TEST_F(BinanceGatewayTest, SignedRequestCarriesKeyAndSignature) {
  auto gateway = makeGateway();
  transport->enqueue(200, R"({"totalWalletBalance":"1"})");

  auto payload = gateway->fetch(futmon::endpoints::account(), {});

  EXPECT_EQ(payload["totalWalletBalance"], "1");
  auto requests = transport->requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].url.rfind(
                "https://fapi.binance.com/fapi/v2/account?recvWindow=5000&"
                "timestamp=",
                0),
            0u);
  EXPECT_NE(requests[0].url.find("&signature="), std::string::npos);
  EXPECT_EQ(headerValue(requests[0], "X-MBX-APIKEY"),
            config.exchange.credentials.api_key);
  EXPECT_EQ(requests[0].timeout_ms, 30'000);
}

TEST_F(BinanceGatewayTest, TestnetUsesTestnetBaseUrl) {
  config.exchange.use_testnet = true;
  auto gateway = makeGateway();
  transport->enqueue(200, "[]");

  gateway->fetch(futmon::endpoints::positionRisk(), {});

  EXPECT_EQ(transport->requests()[0].url.rfind(
                "https://testnet.binancefuture.com/fapi/v2/positionRisk?", 0),
            0u);
}

TEST_F(BinanceGatewayTest, QueryParamsPrecedeSignature) {
  auto gateway = makeGateway();
  transport->enqueue(200, "[]");

  gateway->fetch(futmon::endpoints::userTrades(),
                 {{"symbol", "BTCUSDT"}, {"limit", "500"}});

  const std::string url = transport->requests()[0].url;
  EXPECT_NE(url.find("?symbol=BTCUSDT&limit=500&recvWindow="),
            std::string::npos);
}

// -----------------------------------------------------------------------------
// 2. RateLimit: 429 with Retry-After, then success
// -----------------------------------------------------------------------------
TEST_F(BinanceGatewayTest, RateLimitedThenSucceeds) {
  auto gateway = makeGateway();
  transport->enqueue(429, R"({"code":-1003,"msg":"Too many requests"})",
                     {{"retry-after", "2"}});
  transport->enqueue(200, "[]");

  auto payload = gateway->fetch(futmon::endpoints::positionRisk(), {});

  EXPECT_TRUE(payload.is_array());
  EXPECT_EQ(transport->requests().size(), 2u);
  EXPECT_GE(clock.now_ms() - kStart, 2'000);
}

TEST_F(BinanceGatewayTest, RateLimitHintTooLongIsRethrown) {
  auto gateway = makeGateway();
  transport->enqueue(418, R"({"code":-1003,"msg":"IP banned"})",
                     {{"retry-after", "120"}});

  try {
    gateway->fetch(futmon::endpoints::account(), {});
    FAIL() << "expected RateLimitError";
  } catch (const futmon::RateLimitError& e) {
    EXPECT_EQ(e.retry_after_ms(), 120'000);
  }
  EXPECT_EQ(transport->requests().size(), 1u);
  EXPECT_EQ(clock.now_ms(), kStart);
}

TEST_F(BinanceGatewayTest, SecondRateLimitIsRethrown) {
  auto gateway = makeGateway();
  transport->enqueue(429, "{}", {{"retry-after", "1"}});
  transport->enqueue(429, "{}", {{"retry-after", "1"}});

  EXPECT_THROW(gateway->fetch(futmon::endpoints::account(), {}),
               futmon::RateLimitError);
  EXPECT_EQ(transport->requests().size(), 2u);
}

// -----------------------------------------------------------------------------
// 3. Auth: latched, never retried
// Why: Retrying a revoked key only burns weight and may get the IP banned.
// -----------------------------------------------------------------------------
TEST_F(BinanceGatewayTest, AuthFailureLatches) {
  auto gateway = makeGateway();
  transport->enqueue(401,
                     R"({"code":-2015,"msg":"Invalid API-key, IP, or perms"})");

  EXPECT_THROW(gateway->fetch(futmon::endpoints::account(), {}),
               futmon::AuthError);
  EXPECT_TRUE(gateway->credentialsRejected());

  EXPECT_THROW(gateway->fetch(futmon::endpoints::positionRisk(), {}),
               futmon::AuthError);
  EXPECT_EQ(transport->requests().size(), 1u);
}

TEST_F(BinanceGatewayTest, TimestampOutsideRecvWindowIsAuth) {
  auto gateway = makeGateway();
  transport->enqueue(400, R"({"code":-1021,"msg":"Timestamp outside"})");

  try {
    gateway->fetch(futmon::endpoints::account(), {});
    FAIL() << "expected AuthError";
  } catch (const futmon::AuthError& e) {
    EXPECT_NE(std::string(e.what()).find("recvWindow"), std::string::npos);
  }
}

// -----------------------------------------------------------------------------
// 4. Transient: bounded retries with backoff
// -----------------------------------------------------------------------------
TEST_F(BinanceGatewayTest, ServerErrorsRetriedThenRethrown) {
  auto gateway = makeGateway();
  for (int i = 0; i < 4; ++i) {
    transport->enqueue(503, "<html>Service Unavailable</html>");
  }

  EXPECT_THROW(gateway->fetch(futmon::endpoints::account(), {}),
               futmon::TransientError);
  EXPECT_EQ(transport->requests().size(), 4u);
  EXPECT_EQ(clock.now_ms() - kStart, 500 + 1000 + 2000);
  EXPECT_FALSE(gateway->credentialsRejected());
}

TEST_F(BinanceGatewayTest, TransientThenSuccess) {
  auto gateway = makeGateway();
  transport->enqueue(502, "");
  transport->enqueue(200, "[]");

  EXPECT_NO_THROW(gateway->fetch(futmon::endpoints::income(), {}));
  EXPECT_EQ(clock.now_ms() - kStart, 500);
}

TEST_F(BinanceGatewayTest, TransientRetryDoesNotSpendRateLimitRetry) {
  auto gateway = makeGateway();
  transport->enqueue(503, "");
  transport->enqueue(429, "{}", {{"retry-after", "1"}});
  transport->enqueue(200, "[]");

  auto payload = gateway->fetch(futmon::endpoints::positionRisk(), {});

  EXPECT_TRUE(payload.is_array());
  EXPECT_EQ(transport->requests().size(), 3u);
  EXPECT_GE(clock.now_ms() - kStart, 500 + 1'000);
}

TEST_F(BinanceGatewayTest, RetryCeilingIsConfigurable) {
  config.retry.max_transient_retries = 1;
  auto gateway = makeGateway();
  transport->enqueue(500, "");
  transport->enqueue(500, "");
  transport->enqueue(200, "[]");

  EXPECT_THROW(gateway->fetch(futmon::endpoints::account(), {}),
               futmon::TransientError);
  EXPECT_EQ(transport->pending(), 1u);
}

// -----------------------------------------------------------------------------
// 5. Protocol
// -----------------------------------------------------------------------------
TEST_F(BinanceGatewayTest, MalformedBodyIsProtocolError) {
  auto gateway = makeGateway();
  transport->enqueue(200, "{not json");
  transport->enqueue(200, "[]");

  EXPECT_THROW(gateway->fetch(futmon::endpoints::account(), {}),
               futmon::ProtocolError);
  EXPECT_EQ(transport->requests().size(), 1u);
}

TEST_F(BinanceGatewayTest, UnknownClientErrorIsProtocolError) {
  auto gateway = makeGateway();
  transport->enqueue(400, R"({"code":-1102,"msg":"Mandatory parameter"})");

  EXPECT_THROW(gateway->fetch(futmon::endpoints::userTrades(), {}),
               futmon::ProtocolError);
}

// -----------------------------------------------------------------------------
// 6. Server time sync
// -----------------------------------------------------------------------------
TEST_F(BinanceGatewayTest, ServerTimeSyncRunsBeforeFirstSignedCall) {
  config.exchange.sync_server_time = true;
  auto gateway = makeGateway();
  transport->enqueue(200, R"({"serverTime":1700000003000})");
  transport->enqueue(200, "[]");
  transport->enqueue(200, "[]");

  gateway->fetch(futmon::endpoints::positionRisk(), {});
  gateway->fetch(futmon::endpoints::positionRisk(), {});

  auto requests = transport->requests();
  ASSERT_EQ(requests.size(), 3u);
  EXPECT_NE(requests[0].url.find("/fapi/v1/time"), std::string::npos);
  EXPECT_EQ(headerValue(requests[0], "X-MBX-APIKEY"), "");
  EXPECT_NE(requests[1].url.find("timestamp=1700000003000"),
            std::string::npos);
}

TEST_F(BinanceGatewayTest, SlowTimeSyncDoesNotBlockOtherSignedCalls) {
  config.exchange.sync_server_time = true;
  auto gated = std::make_shared<GatedTimeTransport>(kStart + 3'000);
  auto gateway =
      std::make_unique<futmon::BinanceFuturesGateway>(config, gated, clock);

  auto first = std::async(std::launch::async, [&gateway] {
    return gateway->fetch(futmon::endpoints::positionRisk(), {});
  });
  ASSERT_TRUE(waitUntil([&gated] { return gated->urls().size() == 1u; }));

  auto second = std::async(std::launch::async, [&gateway] {
    return gateway->fetch(futmon::endpoints::account(), {});
  });
  ASSERT_EQ(second.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  EXPECT_NO_THROW(second.get());
  EXPECT_EQ(first.wait_for(std::chrono::milliseconds(0)),
            std::future_status::timeout);

  gated->release();
  ASSERT_EQ(first.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  EXPECT_NO_THROW(first.get());

  auto urls = gated->urls();
  ASSERT_EQ(urls.size(), 3u);
  EXPECT_NE(urls[0].find("/fapi/v1/time"), std::string::npos);
  EXPECT_NE(urls[1].find("/fapi/v2/account"), std::string::npos);
  EXPECT_NE(urls[2].find("timestamp=1700000003000"), std::string::npos);
}
