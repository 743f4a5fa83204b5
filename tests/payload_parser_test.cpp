// =============================================================================
// payload_parser_test.cpp
// =============================================================================
// Unit tests for the futmon::payload parsers.
//
// Validates:
//   - String decimals and plain numbers are both accepted
//   - Zero-size position rows are dropped
//   - One-way ("BOTH") vs hedge-mode sides
//   - Missing fields and wrong top-level shapes raise ProtocolError
//   - Income tradeId "" is tolerated, unknown income types map to Other
// =============================================================================

#include "futmon/gateway/payload_parser.hpp"
#include "futmon/errors/exchange_error.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

using futmon::ProtocolError;
using futmon::domain::IncomeType;
using futmon::domain::MarginMode;
using futmon::domain::PositionSide;
using futmon::domain::TradeSide;
using nlohmann::json;

namespace payload = futmon::payload;

class PayloadParserTest : public ::testing::Test {};

// -----------------------------------------------------------------------------
// 1. Account snapshot
// -----------------------------------------------------------------------------
TEST_F(PayloadParserTest, ParsesAccountSnapshot) {
  json body = futmon_test::accountPayload(1000.0, 50.0, 21.0);
  body["assets"] = json::array({{{"asset", "USDT"},
                                 {"walletBalance", "1000.0"},
                                 {"unrealizedProfit", "50.0"}}});

  auto snapshot = payload::parseAccountSnapshot(body, 42);

  EXPECT_DOUBLE_EQ(snapshot.wallet_balance, 1000.0);
  EXPECT_DOUBLE_EQ(snapshot.unrealized_pnl, 50.0);
  EXPECT_DOUBLE_EQ(snapshot.margin_balance, 1050.0);
  EXPECT_DOUBLE_EQ(snapshot.maint_margin, 21.0);
  EXPECT_DOUBLE_EQ(snapshot.margin_ratio, 0.02);
  EXPECT_EQ(snapshot.as_of_ms, 42);  // updateTime 0 → fetch time
  ASSERT_EQ(snapshot.assets.size(), 1u);
  EXPECT_EQ(snapshot.assets[0].asset, "USDT");
}

TEST_F(PayloadParserTest, AcceptsNumericDecimals) {
  json body = futmon_test::accountPayload(0, 0, 0);
  body["totalWalletBalance"] = 12.5;
  body["updateTime"] = 99;

  auto snapshot = payload::parseAccountSnapshot(body, 42);

  EXPECT_DOUBLE_EQ(snapshot.wallet_balance, 12.5);
  EXPECT_EQ(snapshot.as_of_ms, 99);
}

TEST_F(PayloadParserTest, AccountMissingFieldIsProtocolError) {
  json body = futmon_test::accountPayload(1000.0, 0, 0);
  body.erase("totalWalletBalance");
  EXPECT_THROW(payload::parseAccountSnapshot(body, 0), ProtocolError);
}

TEST_F(PayloadParserTest, AccountNonDecimalIsProtocolError) {
  json body = futmon_test::accountPayload(1000.0, 0, 0);
  body["availableBalance"] = "12abc";
  EXPECT_THROW(payload::parseAccountSnapshot(body, 0), ProtocolError);
}

TEST_F(PayloadParserTest, AccountArrayIsProtocolError) {
  EXPECT_THROW(payload::parseAccountSnapshot(json::array(), 0), ProtocolError);
}

// -----------------------------------------------------------------------------
// 2. Positions
// -----------------------------------------------------------------------------
TEST_F(PayloadParserTest, DropsZeroSizePositions) {
  json body = json::array({futmon_test::positionRow("BTCUSDT", 0.1, 30000,
                                                    30500, 50, 10),
                           futmon_test::positionRow("ETHUSDT", 0, 0, 2000, 0,
                                                    20)});

  auto positions = payload::parsePositions(body);

  ASSERT_EQ(positions.size(), 1u);
  EXPECT_EQ(positions[0].symbol, "BTCUSDT");
  EXPECT_EQ(positions[0].side, PositionSide::Long);
  EXPECT_FALSE(positions[0].hedge_mode);
  EXPECT_DOUBLE_EQ(positions[0].leverage, 10.0);
  EXPECT_EQ(positions[0].margin_mode, MarginMode::Cross);
}

TEST_F(PayloadParserTest, OneWayNegativeAmountIsShort) {
  json body = json::array(
      {futmon_test::positionRow("ETHUSDT", -2.0, 2000, 1990, 20, 5)});

  auto positions = payload::parsePositions(body);

  ASSERT_EQ(positions.size(), 1u);
  EXPECT_EQ(positions[0].side, PositionSide::Short);
  EXPECT_DOUBLE_EQ(positions[0].amount, -2.0);
}

TEST_F(PayloadParserTest, HedgeModeKeepsBothSides) {
  json body = json::array(
      {futmon_test::positionRow("BTCUSDT", 0.1, 30000, 30000, 0, 10, "LONG"),
       futmon_test::positionRow("BTCUSDT", -0.2, 30000, 30000, 0, 10,
                                "SHORT")});
  body[1]["marginType"] = "isolated";

  auto positions = payload::parsePositions(body);

  ASSERT_EQ(positions.size(), 2u);
  EXPECT_EQ(positions[0].side, PositionSide::Long);
  EXPECT_EQ(positions[1].side, PositionSide::Short);
  EXPECT_TRUE(positions[1].hedge_mode);
  EXPECT_EQ(positions[1].margin_mode, MarginMode::Isolated);
}

TEST_F(PayloadParserTest, UnknownPositionSideIsProtocolError) {
  json body = json::array(
      {futmon_test::positionRow("BTCUSDT", 0.1, 1, 1, 0, 10, "SIDEWAYS")});
  EXPECT_THROW(payload::parsePositions(body), ProtocolError);
}

TEST_F(PayloadParserTest, PositionsObjectIsProtocolError) {
  EXPECT_THROW(payload::parsePositions(json::object()), ProtocolError);
}

// -----------------------------------------------------------------------------
// 3. Trades
// -----------------------------------------------------------------------------
TEST_F(PayloadParserTest, ParsesTrades) {
  json body = json::array(
      {futmon_test::tradeRow(7, "BTCUSDT", false, 30000, 0.01, 1.25, 1000)});

  auto trades = payload::parseTrades(body);

  ASSERT_EQ(trades.size(), 1u);
  EXPECT_EQ(trades[0].id, 7);
  EXPECT_EQ(trades[0].order_id, 70);
  EXPECT_EQ(trades[0].side, TradeSide::Sell);
  EXPECT_DOUBLE_EQ(trades[0].quote_quantity, 300.0);
  EXPECT_DOUBLE_EQ(trades[0].realized_pnl, 1.25);
  EXPECT_DOUBLE_EQ(trades[0].commission, 0.01);
  EXPECT_EQ(trades[0].time_ms, 1000);
}

TEST_F(PayloadParserTest, TradeWithoutIdIsProtocolError) {
  json row = futmon_test::tradeRow(7, "BTCUSDT", true, 1, 1, 0, 1);
  row.erase("id");
  EXPECT_THROW(payload::parseTrades(json::array({row})), ProtocolError);
}

// -----------------------------------------------------------------------------
// 4. Income
// -----------------------------------------------------------------------------
TEST_F(PayloadParserTest, ParsesIncomeAndMapsTypes) {
  json body = json::array({futmon_test::incomeRow(1, "FUNDING_FEE", -0.5, 10),
                           futmon_test::incomeRow(2, "SOMETHING_NEW", 1, 20)});
  body[0]["tradeId"] = "12345";

  auto records = payload::parseIncome(body);

  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].type, IncomeType::FundingFee);
  EXPECT_EQ(records[0].trade_id, 12345);
  EXPECT_DOUBLE_EQ(records[0].amount, -0.5);
  EXPECT_EQ(records[1].type, IncomeType::Other);
  EXPECT_EQ(records[1].raw_type, "SOMETHING_NEW");
  EXPECT_EQ(records[1].trade_id, 0);
}

TEST_F(PayloadParserTest, ParsesServerTime) {
  EXPECT_EQ(payload::parseServerTime(json{{"serverTime", 1499827319559LL}}),
            1499827319559LL);
  EXPECT_THROW(payload::parseServerTime(json{{"time", 1}}), ProtocolError);
}
