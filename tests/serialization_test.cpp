// =============================================================================
// serialization_test.cpp
// =============================================================================
// Unit tests for the JSON rendering used by adapters and the demo report.
//
// Validates:
//   - Value types render as {value, asset} / {value, pair, base, quote}
//   - Orders and positions render their grouped blocks
//   - Absent optionals render as null, timestamps as ISO-8601 UTC
//   - DomainError renders as {type, message, details}
// =============================================================================

#include "tradekernel/book/order_book_snapshot.hpp"
#include "tradekernel/domain/errors.hpp"
#include "tradekernel/domain/order.hpp"
#include "tradekernel/domain/position.hpp"
#include "tradekernel/serialization/json.hpp"
#include "tradekernel/time/simulation_time_provider.hpp"
#include "tradekernel/time/time_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>

using namespace tradekernel;
using namespace tradekernel::domain;
using nlohmann::json;

class SerializationTest : public ::testing::Test {
 protected:
  SimulationTimeProvider clock{1704067200000};
  Asset btc = Asset::crypto("BTC");
  Asset usdt = Asset::stablecoin("USDT");
  TradingPair pair = TradingPair::from(btc, usdt);

  Price px(double value) const { return Price::from(value, pair); }
  Amount base(double value) const { return Amount::from(value, btc); }
  Amount quote(double value) const { return Amount::from(value, usdt); }

  Position longPosition() {
    return Position::open(
        PositionOpenParams{PositionId::from("pos-1"), pair, PositionSide::Long,
                           px(50000), px(48000), px(56000), base(2),
                           OrderId::from("ord-1"), "agent-1", std::nullopt,
                           PositionProfile::Extended},
        clock);
  }
};

// -----------------------------------------------------------------------------
// 1. Value types
// -----------------------------------------------------------------------------
TEST_F(SerializationTest, ValueTypes) {
  const json amount = quote(12.5);
  EXPECT_DOUBLE_EQ(amount["value"].get<double>(), 12.5);
  EXPECT_EQ(amount["asset"], "USDT");

  const json price = px(50000);
  EXPECT_DOUBLE_EQ(price["value"].get<double>(), 50000.0);
  EXPECT_EQ(price["pair"], "BTC/USDT");
  EXPECT_EQ(price["base"], "BTC");
  EXPECT_EQ(price["quote"], "USDT");

  const json asset = usdt;
  EXPECT_EQ(asset["type"], "STABLECOIN");
}

// -----------------------------------------------------------------------------
// 2. A pending order has null execution fields.
// -----------------------------------------------------------------------------
TEST_F(SerializationTest, PendingOrder) {
  const Order order = Order::create(
      OrderId::from("ord-1"), OrderParameters::marketBuy(pair, base(1)),
      clock);
  const json j = order;

  EXPECT_EQ(j["id"], "ord-1");
  EXPECT_EQ(j["status"], "PENDING");
  EXPECT_TRUE(j["exchangeOrderId"].is_null());
  EXPECT_TRUE(j["averageFillPrice"].is_null());
  EXPECT_TRUE(j["rejectionReason"].is_null());
  EXPECT_TRUE(j["fills"].empty());
  EXPECT_EQ(j["parameters"]["side"], "BUY");
  EXPECT_EQ(j["parameters"]["type"], "MARKET");
  EXPECT_TRUE(j["parameters"]["stopPrice"].is_null());
  EXPECT_EQ(j["timestamps"]["createdAt"], "2024-01-01T00:00:00.000Z");
  EXPECT_TRUE(j["timestamps"]["submittedAt"].is_null());
}

TEST_F(SerializationTest, FilledOrder) {
  Order order = Order::create(
      OrderId::from("ord-1"), OrderParameters::marketBuy(pair, base(1)),
      clock);
  order.submit(ExchangeOrderId::from("EX-1"));
  clock.advance_by(1500);
  order.addFill(Fill::from({pair, ExchangeOrderId::from("EX-1"), base(1),
                            px(50100), quote(50.1),
                            ms_to_timestamp(clock.now_ms()), "T-1"}));
  const json j = order;

  EXPECT_EQ(j["status"], "FILLED");
  EXPECT_EQ(j["exchangeOrderId"], "EX-1");
  ASSERT_EQ(j["fills"].size(), 1u);
  EXPECT_EQ(j["fills"][0]["tradeId"], "T-1");
  EXPECT_EQ(j["fills"][0]["timestamp"], "2024-01-01T00:00:01.500Z");
  EXPECT_DOUBLE_EQ(j["averageFillPrice"]["value"].get<double>(), 50100.0);
  EXPECT_DOUBLE_EQ(j["remainingQuantity"]["value"].get<double>(), 0.0);
  ASSERT_EQ(j["totalFees"].size(), 1u);
  EXPECT_EQ(j["totalFees"][0]["asset"], "USDT");
  EXPECT_DOUBLE_EQ(j["feesInQuote"]["value"].get<double>(), 50.1);
  EXPECT_EQ(j["timestamps"]["completedAt"], "2024-01-01T00:00:01.500Z");
}

// -----------------------------------------------------------------------------
// 3. Position blocks before and after the round trip.
// -----------------------------------------------------------------------------
TEST_F(SerializationTest, OpeningPosition) {
  const json j = longPosition();

  EXPECT_EQ(j["status"], "OPENING");
  EXPECT_EQ(j["side"], "LONG");
  EXPECT_EQ(j["profile"], "extended");
  EXPECT_DOUBLE_EQ(j["intended"]["stopLoss"]["value"].get<double>(), 48000.0);
  EXPECT_TRUE(j["actual"]["entryPrice"].is_null());
  EXPECT_TRUE(j["pnl"]["realized"].is_null());
  EXPECT_TRUE(j["pnl"]["roi"].is_null());
  EXPECT_EQ(j["orders"]["entry"], "ord-1");
  EXPECT_TRUE(j["orders"]["exit"].is_null());
  EXPECT_TRUE(j["timestamps"]["durationMs"].is_null());
  EXPECT_TRUE(j["metadata"]["strategyId"].is_null());
  EXPECT_TRUE(j["metadata"]["tags"].empty());
}

TEST_F(SerializationTest, ClosedPosition) {
  Position position = longPosition();
  position.markAsOpened(px(50000), base(2), quote(4));
  position.updateMetadata({{"session", "london"}});
  clock.advance_by(60000);
  position.markAsClosed(px(55000), PositionExitReason::TakeProfit, quote(6));
  const json j = position;

  EXPECT_EQ(j["status"], "CLOSED");
  EXPECT_EQ(j["actual"]["exitReason"], "TAKE_PROFIT");
  EXPECT_DOUBLE_EQ(j["pnl"]["realized"]["value"].get<double>(), 9990.0);
  EXPECT_NEAR(j["pnl"]["roi"].get<double>(), 9.99, 1e-9);
  EXPECT_DOUBLE_EQ(j["pnl"]["totalFees"]["value"].get<double>(), 10.0);
  EXPECT_DOUBLE_EQ(j["slippage"]["exit"]["value"].get<double>(), -1000.0);
  EXPECT_EQ(j["timestamps"]["durationMs"], 60000);
  EXPECT_EQ(j["timestamps"]["closedAt"], "2024-01-01T00:01:00.000Z");
  EXPECT_EQ(j["metadata"]["tags"]["session"], "london");
}

// -----------------------------------------------------------------------------
// 4. Order book snapshot
// -----------------------------------------------------------------------------
TEST_F(SerializationTest, OrderBookSnapshot) {
  const auto level = [this](double price, double quantity) {
    return OrderBookLevel::from(px(price), base(quantity));
  };
  const auto book = OrderBookSnapshot::from(
      pair, {level(49900, 1), level(49800, 2)},
      {level(50100, 1), level(50200, 2), level(50300, 3)},
      ms_to_timestamp(1704067200000));
  const json j = book;

  EXPECT_EQ(j["pair"]["symbol"], "BTC/USDT");
  EXPECT_DOUBLE_EQ(j["bestBid"]["price"].get<double>(), 49900.0);
  EXPECT_DOUBLE_EQ(j["bestAsk"]["total"].get<double>(), 50100.0);
  EXPECT_DOUBLE_EQ(j["spread"]["value"].get<double>(), 200.0);
  EXPECT_NEAR(j["spreadPercent"].get<double>(), 0.4, 1e-12);
  EXPECT_EQ(j["depth"]["bids"], 2);
  EXPECT_EQ(j["depth"]["asks"], 3);
  EXPECT_EQ(j["asks"].size(), 3u);
}

// -----------------------------------------------------------------------------
// 5. Errors carry their kind and the fields of the concrete type.
// -----------------------------------------------------------------------------
TEST_F(SerializationTest, DomainErrors) {
  json transition;
  tradekernel::to_json(transition,
          InvalidStateTransitionError("Order", "FILLED", "cancel"));
  EXPECT_EQ(transition["type"], "InvalidStateTransition");
  EXPECT_EQ(transition["details"]["entity"], "Order");
  EXPECT_EQ(transition["details"]["currentState"], "FILLED");
  EXPECT_EQ(transition["details"]["attempted"], "cancel");
  EXPECT_FALSE(transition["message"].get<std::string>().empty());

  json invalid;
  tradekernel::to_json(invalid,
                       InvalidValueError("Price", "must be positive", "-1"));
  EXPECT_EQ(invalid["type"], "InvalidValue");
  EXPECT_EQ(invalid["details"]["valueType"], "Price");
  EXPECT_EQ(invalid["details"]["providedValue"], "-1");

  json position;
  tradekernel::to_json(position,
                       PositionValidationError("stop above entry"));
  EXPECT_EQ(position["type"], "PositionValidation");
  EXPECT_EQ(position["details"]["reason"], "stop above entry");
}
