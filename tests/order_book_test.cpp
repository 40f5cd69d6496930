// =============================================================================
// order_book_test.cpp
// =============================================================================
// Unit tests for OrderBookLevel and OrderBookSnapshot.
//
// Validates:
//   - Levels: positive base-asset quantity, notional value
//   - Snapshot construction: both sides required, single pair, crossed-book
//     rejection, bids sorted descending and asks ascending
//   - Top-of-book metrics: best bid/ask, mid, spread, spread percent
//   - Liquidity sums over N levels and the bid/ask imbalance
//   - Market-order sweeps in partial and strict liquidity modes
// =============================================================================

#include "tradekernel/book/order_book_level.hpp"
#include "tradekernel/book/order_book_snapshot.hpp"
#include "tradekernel/domain/errors.hpp"
#include "tradekernel/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace tradekernel;
using namespace tradekernel::domain;

class OrderBookTest : public ::testing::Test {
 protected:
  Asset btc = Asset::crypto("BTC");
  Asset usdt = Asset::stablecoin("USDT");
  TradingPair pair = TradingPair::from(btc, usdt);
  Timestamp ts = ms_to_timestamp(1704067200000);

  OrderBookLevel level(double price, double quantity) const {
    return OrderBookLevel::from(Price::from(price, pair),
                                Amount::from(quantity, btc));
  }

  // Asks from the worked example; bids mirror them below the spread.
  OrderBookSnapshot book() const {
    return OrderBookSnapshot::from(
        pair, {level(49900, 1), level(49800, 2), level(49700, 3)},
        {level(50100, 1), level(50200, 2), level(50300, 3)}, ts);
  }
};

// -----------------------------------------------------------------------------
// 1. OrderBookLevel
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, LevelValueAndValidation) {
  const auto l = level(50000, 1.5);
  EXPECT_EQ(l.totalValue().toString(), "75000 USDT");
  EXPECT_EQ(l.toString(), "50000 x 1.5 BTC");
  EXPECT_EQ(l, level(50000, 1.5));
  EXPECT_THROW(level(50000, 0), InvalidValueError);
  EXPECT_THROW(OrderBookLevel::from(Price::from(50000, pair),
                                    Amount::from(1, usdt)),
               InvalidValueError);
}

// -----------------------------------------------------------------------------
// 2. Construction sorts both ladders.
// Why: every metric reads the front of a ladder as "best"; unsorted input
//      from an exchange feed must not change the answer.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, UnsortedInputIsSorted) {
  const auto snapshot = OrderBookSnapshot::from(
      pair, {level(49700, 3), level(49900, 1), level(49800, 2)},
      {level(50300, 3), level(50100, 1), level(50200, 2)}, ts);

  const auto bids = snapshot.bids();
  const auto asks = snapshot.asks();
  ASSERT_EQ(bids.size(), 3u);
  ASSERT_EQ(asks.size(), 3u);
  EXPECT_EQ(bids[0].price().format(), "49900");
  EXPECT_EQ(bids[1].price().format(), "49800");
  EXPECT_EQ(bids[2].price().format(), "49700");
  EXPECT_EQ(asks[0].price().format(), "50100");
  EXPECT_EQ(asks[1].price().format(), "50200");
  EXPECT_EQ(asks[2].price().format(), "50300");
}

TEST_F(OrderBookTest, ReturnedLaddersAreCopies) {
  const auto snapshot = book();
  auto bids = snapshot.bids();
  bids.clear();
  EXPECT_EQ(snapshot.bidDepth(), 3u);
}

TEST_F(OrderBookTest, CrossedOrLockedBookIsRejected) {
  EXPECT_THROW(OrderBookSnapshot::from(pair, {level(50100, 1)},
                                       {level(50000, 1)}, ts),
               InvalidValueError);
  EXPECT_THROW(OrderBookSnapshot::from(pair, {level(50000, 1)},
                                       {level(50000, 1)}, ts),
               InvalidValueError);
}

TEST_F(OrderBookTest, EmptySidesAndForeignLevelsAreRejected) {
  EXPECT_THROW(OrderBookSnapshot::from(pair, {}, {level(50100, 1)}, ts),
               InvalidValueError);
  EXPECT_THROW(OrderBookSnapshot::from(pair, {level(49900, 1)}, {}, ts),
               InvalidValueError);

  const auto eth_usdt =
      TradingPair::from(Asset::crypto("ETH"), Asset::stablecoin("USDT"));
  const auto foreign = OrderBookLevel::from(
      Price::from(3000, eth_usdt), Amount::from(1, Asset::crypto("ETH")));
  EXPECT_THROW(OrderBookSnapshot::from(pair, {foreign}, {level(50100, 1)}, ts),
               InvalidValueError);
}

// -----------------------------------------------------------------------------
// 3. Top of book
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, TopOfBookMetrics) {
  const auto snapshot = book();
  EXPECT_EQ(snapshot.bestBid().price().format(), "49900");
  EXPECT_EQ(snapshot.bestAsk().price().format(), "50100");
  EXPECT_EQ(snapshot.midPrice().format(), "50000");
  EXPECT_EQ(snapshot.spread().toString(), "200 USDT");
  EXPECT_EQ(snapshot.spreadPercent().format(3), "0.400%");
  EXPECT_EQ(snapshot.toString(),
            "BTC/USDT OrderBook: 49900 / 50100 (0.400% spread)");
}

// -----------------------------------------------------------------------------
// 4. Liquidity
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, LiquidityOverLevels) {
  const auto snapshot = book();
  // 49900 + 99600 + 149100
  EXPECT_EQ(snapshot.bidLiquidity().toString(), "298600 USDT");
  EXPECT_EQ(snapshot.bidLiquidity(1).toString(), "49900 USDT");
  // 50100 + 100400 + 150900
  EXPECT_EQ(snapshot.askLiquidity().toString(), "301400 USDT");
  EXPECT_EQ(snapshot.askLiquidity(2).toString(), "150500 USDT");
  // More levels than the ladder holds: clamped.
  EXPECT_EQ(snapshot.askLiquidity(50).toString(), "301400 USDT");
  EXPECT_THROW(snapshot.askLiquidity(0), InvalidOperationError);
}

TEST_F(OrderBookTest, LiquidityImbalance) {
  const auto snapshot = OrderBookSnapshot::from(
      pair, {level(100, 3)}, {level(200, 0.5)}, ts);
  // bid 300, ask 100 -> (300 - 100) / 400
  EXPECT_EQ(formatDecimal(snapshot.liquidityImbalance()), "0.5");
  EXPECT_LE(book().liquidityImbalance(), 1);
  EXPECT_GE(book().liquidityImbalance(), -1);
}

// -----------------------------------------------------------------------------
// 5. Market buy sweep over asks (50100,1),(50200,2),(50300,3).
// Why: size 2 takes 1 @ 50100 and 1 @ 50200, so the cost is 100300 and the
//      volume-weighted average 50150.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, MarketBuyWalksTheAsks) {
  const auto estimate = book().estimateMarketBuy(Amount::from(2, btc));
  EXPECT_EQ(estimate.filled_quantity.toString(), "2 BTC");
  EXPECT_EQ(estimate.total_cost.toString(), "100300 USDT");
  EXPECT_EQ(estimate.average_price.format(), "50150");
  EXPECT_TRUE(estimate.fully_filled);
  // (50150 - 50100) / 50100
  EXPECT_EQ(estimate.slippage.format(4), "0.0998%");
}

TEST_F(OrderBookTest, MarketBuyWithinBestLevelHasNoSlippage) {
  const auto estimate = book().estimateMarketBuy(Amount::from(0.5, btc));
  EXPECT_EQ(estimate.average_price.format(), "50100");
  EXPECT_TRUE(estimate.slippage.isZero());
}

TEST_F(OrderBookTest, MarketBuyPartialWhenDepthRunsOut) {
  const auto shallow = OrderBookSnapshot::from(
      pair, {level(49900, 1)}, {level(50100, 1), level(50200, 1)}, ts);
  const auto estimate = shallow.estimateMarketBuy(Amount::from(5, btc));
  EXPECT_EQ(estimate.filled_quantity.toString(), "2 BTC");
  EXPECT_FALSE(estimate.fully_filled);
  EXPECT_EQ(estimate.total_cost.toString(), "100300 USDT");
}

TEST_F(OrderBookTest, StrictModeRaisesWhenDepthRunsOut) {
  const auto snapshot = book();
  EXPECT_THROW(
      snapshot.estimateMarketBuy(Amount::from(7, btc), LiquidityMode::Strict),
      InvalidOperationError);
  EXPECT_NO_THROW(
      snapshot.estimateMarketBuy(Amount::from(6, btc), LiquidityMode::Strict));
}

TEST_F(OrderBookTest, MarketSellWalksTheBids) {
  const auto estimate = book().estimateMarketSell(Amount::from(3, btc));
  // 1 @ 49900 + 2 @ 49800
  EXPECT_EQ(estimate.total_proceeds.toString(), "149500 USDT");
  EXPECT_EQ(estimate.average_price.format(2), "49833.33");
  EXPECT_TRUE(estimate.fully_filled);
  EXPECT_TRUE(estimate.slippage.isPositive());
}

TEST_F(OrderBookTest, EstimateRejectsBadSize) {
  const auto snapshot = book();
  EXPECT_THROW(snapshot.estimateMarketBuy(Amount::from(1, usdt)),
               InvalidOperationError);
  EXPECT_THROW(snapshot.estimateMarketSell(Amount::zero(btc)),
               InvalidOperationError);
}
