#pragma once

#include "tradekernel/book/order_book_level.hpp"
#include "tradekernel/domain/amount.hpp"
#include "tradekernel/domain/decimal.hpp"
#include "tradekernel/domain/percentage.hpp"
#include "tradekernel/domain/price.hpp"
#include "tradekernel/domain/trading_pair.hpp"
#include "tradekernel/time/time_utils.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tradekernel {
namespace domain {

// -----------------------------------------------------------------------------
// LiquidityMode — what a market-order estimate does when the ladder runs dry
// -----------------------------------------------------------------------------
//   Partial  return what could be filled, fully_filled = false
//   Strict   raise InvalidOperationError
// -----------------------------------------------------------------------------
enum class LiquidityMode {
  Partial,
  Strict,
};

inline const char* toString(LiquidityMode mode) {
  switch (mode) {
    case LiquidityMode::Partial: return "partial";
    case LiquidityMode::Strict:  return "strict";
  }
  return "unknown";
}

struct MarketBuyEstimate {
  Amount filled_quantity;   // base
  Amount total_cost;        // quote
  Price average_price;
  Percentage slippage;      // average vs best ask, >= 0
  bool fully_filled{false};
};

struct MarketSellEstimate {
  Amount filled_quantity;   // base
  Amount total_proceeds;    // quote
  Price average_price;
  Percentage slippage;      // best bid vs average, >= 0
  bool fully_filled{false};
};

// -----------------------------------------------------------------------------
// OrderBookSnapshot — immutable, uncrossed depth for one pair
// -----------------------------------------------------------------------------
//
// @brief  Bid ladder (descending) and ask ladder (ascending) at one instant.
//         Answers spread, liquidity and market-impact questions.
//
// @details
// from() copies and sorts both ladders (stable, so equal-priced levels keep
// their feed order), then requires best bid < best ask. A touching or
// crossed book is treated as a corrupt feed and rejected.
//
// Market-order simulation walks the opposing ladder from the best price
// outward, taking min(remaining, level quantity) at each rung. Running out
// of ladder is not an error in LiquidityMode::Partial; the estimate reports
// fully_filled = false instead.
//
// Thread model:
//   Immutable after construction; share freely across threads. A new
//   market state is a new snapshot.
// -----------------------------------------------------------------------------
class OrderBookSnapshot {
 public:
  static OrderBookSnapshot from(const TradingPair& pair,
                                std::vector<OrderBookLevel> bids,
                                std::vector<OrderBookLevel> asks,
                                Timestamp timestamp);

  const TradingPair& pair() const { return pair_; }
  Timestamp timestamp() const { return timestamp_; }

  // Copies; callers cannot reach the snapshot's ladders.
  std::vector<OrderBookLevel> bids() const { return bids_; }
  std::vector<OrderBookLevel> asks() const { return asks_; }
  std::size_t bidDepth() const { return bids_.size(); }
  std::size_t askDepth() const { return asks_.size(); }

  OrderBookLevel bestBid() const { return bids_.front(); }
  OrderBookLevel bestAsk() const { return asks_.front(); }

  // (best bid + best ask) / 2
  Price midPrice() const;
  // best ask - best bid, in quote
  Amount spread() const;
  // spread / mid x 100
  Percentage spreadPercent() const;

  // -------------------------------------------------------------------------
  // bidLiquidity(levels) / askLiquidity(levels)
  // -------------------------------------------------------------------------
  // @brief  Sum of price x quantity over the first `levels` rungs, in quote.
  //         All rungs when `levels` is empty; clamped to the ladder depth.
  //
  // @throws InvalidOperationError when levels == 0.
  // -------------------------------------------------------------------------
  Amount bidLiquidity(std::optional<std::size_t> levels = std::nullopt) const;
  Amount askLiquidity(std::optional<std::size_t> levels = std::nullopt) const;

  // (bid - ask) / (bid + ask), in [-1, 1]. Positive means bid-heavy.
  Decimal liquidityImbalance(
      std::optional<std::size_t> levels = std::nullopt) const;

  // -------------------------------------------------------------------------
  // estimateMarketBuy(size, mode) / estimateMarketSell(size, mode)
  // -------------------------------------------------------------------------
  // @param  size  Requested quantity; must be > 0 and in the pair base.
  // @param  mode  Partial (default) or Strict exhaustion handling.
  //
  // @throws InvalidOperationError for a non-base or non-positive size, and
  //         in Strict mode when the ladder cannot cover `size`.
  // -------------------------------------------------------------------------
  MarketBuyEstimate estimateMarketBuy(
      const Amount& size, LiquidityMode mode = LiquidityMode::Partial) const;
  MarketSellEstimate estimateMarketSell(
      const Amount& size, LiquidityMode mode = LiquidityMode::Partial) const;

  // "BTC/USDT OrderBook: 49900 / 50100 (0.400% spread)"
  std::string toString() const;

 private:
  OrderBookSnapshot(TradingPair pair, std::vector<OrderBookLevel> bids,
                    std::vector<OrderBookLevel> asks, Timestamp timestamp);

  // Outcome of walking one ladder.
  struct Sweep {
    Decimal filled;
    Decimal notional;
    bool complete{false};
  };

  Sweep sweep(const std::vector<OrderBookLevel>& ladder, const Amount& size,
              LiquidityMode mode, const char* operation) const;
  Amount sumLiquidity(const std::vector<OrderBookLevel>& ladder,
                      std::optional<std::size_t> levels,
                      const char* operation) const;

  TradingPair pair_;
  std::vector<OrderBookLevel> bids_;
  std::vector<OrderBookLevel> asks_;
  Timestamp timestamp_;
};

}  // namespace domain
}  // namespace tradekernel
