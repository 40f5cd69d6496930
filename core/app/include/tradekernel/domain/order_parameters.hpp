#pragma once

#include "tradekernel/domain/amount.hpp"
#include "tradekernel/domain/order_types.hpp"
#include "tradekernel/domain/price.hpp"
#include "tradekernel/domain/trading_pair.hpp"

#include <optional>
#include <string>

namespace tradekernel {
namespace domain {

// -----------------------------------------------------------------------------
// OrderParameters — what the agent asked the exchange to do
// -----------------------------------------------------------------------------
//
// @brief  Pair, side, type, base-asset quantity and an optional stop price.
//
// @details
// Validation (InvalidValueError, value_type "OrderParameters"):
//   - quantity is strictly positive and denominated in the pair base
//   - StopLoss and TakeProfit orders carry a stop price
//   - Market orders carry none
//   - the stop price belongs to the same pair
// -----------------------------------------------------------------------------
class OrderParameters {
 public:
  static OrderParameters create(const TradingPair& pair, Side side,
                                OrderType type, const Amount& quantity,
                                const std::optional<Price>& stop_price =
                                    std::nullopt);

  static OrderParameters marketBuy(const TradingPair& pair,
                                   const Amount& quantity);
  static OrderParameters marketSell(const TradingPair& pair,
                                    const Amount& quantity);
  static OrderParameters stopLoss(const TradingPair& pair, Side side,
                                  const Amount& quantity,
                                  const Price& stop_price);
  static OrderParameters takeProfit(const TradingPair& pair, Side side,
                                    const Amount& quantity,
                                    const Price& take_profit_price);

  const TradingPair& pair() const { return pair_; }
  Side side() const { return side_; }
  OrderType type() const { return type_; }
  const Amount& quantity() const { return quantity_; }
  const std::optional<Price>& stopPrice() const { return stop_price_; }

  bool isMarketOrder() const { return type_ == OrderType::Market; }
  bool isStopOrder() const { return !isMarketOrder(); }

  // quantity x (stop price, or market_price for market orders), in quote.
  // market_price must belong to the order pair.
  Amount estimatedValue(const Price& market_price) const;

  // "MARKET BUY 0.5 BTC BTC/USDT", with " @ 48000" for stop orders.
  std::string toString() const;

 private:
  OrderParameters(TradingPair pair, Side side, OrderType type, Amount quantity,
                  std::optional<Price> stop_price);

  TradingPair pair_;
  Side side_;
  OrderType type_;
  Amount quantity_;
  std::optional<Price> stop_price_;
};

}  // namespace domain
}  // namespace tradekernel
