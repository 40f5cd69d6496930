#include "tradekernel/domain/order_parameters.hpp"
#include "tradekernel/domain/errors.hpp"

#include <utility>

namespace tradekernel {
namespace domain {

OrderParameters::OrderParameters(TradingPair pair, Side side, OrderType type,
                                 Amount quantity,
                                 std::optional<Price> stop_price)
    : pair_(std::move(pair)),
      side_(side),
      type_(type),
      quantity_(std::move(quantity)),
      stop_price_(std::move(stop_price)) {}

// -----------------------------------------------------------------------------
// create(): the single validation point; named factories delegate here
// -----------------------------------------------------------------------------
OrderParameters OrderParameters::create(const TradingPair& pair, Side side,
                                        OrderType type, const Amount& quantity,
                                        const std::optional<Price>& stop_price) {
  if (!quantity.isValidSize()) {
    throw InvalidValueError("OrderParameters",
                            "Order quantity must be positive",
                            quantity.toString());
  }
  if (quantity.asset() != pair.base()) {
    throw InvalidValueError("OrderParameters",
                            "Quantity asset " + quantity.asset().symbol() +
                                " does not match pair base " +
                                pair.base().symbol(),
                            quantity.toString());
  }
  if (type != OrderType::Market && !stop_price) {
    throw InvalidValueError(
        "OrderParameters",
        std::string("Stop price required for ") + domain::toString(type) +
            " orders");
  }
  if (type == OrderType::Market && stop_price) {
    throw InvalidValueError("OrderParameters",
                            "Market orders do not take a stop price",
                            stop_price->toString());
  }
  if (stop_price && stop_price->pair() != pair) {
    throw InvalidValueError("OrderParameters",
                            "Stop price pair does not match order pair " +
                                pair.symbol(),
                            stop_price->toString());
  }
  return OrderParameters(pair, side, type, quantity, stop_price);
}

OrderParameters OrderParameters::marketBuy(const TradingPair& pair,
                                           const Amount& quantity) {
  return create(pair, Side::Buy, OrderType::Market, quantity);
}

OrderParameters OrderParameters::marketSell(const TradingPair& pair,
                                            const Amount& quantity) {
  return create(pair, Side::Sell, OrderType::Market, quantity);
}

OrderParameters OrderParameters::stopLoss(const TradingPair& pair, Side side,
                                          const Amount& quantity,
                                          const Price& stop_price) {
  return create(pair, side, OrderType::StopLoss, quantity, stop_price);
}

OrderParameters OrderParameters::takeProfit(const TradingPair& pair, Side side,
                                            const Amount& quantity,
                                            const Price& take_profit_price) {
  return create(pair, side, OrderType::TakeProfit, quantity,
                take_profit_price);
}

Amount OrderParameters::estimatedValue(const Price& market_price) const {
  if (market_price.pair() != pair_) {
    throw InvalidOperationError("OrderParameters.estimatedValue",
                                "Market price pair " +
                                    market_price.pair().symbol() +
                                    " does not match order pair " +
                                    pair_.symbol());
  }
  const Price& reference = stop_price_ ? *stop_price_ : market_price;
  return reference.convertToQuote(quantity_);
}

std::string OrderParameters::toString() const {
  std::string text = std::string(domain::toString(type_)) + " " +
                     domain::toString(side_) + " " + quantity_.format() + " " +
                     pair_.symbol();
  if (stop_price_) {
    text += " @ " + stop_price_->format();
  }
  return text;
}

}  // namespace domain
}  // namespace tradekernel
