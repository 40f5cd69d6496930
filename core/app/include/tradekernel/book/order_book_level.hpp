#pragma once

#include "tradekernel/domain/amount.hpp"
#include "tradekernel/domain/price.hpp"

#include <string>

namespace tradekernel {
namespace domain {

// -----------------------------------------------------------------------------
// OrderBookLevel — one rung of a depth ladder
// -----------------------------------------------------------------------------
// Resting quantity (base asset, > 0) at one price. The quantity must be in
// the base asset of the price's pair.
// -----------------------------------------------------------------------------
class OrderBookLevel {
 public:
  static OrderBookLevel from(const Price& price, const Amount& quantity);

  const Price& price() const { return price_; }
  const Amount& quantity() const { return quantity_; }

  // price x quantity, in quote.
  Amount totalValue() const { return price_.convertToQuote(quantity_); }

  bool equals(const OrderBookLevel& other) const {
    return price_ == other.price_ && quantity_ == other.quantity_;
  }

  // "50000 x 1.5 BTC"
  std::string toString() const;

 private:
  OrderBookLevel(Price price, Amount quantity);

  Price price_;
  Amount quantity_;
};

inline bool operator==(const OrderBookLevel& lhs, const OrderBookLevel& rhs) {
  return lhs.equals(rhs);
}
inline bool operator!=(const OrderBookLevel& lhs, const OrderBookLevel& rhs) {
  return !lhs.equals(rhs);
}

}  // namespace domain
}  // namespace tradekernel
