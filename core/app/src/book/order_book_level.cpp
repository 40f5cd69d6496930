#include "tradekernel/book/order_book_level.hpp"
#include "tradekernel/domain/errors.hpp"

#include <utility>

namespace tradekernel {
namespace domain {

OrderBookLevel::OrderBookLevel(Price price, Amount quantity)
    : price_(std::move(price)), quantity_(std::move(quantity)) {}

OrderBookLevel OrderBookLevel::from(const Price& price,
                                    const Amount& quantity) {
  if (!quantity.isValidSize()) {
    throw InvalidValueError("OrderBookLevel", "Quantity must be positive",
                            quantity.toString());
  }
  if (quantity.asset() != price.pair().base()) {
    throw InvalidValueError("OrderBookLevel",
                            "Quantity must be in base asset " +
                                price.pair().base().symbol() +
                                " of price pair",
                            quantity.toString());
  }
  return OrderBookLevel(price, quantity);
}

std::string OrderBookLevel::toString() const {
  return price_.format() + " x " + quantity_.format();
}

}  // namespace domain
}  // namespace tradekernel
