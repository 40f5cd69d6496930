#pragma once

#include "tradekernel/domain/amount.hpp"
#include "tradekernel/domain/decimal.hpp"
#include "tradekernel/domain/percentage.hpp"
#include "tradekernel/domain/trading_pair.hpp"

#include <optional>
#include <string>

namespace tradekernel {
namespace domain {

// -----------------------------------------------------------------------------
// Price — strictly positive quote-per-base rate scoped to one pair
// -----------------------------------------------------------------------------
//
// @brief  50000 on BTC/USDT means one BTC costs 50000 USDT.
//
// @details
// Prices never add (there is no meaning to 50000 + 51000). They subtract to
// a signed quote Amount, scale by finite scalars and convert amounts between
// the two sides of the pair. Any comparison or arithmetic between Prices of
// different pairs raises InvalidOperationError.
//
// Every operation that produces a Price re-checks the > 0 invariant and
// raises InvalidOperationError rather than returning a non-positive rate.
// -----------------------------------------------------------------------------
class Price {
 public:
  static Price from(double value, const TradingPair& pair);
  static Price from(const Decimal& value, const TradingPair& pair);
  static Price fromString(const std::string& value, const TradingPair& pair);

  double value() const { return toDouble(value_); }
  const Decimal& decimal() const { return value_; }
  const TradingPair& pair() const { return pair_; }

  // Signed difference this - other, in the quote asset.
  Amount subtract(const Price& other) const;
  Amount absoluteDifference(const Price& other) const;

  Price multiplyBy(double factor) const;
  Price multiplyBy(const Decimal& factor) const;
  Price divideBy(double divisor) const;
  Price divideBy(const Decimal& divisor) const;

  // 50000 with +10% -> 55000. The result must remain positive, so -100%
  // is rejected.
  Price applyPercentageChange(const Percentage& change) const;

  // Change from this price to `next`, as a percentage of this price.
  Percentage percentageChangeTo(const Price& next) const;
  // Change from `previous` to this price, as a percentage of `previous`.
  Percentage percentageChangeFrom(const Price& previous) const;

  // base Amount -> quote Amount (1 BTC at 50000 -> 50000 USDT)
  Amount convertToQuote(const Amount& base_amount) const;
  // quote Amount -> base Amount (50000 USDT at 50000 -> 1 BTC)
  Amount convertToBase(const Amount& quote_amount) const;

  // -------------------------------------------------------------------------
  // Tick size operations
  // -------------------------------------------------------------------------
  // Exchanges quote prices on a fixed grid. All four reject tick_size <= 0
  // and results that would fall to zero or below (InvalidOperationError).
  // roundToTickSize rounds half away from zero.
  // -------------------------------------------------------------------------
  Price roundToTickSize(double tick_size) const;
  Price floorToTickSize(double tick_size) const;
  Price ceilToTickSize(double tick_size) const;
  Price addTicks(long ticks, double tick_size) const;

  bool greaterThan(const Price& other) const;
  bool greaterThanOrEqual(const Price& other) const;
  bool lessThan(const Price& other) const;
  bool lessThanOrEqual(const Price& other) const;
  bool equals(const Price& other) const;
  // Inclusive on both ends.
  bool isBetween(const Price& lower, const Price& upper) const;
  Price min(const Price& other) const;
  Price max(const Price& other) const;

  // Bare number, "50000" or "50000.00".
  std::string format(std::optional<int> decimals = std::nullopt) const;
  // "50000 BTC/USDT"
  std::string toString() const;

 private:
  Price(Decimal value, TradingPair pair);

  static Price checkedResult(const Decimal& value, const TradingPair& pair,
                             const char* operation);
  static Decimal checkedTickSize(double tick_size, const char* operation);
  void assertSamePair(const Price& other, const char* operation) const;

  Decimal value_;
  TradingPair pair_;
};

inline bool operator==(const Price& lhs, const Price& rhs) {
  return lhs.equals(rhs);
}
inline bool operator!=(const Price& lhs, const Price& rhs) {
  return !lhs.equals(rhs);
}
inline bool operator<(const Price& lhs, const Price& rhs) {
  return lhs.lessThan(rhs);
}
inline bool operator<=(const Price& lhs, const Price& rhs) {
  return lhs.lessThanOrEqual(rhs);
}
inline bool operator>(const Price& lhs, const Price& rhs) {
  return lhs.greaterThan(rhs);
}
inline bool operator>=(const Price& lhs, const Price& rhs) {
  return lhs.greaterThanOrEqual(rhs);
}

}  // namespace domain
}  // namespace tradekernel
