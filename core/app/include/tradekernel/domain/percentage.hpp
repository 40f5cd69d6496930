#pragma once

#include "tradekernel/domain/decimal.hpp"

#include <string>

namespace tradekernel {
namespace domain {

class Amount;

// -----------------------------------------------------------------------------
// Percentage — finite percentage, default domain [-100, +100]
// -----------------------------------------------------------------------------
//
// @brief  Fees (0.1), stop distances (-2), returns (35). 50 means 50%.
//
// @details
// The lower bound of -100 always holds. allow_above_100 lifts only the upper
// bound, for ratio-derived or cumulative values (fromRatio(1.5) is 150%).
//
// Arithmetic keeps the original bound rules:
//   add, multiply  result may exceed 100
//   subtract       result must stay inside [-100, 100]
// -----------------------------------------------------------------------------
class Percentage {
 public:
  static Percentage from(double value, bool allow_above_100 = false);
  static Percentage from(const Decimal& value, bool allow_above_100 = false);
  static Percentage zero();
  static Percentage fromRatio(double ratio);
  static Percentage fromRatio(const Decimal& ratio);
  static Percentage fromBasisPoints(double bps);

  double value() const { return toDouble(value_); }
  const Decimal& decimal() const { return value_; }

  // 50% -> 0.5
  Decimal toRatio() const;
  // 0.5% -> 50
  Decimal toBasisPoints() const;

  Percentage add(const Percentage& other) const;
  Percentage subtract(const Percentage& other) const;
  Percentage multiply(double factor) const;

  // -------------------------------------------------------------------------
  // of(amount)
  // -------------------------------------------------------------------------
  // @brief  Applies this percentage to an amount: 10% of 200 USDT = 20 USDT.
  //
  // @throws InvalidOperationError when this percentage lies outside [0, 100].
  //         A negative or above-100 share of a balance has no meaning.
  // -------------------------------------------------------------------------
  Amount of(const Amount& amount) const;

  bool isZero() const { return value_.is_zero(); }
  bool isPositive() const { return value_ > 0; }
  bool isNegative() const { return value_ < 0; }

  bool equals(const Percentage& other) const { return value_ == other.value_; }

  // "12.50%"
  std::string format(int decimals = 2) const;
  std::string toString() const { return format(); }

 private:
  explicit Percentage(Decimal value);

  Decimal value_;
};

inline bool operator==(const Percentage& lhs, const Percentage& rhs) {
  return lhs.equals(rhs);
}
inline bool operator!=(const Percentage& lhs, const Percentage& rhs) {
  return !lhs.equals(rhs);
}
inline bool operator<(const Percentage& lhs, const Percentage& rhs) {
  return lhs.decimal() < rhs.decimal();
}
inline bool operator<=(const Percentage& lhs, const Percentage& rhs) {
  return lhs.decimal() <= rhs.decimal();
}
inline bool operator>(const Percentage& lhs, const Percentage& rhs) {
  return lhs.decimal() > rhs.decimal();
}
inline bool operator>=(const Percentage& lhs, const Percentage& rhs) {
  return lhs.decimal() >= rhs.decimal();
}

}  // namespace domain
}  // namespace tradekernel
