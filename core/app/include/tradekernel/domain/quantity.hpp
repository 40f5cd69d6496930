#pragma once

#include "tradekernel/domain/decimal.hpp"

#include <string>

namespace tradekernel {
namespace domain {

// -----------------------------------------------------------------------------
// Quantity — dimensionless, non-negative count or multiplier
// -----------------------------------------------------------------------------
//
// @brief  Contracts, leverage, order counts. Carries no asset; use Amount
//         for anything denominated in an asset.
//
// @details
// No operation can produce a negative Quantity: subtract() below zero
// raises InvalidOperationError instead of clamping.
// -----------------------------------------------------------------------------
class Quantity {
 public:
  static Quantity from(double value);
  static Quantity from(const Decimal& value);
  static Quantity fromString(const std::string& value);
  static Quantity zero();
  static Quantity one();

  double value() const { return toDouble(value_); }
  const Decimal& decimal() const { return value_; }

  Quantity add(const Quantity& other) const;
  Quantity subtract(const Quantity& other) const;
  Quantity multiply(double factor) const;
  Quantity multiply(const Decimal& factor) const;
  Quantity divide(double divisor) const;
  Quantity divide(const Decimal& divisor) const;

  bool isZero() const { return value_.is_zero(); }
  bool isPositive() const { return value_ > 0; }

  bool equals(const Quantity& other) const { return value_ == other.value_; }

  std::string toString() const { return formatDecimal(value_); }

 private:
  explicit Quantity(Decimal value);

  Decimal value_;
};

inline bool operator==(const Quantity& lhs, const Quantity& rhs) {
  return lhs.equals(rhs);
}
inline bool operator!=(const Quantity& lhs, const Quantity& rhs) {
  return !lhs.equals(rhs);
}
inline bool operator<(const Quantity& lhs, const Quantity& rhs) {
  return lhs.decimal() < rhs.decimal();
}
inline bool operator<=(const Quantity& lhs, const Quantity& rhs) {
  return lhs.decimal() <= rhs.decimal();
}
inline bool operator>(const Quantity& lhs, const Quantity& rhs) {
  return lhs.decimal() > rhs.decimal();
}
inline bool operator>=(const Quantity& lhs, const Quantity& rhs) {
  return lhs.decimal() >= rhs.decimal();
}

}  // namespace domain
}  // namespace tradekernel
