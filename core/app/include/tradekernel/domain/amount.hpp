#pragma once

#include "tradekernel/domain/asset.hpp"
#include "tradekernel/domain/decimal.hpp"

#include <optional>
#include <string>

namespace tradekernel {
namespace domain {

class Percentage;

// -----------------------------------------------------------------------------
// Amount — signed decimal magnitude denominated in one asset
// -----------------------------------------------------------------------------
//
// @brief  Balances, fees, costs and P&L. May be negative (signed flows).
//
// @details
// Every binary operation and ordering comparison first asserts that both
// operands carry the same asset and raises InvalidOperationError otherwise.
// equals() is the exception: it compares asset and value and never throws,
// so Amounts of different assets are simply unequal.
//
// The magnitude is a Decimal. value() collapses it to a double and is meant
// for display and serialization only.
// -----------------------------------------------------------------------------
class Amount {
 public:
  static Amount from(double value, const Asset& asset);
  static Amount from(const Decimal& value, const Asset& asset);
  static Amount fromString(const std::string& value, const Asset& asset);
  static Amount zero(const Asset& asset);

  double value() const { return toDouble(value_); }
  const Decimal& decimal() const { return value_; }
  const Asset& asset() const { return asset_; }

  Amount add(const Amount& other) const;
  Amount subtract(const Amount& other) const;
  // Floors the result at zero. Used for balance decrements.
  Amount subtractOrZero(const Amount& other) const;
  Amount multiply(double factor) const;
  Amount multiply(const Decimal& factor) const;
  Amount divide(double divisor) const;
  Amount divide(const Decimal& divisor) const;
  Amount abs() const;
  Amount negate() const;
  Amount percentageOf(const Percentage& percentage) const;

  bool isZero() const { return value_.is_zero(); }
  bool isPositive() const { return value_ > 0; }
  bool isNegative() const { return value_ < 0; }
  bool isValidSize() const { return isPositive(); }
  bool isValidVolume() const { return value_ >= 0; }

  bool greaterThan(const Amount& other) const;
  bool greaterThanOrEqual(const Amount& other) const;
  bool lessThan(const Amount& other) const;
  bool lessThanOrEqual(const Amount& other) const;
  bool equals(const Amount& other) const;

  // -------------------------------------------------------------------------
  // ensureCovers(required)
  // -------------------------------------------------------------------------
  // @brief  Balance guarantee: this amount must be at least `required`.
  //
  // @throws InsufficientFundsError  when this < required.
  // @throws InvalidOperationError   when the assets differ.
  // -------------------------------------------------------------------------
  void ensureCovers(const Amount& required) const;

  // "1.5 BTC", or "1.50000000 BTC" with decimals = 8.
  std::string format(std::optional<int> decimals = std::nullopt) const;
  std::string toString() const { return format(); }

 private:
  Amount(Decimal value, Asset asset);

  void assertSameAsset(const Amount& other, const char* operation) const;

  Decimal value_;
  Asset asset_;
};

inline Amount operator+(const Amount& lhs, const Amount& rhs) {
  return lhs.add(rhs);
}
inline Amount operator-(const Amount& lhs, const Amount& rhs) {
  return lhs.subtract(rhs);
}
inline bool operator==(const Amount& lhs, const Amount& rhs) {
  return lhs.equals(rhs);
}
inline bool operator!=(const Amount& lhs, const Amount& rhs) {
  return !lhs.equals(rhs);
}
inline bool operator<(const Amount& lhs, const Amount& rhs) {
  return lhs.lessThan(rhs);
}
inline bool operator<=(const Amount& lhs, const Amount& rhs) {
  return lhs.lessThanOrEqual(rhs);
}
inline bool operator>(const Amount& lhs, const Amount& rhs) {
  return lhs.greaterThan(rhs);
}
inline bool operator>=(const Amount& lhs, const Amount& rhs) {
  return lhs.greaterThanOrEqual(rhs);
}

}  // namespace domain
}  // namespace tradekernel
