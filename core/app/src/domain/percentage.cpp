#include "tradekernel/domain/percentage.hpp"
#include "tradekernel/domain/amount.hpp"
#include "tradekernel/domain/errors.hpp"

#include <cmath>
#include <utility>

namespace tradekernel {
namespace domain {

Percentage::Percentage(Decimal value) : value_(std::move(value)) {}

Percentage Percentage::from(double value, bool allow_above_100) {
  if (!std::isfinite(value)) {
    throw InvalidValueError("Percentage", "Value must be a finite number",
                            std::to_string(value));
  }
  return from(decimalFromDouble(value), allow_above_100);
}

// -----------------------------------------------------------------------------
// from(Decimal): bound checks shared by every factory and arithmetic result
// -----------------------------------------------------------------------------
Percentage Percentage::from(const Decimal& value, bool allow_above_100) {
  if (!isFiniteDecimal(value)) {
    throw InvalidValueError("Percentage", "Value must be a finite number");
  }
  if (value < -100) {
    throw InvalidValueError("Percentage", "Cannot be less than -100%",
                            formatDecimal(value));
  }
  if (!allow_above_100 && value > 100) {
    throw InvalidValueError("Percentage", "Cannot be greater than 100%",
                            formatDecimal(value));
  }
  return Percentage(value);
}

Percentage Percentage::zero() { return Percentage(Decimal(0)); }

Percentage Percentage::fromRatio(double ratio) {
  if (!std::isfinite(ratio)) {
    throw InvalidValueError("Percentage", "Ratio must be a finite number",
                            std::to_string(ratio));
  }
  return fromRatio(decimalFromDouble(ratio));
}

Percentage Percentage::fromRatio(const Decimal& ratio) {
  Decimal percent = ratio * 100;
  return from(percent, true);
}

Percentage Percentage::fromBasisPoints(double bps) {
  if (!std::isfinite(bps)) {
    throw InvalidValueError("Percentage",
                            "Basis points must be a finite number",
                            std::to_string(bps));
  }
  Decimal percent = decimalFromDouble(bps) / 100;
  return from(percent);
}

Decimal Percentage::toRatio() const { return value_ / 100; }

Decimal Percentage::toBasisPoints() const { return value_ * 100; }

Percentage Percentage::add(const Percentage& other) const {
  Decimal sum = value_ + other.value_;
  return from(sum, true);
}

Percentage Percentage::subtract(const Percentage& other) const {
  Decimal difference = value_ - other.value_;
  return from(difference);
}

Percentage Percentage::multiply(double factor) const {
  if (!std::isfinite(factor)) {
    throw InvalidOperationError("Percentage.multiply", "Factor must be finite");
  }
  Decimal product = value_ * decimalFromDouble(factor);
  return from(product, true);
}

// -----------------------------------------------------------------------------
// of(): share of an amount, same asset
// -----------------------------------------------------------------------------
Amount Percentage::of(const Amount& amount) const {
  if (value_ < 0 || value_ > 100) {
    throw InvalidOperationError(
        "Percentage.of", "Percentage must be between 0 and 100, got " +
                             format());
  }
  return amount.multiply(toRatio());
}

std::string Percentage::format(int decimals) const {
  return formatDecimal(value_, decimals) + "%";
}

}  // namespace domain
}  // namespace tradekernel
