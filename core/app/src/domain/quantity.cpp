#include "tradekernel/domain/quantity.hpp"
#include "tradekernel/domain/errors.hpp"

#include <cmath>
#include <utility>

namespace tradekernel {
namespace domain {

Quantity::Quantity(Decimal value) : value_(std::move(value)) {}

Quantity Quantity::from(double value) {
  if (!std::isfinite(value)) {
    throw InvalidValueError("Quantity", "Must be a finite number",
                            std::to_string(value));
  }
  return from(decimalFromDouble(value));
}

// -----------------------------------------------------------------------------
// from(Decimal): the single validation point for every factory
// -----------------------------------------------------------------------------
Quantity Quantity::from(const Decimal& value) {
  if (!isFiniteDecimal(value)) {
    throw InvalidValueError("Quantity", "Must be a finite number");
  }
  if (value < 0) {
    throw InvalidValueError("Quantity", "Cannot be negative",
                            formatDecimal(value));
  }
  return Quantity(value);
}

Quantity Quantity::fromString(const std::string& value) {
  return from(parseDecimal(value));
}

Quantity Quantity::zero() { return Quantity(Decimal(0)); }

Quantity Quantity::one() { return Quantity(Decimal(1)); }

Quantity Quantity::add(const Quantity& other) const {
  Decimal sum = value_ + other.value_;
  return Quantity(sum);
}

Quantity Quantity::subtract(const Quantity& other) const {
  Decimal result = value_ - other.value_;
  if (result < 0) {
    throw InvalidOperationError(
        "Quantity.subtract", "Result would be negative: " + toString() + " - " +
                        other.toString());
  }
  return Quantity(result);
}

Quantity Quantity::multiply(double factor) const {
  if (!std::isfinite(factor)) {
    throw InvalidOperationError("Quantity.multiply", "Factor must be finite");
  }
  return multiply(decimalFromDouble(factor));
}

Quantity Quantity::multiply(const Decimal& factor) const {
  if (!isFiniteDecimal(factor)) {
    throw InvalidOperationError("Quantity.multiply", "Factor must be finite");
  }
  if (factor < 0) {
    throw InvalidOperationError("Quantity.multiply",
                                "Factor cannot be negative");
  }
  Decimal product = value_ * factor;
  return Quantity(product);
}

Quantity Quantity::divide(double divisor) const {
  if (!std::isfinite(divisor)) {
    throw InvalidOperationError("Quantity.divide", "Divisor must be finite");
  }
  return divide(decimalFromDouble(divisor));
}

Quantity Quantity::divide(const Decimal& divisor) const {
  if (!isFiniteDecimal(divisor)) {
    throw InvalidOperationError("Quantity.divide", "Divisor must be finite");
  }
  if (divisor.is_zero()) {
    throw InvalidOperationError("Quantity.divide", "Cannot divide by zero");
  }
  if (divisor < 0) {
    throw InvalidOperationError("Quantity.divide",
                                "Divisor cannot be negative");
  }
  Decimal quotient = value_ / divisor;
  return Quantity(quotient);
}

}  // namespace domain
}  // namespace tradekernel
