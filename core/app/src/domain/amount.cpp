#include "tradekernel/domain/amount.hpp"
#include "tradekernel/domain/errors.hpp"
#include "tradekernel/domain/percentage.hpp"

#include <cmath>
#include <utility>

namespace tradekernel {
namespace domain {

Amount::Amount(Decimal value, Asset asset)
    : value_(std::move(value)), asset_(std::move(asset)) {}

Amount Amount::from(double value, const Asset& asset) {
  if (!std::isfinite(value)) {
    throw InvalidValueError("Amount", "Value must be a finite number",
                            std::to_string(value));
  }
  return Amount(decimalFromDouble(value), asset);
}

Amount Amount::from(const Decimal& value, const Asset& asset) {
  if (!isFiniteDecimal(value)) {
    throw InvalidValueError("Amount", "Value must be a finite number");
  }
  return Amount(value, asset);
}

Amount Amount::fromString(const std::string& value, const Asset& asset) {
  return from(parseDecimal(value), asset);
}

Amount Amount::zero(const Asset& asset) { return Amount(Decimal(0), asset); }

// -----------------------------------------------------------------------------
// Arithmetic: asset check first, then exact Decimal math
// -----------------------------------------------------------------------------
Amount Amount::add(const Amount& other) const {
  assertSameAsset(other, "add");
  Decimal sum = value_ + other.value_;
  return Amount(sum, asset_);
}

Amount Amount::subtract(const Amount& other) const {
  assertSameAsset(other, "subtract");
  Decimal difference = value_ - other.value_;
  return Amount(difference, asset_);
}

Amount Amount::subtractOrZero(const Amount& other) const {
  assertSameAsset(other, "subtractOrZero");
  Decimal difference = value_ - other.value_;
  if (difference < 0) {
    return zero(asset_);
  }
  return Amount(difference, asset_);
}

Amount Amount::multiply(double factor) const {
  if (!std::isfinite(factor)) {
    throw InvalidOperationError("Amount.multiply", "Factor must be finite");
  }
  return multiply(decimalFromDouble(factor));
}

Amount Amount::multiply(const Decimal& factor) const {
  if (!isFiniteDecimal(factor)) {
    throw InvalidOperationError("Amount.multiply", "Factor must be finite");
  }
  Decimal product = value_ * factor;
  return Amount(product, asset_);
}

Amount Amount::divide(double divisor) const {
  if (!std::isfinite(divisor)) {
    throw InvalidOperationError("Amount.divide", "Divisor must be finite");
  }
  return divide(decimalFromDouble(divisor));
}

Amount Amount::divide(const Decimal& divisor) const {
  if (!isFiniteDecimal(divisor)) {
    throw InvalidOperationError("Amount.divide", "Divisor must be finite");
  }
  if (divisor.is_zero()) {
    throw InvalidOperationError("Amount.divide", "Cannot divide by zero");
  }
  Decimal quotient = value_ / divisor;
  return Amount(quotient, asset_);
}

Amount Amount::abs() const {
  Decimal magnitude = boost::multiprecision::abs(value_);
  return Amount(magnitude, asset_);
}

Amount Amount::negate() const {
  Decimal negated = -value_;
  return Amount(negated, asset_);
}

Amount Amount::percentageOf(const Percentage& percentage) const {
  return percentage.of(*this);
}

// -----------------------------------------------------------------------------
// Comparisons
// -----------------------------------------------------------------------------
bool Amount::greaterThan(const Amount& other) const {
  assertSameAsset(other, "greaterThan");
  return value_ > other.value_;
}

bool Amount::greaterThanOrEqual(const Amount& other) const {
  assertSameAsset(other, "greaterThanOrEqual");
  return value_ >= other.value_;
}

bool Amount::lessThan(const Amount& other) const {
  assertSameAsset(other, "lessThan");
  return value_ < other.value_;
}

bool Amount::lessThanOrEqual(const Amount& other) const {
  assertSameAsset(other, "lessThanOrEqual");
  return value_ <= other.value_;
}

bool Amount::equals(const Amount& other) const {
  return asset_ == other.asset_ && value_ == other.value_;
}

void Amount::ensureCovers(const Amount& required) const {
  if (lessThan(required)) {
    throw InsufficientFundsError(asset_.symbol(), required.toString(),
                                 toString());
  }
}

std::string Amount::format(std::optional<int> decimals) const {
  return formatDecimal(value_, decimals.value_or(-1)) + " " + asset_.symbol();
}

void Amount::assertSameAsset(const Amount& other,
                             const char* operation) const {
  if (asset_ != other.asset_) {
    throw InvalidOperationError(
        std::string("Amount.") + operation,
        "Cannot operate on amounts with different assets: " +
            asset_.symbol() + " vs " + other.asset_.symbol());
  }
}

}  // namespace domain
}  // namespace tradekernel
