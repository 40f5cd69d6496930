#include "tradekernel/domain/price.hpp"
#include "tradekernel/domain/errors.hpp"

#include <cmath>
#include <utility>

namespace tradekernel {
namespace domain {

Price::Price(Decimal value, TradingPair pair)
    : value_(std::move(value)), pair_(std::move(pair)) {}

Price Price::from(double value, const TradingPair& pair) {
  if (!std::isfinite(value)) {
    throw InvalidValueError("Price", "Value must be a finite number",
                            std::to_string(value));
  }
  return from(decimalFromDouble(value), pair);
}

Price Price::from(const Decimal& value, const TradingPair& pair) {
  if (!isFiniteDecimal(value)) {
    throw InvalidValueError("Price", "Value must be a finite number");
  }
  if (value <= 0) {
    throw InvalidValueError("Price", "Value must be strictly positive",
                            formatDecimal(value));
  }
  return Price(value, pair);
}

Price Price::fromString(const std::string& value, const TradingPair& pair) {
  return from(parseDecimal(value), pair);
}

Price Price::checkedResult(const Decimal& value, const TradingPair& pair,
                           const char* operation) {
  if (!isFiniteDecimal(value) || value <= 0) {
    throw InvalidOperationError(
        std::string("Price.") + operation,
        "Result would be non-positive: " + formatDecimal(value));
  }
  return Price(value, pair);
}

// -----------------------------------------------------------------------------
// Differences: results live in the quote asset
// -----------------------------------------------------------------------------
Amount Price::subtract(const Price& other) const {
  assertSamePair(other, "subtract");
  Decimal difference = value_ - other.value_;
  return Amount::from(difference, pair_.quote());
}

Amount Price::absoluteDifference(const Price& other) const {
  return subtract(other).abs();
}

// -----------------------------------------------------------------------------
// Scaling
// -----------------------------------------------------------------------------
Price Price::multiplyBy(double factor) const {
  if (!std::isfinite(factor)) {
    throw InvalidOperationError("Price.multiplyBy", "Factor must be finite");
  }
  return multiplyBy(decimalFromDouble(factor));
}

Price Price::multiplyBy(const Decimal& factor) const {
  if (!isFiniteDecimal(factor)) {
    throw InvalidOperationError("Price.multiplyBy", "Factor must be finite");
  }
  Decimal product = value_ * factor;
  return checkedResult(product, pair_, "multiplyBy");
}

Price Price::divideBy(double divisor) const {
  if (!std::isfinite(divisor)) {
    throw InvalidOperationError("Price.divideBy", "Divisor must be finite");
  }
  return divideBy(decimalFromDouble(divisor));
}

Price Price::divideBy(const Decimal& divisor) const {
  if (!isFiniteDecimal(divisor)) {
    throw InvalidOperationError("Price.divideBy", "Divisor must be finite");
  }
  if (divisor.is_zero()) {
    throw InvalidOperationError("Price.divideBy", "Cannot divide by zero");
  }
  Decimal quotient = value_ / divisor;
  return checkedResult(quotient, pair_, "divideBy");
}

Price Price::applyPercentageChange(const Percentage& change) const {
  Decimal multiplier = 1 + change.toRatio();
  Decimal changed = value_ * multiplier;
  return checkedResult(changed, pair_, "applyPercentageChange");
}

Percentage Price::percentageChangeTo(const Price& next) const {
  assertSamePair(next, "percentageChangeTo");
  Decimal change = (next.value_ - value_) / value_ * 100;
  return Percentage::from(change, true);
}

Percentage Price::percentageChangeFrom(const Price& previous) const {
  assertSamePair(previous, "percentageChangeFrom");
  return previous.percentageChangeTo(*this);
}

// -----------------------------------------------------------------------------
// Conversions across the pair
// -----------------------------------------------------------------------------
Amount Price::convertToQuote(const Amount& base_amount) const {
  if (base_amount.asset() != pair_.base()) {
    throw InvalidOperationError(
        "Price.convertToQuote",
        "Amount asset " + base_amount.asset().symbol() +
            " doesn't match pair base " + pair_.base().symbol());
  }
  Decimal converted = base_amount.decimal() * value_;
  return Amount::from(converted, pair_.quote());
}

Amount Price::convertToBase(const Amount& quote_amount) const {
  if (quote_amount.asset() != pair_.quote()) {
    throw InvalidOperationError(
        "Price.convertToBase",
        "Amount asset " + quote_amount.asset().symbol() +
            " doesn't match pair quote " + pair_.quote().symbol());
  }
  Decimal converted = quote_amount.decimal() / value_;
  return Amount::from(converted, pair_.base());
}

// -----------------------------------------------------------------------------
// Tick grid
// -----------------------------------------------------------------------------
Decimal Price::checkedTickSize(double tick_size, const char* operation) {
  if (!std::isfinite(tick_size) || tick_size <= 0) {
    throw InvalidOperationError(std::string("Price.") + operation,
                                "Tick size must be positive");
  }
  return decimalFromDouble(tick_size);
}

Price Price::roundToTickSize(double tick_size) const {
  const Decimal tick = checkedTickSize(tick_size, "roundToTickSize");
  Decimal ticks = boost::multiprecision::round(value_ / tick);
  Decimal rounded = ticks * tick;
  return checkedResult(rounded, pair_, "roundToTickSize");
}

Price Price::floorToTickSize(double tick_size) const {
  const Decimal tick = checkedTickSize(tick_size, "floorToTickSize");
  Decimal ticks = boost::multiprecision::floor(value_ / tick);
  Decimal floored = ticks * tick;
  return checkedResult(floored, pair_, "floorToTickSize");
}

Price Price::ceilToTickSize(double tick_size) const {
  const Decimal tick = checkedTickSize(tick_size, "ceilToTickSize");
  Decimal ticks = boost::multiprecision::ceil(value_ / tick);
  Decimal ceiled = ticks * tick;
  return checkedResult(ceiled, pair_, "ceilToTickSize");
}

Price Price::addTicks(long ticks, double tick_size) const {
  const Decimal tick = checkedTickSize(tick_size, "addTicks");
  Decimal shifted = value_ + tick * ticks;
  return checkedResult(shifted, pair_, "addTicks");
}

// -----------------------------------------------------------------------------
// Comparisons
// -----------------------------------------------------------------------------
bool Price::greaterThan(const Price& other) const {
  assertSamePair(other, "greaterThan");
  return value_ > other.value_;
}

bool Price::greaterThanOrEqual(const Price& other) const {
  assertSamePair(other, "greaterThanOrEqual");
  return value_ >= other.value_;
}

bool Price::lessThan(const Price& other) const {
  assertSamePair(other, "lessThan");
  return value_ < other.value_;
}

bool Price::lessThanOrEqual(const Price& other) const {
  assertSamePair(other, "lessThanOrEqual");
  return value_ <= other.value_;
}

bool Price::equals(const Price& other) const {
  return pair_ == other.pair_ && value_ == other.value_;
}

bool Price::isBetween(const Price& lower, const Price& upper) const {
  assertSamePair(lower, "isBetween");
  assertSamePair(upper, "isBetween");
  return value_ >= lower.value_ && value_ <= upper.value_;
}

Price Price::min(const Price& other) const {
  assertSamePair(other, "min");
  return value_ <= other.value_ ? *this : other;
}

Price Price::max(const Price& other) const {
  assertSamePair(other, "max");
  return value_ >= other.value_ ? *this : other;
}

void Price::assertSamePair(const Price& other, const char* operation) const {
  if (pair_ != other.pair_) {
    throw InvalidOperationError(
        std::string("Price.") + operation,
        "Cannot operate on prices from different pairs: " + pair_.symbol() +
            " vs " + other.pair_.symbol());
  }
}

std::string Price::format(std::optional<int> decimals) const {
  return formatDecimal(value_, decimals.value_or(-1));
}

std::string Price::toString() const {
  return format() + " " + pair_.symbol();
}

}  // namespace domain
}  // namespace tradekernel
