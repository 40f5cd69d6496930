#include "tradekernel/domain/decimal.hpp"
#include "tradekernel/domain/errors.hpp"

#include <cstdlib>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace tradekernel {

namespace {

constexpr int kShortestFractionDigits = 18;

}  // namespace

// -----------------------------------------------------------------------------
// decimalFromDouble(): shortest round-trip text, then parse
// -----------------------------------------------------------------------------
Decimal decimalFromDouble(double value) {
  // 15 significant digits round-trips most literals (0.1, 50000.25). Only
  // values that need more (results of binary arithmetic) fall through to 17.
  std::string text;
  for (int precision = 15; precision <= 17; ++precision) {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::setprecision(precision) << value;
    text = out.str();
    if (std::strtod(text.c_str(), nullptr) == value) {
      break;
    }
  }
  return Decimal(text.c_str());
}

// -----------------------------------------------------------------------------
// parseDecimal(): translate Boost's parse failure into the domain taxonomy
// -----------------------------------------------------------------------------
Decimal parseDecimal(const std::string& text) {
  if (text.empty()) {
    throw InvalidValueError("Decimal", "Value must not be empty", text);
  }
  Decimal parsed;
  try {
    parsed = Decimal(text.c_str());
  } catch (const std::runtime_error&) {
    throw InvalidValueError("Decimal", "Value is not a decimal number", text);
  }
  if (!isFiniteDecimal(parsed)) {
    throw InvalidValueError("Decimal", "Value must be a finite number", text);
  }
  return parsed;
}

bool isFiniteDecimal(const Decimal& value) {
  return (boost::multiprecision::isfinite)(value);
}

double toDouble(const Decimal& value) {
  return value.convert_to<double>();
}

// -----------------------------------------------------------------------------
// formatDecimal(): fixed notation, optionally trimmed
// -----------------------------------------------------------------------------
std::string formatDecimal(const Decimal& value, int decimals) {
  if (decimals >= 0) {
    return value.str(decimals, std::ios_base::fixed);
  }

  std::string text = value.str(kShortestFractionDigits, std::ios_base::fixed);
  if (text.find('.') != std::string::npos) {
    text.erase(text.find_last_not_of('0') + 1);
    if (text.back() == '.') {
      text.pop_back();
    }
  }
  if (text == "-0") {
    text = "0";
  }
  return text;
}

}  // namespace tradekernel
