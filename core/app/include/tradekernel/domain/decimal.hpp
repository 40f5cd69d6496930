#pragma once

#include <boost/multiprecision/cpp_dec_float.hpp>

#include <string>

namespace tradekernel {

// -----------------------------------------------------------------------------
// Decimal — arbitrary precision magnitude used by every value type
// -----------------------------------------------------------------------------
//
// @brief  50 significant decimal digits, base-10 storage. Chained fee and
//         P&L arithmetic stays exact where binary doubles would drift.
//
// @details
// cpp_dec_float_50 is expression-template enabled. Always bind results to a
// named Decimal (never `auto`) so the expression is evaluated before the
// operands go out of scope.
//
// Doubles enter the type through their shortest round-trip text form, so
// decimalFromDouble(0.1) is exactly one tenth rather than the nearest binary
// fraction.
// -----------------------------------------------------------------------------
using Decimal = boost::multiprecision::cpp_dec_float_50;

// Converts a finite double through its shortest round-trip representation.
// Callers must reject non-finite input before calling.
Decimal decimalFromDouble(double value);

// Parses a plain or exponent-notation decimal literal. Throws
// InvalidValueError (value_type "Decimal") on malformed input.
Decimal parseDecimal(const std::string& text);

bool isFiniteDecimal(const Decimal& value);

double toDouble(const Decimal& value);

// -------------------------------------------------------------------------
// formatDecimal(value, decimals)
// -------------------------------------------------------------------------
// @brief  Renders a Decimal in fixed notation.
//
// @param  decimals  Number of fractional digits. A negative value renders
//                   the shortest fixed form (trailing zeros removed, up to
//                   18 fractional digits).
// -------------------------------------------------------------------------
std::string formatDecimal(const Decimal& value, int decimals = -1);

}  // namespace tradekernel
