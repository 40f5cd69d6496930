#pragma once

#include "tradekernel/time/time_utils.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace tradekernel {

// Candle width. Canonical strings follow exchange conventions ("1m" is one
// minute, "1M" is one month).
enum class Timeframe {
  OneSecond,
  OneMinute,
  ThreeMinutes,
  FiveMinutes,
  FifteenMinutes,
  ThirtyMinutes,
  OneHour,
  TwoHours,
  FourHours,
  SixHours,
  EightHours,
  TwelveHours,
  OneDay,
  ThreeDays,
  OneWeek,
  OneMonth
};

// -------------------------------------------------------------------------
// timeframe_duration
// -------------------------------------------------------------------------
// @brief  Fixed width of a timeframe. Total over the enum; a month is
//         approximated as 30 days.
// -------------------------------------------------------------------------
std::chrono::milliseconds timeframe_duration(Timeframe timeframe);

// "15m", "1h", "1M"
const char* to_string(Timeframe timeframe);

// Inverse of to_string(). Case-sensitive. Throws InvalidValueError for
// anything outside the canonical set.
Timeframe parse_timeframe(const std::string& text);

// True when `tp` falls on a boundary of the timeframe grid anchored at the
// Unix epoch.
bool is_aligned(Timestamp tp, Timeframe timeframe);

}  // namespace tradekernel
