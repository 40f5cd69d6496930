#include "tradekernel/time/timeframe.hpp"
#include "tradekernel/domain/errors.hpp"

#include <array>

namespace tradekernel {

namespace {

constexpr std::array<Timeframe, 16> kAllTimeframes = {
    Timeframe::OneSecond,      Timeframe::OneMinute,
    Timeframe::ThreeMinutes,   Timeframe::FiveMinutes,
    Timeframe::FifteenMinutes, Timeframe::ThirtyMinutes,
    Timeframe::OneHour,        Timeframe::TwoHours,
    Timeframe::FourHours,      Timeframe::SixHours,
    Timeframe::EightHours,     Timeframe::TwelveHours,
    Timeframe::OneDay,         Timeframe::ThreeDays,
    Timeframe::OneWeek,        Timeframe::OneMonth};

}  // namespace

// -----------------------------------------------------------------------------
// timeframe_duration(): one case per enumerator, no fallback lookup
// -----------------------------------------------------------------------------
std::chrono::milliseconds timeframe_duration(Timeframe timeframe) {
  using std::chrono::hours;
  using std::chrono::minutes;
  using std::chrono::seconds;
  using std::chrono::milliseconds;

  switch (timeframe) {
    case Timeframe::OneSecond:      return seconds{1};
    case Timeframe::OneMinute:      return minutes{1};
    case Timeframe::ThreeMinutes:   return minutes{3};
    case Timeframe::FiveMinutes:    return minutes{5};
    case Timeframe::FifteenMinutes: return minutes{15};
    case Timeframe::ThirtyMinutes:  return minutes{30};
    case Timeframe::OneHour:        return hours{1};
    case Timeframe::TwoHours:       return hours{2};
    case Timeframe::FourHours:      return hours{4};
    case Timeframe::SixHours:       return hours{6};
    case Timeframe::EightHours:     return hours{8};
    case Timeframe::TwelveHours:    return hours{12};
    case Timeframe::OneDay:         return hours{24};
    case Timeframe::ThreeDays:      return hours{24 * 3};
    case Timeframe::OneWeek:        return hours{24 * 7};
    case Timeframe::OneMonth:       return hours{24 * 30};
  }
  return milliseconds{0};
}

const char* to_string(Timeframe timeframe) {
  switch (timeframe) {
    case Timeframe::OneSecond:      return "1s";
    case Timeframe::OneMinute:      return "1m";
    case Timeframe::ThreeMinutes:   return "3m";
    case Timeframe::FiveMinutes:    return "5m";
    case Timeframe::FifteenMinutes: return "15m";
    case Timeframe::ThirtyMinutes:  return "30m";
    case Timeframe::OneHour:        return "1h";
    case Timeframe::TwoHours:       return "2h";
    case Timeframe::FourHours:      return "4h";
    case Timeframe::SixHours:       return "6h";
    case Timeframe::EightHours:     return "8h";
    case Timeframe::TwelveHours:    return "12h";
    case Timeframe::OneDay:         return "1d";
    case Timeframe::ThreeDays:      return "3d";
    case Timeframe::OneWeek:        return "1w";
    case Timeframe::OneMonth:       return "1M";
  }
  return "unknown";
}

Timeframe parse_timeframe(const std::string& text) {
  for (Timeframe candidate : kAllTimeframes) {
    if (text == to_string(candidate)) {
      return candidate;
    }
  }
  throw InvalidValueError("Timeframe",
                          "Must be one of 1s, 1m, 3m, 5m, 15m, 30m, 1h, 2h, "
                          "4h, 6h, 8h, 12h, 1d, 3d, 1w, 1M",
                          text);
}

bool is_aligned(Timestamp tp, Timeframe timeframe) {
  return timestamp_to_ms(tp) % timeframe_duration(timeframe).count() == 0;
}

}  // namespace tradekernel
