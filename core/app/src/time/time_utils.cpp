#include "tradekernel/time/time_utils.hpp"

#include <cstdio>
#include <ctime>

namespace tradekernel {

// -----------------------------------------------------------------------------
// format_iso8601(): floor to whole seconds for gmtime_r, append millis
// -----------------------------------------------------------------------------
std::string format_iso8601(Timestamp tp) {
  const std::int64_t total_ms = timestamp_to_ms(tp);
  std::int64_t seconds = total_ms / 1000;
  std::int64_t millis = total_ms % 1000;
  if (millis < 0) {
    millis += 1000;
    seconds -= 1;
  }

  const std::time_t as_time_t = static_cast<std::time_t>(seconds);
  std::tm utc{};
  gmtime_r(&as_time_t, &utc);

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, static_cast<int>(millis));
  return buffer;
}

}  // namespace tradekernel
