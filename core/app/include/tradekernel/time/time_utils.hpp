#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tradekernel {

// Wall-clock instant carried by every entity and value type.
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions that convert between Timestamp and int64_t
//         milliseconds since epoch.
//
// @details
// ITimeProvider speaks epoch milliseconds; entities store Timestamp. These
// bridge the two. The conversions are inline one-liners; the ISO-8601
// formatter lives in time_utils.cpp.
//
// Thread-safety: Stateless. Safe to call from any thread.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// format_iso8601
// -------------------------------------------------------------------------
// @brief  Renders a Timestamp as UTC "YYYY-MM-DDTHH:MM:SS.mmmZ".
//
// @details
// Used by the JSON projections. Millisecond resolution matches the
// ITimeProvider contract; anything finer is truncated.
// -------------------------------------------------------------------------
std::string format_iso8601(Timestamp tp);

}  // namespace tradekernel
