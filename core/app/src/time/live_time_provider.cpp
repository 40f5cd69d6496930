#include "tradekernel/time/live_time_provider.hpp"
#include "tradekernel/time/time_utils.hpp"

#include <chrono>

namespace tradekernel {

// -----------------------------------------------------------------------------
// now_ms(): delegate to system_clock and convert to epoch milliseconds
// -----------------------------------------------------------------------------
std::int64_t LiveTimeProvider::now_ms() const {
  return timestamp_to_ms(std::chrono::system_clock::now());
}

}  // namespace tradekernel
