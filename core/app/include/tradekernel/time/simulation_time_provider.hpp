#pragma once

#include "tradekernel/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tradekernel {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" is set explicitly by the caller
//         rather than read from the system clock.
//
// @details
// Used for replaying recorded exchange events and in every unit test: the
// test sets the clock, performs a transition and asserts the exact stamped
// timestamp.
//
// Internal storage:
//   std::atomic<int64_t> current_time_ms_. A reader on another thread sees
//   the latest advance_time() without a mutex.
//
// Thread model:
//   advance_time() from one writer, now_ms() from any number of readers.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  explicit SimulationTimeProvider(std::int64_t start_time_ms)
      : current_time_ms_(start_time_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to the given epoch milliseconds.
  //
  // @details
  // Monotonicity is the caller's responsibility; tests rely on being able to
  // set arbitrary times.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace tradekernel
