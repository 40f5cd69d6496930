#pragma once

#include <cstdint>

namespace tradekernel {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// Entities stamp createdAt, submittedAt, openedAt and friends whenever they
// transition. If they read the system clock directly, a replayed session or
// a unit test could never reproduce those timestamps. Instead every entity
// factory takes a `const ITimeProvider&`:
//   - LiveTimeProvider       -> delegates to std::chrono::system_clock.
//   - SimulationTimeProvider -> returns a value set by the caller.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//   Writers (SimulationTimeProvider::advance_time) synchronize with readers
//   internally.
//
// Ownership:
//   Entities and the TradeLedger hold a non-owning pointer or reference. The
//   provider must outlive every entity stamped by it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tradekernel
