#pragma once

#include "tradekernel/time/i_time_provider.hpp"

namespace tradekernel {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// Thread model:
//   system_clock::now() is safe from any thread. No internal state.
//
// Ownership:
//   Created by the host (tradekernel_demo, an order-management service) and
//   lent to the TradeLedger by const reference.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace tradekernel
