#pragma once

#include "tradekernel/domain/position.hpp"
#include "tradekernel/domain/position_status.hpp"
#include "tradekernel/time/time_utils.hpp"

#include <cstdint>
#include <optional>

namespace tradekernel {

// -----------------------------------------------------------------------------
// PositionUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of a Position after a ledger mutation. Level updates and
//         metadata changes publish with previous_status equal to the
//         current status.
//
// Ownership:
//   Self-contained. No references to ledger state.
// -----------------------------------------------------------------------------
struct PositionUpdateEvent {
  domain::Position position;
  std::optional<domain::PositionStatus> previous_status;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace tradekernel
