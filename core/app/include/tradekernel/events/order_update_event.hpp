#pragma once

#include "tradekernel/domain/order.hpp"
#include "tradekernel/domain/order_status.hpp"
#include "tradekernel/time/time_utils.hpp"

#include <cstdint>
#include <optional>

namespace tradekernel {

// -----------------------------------------------------------------------------
// OrderUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by the TradeLedger after every successful order mutation.
//
// @details
// `order` is a full copy taken after the mutation. `previous_status` is
// empty for the event that announces a newly placed order.
//
// Ownership:
//   Self-contained. No references to ledger state.
// -----------------------------------------------------------------------------
struct OrderUpdateEvent {
  domain::Order order;
  std::optional<domain::OrderStatus> previous_status;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace tradekernel
