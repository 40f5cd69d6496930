#pragma once

#include "tradekernel/events/order_update_event.hpp"
#include "tradekernel/events/position_update_event.hpp"

#include <variant>

namespace tradekernel {

// Envelope for everything the EventBus carries. Dispatch with std::visit or
// std::get_if.
using Event = std::variant<OrderUpdateEvent, PositionUpdateEvent>;

}  // namespace tradekernel
