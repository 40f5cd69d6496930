#pragma once

namespace tradekernel {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus — order lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Every state an Order can occupy between creation and archive.
//
// @details
// The Order entity enforces the transition graph:
//
//   Pending ───> Submitted ───> Open ───> PartiallyFilled ───> Filled
//      │             │            │            │     ▲
//      │ (market     │ (market    │            └─────┘
//      │  fills)     │  fills)    │
//      ├─────────────┴────────────┴──> PartiallyFilled / Filled
//      ├──> Cancelled   (from any non-terminal state)
//      ├──> Rejected    (from Pending or Submitted)
//      └──> Failed      (from any state except Filled)
//
// Terminal states: Filled, Cancelled, Rejected, Failed.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,          // Created locally, not yet sent
  Submitted,        // Accepted by the exchange, exchange id assigned
  Open,             // Resting on the book (stop / take-profit orders)
  PartiallyFilled,  // Some quantity executed
  Filled,           // Requested quantity executed (terminal)
  Cancelled,        // Cancelled by request (terminal)
  Rejected,         // Refused by the exchange (terminal)
  Failed,           // Local or transport failure (terminal)
};

inline bool isTerminal(OrderStatus status) {
  return status == OrderStatus::Filled ||
         status == OrderStatus::Cancelled ||
         status == OrderStatus::Rejected ||
         status == OrderStatus::Failed;
}

inline const char* toString(OrderStatus status) {
  switch (status) {
    case OrderStatus::Pending:         return "PENDING";
    case OrderStatus::Submitted:       return "SUBMITTED";
    case OrderStatus::Open:            return "OPEN";
    case OrderStatus::PartiallyFilled: return "PARTIALLY_FILLED";
    case OrderStatus::Filled:          return "FILLED";
    case OrderStatus::Cancelled:       return "CANCELLED";
    case OrderStatus::Rejected:        return "REJECTED";
    case OrderStatus::Failed:          return "FAILED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace tradekernel
