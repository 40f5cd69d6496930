#pragma once

namespace tradekernel {
namespace domain {

// -----------------------------------------------------------------------------
// PositionStatus — position lifecycle state machine
// -----------------------------------------------------------------------------
//
//   Opening ───> Open ───> Closing ───> Closed
//                  │          │
//                  └────┬─────┘
//                       ├──> Closed      (exit fills without a closing order)
//                       └──> Liquidated  (forced exit, Extended profile only)
//
// Terminal states: Closed, Liquidated.
// -----------------------------------------------------------------------------
enum class PositionStatus {
  Opening,     // Entry order placed, not yet filled
  Open,        // Entry filled, exposure live
  Closing,     // Exit order placed
  Closed,      // Exit filled (terminal)
  Liquidated,  // Forced exit by the venue (terminal)
};

// Long profits when price rises, Short when it falls.
enum class PositionSide {
  Long,
  Short,
};

enum class PositionExitReason {
  StopLoss,
  TakeProfit,
  ManualClose,
  Liquidation,
  Expired,
};

// -----------------------------------------------------------------------------
// PositionProfile — which lifecycle shape a deployment uses
// -----------------------------------------------------------------------------
// Extended  Liquidated is a distinct terminal status.
// Basic     Opening/Open/Closing/Closed only; a liquidation closes the
//           position with exit reason Liquidation.
// -----------------------------------------------------------------------------
enum class PositionProfile {
  Basic,
  Extended,
};

inline bool isTerminal(PositionStatus status) {
  return status == PositionStatus::Closed ||
         status == PositionStatus::Liquidated;
}

inline const char* toString(PositionStatus status) {
  switch (status) {
    case PositionStatus::Opening:    return "OPENING";
    case PositionStatus::Open:       return "OPEN";
    case PositionStatus::Closing:    return "CLOSING";
    case PositionStatus::Closed:     return "CLOSED";
    case PositionStatus::Liquidated: return "LIQUIDATED";
  }
  return "UNKNOWN";
}

inline const char* toString(PositionSide side) {
  switch (side) {
    case PositionSide::Long:  return "LONG";
    case PositionSide::Short: return "SHORT";
  }
  return "UNKNOWN";
}

inline const char* toString(PositionExitReason reason) {
  switch (reason) {
    case PositionExitReason::StopLoss:    return "STOP_LOSS";
    case PositionExitReason::TakeProfit:  return "TAKE_PROFIT";
    case PositionExitReason::ManualClose: return "MANUAL_CLOSE";
    case PositionExitReason::Liquidation: return "LIQUIDATION";
    case PositionExitReason::Expired:     return "EXPIRED";
  }
  return "UNKNOWN";
}

inline const char* toString(PositionProfile profile) {
  switch (profile) {
    case PositionProfile::Basic:    return "basic";
    case PositionProfile::Extended: return "extended";
  }
  return "unknown";
}

}  // namespace domain
}  // namespace tradekernel
