#pragma once

namespace tradekernel {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Buy spends the quote asset to acquire base; Sell does the reverse.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// OrderType
// -----------------------------------------------------------------------------
// Market orders execute immediately against the book. StopLoss and
// TakeProfit orders rest on the book until their stop price triggers, so
// they pass through Open before any fill.
// -----------------------------------------------------------------------------
enum class OrderType {
  Market,
  StopLoss,
  TakeProfit,
};

inline const char* toString(Side side) {
  switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

inline const char* toString(OrderType type) {
  switch (type) {
    case OrderType::Market:     return "MARKET";
    case OrderType::StopLoss:   return "STOP_LOSS";
    case OrderType::TakeProfit: return "TAKE_PROFIT";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace tradekernel
