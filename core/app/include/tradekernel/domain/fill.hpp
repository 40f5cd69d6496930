#pragma once

#include "tradekernel/domain/amount.hpp"
#include "tradekernel/domain/identifiers.hpp"
#include "tradekernel/domain/order_types.hpp"
#include "tradekernel/domain/price.hpp"
#include "tradekernel/domain/trading_pair.hpp"
#include "tradekernel/time/time_utils.hpp"

#include <string>

namespace tradekernel {
namespace domain {

// Raw execution report fields, validated by Fill::from().
struct FillParams {
  TradingPair pair;
  ExchangeOrderId exchange_order_id;
  Amount executed_quantity;
  Price execution_price;
  Amount fee;
  Timestamp timestamp;
  std::string trade_id;
};

// -----------------------------------------------------------------------------
// Fill — one exchange-reported execution, immutable audit record
// -----------------------------------------------------------------------------
//
// @brief  Quantity executed at one price for one exchange order.
//
// @details
// Validation (InvalidValueError, value_type "Fill"):
//   - executed quantity > 0, denominated in the pair base
//   - execution price belongs to the pair
//   - fee >= 0 (any asset; Order::addFill restricts it to base or quote)
//   - trade id is non-blank
// -----------------------------------------------------------------------------
class Fill {
 public:
  static Fill from(const FillParams& params);

  const TradingPair& pair() const { return pair_; }
  const ExchangeOrderId& exchangeOrderId() const { return exchange_order_id_; }
  const Amount& executedQuantity() const { return executed_quantity_; }
  const Price& executionPrice() const { return execution_price_; }
  const Amount& fee() const { return fee_; }
  Timestamp timestamp() const { return timestamp_; }
  const std::string& tradeId() const { return trade_id_; }

  // quantity x price, in quote.
  Amount grossTotal() const;

  // -------------------------------------------------------------------------
  // netTotal(side)
  // -------------------------------------------------------------------------
  // @brief  Cash actually moved by the execution, in quote.
  //
  // @details
  //   Buy  -> gross + fee  (paid out)
  //   Sell -> gross - fee  (received)
  //
  // @throws InvalidOperationError when the fee is not in the quote asset.
  // -------------------------------------------------------------------------
  Amount netTotal(Side side) const;

  bool matchesOrder(const ExchangeOrderId& exchange_order_id) const {
    return exchange_order_id_ == exchange_order_id;
  }

  // "Fill: 0.5 BTC @ 50000 (fee: 25 USDT)"
  std::string toString() const;

 private:
  explicit Fill(const FillParams& params);

  TradingPair pair_;
  ExchangeOrderId exchange_order_id_;
  Amount executed_quantity_;
  Price execution_price_;
  Amount fee_;
  Timestamp timestamp_;
  std::string trade_id_;
};

}  // namespace domain
}  // namespace tradekernel
