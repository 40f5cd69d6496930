#include "tradekernel/domain/fill.hpp"
#include "tradekernel/domain/errors.hpp"

namespace tradekernel {
namespace domain {

Fill::Fill(const FillParams& params)
    : pair_(params.pair),
      exchange_order_id_(params.exchange_order_id),
      executed_quantity_(params.executed_quantity),
      execution_price_(params.execution_price),
      fee_(params.fee),
      timestamp_(params.timestamp),
      trade_id_(params.trade_id) {}

Fill Fill::from(const FillParams& params) {
  if (!params.executed_quantity.isValidSize()) {
    throw InvalidValueError("Fill", "Executed quantity must be positive",
                            params.executed_quantity.toString());
  }
  if (params.executed_quantity.asset() != params.pair.base()) {
    throw InvalidValueError(
        "Fill",
        "Executed quantity asset " +
            params.executed_quantity.asset().symbol() +
            " does not match pair base " + params.pair.base().symbol(),
        params.executed_quantity.toString());
  }
  if (params.execution_price.pair() != params.pair) {
    throw InvalidValueError("Fill",
                            "Execution price pair does not match fill pair " +
                                params.pair.symbol(),
                            params.execution_price.toString());
  }
  if (!params.fee.isValidVolume()) {
    throw InvalidValueError("Fill", "Fee cannot be negative",
                            params.fee.toString());
  }
  if (params.trade_id.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw InvalidValueError("Fill", "Trade ID cannot be empty",
                            params.trade_id);
  }
  return Fill(params);
}

Amount Fill::grossTotal() const {
  return execution_price_.convertToQuote(executed_quantity_);
}

Amount Fill::netTotal(Side side) const {
  if (fee_.asset() != pair_.quote()) {
    throw InvalidOperationError("Fill.netTotal",
                                "Fee asset " + fee_.asset().symbol() +
                                    " must match quote asset " +
                                    pair_.quote().symbol());
  }
  const Amount gross = grossTotal();
  return side == Side::Buy ? gross.add(fee_) : gross.subtract(fee_);
}

std::string Fill::toString() const {
  return "Fill: " + executed_quantity_.format() + " @ " +
         execution_price_.format() + " (fee: " + fee_.format() + ")";
}

}  // namespace domain
}  // namespace tradekernel
