#include "tradekernel/domain/position.hpp"
#include "tradekernel/domain/errors.hpp"

#include <utility>

namespace tradekernel {
namespace domain {

namespace {

// LONG: stop below entry. SHORT: stop above entry.
bool stopOnProtectiveSide(PositionSide side, const Price& entry,
                          const Price& stop_loss) {
  return side == PositionSide::Long ? stop_loss < entry : stop_loss > entry;
}

// LONG: target above entry. SHORT: target below entry.
bool targetOnProfitSide(PositionSide side, const Price& entry,
                        const Price& take_profit) {
  return side == PositionSide::Long ? take_profit > entry
                                    : take_profit < entry;
}

std::string directionRule(PositionSide side) {
  return side == PositionSide::Long
             ? "LONG requires stopLoss < entry < takeProfit"
             : "SHORT requires takeProfit < entry < stopLoss";
}

}  // namespace

Position::Position(const PositionOpenParams& params,
                   const ITimeProvider& clock)
    : id_(params.id),
      pair_(params.pair),
      side_(params.side),
      profile_(params.profile),
      intended_{params.entry_price, params.stop_loss, params.take_profit,
                params.size},
      stop_loss_(params.stop_loss),
      take_profit_(params.take_profit),
      entry_order_id_(params.entry_order_id),
      agent_id_(params.agent_id),
      strategy_id_(params.strategy_id),
      clock_(&clock) {
  created_at_ = now();
  updated_at_ = created_at_;
}

// -----------------------------------------------------------------------------
// open(): pair membership, size units, directional rule
// -----------------------------------------------------------------------------
Position Position::open(const PositionOpenParams& params,
                        const ITimeProvider& clock) {
  const TradingPair& pair = params.pair;

  const auto requirePair = [&pair](const Price& price, const char* field) {
    if (price.pair() != pair) {
      throw PositionValidationError(std::string(field) + " " +
                                    price.toString() +
                                    " is not priced in " + pair.symbol());
    }
  };
  requirePair(params.entry_price, "Entry price");
  requirePair(params.stop_loss, "Stop loss");
  requirePair(params.take_profit, "Take profit");

  if (params.size.asset() != pair.base()) {
    throw PositionValidationError("Size must be in base asset " +
                                  pair.base().symbol() + ", got " +
                                  params.size.toString());
  }
  if (!params.size.isValidSize()) {
    throw PositionValidationError("Size must be positive, got " +
                                  params.size.toString());
  }

  if (!stopOnProtectiveSide(params.side, params.entry_price,
                            params.stop_loss) ||
      !targetOnProfitSide(params.side, params.entry_price,
                          params.take_profit)) {
    throw PositionValidationError(
        directionRule(params.side) + " (entry " +
        params.entry_price.format() + ", stopLoss " +
        params.stop_loss.format() + ", takeProfit " +
        params.take_profit.format() + ")");
  }

  return Position(params, clock);
}

Timestamp Position::now() const { return ms_to_timestamp(clock_->now_ms()); }

void Position::requireStatus(bool allowed, const char* operation) const {
  if (!allowed) {
    throw InvalidStateTransitionError("Position", toString(status_),
                                      operation);
  }
}

void Position::requireInPair(const Price& price, const char* field) const {
  if (price.pair() != pair_) {
    throw PositionValidationError(std::string(field) + " " +
                                  price.toString() + " is not priced in " +
                                  pair_.symbol());
  }
}

void Position::requireQuoteFee(const std::optional<Amount>& fee,
                               const char* field) const {
  if (!fee) {
    return;
  }
  if (fee->asset() != pair_.quote()) {
    throw PositionValidationError(std::string(field) +
                                  " must be in quote asset " +
                                  pair_.quote().symbol() + ", got " +
                                  fee->toString());
  }
  if (fee->isNegative()) {
    throw PositionValidationError(std::string(field) +
                                  " cannot be negative, got " +
                                  fee->toString());
  }
}

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------
void Position::markAsOpened(const Price& actual_entry,
                            const Amount& actual_size,
                            const std::optional<Amount>& entry_fees,
                            const std::optional<OrderId>& stop_loss_order_id,
                            const std::optional<OrderId>& take_profit_order_id) {
  requireStatus(status_ == PositionStatus::Opening, "markAsOpened");
  requireInPair(actual_entry, "Actual entry");
  if (actual_size.asset() != pair_.base() || !actual_size.isValidSize()) {
    throw PositionValidationError("Actual size must be a positive " +
                                  pair_.base().symbol() + " amount, got " +
                                  actual_size.toString());
  }
  requireQuoteFee(entry_fees, "Entry fees");

  actual_entry_ = actual_entry;
  actual_size_ = actual_size;
  entry_fees_ = entry_fees;
  if (stop_loss_order_id) {
    stop_loss_order_id_ = stop_loss_order_id;
  }
  if (take_profit_order_id) {
    take_profit_order_id_ = take_profit_order_id;
  }
  status_ = PositionStatus::Open;
  updated_at_ = now();
  opened_at_ = updated_at_;
}

void Position::markAsClosing(const OrderId& exit_order_id) {
  requireStatus(status_ == PositionStatus::Open, "markAsClosing");
  exit_order_id_ = exit_order_id;
  status_ = PositionStatus::Closing;
  updated_at_ = now();
}

void Position::markAsClosed(const Price& exit_price,
                            PositionExitReason reason,
                            const std::optional<Amount>& exit_fees) {
  requireStatus(status_ == PositionStatus::Open ||
                    status_ == PositionStatus::Closing,
                "markAsClosed");
  if (reason == PositionExitReason::Liquidation) {
    throw PositionValidationError(
        "Liquidation exits go through markAsLiquidated, not markAsClosed");
  }
  finalize(exit_price, reason, PositionStatus::Closed, exit_fees);
}

void Position::markAsLiquidated(const Price& exit_price,
                                const std::optional<Amount>& exit_fees) {
  requireStatus(status_ == PositionStatus::Open ||
                    status_ == PositionStatus::Closing,
                "markAsLiquidated");
  const PositionStatus terminal = profile_ == PositionProfile::Extended
                                      ? PositionStatus::Liquidated
                                      : PositionStatus::Closed;
  finalize(exit_price, PositionExitReason::Liquidation, terminal, exit_fees);
}

// -----------------------------------------------------------------------------
// finalize(): shared exit bookkeeping; Open/Closing already verified
// -----------------------------------------------------------------------------
void Position::finalize(const Price& exit_price, PositionExitReason reason,
                        PositionStatus terminal,
                        const std::optional<Amount>& fees) {
  requireInPair(exit_price, "Exit price");
  requireQuoteFee(fees, "Exit fees");

  exit_price_ = exit_price;
  exit_fees_ = fees;
  exit_reason_ = reason;
  realized_pnl_ = grossPnLAt(exit_price).subtract(totalFees());
  status_ = terminal;
  updated_at_ = now();
  closed_at_ = updated_at_;
}

// -----------------------------------------------------------------------------
// Protective levels
// -----------------------------------------------------------------------------
void Position::updateStopLoss(const Price& stop_loss,
                              const std::optional<OrderId>& order_id) {
  requireStatus(status_ == PositionStatus::Open, "updateStopLoss");
  requireInPair(stop_loss, "Stop loss");
  if (!stopOnProtectiveSide(side_, *actual_entry_, stop_loss)) {
    throw PositionValidationError(
        std::string(toString(side_)) + " stop loss " + stop_loss.format() +
        " is on the wrong side of entry " + actual_entry_->format());
  }
  stop_loss_ = stop_loss;
  if (order_id) {
    stop_loss_order_id_ = order_id;
  }
  updated_at_ = now();
}

void Position::updateTakeProfit(const Price& take_profit,
                                const std::optional<OrderId>& order_id) {
  requireStatus(status_ == PositionStatus::Open, "updateTakeProfit");
  requireInPair(take_profit, "Take profit");
  if (!targetOnProfitSide(side_, *actual_entry_, take_profit)) {
    throw PositionValidationError(
        std::string(toString(side_)) + " take profit " +
        take_profit.format() + " is on the wrong side of entry " +
        actual_entry_->format());
  }
  take_profit_ = take_profit;
  if (order_id) {
    take_profit_order_id_ = order_id;
  }
  updated_at_ = now();
}

void Position::updateMetadata(const std::map<std::string, std::string>& tags) {
  requireStatus(!isClosed(), "updateMetadata");
  for (const auto& [key, value] : tags) {
    tags_[key] = value;
  }
  updated_at_ = now();
}

// -----------------------------------------------------------------------------
// P&L
// -----------------------------------------------------------------------------
Amount Position::grossPnLAt(const Price& exit) const {
  const Amount per_unit = side_ == PositionSide::Long
                              ? exit.subtract(*actual_entry_)
                              : actual_entry_->subtract(exit);
  return per_unit.multiply(actual_size_->decimal());
}

std::optional<Amount> Position::unrealizedPnL(const Price& mark) const {
  if (status_ != PositionStatus::Open) {
    return std::nullopt;
  }
  if (mark.pair() != pair_) {
    throw InvalidOperationError("Position.unrealizedPnL",
                                "Mark price " + mark.toString() +
                                    " is not priced in " + pair_.symbol());
  }
  return grossPnLAt(mark);
}

std::optional<Decimal> Position::roi() const {
  if (!realized_pnl_) {
    return std::nullopt;
  }
  Decimal initial = actual_entry_->decimal() * actual_size_->decimal();
  Decimal percent = realized_pnl_->decimal() / initial * 100;
  return percent;
}

std::optional<std::chrono::milliseconds> Position::duration() const {
  if (!opened_at_) {
    return std::nullopt;
  }
  const Timestamp end = closed_at_.value_or(now());
  return std::chrono::duration_cast<std::chrono::milliseconds>(end -
                                                               *opened_at_);
}

std::optional<Amount> Position::entrySlippage() const {
  if (!actual_entry_) {
    return std::nullopt;
  }
  return actual_entry_->subtract(intended_.entry);
}

std::optional<Amount> Position::exitSlippage() const {
  if (!exit_price_ || !exit_reason_) {
    return std::nullopt;
  }
  switch (*exit_reason_) {
    case PositionExitReason::StopLoss:
      return exit_price_->subtract(stop_loss_);
    case PositionExitReason::TakeProfit:
      return exit_price_->subtract(take_profit_);
    case PositionExitReason::ManualClose:
    case PositionExitReason::Liquidation:
    case PositionExitReason::Expired:
      return std::nullopt;
  }
  return std::nullopt;
}

Amount Position::totalFees() const {
  Amount total = Amount::zero(pair_.quote());
  if (entry_fees_) {
    total = total.add(*entry_fees_);
  }
  if (exit_fees_) {
    total = total.add(*exit_fees_);
  }
  return total;
}

}  // namespace domain
}  // namespace tradekernel
