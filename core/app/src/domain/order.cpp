#include "tradekernel/domain/order.hpp"
#include "tradekernel/domain/errors.hpp"

#include <algorithm>
#include <utility>

namespace tradekernel {
namespace domain {

Order::Order(OrderId id, OrderParameters parameters,
             const ITimeProvider& clock)
    : id_(std::move(id)), parameters_(std::move(parameters)), clock_(&clock) {
  created_at_ = now();
  updated_at_ = created_at_;
}

Order Order::create(const OrderId& id, const OrderParameters& parameters,
                    const ITimeProvider& clock) {
  return Order(id, parameters, clock);
}

Timestamp Order::now() const { return ms_to_timestamp(clock_->now_ms()); }

// -----------------------------------------------------------------------------
// canTransition: the legal OrderStatus graph
// -----------------------------------------------------------------------------
bool Order::canTransition(OrderStatus current, OrderStatus next) {
  using S = OrderStatus;

  switch (current) {
    case S::Pending:
      return next == S::Submitted ||
             next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Cancelled ||
             next == S::Rejected ||
             next == S::Failed;

    case S::Submitted:
      return next == S::Open ||
             next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Cancelled ||
             next == S::Rejected ||
             next == S::Failed;

    case S::Open:
    case S::PartiallyFilled:
      return next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Cancelled ||
             next == S::Failed;

    // A failure can still be recorded over any outcome but a completed fill.
    case S::Cancelled:
    case S::Rejected:
    case S::Failed:
      return next == S::Failed;

    case S::Filled:
      return false;
  }

  return false;
}

void Order::transitionTo(OrderStatus next, const char* operation) {
  if (!canTransition(status_, next)) {
    throw InvalidStateTransitionError("Order", toString(status_), operation);
  }
  status_ = next;
  updated_at_ = now();
  if (isTerminal() && !completed_at_) {
    completed_at_ = updated_at_;
  }
}

// -----------------------------------------------------------------------------
// submit / open
// -----------------------------------------------------------------------------
void Order::submit(const ExchangeOrderId& exchange_order_id) {
  transitionTo(OrderStatus::Submitted, "submit");
  exchange_order_id_ = exchange_order_id;
  submitted_at_ = updated_at_;
}

void Order::open() { transitionTo(OrderStatus::Open, "open"); }

// -----------------------------------------------------------------------------
// addFill: validate ownership, then status, then append and re-derive
// -----------------------------------------------------------------------------
void Order::addFill(const Fill& fill) {
  const TradingPair& pair = parameters_.pair();

  if (fill.pair() != pair) {
    throw OrderValidationError("Fill pair " + fill.pair().symbol() +
                               " does not match order pair " + pair.symbol());
  }
  const Asset& fee_asset = fill.fee().asset();
  if (fee_asset != pair.base() && fee_asset != pair.quote()) {
    throw OrderValidationError("Fill fee asset " + fee_asset.symbol() +
                               " is neither base nor quote of " +
                               pair.symbol());
  }
  if (exchange_order_id_ && !fill.matchesOrder(*exchange_order_id_)) {
    throw OrderValidationError("Fill exchange order ID " +
                               fill.exchangeOrderId().value() +
                               " does not match order " +
                               exchange_order_id_->value());
  }

  using S = OrderStatus;
  const bool accepts =
      parameters_.isMarketOrder()
          ? (status_ == S::Pending || status_ == S::Submitted ||
             status_ == S::PartiallyFilled)
          : (status_ == S::Open || status_ == S::PartiallyFilled);
  if (!accepts) {
    throw InvalidStateTransitionError("Order", toString(status_), "addFill");
  }

  fills_.push_back(fill);

  const bool complete =
      totalFilledQuantity().greaterThanOrEqual(parameters_.quantity());
  status_ = complete ? S::Filled : S::PartiallyFilled;
  updated_at_ = now();
  if (complete) {
    completed_at_ = updated_at_;
  }
}

void Order::cancel() { transitionTo(OrderStatus::Cancelled, "cancel"); }

void Order::reject(const std::string& reason) {
  transitionTo(OrderStatus::Rejected, "reject");
  rejection_reason_ = reason;
}

void Order::fail(const std::string& reason) {
  transitionTo(OrderStatus::Failed, "fail");
  if (!rejection_reason_) {
    rejection_reason_ = reason;
  }
}

// -----------------------------------------------------------------------------
// Aggregates, recomputed from fills_ on every call
// -----------------------------------------------------------------------------
Amount Order::totalFilledQuantity() const {
  Amount total = Amount::zero(parameters_.quantity().asset());
  for (const Fill& fill : fills_) {
    total = total.add(fill.executedQuantity());
  }
  return total;
}

Amount Order::totalFees() const { return totalFees(parameters_.pair().quote()); }

Amount Order::totalFees(const Asset& asset) const {
  Amount total = Amount::zero(asset);
  for (const Fill& fill : fills_) {
    if (fill.fee().asset() == asset) {
      total = total.add(fill.fee());
    }
  }
  return total;
}

std::vector<Amount> Order::feesByAsset() const {
  std::vector<Amount> totals;
  for (const Fill& fill : fills_) {
    auto it = std::find_if(totals.begin(), totals.end(),
                           [&fill](const Amount& total) {
                             return total.asset() == fill.fee().asset();
                           });
    if (it == totals.end()) {
      totals.push_back(fill.fee());
    } else {
      *it = it->add(fill.fee());
    }
  }
  return totals;
}

Amount Order::feesInQuote() const {
  const TradingPair& pair = parameters_.pair();
  Amount total = Amount::zero(pair.quote());
  for (const Fill& fill : fills_) {
    if (fill.fee().asset() == pair.base()) {
      total = total.add(fill.executionPrice().convertToQuote(fill.fee()));
    } else {
      total = total.add(fill.fee());
    }
  }
  return total;
}

Amount Order::netFilledQuantity() const {
  const Amount filled = totalFilledQuantity();
  if (parameters_.side() == Side::Sell) {
    return filled;
  }
  return filled.subtractOrZero(totalFees(parameters_.pair().base()));
}

std::optional<Price> Order::averageFillPrice() const {
  if (fills_.empty()) {
    return std::nullopt;
  }
  Decimal notional = 0;
  Decimal quantity = 0;
  for (const Fill& fill : fills_) {
    notional += fill.executedQuantity().decimal() *
                fill.executionPrice().decimal();
    quantity += fill.executedQuantity().decimal();
  }
  Decimal average = notional / quantity;
  return Price::from(average, parameters_.pair());
}

Amount Order::remainingQuantity() const {
  return parameters_.quantity().subtractOrZero(totalFilledQuantity());
}

}  // namespace domain
}  // namespace tradekernel
