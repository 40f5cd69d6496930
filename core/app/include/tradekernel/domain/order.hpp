#pragma once

#include "tradekernel/domain/amount.hpp"
#include "tradekernel/domain/asset.hpp"
#include "tradekernel/domain/fill.hpp"
#include "tradekernel/domain/identifiers.hpp"
#include "tradekernel/domain/order_parameters.hpp"
#include "tradekernel/domain/order_status.hpp"
#include "tradekernel/domain/price.hpp"
#include "tradekernel/time/i_time_provider.hpp"
#include "tradekernel/time/time_utils.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tradekernel {
namespace domain {

// -----------------------------------------------------------------------------
// Order — lifecycle of one exchange order, from creation to terminal state
// -----------------------------------------------------------------------------
//
// @brief  Records what was requested (OrderParameters) against what the
//         exchange reported (fills), enforcing the OrderStatus graph.
//
// @details
// Every mutator checks its precondition first and throws without touching
// any field when it fails:
//   - InvalidStateTransitionError when the current status forbids the call
//   - OrderValidationError when a fill does not belong to this order
//
// Fills are append-only. Every aggregate (filled quantity, fees, average
// price, remaining quantity) is recomputed from the fill list on each call;
// nothing is cached.
//
// A fill that pushes the cumulative quantity past the requested quantity is
// accepted. The exchange is the source of truth for what executed; the
// order simply becomes Filled.
//
// Thread model:
//   Not internally synchronized. Exactly one logical owner mutates an Order
//   at a time; the TradeLedger serializes access by id.
//
// Ownership:
//   Holds a non-owning pointer to the ITimeProvider used for timestamps. The
//   provider must outlive the Order and every copy of it.
// -----------------------------------------------------------------------------
class Order {
 public:
  // -------------------------------------------------------------------------
  // create(id, parameters, clock)
  // -------------------------------------------------------------------------
  // @brief  New order in Pending, with createdAt = updatedAt = clock now.
  // -------------------------------------------------------------------------
  static Order create(const OrderId& id, const OrderParameters& parameters,
                      const ITimeProvider& clock);

  const OrderId& id() const { return id_; }
  const OrderParameters& parameters() const { return parameters_; }
  OrderStatus status() const { return status_; }
  const std::optional<ExchangeOrderId>& exchangeOrderId() const {
    return exchange_order_id_;
  }
  // Copy of the fill list.
  std::vector<Fill> fills() const { return fills_; }
  std::size_t fillCount() const { return fills_.size(); }
  Timestamp createdAt() const { return created_at_; }
  Timestamp updatedAt() const { return updated_at_; }
  const std::optional<Timestamp>& submittedAt() const { return submitted_at_; }
  const std::optional<Timestamp>& completedAt() const { return completed_at_; }
  // Set by reject() and fail().
  const std::optional<std::string>& rejectionReason() const {
    return rejection_reason_;
  }

  // Pending -> Submitted. Records the exchange id and submittedAt.
  void submit(const ExchangeOrderId& exchange_order_id);

  // Submitted -> Open. Resting orders only; market orders skip it.
  void open();

  // -------------------------------------------------------------------------
  // addFill(fill)
  // -------------------------------------------------------------------------
  // @brief  Appends an execution and moves to PartiallyFilled or Filled.
  //
  // @details
  // Checks, in order:
  //   1. fill pair equals the order pair              (OrderValidation)
  //   2. fee asset is the pair base or quote           (OrderValidation)
  //   3. fill exchange id matches, once one is known   (OrderValidation)
  //   4. status accepts fills                          (StateTransition)
  //        Market:              Pending, Submitted, PartiallyFilled
  //        StopLoss/TakeProfit: Open, PartiallyFilled
  //
  // Filled sets completedAt.
  // -------------------------------------------------------------------------
  void addFill(const Fill& fill);

  // Any non-terminal status -> Cancelled. Sets completedAt.
  void cancel();

  // Pending or Submitted -> Rejected. Stores the reason, sets completedAt.
  void reject(const std::string& reason);

  // Any status except Filled -> Failed. From a terminal status the first
  // completedAt and any earlier reason are kept.
  void fail(const std::string& reason);

  // -------------------------------------------------------------------------
  // Derived views
  // -------------------------------------------------------------------------
  Amount totalFilledQuantity() const;
  // Sum of fees paid in the quote asset.
  Amount totalFees() const;
  // Sum of fees paid in `asset`; zero when no fill paid in it.
  Amount totalFees(const Asset& asset) const;
  // One total per fee asset named by the fills, in first-seen order.
  std::vector<Amount> feesByAsset() const;
  // -------------------------------------------------------------------------
  // feesInQuote()
  // -------------------------------------------------------------------------
  // Every fee valued in the quote asset. A base-asset fee is converted at the
  // execution price of the fill that charged it.
  // -------------------------------------------------------------------------
  Amount feesInQuote() const;
  // Base quantity the order left in the account. A Buy loses its base-asset
  // fees; a Sell pays them on top and keeps the full filled quantity.
  Amount netFilledQuantity() const;
  // Quantity-weighted average execution price; empty before the first fill.
  std::optional<Price> averageFillPrice() const;
  // Requested minus filled, floored at zero.
  Amount remainingQuantity() const;

  bool isTerminal() const { return domain::isTerminal(status_); }
  bool isActive() const { return !isTerminal(); }

  // -------------------------------------------------------------------------
  // canTransition(current, next)
  // -------------------------------------------------------------------------
  // @brief  The OrderStatus graph as a pure function. Every mutator consults
  //         it before changing status.
  // -------------------------------------------------------------------------
  static bool canTransition(OrderStatus current, OrderStatus next);

 private:
  Order(OrderId id, OrderParameters parameters, const ITimeProvider& clock);

  void transitionTo(OrderStatus next, const char* operation);
  Timestamp now() const;

  OrderId id_;
  OrderParameters parameters_;
  OrderStatus status_{OrderStatus::Pending};
  std::optional<ExchangeOrderId> exchange_order_id_;
  std::vector<Fill> fills_;
  Timestamp created_at_{};
  Timestamp updated_at_{};
  std::optional<Timestamp> submitted_at_;
  std::optional<Timestamp> completed_at_;
  std::optional<std::string> rejection_reason_;
  const ITimeProvider* clock_;
};

}  // namespace domain
}  // namespace tradekernel
