#include "tradekernel/engine/trade_ledger.hpp"
#include "tradekernel/domain/errors.hpp"
#include "tradekernel/time/time_utils.hpp"

#include <iostream>
#include <mutex>
#include <utility>

namespace tradekernel {

namespace {

// -----------------------------------------------------------------------------
// logged(): run `fn`, report a DomainError on stderr, rethrow it unchanged
// -----------------------------------------------------------------------------
template <typename Fn>
auto logged(const char* operation, const std::string& subject, Fn&& fn)
    -> decltype(fn()) {
  try {
    return fn();
  } catch (const DomainError& e) {
    std::cerr << "[TradeLedger] WARNING: " << operation << "(" << subject
              << ") failed with " << e.kind() << ": " << e.what() << "\n";
    throw;
  }
}

domain::Side entrySideFor(domain::PositionSide side) {
  return side == domain::PositionSide::Long ? domain::Side::Buy
                                            : domain::Side::Sell;
}

}  // namespace

TradeLedger::TradeLedger(const ITimeProvider& clock, KernelConfig config)
    : clock_(clock), config_(std::move(config)) {}

Timestamp TradeLedger::now() const { return ms_to_timestamp(clock_.now_ms()); }

// -----------------------------------------------------------------------------
// Lookups
// -----------------------------------------------------------------------------
domain::Order& TradeLedger::findOrder(const domain::OrderId& id,
                                      const char* operation) {
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    throw InvalidOperationError(operation, "Unknown order id " + id.value());
  }
  return it->second;
}

const domain::Order& TradeLedger::findOrder(const domain::OrderId& id,
                                            const char* operation) const {
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    throw InvalidOperationError(operation, "Unknown order id " + id.value());
  }
  return it->second;
}

domain::Position& TradeLedger::findPosition(const domain::PositionId& id,
                                            const char* operation) {
  auto it = positions_.find(id);
  if (it == positions_.end()) {
    throw InvalidOperationError(operation,
                                "Unknown position id " + id.value());
  }
  return it->second;
}

const domain::Position& TradeLedger::findPosition(
    const domain::PositionId& id, const char* operation) const {
  auto it = positions_.find(id);
  if (it == positions_.end()) {
    throw InvalidOperationError(operation,
                                "Unknown position id " + id.value());
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// mutateOrder / mutatePosition: lock, apply, stamp, unlock, publish
// -----------------------------------------------------------------------------
domain::Order TradeLedger::mutateOrder(const domain::OrderId& id,
                                       const char* operation,
                                       const OrderMutation& mutation) {
  OrderUpdateEvent update = logged(operation, id.value(), [&] {
    std::unique_lock lock(mutex_);
    domain::Order& order = findOrder(id, operation);
    const domain::OrderStatus previous = order.status();
    mutation(order);
    return OrderUpdateEvent{order, previous, now(), next_sequence_id_++};
  });

  bus_.publish(update);
  return update.order;
}

domain::Position TradeLedger::mutatePosition(
    const domain::PositionId& id, const char* operation,
    const PositionMutation& mutation) {
  PositionUpdateEvent update = logged(operation, id.value(), [&] {
    std::unique_lock lock(mutex_);
    domain::Position& position = findPosition(id, operation);
    const domain::PositionStatus previous = position.status();
    mutation(position);
    return PositionUpdateEvent{position, previous, now(),
                               next_sequence_id_++};
  });

  bus_.publish(update);
  return update.position;
}

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------
domain::OrderId TradeLedger::placeOrder(
    const domain::OrderParameters& parameters) {
  OrderUpdateEvent update =
      logged("placeOrder", parameters.pair().symbol(), [&] {
        std::unique_lock lock(mutex_);
        const domain::OrderId id = ids_.next_order_id();
        domain::Order order = domain::Order::create(id, parameters, clock_);
        orders_.emplace(id, order);
        order_sequence_.push_back(id);
        return OrderUpdateEvent{order, std::nullopt, now(),
                                next_sequence_id_++};
      });

  bus_.publish(update);
  return update.order.id();
}

domain::Order TradeLedger::submitOrder(
    const domain::OrderId& id,
    const domain::ExchangeOrderId& exchange_order_id) {
  return mutateOrder(id, "submitOrder", [&](domain::Order& order) {
    order.submit(exchange_order_id);
  });
}

domain::Order TradeLedger::openOrder(const domain::OrderId& id) {
  return mutateOrder(id, "openOrder",
                     [](domain::Order& order) { order.open(); });
}

domain::Order TradeLedger::applyFill(const domain::OrderId& id,
                                     const domain::Fill& fill) {
  return mutateOrder(id, "applyFill",
                     [&fill](domain::Order& order) { order.addFill(fill); });
}

domain::Order TradeLedger::cancelOrder(const domain::OrderId& id) {
  return mutateOrder(id, "cancelOrder",
                     [](domain::Order& order) { order.cancel(); });
}

domain::Order TradeLedger::rejectOrder(const domain::OrderId& id,
                                       const std::string& reason) {
  return mutateOrder(id, "rejectOrder", [&reason](domain::Order& order) {
    order.reject(reason);
  });
}

domain::Order TradeLedger::failOrder(const domain::OrderId& id,
                                     const std::string& reason) {
  return mutateOrder(id, "failOrder", [&reason](domain::Order& order) {
    order.fail(reason);
  });
}

// -----------------------------------------------------------------------------
// openPosition(): the entry order must exist, trade the same pair, and point
// the same direction as the position
// -----------------------------------------------------------------------------
domain::PositionId TradeLedger::openPosition(const PositionRequest& request) {
  PositionUpdateEvent update =
      logged("openPosition", request.entry_order_id.value(), [&] {
        std::unique_lock lock(mutex_);

        const domain::Order& entry =
            findOrder(request.entry_order_id, "openPosition");
        if (entry.parameters().pair() != request.pair) {
          throw PositionValidationError(
              "Entry order " + entry.id().value() + " trades " +
              entry.parameters().pair().symbol() + ", position is " +
              request.pair.symbol());
        }
        if (entry.parameters().side() != entrySideFor(request.side)) {
          throw PositionValidationError(
              std::string(domain::toString(request.side)) +
              " position needs a " +
              domain::toString(entrySideFor(request.side)) +
              " entry order, " + entry.id().value() + " is " +
              domain::toString(entry.parameters().side()));
        }

        domain::PositionOpenParams params{ids_.next_position_id(),
                                          request.pair,
                                          request.side,
                                          request.entry_price,
                                          request.stop_loss,
                                          request.take_profit,
                                          request.size,
                                          request.entry_order_id,
                                          request.agent_id,
                                          request.strategy_id,
                                          config_.position_profile};
        domain::Position position = domain::Position::open(params, clock_);
        positions_.emplace(position.id(), position);
        position_sequence_.push_back(position.id());
        return PositionUpdateEvent{position, std::nullopt, now(),
                                   next_sequence_id_++};
      });

  bus_.publish(update);
  return update.position.id();
}

domain::Position TradeLedger::linkEntryFill(
    const domain::PositionId& position_id, const domain::OrderId& order_id,
    const std::optional<domain::OrderId>& stop_loss_order_id,
    const std::optional<domain::OrderId>& take_profit_order_id) {
  return mutatePosition(
      position_id, "linkEntryFill", [&](domain::Position& position) {
        if (position.entryOrderId() != order_id) {
          throw InvalidOperationError(
              "linkEntryFill", order_id.value() +
                                   " is not the entry order of " +
                                   position.id().value());
        }
        const domain::Order& entry = findOrder(order_id, "linkEntryFill");
        const auto average = entry.averageFillPrice();
        if (entry.status() != domain::OrderStatus::Filled || !average) {
          throw InvalidOperationError(
              "linkEntryFill", "Entry order " + order_id.value() + " is " +
                                   domain::toString(entry.status()) +
                                   ", expected FILLED");
        }
        // Base-asset fees shrink a Buy's holding and are valued in quote at
        // their fill price, so P&L sees every fee the entry paid.
        position.markAsOpened(*average, entry.netFilledQuantity(),
                              entry.feesInQuote(), stop_loss_order_id,
                              take_profit_order_id);
      });
}

domain::Position TradeLedger::beginClose(const domain::PositionId& id,
                                         const domain::OrderId& exit_order_id) {
  return mutatePosition(id, "beginClose", [&](domain::Position& position) {
    findOrder(exit_order_id, "beginClose");
    position.markAsClosing(exit_order_id);
  });
}

domain::Position TradeLedger::closePosition(
    const domain::PositionId& id, const domain::Price& exit_price,
    domain::PositionExitReason reason,
    const std::optional<domain::Amount>& exit_fees) {
  return mutatePosition(id, "closePosition", [&](domain::Position& position) {
    position.markAsClosed(exit_price, reason, exit_fees);
  });
}

domain::Position TradeLedger::liquidatePosition(
    const domain::PositionId& id, const domain::Price& exit_price,
    const std::optional<domain::Amount>& exit_fees) {
  return mutatePosition(id, "liquidatePosition",
                        [&](domain::Position& position) {
                          position.markAsLiquidated(exit_price, exit_fees);
                        });
}

domain::Position TradeLedger::updateStopLoss(
    const domain::PositionId& id, const domain::Price& stop_loss,
    const std::optional<domain::OrderId>& order_id) {
  return mutatePosition(id, "updateStopLoss", [&](domain::Position& position) {
    position.updateStopLoss(stop_loss, order_id);
  });
}

domain::Position TradeLedger::updateTakeProfit(
    const domain::PositionId& id, const domain::Price& take_profit,
    const std::optional<domain::OrderId>& order_id) {
  return mutatePosition(id, "updateTakeProfit",
                        [&](domain::Position& position) {
                          position.updateTakeProfit(take_profit, order_id);
                        });
}

domain::Position TradeLedger::tagPosition(
    const domain::PositionId& id,
    const std::map<std::string, std::string>& tags) {
  return mutatePosition(id, "tagPosition", [&tags](domain::Position& position) {
    position.updateMetadata(tags);
  });
}

// -----------------------------------------------------------------------------
// Snapshots
// -----------------------------------------------------------------------------
domain::Order TradeLedger::order(const domain::OrderId& id) const {
  return logged("order", id.value(), [&] {
    std::shared_lock lock(mutex_);
    return findOrder(id, "order");
  });
}

domain::Position TradeLedger::position(const domain::PositionId& id) const {
  return logged("position", id.value(), [&] {
    std::shared_lock lock(mutex_);
    return findPosition(id, "position");
  });
}

std::vector<domain::Order> TradeLedger::orderSnapshots() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Order> snapshots;
  snapshots.reserve(order_sequence_.size());
  for (const auto& id : order_sequence_) {
    snapshots.push_back(orders_.at(id));
  }
  return snapshots;
}

std::vector<domain::Position> TradeLedger::positionSnapshots() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Position> snapshots;
  snapshots.reserve(position_sequence_.size());
  for (const auto& id : position_sequence_) {
    snapshots.push_back(positions_.at(id));
  }
  return snapshots;
}

}  // namespace tradekernel
