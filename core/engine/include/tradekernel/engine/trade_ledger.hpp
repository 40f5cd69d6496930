#pragma once

#include "tradekernel/concurrent/id_generator.hpp"
#include "tradekernel/config/kernel_config.hpp"
#include "tradekernel/domain/fill.hpp"
#include "tradekernel/domain/identifiers.hpp"
#include "tradekernel/domain/order.hpp"
#include "tradekernel/domain/order_parameters.hpp"
#include "tradekernel/domain/position.hpp"
#include "tradekernel/eventbus/event_bus.hpp"
#include "tradekernel/events/event.hpp"
#include "tradekernel/time/i_time_provider.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradekernel {

// What a caller supplies to open a position. The ledger assigns the id and
// takes the profile from KernelConfig.
struct PositionRequest {
  domain::TradingPair pair;
  domain::PositionSide side;
  domain::Price entry_price;
  domain::Price stop_loss;
  domain::Price take_profit;
  domain::Amount size;
  domain::OrderId entry_order_id;
  std::string agent_id;
  std::optional<std::string> strategy_id;
};

// -----------------------------------------------------------------------------
// TradeLedger
// -----------------------------------------------------------------------------
//
// @brief  Owns every Order and Position by id and is the single place they
//         are mutated. Publishes one update event per successful mutation.
//
// @details
// Each mutating call:
//   1. takes the write lock and looks the entity up (unknown id raises
//      InvalidOperationError),
//   2. applies the entity operation, which validates before it changes
//      anything,
//   3. stamps an OrderUpdateEvent / PositionUpdateEvent with the next
//      sequence id,
//   4. releases the lock and publishes the event on bus().
//
// Any DomainError from steps 1-2 is logged to std::cerr with a
// "[TradeLedger] WARNING:" prefix and rethrown unchanged. Nothing is
// published for a failed call and the entity keeps its previous state.
//
// Read accessors return copies taken under the shared lock.
//
// Thread model:
//   All methods are safe to call concurrently. Mutations on the ledger are
//   serialized; subscribers run on the mutating thread after the lock is
//   released, so a subscriber may read the ledger. Events from concurrent
//   callers may reach subscribers out of sequence_id order.
//
// Ownership:
//   TradeLedger
//    ├── orders_ / positions_   (entities by value)
//    ├── ids_                   (IdGenerator, value member)
//    ├── bus_                   (EventBus, value member)
//    └── clock_                 (const ITimeProvider&, non-owning)
// -----------------------------------------------------------------------------
class TradeLedger {
 public:
  explicit TradeLedger(const ITimeProvider& clock, KernelConfig config = {});

  TradeLedger(const TradeLedger&) = delete;
  TradeLedger& operator=(const TradeLedger&) = delete;
  TradeLedger(TradeLedger&&) = delete;
  TradeLedger& operator=(TradeLedger&&) = delete;

  EventBus& bus() { return bus_; }
  const KernelConfig& config() const { return config_; }

  // -------------------------------------------------------------------------
  // Orders
  // -------------------------------------------------------------------------
  // Creates a Pending order with a fresh "ord-<n>" id.
  domain::OrderId placeOrder(const domain::OrderParameters& parameters);

  domain::Order submitOrder(const domain::OrderId& id,
                            const domain::ExchangeOrderId& exchange_order_id);
  domain::Order openOrder(const domain::OrderId& id);
  domain::Order applyFill(const domain::OrderId& id, const domain::Fill& fill);
  domain::Order cancelOrder(const domain::OrderId& id);
  domain::Order rejectOrder(const domain::OrderId& id,
                            const std::string& reason);
  domain::Order failOrder(const domain::OrderId& id, const std::string& reason);

  // -------------------------------------------------------------------------
  // Positions
  // -------------------------------------------------------------------------
  // Creates an Opening position with a fresh "pos-<n>" id. The entry order
  // must already be in the ledger.
  domain::PositionId openPosition(const PositionRequest& request);

  // -------------------------------------------------------------------------
  // linkEntryFill(position_id, order_id, ...)
  // -------------------------------------------------------------------------
  // @brief  Opening -> Open from the entry order's execution: average fill
  //         price, net filled quantity and every fee valued in quote.
  //
  // @details
  // A fee charged in the base asset is converted at its fill's execution
  // price. On a Buy entry it also comes out of the position size.
  //
  // @throws InvalidOperationError if order_id is not the position's entry
  //         order or the order is not Filled.
  // -------------------------------------------------------------------------
  domain::Position linkEntryFill(
      const domain::PositionId& position_id, const domain::OrderId& order_id,
      const std::optional<domain::OrderId>& stop_loss_order_id = std::nullopt,
      const std::optional<domain::OrderId>& take_profit_order_id =
          std::nullopt);

  domain::Position beginClose(const domain::PositionId& id,
                              const domain::OrderId& exit_order_id);
  domain::Position closePosition(
      const domain::PositionId& id, const domain::Price& exit_price,
      domain::PositionExitReason reason,
      const std::optional<domain::Amount>& exit_fees = std::nullopt);
  domain::Position liquidatePosition(
      const domain::PositionId& id, const domain::Price& exit_price,
      const std::optional<domain::Amount>& exit_fees = std::nullopt);
  domain::Position updateStopLoss(
      const domain::PositionId& id, const domain::Price& stop_loss,
      const std::optional<domain::OrderId>& order_id = std::nullopt);
  domain::Position updateTakeProfit(
      const domain::PositionId& id, const domain::Price& take_profit,
      const std::optional<domain::OrderId>& order_id = std::nullopt);
  domain::Position tagPosition(const domain::PositionId& id,
                               const std::map<std::string, std::string>& tags);

  // -------------------------------------------------------------------------
  // Snapshots
  // -------------------------------------------------------------------------
  domain::Order order(const domain::OrderId& id) const;
  domain::Position position(const domain::PositionId& id) const;
  // In creation order.
  std::vector<domain::Order> orderSnapshots() const;
  std::vector<domain::Position> positionSnapshots() const;

 private:
  using OrderMutation = std::function<void(domain::Order&)>;
  using PositionMutation = std::function<void(domain::Position&)>;

  domain::Order mutateOrder(const domain::OrderId& id, const char* operation,
                            const OrderMutation& mutation);
  domain::Position mutatePosition(const domain::PositionId& id,
                                  const char* operation,
                                  const PositionMutation& mutation);

  // Lookups; caller holds the lock.
  domain::Order& findOrder(const domain::OrderId& id, const char* operation);
  const domain::Order& findOrder(const domain::OrderId& id,
                                 const char* operation) const;
  domain::Position& findPosition(const domain::PositionId& id,
                                 const char* operation);
  const domain::Position& findPosition(const domain::PositionId& id,
                                       const char* operation) const;

  Timestamp now() const;

  const ITimeProvider& clock_;
  KernelConfig config_;
  IdGenerator ids_;
  EventBus bus_;

  mutable std::shared_mutex mutex_;  // Protects the maps and the orderings
  std::unordered_map<domain::OrderId, domain::Order> orders_;
  std::unordered_map<domain::PositionId, domain::Position> positions_;
  std::vector<domain::OrderId> order_sequence_;
  std::vector<domain::PositionId> position_sequence_;
  std::uint64_t next_sequence_id_{1};  // Guarded by mutex_
};

}  // namespace tradekernel
