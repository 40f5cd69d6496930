#pragma once

#include "tradekernel/domain/amount.hpp"
#include "tradekernel/domain/decimal.hpp"
#include "tradekernel/domain/identifiers.hpp"
#include "tradekernel/domain/position_status.hpp"
#include "tradekernel/domain/price.hpp"
#include "tradekernel/domain/trading_pair.hpp"
#include "tradekernel/time/i_time_provider.hpp"
#include "tradekernel/time/time_utils.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace tradekernel {
namespace domain {

// What the agent planned when it opened the position.
struct PositionLevels {
  Price entry;
  Price stop_loss;
  Price take_profit;
  Amount size;  // base asset
};

struct PositionOpenParams {
  PositionId id;
  TradingPair pair;
  PositionSide side;
  Price entry_price;
  Price stop_loss;
  Price take_profit;
  Amount size;
  OrderId entry_order_id;
  std::string agent_id;
  std::optional<std::string> strategy_id;
  PositionProfile profile{PositionProfile::Extended};
};

// -----------------------------------------------------------------------------
// Position — directional exposure from entry to exit, with P&L
// -----------------------------------------------------------------------------
//
// @brief  Tracks intended levels against actual executions for one LONG or
//         SHORT position and derives realized/unrealized P&L, ROI and
//         slippage from them.
//
// @details
// Directional rule, checked at open() against the intended entry and again
// on every protective-level update against the actual entry:
//
//   LONG    stop loss  <  entry  <  take profit
//   SHORT   take profit <  entry  <  stop loss
//
// P&L (quote asset):
//   gross    = (exit - entry) x size   for LONG
//              (entry - exit) x size   for SHORT
//   realized = gross - entry fees - exit fees
// using the actual entry price and actual filled size. Fees must be paid in
// the quote asset.
//
// Failures:
//   InvalidStateTransitionError  status forbids the call
//   PositionValidationError      level, asset or direction rule broken
//
// Closed and liquidated positions are immutable: every mutator throws.
//
// Thread model:
//   Not internally synchronized. The TradeLedger serializes access by id.
//
// Ownership:
//   Holds a non-owning pointer to the ITimeProvider used for timestamps.
// -----------------------------------------------------------------------------
class Position {
 public:
  // -------------------------------------------------------------------------
  // open(params, clock)
  // -------------------------------------------------------------------------
  // @brief  New position in Opening.
  //
  // @throws PositionValidationError when a level is priced in another pair,
  //         the size is not a positive base amount, or the levels break the
  //         directional rule for params.side.
  // -------------------------------------------------------------------------
  static Position open(const PositionOpenParams& params,
                       const ITimeProvider& clock);

  const PositionId& id() const { return id_; }
  const TradingPair& pair() const { return pair_; }
  PositionSide side() const { return side_; }
  PositionStatus status() const { return status_; }
  PositionProfile profile() const { return profile_; }

  const PositionLevels& intended() const { return intended_; }
  const std::optional<Price>& actualEntryPrice() const {
    return actual_entry_;
  }
  const std::optional<Amount>& actualSize() const { return actual_size_; }
  const std::optional<Price>& exitPrice() const { return exit_price_; }

  // Current protective levels; start at the intended ones.
  const Price& stopLoss() const { return stop_loss_; }
  const Price& takeProfit() const { return take_profit_; }

  const OrderId& entryOrderId() const { return entry_order_id_; }
  const std::optional<OrderId>& stopLossOrderId() const {
    return stop_loss_order_id_;
  }
  const std::optional<OrderId>& takeProfitOrderId() const {
    return take_profit_order_id_;
  }
  const std::optional<OrderId>& exitOrderId() const { return exit_order_id_; }

  const std::optional<PositionExitReason>& exitReason() const {
    return exit_reason_;
  }
  const std::optional<Amount>& realizedPnL() const { return realized_pnl_; }
  const std::optional<Amount>& entryFees() const { return entry_fees_; }
  const std::optional<Amount>& exitFees() const { return exit_fees_; }

  Timestamp createdAt() const { return created_at_; }
  Timestamp updatedAt() const { return updated_at_; }
  const std::optional<Timestamp>& openedAt() const { return opened_at_; }
  const std::optional<Timestamp>& closedAt() const { return closed_at_; }

  const std::string& agentId() const { return agent_id_; }
  const std::optional<std::string>& strategyId() const { return strategy_id_; }
  std::map<std::string, std::string> tags() const { return tags_; }

  // -------------------------------------------------------------------------
  // markAsOpened(...)
  // -------------------------------------------------------------------------
  // @brief  Opening -> Open once the entry order has filled.
  //
  // @param  actual_entry          Average entry execution price.
  // @param  actual_size           Filled size, base asset, > 0.
  // @param  entry_fees            Quote-asset fees of the entry, >= 0.
  // @param  stop_loss_order_id    Protective orders placed with the entry.
  // @param  take_profit_order_id
  // -------------------------------------------------------------------------
  void markAsOpened(const Price& actual_entry, const Amount& actual_size,
                    const std::optional<Amount>& entry_fees = std::nullopt,
                    const std::optional<OrderId>& stop_loss_order_id =
                        std::nullopt,
                    const std::optional<OrderId>& take_profit_order_id =
                        std::nullopt);

  // Open -> Closing.
  void markAsClosing(const OrderId& exit_order_id);

  // Open or Closing -> Closed. Computes realizedPnL. A Liquidation reason is
  // rejected with PositionValidationError; use markAsLiquidated.
  void markAsClosed(const Price& exit_price, PositionExitReason reason,
                    const std::optional<Amount>& exit_fees = std::nullopt);

  // -------------------------------------------------------------------------
  // markAsLiquidated(exit_price, exit_fees)
  // -------------------------------------------------------------------------
  // @brief  Forced exit from Open or Closing. Same P&L formula as a close.
  //
  // @details
  // Extended profile: status becomes Liquidated.
  // Basic profile:    status becomes Closed.
  // Exit reason is Liquidation in both cases.
  // -------------------------------------------------------------------------
  void markAsLiquidated(const Price& exit_price,
                        const std::optional<Amount>& exit_fees = std::nullopt);

  // Open only. The directional rule is checked against the actual entry.
  void updateStopLoss(const Price& stop_loss,
                      const std::optional<OrderId>& order_id = std::nullopt);
  void updateTakeProfit(const Price& take_profit,
                        const std::optional<OrderId>& order_id = std::nullopt);

  // Merges `tags` into the metadata; later values win. Rejected once the
  // position is terminal.
  void updateMetadata(const std::map<std::string, std::string>& tags);

  // -------------------------------------------------------------------------
  // Derived views
  // -------------------------------------------------------------------------
  // Mark-to-market P&L at `mark`, before fees. Empty unless Open.
  std::optional<Amount> unrealizedPnL(const Price& mark) const;
  // realizedPnL / (actual entry x actual size) x 100. Empty until closed.
  std::optional<Decimal> roi() const;
  // Opened to closed, or opened to now while still live.
  std::optional<std::chrono::milliseconds> duration() const;
  // actual entry - intended entry, signed, quote asset.
  std::optional<Amount> entrySlippage() const;
  // actual exit - protective level that triggered it. Only for StopLoss
  // and TakeProfit exits.
  std::optional<Amount> exitSlippage() const;
  // Entry plus exit fees, quote asset.
  Amount totalFees() const;

  bool isOpen() const { return status_ == PositionStatus::Open; }
  bool isClosed() const { return domain::isTerminal(status_); }

 private:
  Position(const PositionOpenParams& params, const ITimeProvider& clock);

  void requireStatus(bool allowed, const char* operation) const;
  void requireInPair(const Price& price, const char* field) const;
  void requireQuoteFee(const std::optional<Amount>& fee,
                       const char* field) const;
  void finalize(const Price& exit_price, PositionExitReason reason,
                PositionStatus terminal, const std::optional<Amount>& fees);
  Amount grossPnLAt(const Price& exit) const;
  Timestamp now() const;

  PositionId id_;
  TradingPair pair_;
  PositionSide side_;
  PositionStatus status_{PositionStatus::Opening};
  PositionProfile profile_;

  PositionLevels intended_;
  std::optional<Price> actual_entry_;
  std::optional<Amount> actual_size_;
  std::optional<Price> exit_price_;
  Price stop_loss_;
  Price take_profit_;

  OrderId entry_order_id_;
  std::optional<OrderId> stop_loss_order_id_;
  std::optional<OrderId> take_profit_order_id_;
  std::optional<OrderId> exit_order_id_;

  std::optional<PositionExitReason> exit_reason_;
  std::optional<Amount> realized_pnl_;
  std::optional<Amount> entry_fees_;
  std::optional<Amount> exit_fees_;

  Timestamp created_at_{};
  Timestamp updated_at_{};
  std::optional<Timestamp> opened_at_;
  std::optional<Timestamp> closed_at_;

  std::string agent_id_;
  std::optional<std::string> strategy_id_;
  std::map<std::string, std::string> tags_;

  const ITimeProvider* clock_;
};

}  // namespace domain
}  // namespace tradekernel
