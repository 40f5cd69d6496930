// =============================================================================
// trade_ledger_test.cpp
// =============================================================================
// Tests for tradekernel::TradeLedger.
//
// Validates:
//   - One event per successful mutation, stamped with increasing sequence ids
//   - Failed calls publish nothing, leave state intact and rethrow
//   - Unknown ids raise InvalidOperationError
//   - openPosition() checks the entry order's existence, pair and side
//   - linkEntryFill() opens a position from the entry order's execution
//   - The configured position profile governs liquidation
//   - Snapshots come back in creation order
//   - Concurrent placement yields unique order ids and sequence ids
// =============================================================================

#include "tradekernel/domain/errors.hpp"
#include "tradekernel/engine/trade_ledger.hpp"
#include "tradekernel/time/simulation_time_provider.hpp"
#include "tradekernel/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace tradekernel;
using namespace tradekernel::domain;

class TradeLedgerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ledger.bus().subscribe([this](const Event& e) { events.push_back(e); });
  }

  Price px(double value) const { return Price::from(value, pair); }
  Amount base(double value) const { return Amount::from(value, btc); }
  Amount quote(double value) const { return Amount::from(value, usdt); }

  Fill fill(double quantity, double price, double fee,
            const std::string& exchange_id = "EX-1") {
    return Fill::from({pair, ExchangeOrderId::from(exchange_id),
                       base(quantity), px(price), quote(fee),
                       ms_to_timestamp(clock.now_ms()), "T-" + exchange_id});
  }

  // Market buy of `quantity`, submitted and filled in one execution.
  OrderId filledBuy(TradeLedger& target, double quantity, double price,
                    double fee) {
    const OrderId id =
        target.placeOrder(OrderParameters::marketBuy(pair, base(quantity)));
    target.submitOrder(id, ExchangeOrderId::from("EX-1"));
    target.applyFill(id, fill(quantity, price, fee));
    return id;
  }

  PositionRequest longRequest(const OrderId& entry) const {
    return PositionRequest{pair,      PositionSide::Long, px(50000),
                           px(48000), px(56000),          base(2),
                           entry,     "agent-1",          std::nullopt};
  }

  std::vector<std::uint64_t> sequenceIds() const {
    std::vector<std::uint64_t> ids;
    for (const auto& e : events) {
      std::visit([&ids](const auto& update) { ids.push_back(update.sequence_id); },
                 e);
    }
    return ids;
  }

  SimulationTimeProvider clock{1704067200000};
  Asset btc = Asset::crypto("BTC");
  Asset usdt = Asset::stablecoin("USDT");
  TradingPair pair = TradingPair::from(btc, usdt);
  TradeLedger ledger{clock};
  std::vector<Event> events;
};

// -----------------------------------------------------------------------------
// 1. placeOrder announces the new order with no previous status.
// -----------------------------------------------------------------------------
TEST_F(TradeLedgerTest, PlaceOrderPublishesCreation) {
  const OrderId id =
      ledger.placeOrder(OrderParameters::marketBuy(pair, base(1)));
  EXPECT_EQ(id.value(), "ord-1");

  ASSERT_EQ(events.size(), 1u);
  const auto* update = std::get_if<OrderUpdateEvent>(&events[0]);
  ASSERT_NE(update, nullptr);
  EXPECT_FALSE(update->previous_status.has_value());
  EXPECT_EQ(update->order.status(), OrderStatus::Pending);
  EXPECT_EQ(update->sequence_id, 1u);
  EXPECT_EQ(timestamp_to_ms(update->timestamp), 1704067200000);
}

// -----------------------------------------------------------------------------
// 2. Each mutation publishes exactly one event carrying the prior status.
// -----------------------------------------------------------------------------
TEST_F(TradeLedgerTest, EveryMutationPublishesOneEvent) {
  const OrderId id =
      ledger.placeOrder(OrderParameters::marketBuy(pair, base(1)));
  ledger.submitOrder(id, ExchangeOrderId::from("EX-1"));
  ledger.applyFill(id, fill(0.4, 50000, 2));
  const Order done = ledger.applyFill(id, fill(0.6, 50000, 3));

  EXPECT_EQ(done.status(), OrderStatus::Filled);
  ASSERT_EQ(events.size(), 4u);
  EXPECT_EQ(sequenceIds(), (std::vector<std::uint64_t>{1, 2, 3, 4}));

  const auto& last = std::get<OrderUpdateEvent>(events.back());
  EXPECT_EQ(*last.previous_status, OrderStatus::PartiallyFilled);
  EXPECT_EQ(last.order.status(), OrderStatus::Filled);
  EXPECT_EQ(last.order.totalFees().toString(), "5 USDT");
}

// -----------------------------------------------------------------------------
// 3. Unknown ids raise InvalidOperationError and publish nothing.
// -----------------------------------------------------------------------------
TEST_F(TradeLedgerTest, UnknownIdsRaiseInvalidOperation) {
  EXPECT_THROW(ledger.submitOrder(OrderId::from("ord-99"),
                                  ExchangeOrderId::from("EX-1")),
               InvalidOperationError);
  EXPECT_THROW(ledger.order(OrderId::from("ord-99")), InvalidOperationError);
  EXPECT_THROW(ledger.position(PositionId::from("pos-9")),
               InvalidOperationError);
  EXPECT_THROW(ledger.tagPosition(PositionId::from("pos-9"), {{"k", "v"}}),
               InvalidOperationError);
  EXPECT_TRUE(events.empty());
}

// -----------------------------------------------------------------------------
// 4. A rejected mutation leaves the entity unchanged and burns no sequence id.
// Why: subscribers rebuild state from the stream. A gap or a phantom event
//      would desynchronize them.
// -----------------------------------------------------------------------------
TEST_F(TradeLedgerTest, FailedMutationPublishesNothing) {
  const OrderId id =
      ledger.placeOrder(OrderParameters::marketBuy(pair, base(1)));
  ledger.cancelOrder(id);

  EXPECT_THROW(ledger.submitOrder(id, ExchangeOrderId::from("EX-1")),
               InvalidStateTransitionError);
  EXPECT_EQ(events.size(), 2u);
  EXPECT_EQ(ledger.order(id).status(), OrderStatus::Cancelled);

  ledger.placeOrder(OrderParameters::marketBuy(pair, base(1)));
  EXPECT_EQ(sequenceIds(), (std::vector<std::uint64_t>{1, 2, 3}));
}

// -----------------------------------------------------------------------------
// 5. openPosition validates the entry order against the request.
// -----------------------------------------------------------------------------
TEST_F(TradeLedgerTest, OpenPositionChecksEntryOrder) {
  EXPECT_THROW(ledger.openPosition(longRequest(OrderId::from("ord-7"))),
               InvalidOperationError);

  const OrderId sell =
      ledger.placeOrder(OrderParameters::marketSell(pair, base(2)));
  EXPECT_THROW(ledger.openPosition(longRequest(sell)),
               PositionValidationError);

  const TradingPair eth_pair =
      TradingPair::from(Asset::crypto("ETH"), usdt);
  const OrderId eth_buy = ledger.placeOrder(OrderParameters::marketBuy(
      eth_pair, Amount::from(2, eth_pair.base())));
  EXPECT_THROW(ledger.openPosition(longRequest(eth_buy)),
               PositionValidationError);

  EXPECT_TRUE(ledger.positionSnapshots().empty());
}

// -----------------------------------------------------------------------------
// 6. Full LONG round trip through the ledger.
//    Entry: 1 @ 50000 + 1 @ 50100, fees 5 + 5 -> average 50050, fees 10.
//    Exit:  2 @ 56000, fee 10.
//    P&L:   (56000 - 50050) x 2 - 20 = 11880
// -----------------------------------------------------------------------------
TEST_F(TradeLedgerTest, LongRoundTrip) {
  const OrderId entry =
      ledger.placeOrder(OrderParameters::marketBuy(pair, base(2)));
  ledger.submitOrder(entry, ExchangeOrderId::from("EX-1"));
  ledger.applyFill(entry, fill(1, 50000, 5));
  ledger.applyFill(entry, fill(1, 50100, 5));

  const PositionId id = ledger.openPosition(longRequest(entry));
  EXPECT_EQ(id.value(), "pos-1");
  EXPECT_EQ(ledger.position(id).status(), PositionStatus::Opening);

  const OrderId stop = ledger.placeOrder(OrderParameters::stopLoss(
      pair, Side::Sell, base(2), px(48000)));
  const Position opened =
      ledger.linkEntryFill(id, entry, stop, std::nullopt);
  EXPECT_EQ(opened.status(), PositionStatus::Open);
  EXPECT_EQ(opened.actualEntryPrice()->format(), "50050");
  EXPECT_EQ(opened.actualSize()->toString(), "2 BTC");
  EXPECT_EQ(opened.entryFees()->toString(), "10 USDT");
  EXPECT_EQ(*opened.stopLossOrderId(), stop);

  clock.advance_by(3600000);
  const Position closed = ledger.closePosition(
      id, px(56000), PositionExitReason::TakeProfit, quote(10));
  EXPECT_EQ(closed.status(), PositionStatus::Closed);
  EXPECT_EQ(closed.realizedPnL()->toString(), "11880 USDT");
  EXPECT_EQ(closed.duration()->count(), 3600000);

  const auto& last = std::get<PositionUpdateEvent>(events.back());
  EXPECT_EQ(*last.previous_status, PositionStatus::Open);
  EXPECT_EQ(last.position.status(), PositionStatus::Closed);
}

// -----------------------------------------------------------------------------
// 6b. A base-asset entry fee reaches the position.
//    Entry: 2 @ 50000, fee 0.01 BTC -> holding 1.99 BTC, fee worth 500 USDT.
//    Exit:  1.99 @ 55000, no fee.
//    P&L:   (55000 - 50000) x 1.99 - 500 = 9450
//    Cash check: 109450 received - 100000 paid = 9450
// -----------------------------------------------------------------------------
TEST_F(TradeLedgerTest, BaseAssetEntryFeeCountsInPnL) {
  const OrderId entry =
      ledger.placeOrder(OrderParameters::marketBuy(pair, base(2)));
  ledger.submitOrder(entry, ExchangeOrderId::from("EX-1"));
  ledger.applyFill(entry,
                   Fill::from({pair, ExchangeOrderId::from("EX-1"), base(2),
                               px(50000), base(0.01),
                               ms_to_timestamp(clock.now_ms()), "T-1"}));

  const PositionId id = ledger.openPosition(longRequest(entry));
  const Position opened = ledger.linkEntryFill(id, entry);
  EXPECT_EQ(opened.entryFees()->toString(), "500 USDT");
  EXPECT_EQ(opened.actualSize()->toString(), "1.99 BTC");

  const Position closed = ledger.closePosition(
      id, px(55000), PositionExitReason::ManualClose, quote(0));
  EXPECT_EQ(closed.realizedPnL()->toString(), "9450 USDT");
  EXPECT_EQ(closed.totalFees().toString(), "500 USDT");
}

// -----------------------------------------------------------------------------
// 7. linkEntryFill needs the position's own entry order, fully filled.
// -----------------------------------------------------------------------------
TEST_F(TradeLedgerTest, LinkEntryFillGuards) {
  const OrderId entry =
      ledger.placeOrder(OrderParameters::marketBuy(pair, base(2)));
  const PositionId id = ledger.openPosition(longRequest(entry));

  EXPECT_THROW(ledger.linkEntryFill(id, entry), InvalidOperationError);

  const OrderId other = filledBuy(ledger, 2, 50000, 1);
  EXPECT_THROW(ledger.linkEntryFill(id, other), InvalidOperationError);
  EXPECT_EQ(ledger.position(id).status(), PositionStatus::Opening);
}

// -----------------------------------------------------------------------------
// 8. beginClose requires a known exit order.
// -----------------------------------------------------------------------------
TEST_F(TradeLedgerTest, BeginCloseNeedsKnownExitOrder) {
  const OrderId entry = filledBuy(ledger, 2, 50000, 0);
  const PositionId id = ledger.openPosition(longRequest(entry));
  ledger.linkEntryFill(id, entry);

  EXPECT_THROW(ledger.beginClose(id, OrderId::from("ord-404")),
               InvalidOperationError);

  const OrderId exit =
      ledger.placeOrder(OrderParameters::marketSell(pair, base(2)));
  const Position closing = ledger.beginClose(id, exit);
  EXPECT_EQ(closing.status(), PositionStatus::Closing);
  EXPECT_EQ(*closing.exitOrderId(), exit);
}

// -----------------------------------------------------------------------------
// 9. The configured profile decides the terminal status of a liquidation.
// -----------------------------------------------------------------------------
TEST_F(TradeLedgerTest, ProfileGovernsLiquidation) {
  const OrderId entry = filledBuy(ledger, 2, 50000, 0);
  const PositionId id = ledger.openPosition(longRequest(entry));
  ledger.linkEntryFill(id, entry);
  EXPECT_EQ(ledger.liquidatePosition(id, px(45000)).status(),
            PositionStatus::Liquidated);

  KernelConfig config;
  config.position_profile = PositionProfile::Basic;
  TradeLedger basic{clock, config};
  const OrderId basic_entry = filledBuy(basic, 2, 50000, 0);
  const PositionId basic_id = basic.openPosition(longRequest(basic_entry));
  basic.linkEntryFill(basic_id, basic_entry);

  const Position liquidated = basic.liquidatePosition(basic_id, px(45000));
  EXPECT_EQ(liquidated.status(), PositionStatus::Closed);
  EXPECT_EQ(*liquidated.exitReason(), PositionExitReason::Liquidation);
  EXPECT_EQ(liquidated.profile(), PositionProfile::Basic);
}

// -----------------------------------------------------------------------------
// 10. Protective updates and tags go through the ledger.
// -----------------------------------------------------------------------------
TEST_F(TradeLedgerTest, PositionAdjustments) {
  const OrderId entry = filledBuy(ledger, 2, 50000, 0);
  const PositionId id = ledger.openPosition(longRequest(entry));
  ledger.linkEntryFill(id, entry);

  EXPECT_EQ(ledger.updateStopLoss(id, px(49500)).stopLoss().format(),
            "49500");
  EXPECT_THROW(ledger.updateTakeProfit(id, px(49000)),
               PositionValidationError);
  EXPECT_EQ(ledger.updateTakeProfit(id, px(58000)).takeProfit().format(),
            "58000");
  EXPECT_EQ(ledger.tagPosition(id, {{"regime", "trend"}}).tags().at("regime"),
            "trend");
}

// -----------------------------------------------------------------------------
// 11. Snapshots come back in creation order.
// -----------------------------------------------------------------------------
TEST_F(TradeLedgerTest, SnapshotsInCreationOrder) {
  for (int i = 0; i < 12; ++i) {
    ledger.placeOrder(OrderParameters::marketBuy(pair, base(1)));
  }
  const auto orders = ledger.orderSnapshots();
  ASSERT_EQ(orders.size(), 12u);
  for (std::size_t i = 0; i < orders.size(); ++i) {
    EXPECT_EQ(orders[i].id().value(), "ord-" + std::to_string(i + 1));
  }
}

// -----------------------------------------------------------------------------
// 12. Subscribers run after the lock is released and may read the ledger.
// -----------------------------------------------------------------------------
TEST_F(TradeLedgerTest, SubscriberMayReadLedger) {
  std::vector<OrderStatus> seen;
  ledger.bus().subscribe<OrderUpdateEvent>(
      [this, &seen](const OrderUpdateEvent& e) {
        seen.push_back(ledger.order(e.order.id()).status());
      });

  const OrderId id =
      ledger.placeOrder(OrderParameters::marketBuy(pair, base(1)));
  ledger.cancelOrder(id);

  EXPECT_EQ(seen,
            (std::vector<OrderStatus>{OrderStatus::Pending,
                                      OrderStatus::Cancelled}));
}

// -----------------------------------------------------------------------------
// 13. Concurrent placement: ids and sequence ids are unique.
// -----------------------------------------------------------------------------
TEST(TradeLedgerConcurrencyTest, ConcurrentPlacementIsConsistent) {
  SimulationTimeProvider clock{1704067200000};
  TradeLedger ledger{clock};
  const TradingPair pair = TradingPair::from(Asset::crypto("BTC"),
                                             Asset::stablecoin("USDT"));

  std::mutex seen_mutex;
  std::set<std::uint64_t> sequences;
  ledger.bus().subscribe<OrderUpdateEvent>([&](const OrderUpdateEvent& e) {
    std::lock_guard<std::mutex> lock(seen_mutex);
    sequences.insert(e.sequence_id);
  });

  constexpr int kThreads = 4;
  constexpr int kPerThread = 50;
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&] {
      for (int i = 0; i < kPerThread; ++i) {
        ledger.placeOrder(OrderParameters::marketBuy(
            pair, Amount::from(1, pair.base())));
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  const auto orders = ledger.orderSnapshots();
  ASSERT_EQ(orders.size(), static_cast<std::size_t>(kThreads * kPerThread));
  std::set<std::string> ids;
  for (const auto& order : orders) {
    ids.insert(order.id().value());
  }
  EXPECT_EQ(ids.size(), orders.size());
  EXPECT_EQ(sequences.size(), orders.size());
  EXPECT_EQ(*sequences.begin(), 1u);
  EXPECT_EQ(*sequences.rbegin(), static_cast<std::uint64_t>(kThreads * kPerThread));
}
