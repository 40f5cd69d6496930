// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for tradekernel::EventBus.
//
// Validates:
//   - Generic (all-event) subscription receives order and position updates
//   - Typed subscription receives only the matching event type
//   - Multiple subscribers all receive the same published event
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - Re-entrant publish from inside a callback does not deadlock
//   - Payload integrity through the variant dispatch path
//   - Exceptions thrown by a callback reach the publisher
//   - Subscription order is delivery order; ids are not reused
//
// Design note: All tests are single-threaded (testing EventBus in isolation).
// Delivery from the ledger is covered in trade_ledger_test.cpp.
// =============================================================================

#include "tradekernel/eventbus/event_bus.hpp"
#include "tradekernel/events/event.hpp"
#include "tradekernel/time/simulation_time_provider.hpp"
#include "tradekernel/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace tradekernel;
using namespace tradekernel::domain;

// =============================================================================
// Test fixture: a fresh EventBus plus factories for both event types.
// =============================================================================
class EventBusTest : public ::testing::Test {
 protected:
  EventBus bus;
  SimulationTimeProvider clock{1704067200000};
  Asset btc = Asset::crypto("BTC");
  Asset usdt = Asset::stablecoin("USDT");
  TradingPair pair = TradingPair::from(btc, usdt);

  OrderUpdateEvent orderEvent(const std::string& id,
                              std::uint64_t sequence_id = 1) {
    OrderUpdateEvent event{
        Order::create(OrderId::from(id),
                      OrderParameters::marketBuy(pair, Amount::from(1, btc)),
                      clock),
        std::nullopt, ms_to_timestamp(clock.now_ms()), sequence_id};
    return event;
  }

  PositionUpdateEvent positionEvent(const std::string& id,
                                    std::uint64_t sequence_id = 1) {
    PositionOpenParams params{PositionId::from(id),
                              pair,
                              PositionSide::Long,
                              Price::from(50000, pair),
                              Price::from(49000, pair),
                              Price::from(52000, pair),
                              Amount::from(1, btc),
                              OrderId::from("ord-1"),
                              "agent-1",
                              std::nullopt,
                              PositionProfile::Extended};
    PositionUpdateEvent event{Position::open(params, clock), std::nullopt,
                              ms_to_timestamp(clock.now_ms()), sequence_id};
    return event;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber must be invoked for every event type.
// Why: audit loggers subscribe generically and must see every update.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const Event&) { ++call_count; });

  bus.publish(orderEvent("ord-1"));
  bus.publish(positionEvent("pos-1"));

  EXPECT_EQ(call_count, 2);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber must fire only for its registered event type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int order_count = 0;
  int position_count = 0;
  bus.subscribe<OrderUpdateEvent>(
      [&order_count](const OrderUpdateEvent&) { ++order_count; });
  bus.subscribe<PositionUpdateEvent>(
      [&position_count](const PositionUpdateEvent&) { ++position_count; });

  bus.publish(orderEvent("ord-1"));
  bus.publish(orderEvent("ord-2"));
  bus.publish(positionEvent("pos-1"));

  EXPECT_EQ(order_count, 2);
  EXPECT_EQ(position_count, 1);
}

// -----------------------------------------------------------------------------
// 3. Multiple subscribers must all receive the same published event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int count_a = 0;
  int count_b = 0;
  int count_c = 0;

  bus.subscribe<OrderUpdateEvent>(
      [&count_a](const OrderUpdateEvent&) { ++count_a; });
  bus.subscribe<OrderUpdateEvent>(
      [&count_b](const OrderUpdateEvent&) { ++count_b; });
  bus.subscribe([&count_c](const Event&) { ++count_c; });
  EXPECT_EQ(bus.subscriberCount(), 3u);

  bus.publish(orderEvent("ord-1"));

  EXPECT_EQ(count_a, 1);
  EXPECT_EQ(count_b, 1);
  EXPECT_EQ(count_c, 1);
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe(id), the callback must not fire for future publishes.
// Why: subscribers unsubscribe before their captured state goes away.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<OrderUpdateEvent>(
      [&call_count](const OrderUpdateEvent&) { ++call_count; });

  bus.publish(orderEvent("ord-1"));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);
  EXPECT_EQ(bus.subscriberCount(), 0u);

  bus.publish(orderEvent("ord-2"));
  EXPECT_EQ(call_count, 1);
}

// -----------------------------------------------------------------------------
// 5. Unknown ids and empty buses are harmless.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeNonExistentIdIsNoOp) {
  EXPECT_NO_THROW(bus.unsubscribe(9999));
}

TEST_F(EventBusTest, PublishWithNoSubscribers) {
  EXPECT_NO_THROW(bus.publish(positionEvent("pos-1")));
}

// -----------------------------------------------------------------------------
// 6. A subscriber that calls publish() inside its callback must not deadlock.
// Why: the bus copies the subscriber list and releases its lock before
//      invoking callbacks. Holding it across callbacks would hang here.
//
// Scenario: subscriber A receives an order update and publishes a position
//           update. Subscriber B receives the position update.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int position_received = 0;

  bus.subscribe<PositionUpdateEvent>(
      [&position_received](const PositionUpdateEvent&) {
        ++position_received;
      });

  bus.subscribe<OrderUpdateEvent>([this](const OrderUpdateEvent&) {
    bus.publish(positionEvent("pos-1", 2));
  });

  bus.publish(orderEvent("ord-1"));

  EXPECT_EQ(position_received, 1);
}

// -----------------------------------------------------------------------------
// 7. Payloads must survive the variant round trip: publish -> dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  std::string received_id;
  std::uint64_t received_sequence = 0;
  OrderStatus received_status = OrderStatus::Cancelled;

  bus.subscribe<OrderUpdateEvent>([&](const OrderUpdateEvent& e) {
    received_id = e.order.id().value();
    received_sequence = e.sequence_id;
    received_status = e.order.status();
  });

  bus.publish(orderEvent("ord-42", 17));

  EXPECT_EQ(received_id, "ord-42");
  EXPECT_EQ(received_sequence, 17u);
  EXPECT_EQ(received_status, OrderStatus::Pending);
}

// -----------------------------------------------------------------------------
// 8. A throwing callback propagates to the publisher.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, CallbackExceptionReachesPublisher) {
  bus.subscribe([](const Event&) { throw std::runtime_error("subscriber"); });
  EXPECT_THROW(bus.publish(orderEvent("ord-1")), std::runtime_error);
}

// -----------------------------------------------------------------------------
// 9. Delivery follows subscription order and ids are never reused.
// Why: the ledger's subscribers rely on a stable order, and a recycled id
//      would let a stale unsubscribe remove a newer subscriber.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, OrderedDeliveryAndFreshIds) {
  std::vector<int> calls;
  const auto first =
      bus.subscribe([&calls](const Event&) { calls.push_back(1); });
  bus.subscribe([&calls](const Event&) { calls.push_back(2); });
  bus.unsubscribe(first);
  const auto third =
      bus.subscribe([&calls](const Event&) { calls.push_back(3); });
  EXPECT_NE(third, first);

  bus.publish(orderEvent("ord-1"));
  EXPECT_EQ(calls, (std::vector<int>{2, 3}));

  bus.unsubscribe(first);
  EXPECT_EQ(bus.subscriberCount(), 2u);
}
