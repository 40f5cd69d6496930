#pragma once

#include "tradekernel/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace tradekernel {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for ledger updates. Subscribers
// register callbacks; the ledger publishes one Event per successful
// mutation.
//
// Thread model: Thread-safe for concurrent subscribe, unsubscribe and
// publish. Callbacks run synchronously on the publishing thread, outside the
// bus lock.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(callback)
  // -------------------------------------------------------------------------
  // @brief  Registers a callback for every published event, whatever the
  //         alternative it holds.
  //
  // @return Id for unsubscribe(). Ids increase and are never reused.
  //
  // Used by audit loggers such as the one in tradekernel_demo.
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // @brief  Registers a callback that only fires when the published Event
  //         holds EventType (OrderUpdateEvent or PositionUpdateEvent).
  //
  // @details
  // Wraps `callback` in a GenericCallback that filters with std::get_if, so
  // both overloads share one subscriber list and one id sequence.
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // Unknown ids are ignored. A publish already in flight may still reach
  // the removed callback once.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Copies the subscriber list under the lock, then invokes callbacks
  // without it, so a callback may publish or unsubscribe re-entrantly.
  // Exceptions thrown by a callback propagate to the publisher.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  // Number of live subscriptions at the moment of the call.
  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace tradekernel
