#include "tradekernel/eventbus/event_bus.hpp"

#include <algorithm>

namespace tradekernel {

// -----------------------------------------------------------------------------
// subscribe(GenericCallback)
// -----------------------------------------------------------------------------
// What: registers `callback` for every OrderUpdateEvent and
//       PositionUpdateEvent and hands back the id that removes it.
// Thread-safety: takes mutex_ for the append and the id bump only. A
//       publish already copying the list will not see the new entry.
// -----------------------------------------------------------------------------
EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);

  // Ids are never reused, so a stale id can never remove a newer subscriber.
  const SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

// -----------------------------------------------------------------------------
// unsubscribe(id)
// -----------------------------------------------------------------------------
// What: drops the entry registered under `id`. Unknown ids leave the list
//       as it was.
// Thread-safety: erase-remove under mutex_. Subscriber order is preserved
//       for the entries that stay.
// -----------------------------------------------------------------------------
void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& entry) {
                       return entry.first == id;
                     }),
      subscribers_.end());
}

// -----------------------------------------------------------------------------
// publish(event)
// -----------------------------------------------------------------------------
// What: delivers `event` to every subscriber, in subscription order, on the
//       calling thread.
// Thread-safety: the list is snapshotted under mutex_ and the callbacks run
//       after the lock is dropped. A callback may therefore publish,
//       subscribe or unsubscribe, and the TradeLedger's subscribers may read
//       the ledger back.
// Errors: a throwing callback stops delivery to the ones after it and the
//       exception reaches the publisher unchanged.
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = subscribers_;
  }

  for (const SubscriberEntry& entry : snapshot) {
    entry.second(event);
  }
}

// -----------------------------------------------------------------------------
// subscriberCount()
// -----------------------------------------------------------------------------
// Point-in-time size of the list; may be stale as soon as it returns.
// -----------------------------------------------------------------------------
std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace tradekernel
