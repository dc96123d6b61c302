#pragma once

#include "rxpos/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace rxpos {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for POS notifications. The commit
// protocol publishes SaleCompletedEvent, StockAlertEvent and LowStockEvent;
// PosEngine bridges them to the IPC telemetry queue, and tests subscribe to
// observe outcomes.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run synchronously on the publishing thread, after the subscriber
// list has been copied and the lock released.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback for every event kind.
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback that runs only when the published Event holds an
  // EventType (e.g. StockAlertEvent).
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes a subscription. Unknown ids are ignored. A publish() already in
  // progress on another thread may still deliver one last event.
  void unsubscribe(SubscriptionId id);

  // Delivers the event to every current subscriber, in subscription order.
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
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

}  // namespace rxpos
