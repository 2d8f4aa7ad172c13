#pragma once

#include "credit/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace credit {

// -----------------------------------------------------------------------------
// EventBus: synchronous publish/subscribe over the Event variant
// -----------------------------------------------------------------------------
//
// @brief  Fan-out of ledger notifications to loggers, the IPC telemetry
//         queue, and tests.
//
// @details
// publish() invokes every subscriber on the calling thread, in subscription
// order. The subscriber list is copied under the mutex before dispatch, so
// a callback may subscribe, unsubscribe or publish without deadlocking.
//
// A subscriber that throws propagates out of publish() and the remaining
// subscribers are skipped. LoanLedger publishes after commit and logs such
// failures instead of reporting them to its caller.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;

  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Receives every event type.
  SubscriptionId subscribe(GenericCallback callback);

  // Receives only EventType; other alternatives are filtered out.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Unknown ids are ignored.
  void unsubscribe(SubscriptionId id);

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

}  // namespace credit
