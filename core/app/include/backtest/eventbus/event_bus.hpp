#pragma once

#include "backtest/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
//
// @brief  Synchronous publish-subscribe channel for Event values.
//
// @details
// PositionManager, DecisionOrchestrator and SimulationEngine publish here;
// the engine's notification loop, the IPC telemetry bridge and tests
// subscribe. Components never call each other through the bus, it only
// reports what already happened.
//
// Thread model:
//   subscribe(), unsubscribe() and publish() are safe from any thread.
//   Callbacks run on the publishing thread, outside the internal lock, so a
//   callback may itself publish or unsubscribe. A callback that throws a
//   std::exception is logged and skipped; the remaining subscribers still
//   receive the event and the publisher never sees the exception.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback for every event. Returns the id for unsubscribe().
  SubscriptionId subscribe(GenericCallback callback);

  // Registers a callback invoked only for events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // A callback already running for an in-flight publish() may still
  // complete; it will not be invoked for later events.
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
  return subscribe(
      GenericCallback([cb = std::move(callback)](const Event& event) {
        if (const auto* typed = std::get_if<EventType>(&event)) {
          cb(*typed);
        }
      }));
}

}  // namespace backtest
