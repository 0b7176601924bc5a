#include "backtest/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace backtest {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

// -----------------------------------------------------------------------------
// publish(): copy the subscriber list under the lock, dispatch without it
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = subscribers_;
  }

  for (const auto& [id, callback] : snapshot) {
    try {
      callback(event);
    } catch (const std::exception& e) {
      std::cerr << "[EventBus] WARNING: subscriber " << id
                << " threw while handling event index " << event.index()
                << ": " << e.what() << "\n";
    }
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace backtest
