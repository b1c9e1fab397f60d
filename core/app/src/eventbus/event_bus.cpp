#include "mcsim/eventbus/event_bus.hpp"
#include <algorithm>

namespace mcsim {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(
      subscribers_.begin(), subscribers_.end(),
      [id](const SubscriberEntry& entry) { return entry.first == id; });
  if (it != subscribers_.end()) {
    subscribers_.erase(it);
  }
}

// -----------------------------------------------------------------------------
// publish(): deliver to a snapshot of the subscriber list
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> recipients;
  {
    std::lock_guard lock(mutex_);
    recipients = subscribers_;
  }

  for (const auto& entry : recipients) {
    entry.second(event);
  }
}

}  // namespace mcsim
