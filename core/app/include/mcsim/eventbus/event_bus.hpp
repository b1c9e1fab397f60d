#pragma once

#include "mcsim/events/event.hpp"
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace mcsim {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Carries one run's reports from the SimulationDriver to whoever renders
// them: a stream of ProgressEvents followed by a single CompletionEvent or
// FailureEvent (or nothing, for a cancelled run).
//
// Typical subscribers, in attach order inside the engine:
//   * SimulationEngine progress tracker   (last progress for STATUS)
//   * SimulationServer bridge             (JSON on the PUB socket)
//   * CLI progress logger / test recorders
//
// Ordering: events reach each subscriber in publish order, and subscribers
// are called in the order they subscribed. Since the driver publishes from
// one thread, a run's progress values arrive non-decreasing.
//
// Failures: a subscriber that throws stops delivery of that event to later
// subscribers and the exception reaches the publisher. SimulationDriver
// documents how a run reports it.
//
// Thread model: subscribe / unsubscribe / publish may race freely. publish()
// runs the callbacks on its own thread (the SimulationWorker thread for run
// reports) after releasing the lock.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  // Sees every report; callers pick the alternative with std::visit or
  // std::get_if.
  using GenericCallback = std::function<void(const Event&)>;

  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Attaches a subscriber for every report kind.
  SubscriptionId subscribe(GenericCallback callback);

  // Attaches a subscriber for a single report kind, e.g.
  //   bus.subscribe<FailureEvent>([](const FailureEvent& f) { ... });
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Detaches a subscriber. If a publish() is running on another thread the
  // subscriber can still receive that one event. Unknown ids are a no-op.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Delivers the report to the subscribers attached when the call starts and
  // returns once all of them ran. A callback may itself publish, subscribe
  // or unsubscribe; the change applies from the next publish().
  //
  // @throws whatever a subscriber throws; later subscribers miss the event.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;  // in subscription order
};

// Filters the variant down to EventType before calling the subscriber.
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  return subscribe(
      GenericCallback([cb = std::move(callback)](const Event& event) {
        if (const auto* report = std::get_if<EventType>(&event)) {
          cb(*report);
        }
      }));
}

}  // namespace mcsim
