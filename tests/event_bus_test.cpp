// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for mcsim::EventBus.
//
// Validates:
//   - Generic subscription receives progress, completion and failure events
//   - Typed subscription receives only its event type
//   - Multiple subscribers all receive the same event
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - Re-entrant publish from inside a callback does not deadlock
//   - Path batches survive the variant dispatch intact
//   - Subscription order and a throwing subscriber cutting delivery short
//
// Design note: All tests are single-threaded. Cross-thread delivery is
// covered in simulation_worker_test.cpp.
// =============================================================================

#include "mcsim/eventbus/event_bus.hpp"
#include "mcsim/events/event.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

// =============================================================================
// Test fixture: a fresh EventBus for each test.
// =============================================================================
class EventBusTest : public ::testing::Test {
 protected:
  mcsim::EventBus bus;

  static mcsim::ProgressEvent makeProgress(int progress, int completed,
                                           int total) {
    mcsim::ProgressEvent e;
    e.run_id = 1;
    e.progress = progress;
    e.completed = completed;
    e.total = total;
    return e;
  }

  static mcsim::FailureEvent makeFailure(const std::string& reason) {
    mcsim::FailureEvent e;
    e.run_id = 1;
    e.progress = 40;
    e.reason = reason;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber is invoked for every event type.
// Why: The engine's progress tracker and the server bridge subscribe
//      generically and must see every event of a run.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const mcsim::Event&) { ++call_count; });

  bus.publish(makeProgress(50, 1, 2));
  bus.publish(mcsim::CompletionEvent{});
  bus.publish(makeFailure("boom"));

  EXPECT_EQ(call_count, 3);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its registered event type.
// Why: The CLI waits on CompletionEvent; it must not wake on progress.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int completions = 0;
  bus.subscribe<mcsim::CompletionEvent>(
      [&completions](const mcsim::CompletionEvent&) { ++completions; });

  bus.publish(makeProgress(100, 2, 2));
  bus.publish(makeFailure("x"));
  bus.publish(mcsim::CompletionEvent{});

  EXPECT_EQ(completions, 1);
}

// -----------------------------------------------------------------------------
// 3. Multiple subscribers all receive the same event.
// Why: The CLI logger and a terminal-event collector listen to one bus.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int count_a = 0;
  int count_b = 0;

  bus.subscribe<mcsim::ProgressEvent>(
      [&count_a](const mcsim::ProgressEvent&) { ++count_a; });
  bus.subscribe<mcsim::ProgressEvent>(
      [&count_b](const mcsim::ProgressEvent&) { ++count_b; });

  bus.publish(makeProgress(10, 1, 10));

  EXPECT_EQ(count_a, 1);
  EXPECT_EQ(count_b, 1);
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe(id) the callback no longer fires.
// Why: SimulationEngine::stop() removes its bridges; a late callback would
//      reach a destroyed server.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<mcsim::ProgressEvent>(
      [&call_count](const mcsim::ProgressEvent&) { ++call_count; });

  bus.publish(makeProgress(10, 1, 10));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);
  bus.unsubscribe(9999);  // unknown id: ignored

  bus.publish(makeProgress(20, 2, 10));
  EXPECT_EQ(call_count, 1);
}

// -----------------------------------------------------------------------------
// 5. Publishing with no subscribers is harmless.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, PublishWithNoSubscribers) {
  EXPECT_NO_THROW(bus.publish(makeFailure("nobody listens")));
}

// -----------------------------------------------------------------------------
// 6. A subscriber that publishes inside its callback does not deadlock.
// Why: publish() copies the subscriber list and releases the lock before
//      invoking callbacks.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int failures = 0;

  bus.subscribe<mcsim::FailureEvent>(
      [&failures](const mcsim::FailureEvent&) { ++failures; });

  bus.subscribe<mcsim::ProgressEvent>([this](const mcsim::ProgressEvent& e) {
    if (e.progress > 100) {
      bus.publish(makeFailure("progress out of range"));
    }
  });

  bus.publish(makeProgress(101, 11, 10));

  EXPECT_EQ(failures, 1);
}

// -----------------------------------------------------------------------------
// 7. Path batches and fields arrive unchanged.
// Why: The host draws the batch; a sliced or reordered copy would draw the
//      wrong trajectories.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  std::vector<mcsim::domain::SimulationPath> received;
  int received_progress = -1;

  bus.subscribe<mcsim::ProgressEvent>(
      [&received, &received_progress](const mcsim::ProgressEvent& e) {
        received = e.batch;
        received_progress = e.progress;
      });

  mcsim::ProgressEvent e = makeProgress(30, 3, 10);
  e.batch.push_back({{0, 100.0}, {1, 101.5}});
  e.batch.push_back({{0, 100.0}, {1, 98.25}});
  bus.publish(e);

  EXPECT_EQ(received_progress, 30);
  ASSERT_EQ(received.size(), 2u);
  EXPECT_DOUBLE_EQ(received[0][1].value, 101.5);
  EXPECT_DOUBLE_EQ(received[1][1].value, 98.25);
  EXPECT_EQ(received[1][1].day, 1);
}

// -----------------------------------------------------------------------------
// 8. Subscribers run in subscription order; a throwing one stops delivery.
// Why: The driver relies on the exception reaching publish() to fail a run,
//      and subscribers attached after the thrower must not see the event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ThrowingSubscriberStopsDelivery) {
  std::vector<int> calls;

  bus.subscribe([&calls](const mcsim::Event&) { calls.push_back(1); });
  bus.subscribe<mcsim::FailureEvent>([&calls](const mcsim::FailureEvent&) {
    calls.push_back(2);
    throw std::runtime_error("renderer down");
  });
  bus.subscribe([&calls](const mcsim::Event&) { calls.push_back(3); });

  bus.publish(makeProgress(10, 1, 10));
  EXPECT_EQ(calls, (std::vector<int>{1, 3}));

  calls.clear();
  EXPECT_THROW(bus.publish(makeFailure("boom")), std::runtime_error);
  EXPECT_EQ(calls, (std::vector<int>{1, 2}));
}
