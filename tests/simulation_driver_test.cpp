// =============================================================================
// simulation_driver_test.cpp
// =============================================================================
// Unit tests for mcsim::SimulationDriver.
//
// Validates:
//   - Scenario A: constant prices → flat bands
//   - Scenario B: 10 simulations x 5 steps → 6 ordered bands, day 0 exact
//   - Scenario C: two assets, allocations summing to 100% → day 0 equals
//     the portfolio amount
//   - Progress non-decreasing, last progress exactly 100, then completion
//   - batch_size groups paths into progress events
//   - A throwing simulation → one FailureEvent, no completion,
//     SimulationError
//   - Cancellation between simulations → no terminal event, std::nullopt
//   - Same seed → identical results
//   - Invalid requests are rejected before anything is published
//   - A throwing completion subscriber does not add a FailureEvent
//
// Design note: run() executes on the test thread, so events are collected
// synchronously in publish order.
// =============================================================================

#include "mcsim/driver/simulation_driver.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace {

// Returns the same flat path every time; fails on one chosen call.
class FakePathSimulator : public mcsim::IPathSimulator {
 public:
  FakePathSimulator(int time_steps, double value, int fail_on_call = -1)
      : time_steps_(time_steps), value_(value), fail_on_call_(fail_on_call) {}

  mcsim::domain::SimulationPath simulate(
      mcsim::IUniformSource& /*source*/) const override {
    const int call = calls_++;
    if (call == fail_on_call_) {
      throw std::runtime_error("injected failure in simulation " +
                               std::to_string(call));
    }
    mcsim::domain::SimulationPath path;
    for (int day = 0; day <= time_steps_; ++day) {
      path.push_back({day, value_});
    }
    return path;
  }

  int time_steps() const override { return time_steps_; }
  double initial_value() const override { return value_; }

  int calls() const { return calls_; }

 private:
  int time_steps_;
  double value_;
  int fail_on_call_;
  mutable int calls_{0};
};

// Claims more steps than the paths it returns hold, so aggregation throws.
class ShortPathSimulator : public FakePathSimulator {
 public:
  ShortPathSimulator() : FakePathSimulator(2, 1.0) {}
  int time_steps() const override { return 5; }
};

}  // namespace

// =============================================================================
// Test fixture: a driver on a bus whose events are recorded in order.
// =============================================================================
class SimulationDriverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    bus.subscribe([this](const mcsim::Event& e) { events.push_back(e); });
  }

  std::vector<mcsim::ProgressEvent> progressEvents() const {
    std::vector<mcsim::ProgressEvent> out;
    for (const auto& e : events) {
      if (const auto* p = std::get_if<mcsim::ProgressEvent>(&e)) {
        out.push_back(*p);
      }
    }
    return out;
  }

  template <typename T>
  int countOf() const {
    int n = 0;
    for (const auto& e : events) {
      if (std::holds_alternative<T>(e)) {
        ++n;
      }
    }
    return n;
  }

  // A deterministic zig-zag history with non-zero volatility.
  static std::vector<double> zigzag(double start, int count) {
    std::vector<double> prices;
    double p = start;
    for (int i = 0; i < count; ++i) {
      prices.push_back(p);
      p *= (i % 3 == 0) ? 1.02 : 0.995;
    }
    return prices;
  }

  static mcsim::domain::SimulationRequest makeRequest() {
    mcsim::domain::SimulationRequest r;
    r.total_simulations = 10;
    r.time_steps = 5;
    r.lookback_period = 20;
    r.portfolio_amount = 10000.0;
    r.sample_prices["AAA"] = zigzag(50.0, 30);
    r.allocations["AAA"] = 100.0;
    r.seed = 42;
    return r;
  }

  mcsim::EventBus bus;
  mcsim::SimulationDriver driver{bus};
  std::vector<mcsim::Event> events;
};

// -----------------------------------------------------------------------------
// 1. Scenario A: constant prices give flat bands at the portfolio amount.
// -----------------------------------------------------------------------------
TEST_F(SimulationDriverTest, ConstantPricesGiveFlatBands) {
  auto request = makeRequest();
  request.sample_prices["AAA"] = std::vector<double>(30, 25.0);

  auto result = driver.run(request, 1);

  ASSERT_TRUE(result.has_value());
  for (const auto& band : result->final_data) {
    EXPECT_DOUBLE_EQ(band.p5, 10000.0);
    EXPECT_DOUBLE_EQ(band.p50, 10000.0);
    EXPECT_DOUBLE_EQ(band.p95, 10000.0);
  }
}

// -----------------------------------------------------------------------------
// 2. Scenario B: 10 simulations x 5 steps.
// Why: T + 1 bands, ordered, and day 0 is the exact initial value (every
//      path starts at the same number, so every percentile equals it).
// -----------------------------------------------------------------------------
TEST_F(SimulationDriverTest, TenSimulationsFiveSteps) {
  auto result = driver.run(makeRequest(), 7);

  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->final_data.size(), 6u);
  EXPECT_EQ(result->simulations_completed, 10);

  const double initial = result->outcome.initial_value;
  EXPECT_EQ(result->final_data[0].day, 0);
  EXPECT_EQ(result->final_data[0].p5, initial);
  EXPECT_EQ(result->final_data[0].p50, initial);
  EXPECT_EQ(result->final_data[0].p95, initial);

  for (std::size_t day = 0; day < result->final_data.size(); ++day) {
    const auto& band = result->final_data[day];
    EXPECT_EQ(band.day, static_cast<int>(day));
    EXPECT_LE(band.p5, band.p50);
    EXPECT_LE(band.p50, band.p95);
  }

  ASSERT_EQ(countOf<mcsim::CompletionEvent>(), 1);
  const auto& done = std::get<mcsim::CompletionEvent>(events.back());
  EXPECT_EQ(done.run_id, 7u);
  EXPECT_EQ(done.progress, 100);
  EXPECT_EQ(done.final_data.size(), 6u);
}

// -----------------------------------------------------------------------------
// 3. Scenario C: two assets, 60/40 allocation → day 0 ≈ portfolio amount.
// -----------------------------------------------------------------------------
TEST_F(SimulationDriverTest, TwoAssetsStartAtPortfolioAmount) {
  auto request = makeRequest();
  request.sample_prices["BBB"] = zigzag(310.0, 30);
  request.allocations["AAA"] = 60.0;
  request.allocations["BBB"] = 40.0;
  request.portfolio_amount = 250000.0;

  auto result = driver.run(request);

  ASSERT_TRUE(result.has_value());
  EXPECT_NEAR(result->final_data[0].p50, 250000.0, 1e-6);
  EXPECT_NEAR(result->outcome.initial_value, 250000.0, 1e-6);
}

// -----------------------------------------------------------------------------
// 4. Progress is non-decreasing, ends at exactly 100, then completion.
// -----------------------------------------------------------------------------
TEST_F(SimulationDriverTest, ProgressIsMonotonicAndEndsAtHundred) {
  auto request = makeRequest();
  request.total_simulations = 7;

  driver.run(request);

  auto progress = progressEvents();
  ASSERT_EQ(progress.size(), 7u);

  int previous = -1;
  for (std::size_t i = 0; i < progress.size(); ++i) {
    EXPECT_GE(progress[i].progress, previous);
    EXPECT_EQ(progress[i].completed, static_cast<int>(i) + 1);
    EXPECT_EQ(progress[i].total, 7);
    ASSERT_EQ(progress[i].batch.size(), 1u);
    EXPECT_EQ(progress[i].batch[0].size(), 6u);
    previous = progress[i].progress;
  }
  EXPECT_EQ(progress[0].progress, 14);  // floor(1 / 7 * 100)
  EXPECT_EQ(progress.back().progress, 100);

  // The completion event follows the last progress event.
  ASSERT_GE(events.size(), 2u);
  EXPECT_TRUE(std::holds_alternative<mcsim::ProgressEvent>(
      events[events.size() - 2]));
  EXPECT_TRUE(std::holds_alternative<mcsim::CompletionEvent>(events.back()));
}

// -----------------------------------------------------------------------------
// 5. batch_size groups paths; the final partial batch is still reported.
// -----------------------------------------------------------------------------
TEST_F(SimulationDriverTest, BatchSizeGroupsPaths) {
  FakePathSimulator sim(3, 500.0);
  mcsim::RunSettings settings;
  settings.total_simulations = 10;
  settings.batch_size = 4;
  settings.seed = 1;

  auto result = driver.execute(sim, settings, 3);

  ASSERT_TRUE(result.has_value());
  auto progress = progressEvents();
  ASSERT_EQ(progress.size(), 3u);
  EXPECT_EQ(progress[0].batch.size(), 4u);
  EXPECT_EQ(progress[0].progress, 40);
  EXPECT_EQ(progress[1].batch.size(), 4u);
  EXPECT_EQ(progress[1].progress, 80);
  EXPECT_EQ(progress[2].batch.size(), 2u);
  EXPECT_EQ(progress[2].progress, 100);
  EXPECT_EQ(progress[2].run_id, 3u);
}

// -----------------------------------------------------------------------------
// 6. A simulation that throws aborts the run.
// Why: Exactly one failure signal, no completion, no partial aggregation,
//      and the caller sees SimulationError.
// -----------------------------------------------------------------------------
TEST_F(SimulationDriverTest, FailingSimulationPublishesOneFailure) {
  FakePathSimulator sim(4, 100.0, /*fail_on_call=*/3);
  mcsim::RunSettings settings;
  settings.total_simulations = 10;

  EXPECT_THROW(driver.execute(sim, settings, 11), mcsim::SimulationError);

  EXPECT_EQ(sim.calls(), 4);
  EXPECT_EQ(countOf<mcsim::ProgressEvent>(), 3);
  EXPECT_EQ(countOf<mcsim::CompletionEvent>(), 0);
  ASSERT_EQ(countOf<mcsim::FailureEvent>(), 1);

  const auto& failure = std::get<mcsim::FailureEvent>(events.back());
  EXPECT_EQ(failure.run_id, 11u);
  EXPECT_EQ(failure.progress, 30);
  EXPECT_NE(failure.reason.find("injected failure"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 7. A failure in the final aggregation is reported the same way.
// -----------------------------------------------------------------------------
TEST_F(SimulationDriverTest, AggregationFailurePublishesFailure) {
  ShortPathSimulator sim;
  mcsim::RunSettings settings;
  settings.total_simulations = 2;

  EXPECT_THROW(driver.execute(sim, settings), mcsim::SimulationError);

  EXPECT_EQ(countOf<mcsim::CompletionEvent>(), 0);
  ASSERT_EQ(countOf<mcsim::FailureEvent>(), 1);
  EXPECT_EQ(std::get<mcsim::FailureEvent>(events.back()).progress, 100);
}

// -----------------------------------------------------------------------------
// 8. Cancellation is observed between simulations.
// Why: Raised from a progress callback after 3 completions, the run stops
//      before the 4th simulation and publishes no terminal event.
// -----------------------------------------------------------------------------
TEST_F(SimulationDriverTest, CancelStopsBetweenSimulations) {
  std::atomic<bool> cancel{false};
  bus.subscribe<mcsim::ProgressEvent>([&cancel](const mcsim::ProgressEvent& e) {
    if (e.completed == 3) {
      cancel.store(true);
    }
  });

  FakePathSimulator sim(2, 10.0);
  mcsim::RunSettings settings;
  settings.total_simulations = 10;

  auto result = driver.execute(sim, settings, 5, &cancel);

  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(sim.calls(), 3);
  EXPECT_EQ(countOf<mcsim::ProgressEvent>(), 3);
  EXPECT_EQ(countOf<mcsim::CompletionEvent>(), 0);
  EXPECT_EQ(countOf<mcsim::FailureEvent>(), 0);
}

// -----------------------------------------------------------------------------
// 9. The same seed reproduces the same bands and outcome.
// -----------------------------------------------------------------------------
TEST_F(SimulationDriverTest, SameSeedIsReproducible) {
  auto request = makeRequest();
  request.total_simulations = 25;
  request.time_steps = 12;

  auto first = driver.run(request);
  auto second = driver.run(request);

  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  ASSERT_EQ(first->final_data.size(), second->final_data.size());
  for (std::size_t i = 0; i < first->final_data.size(); ++i) {
    EXPECT_EQ(first->final_data[i].p5, second->final_data[i].p5);
    EXPECT_EQ(first->final_data[i].p50, second->final_data[i].p50);
    EXPECT_EQ(first->final_data[i].p95, second->final_data[i].p95);
  }
  EXPECT_EQ(first->outcome.expected_value, second->outcome.expected_value);
}

// -----------------------------------------------------------------------------
// 10. Invalid requests are rejected before anything is published.
// -----------------------------------------------------------------------------
TEST_F(SimulationDriverTest, InvalidRequestPublishesNothing) {
  auto request = makeRequest();
  request.total_simulations = 0;
  EXPECT_THROW(driver.run(request), std::invalid_argument);

  request = makeRequest();
  request.batch_size = 0;
  EXPECT_THROW(driver.run(request), std::invalid_argument);

  request = makeRequest();
  request.time_steps = -1;
  EXPECT_THROW(driver.run(request), std::invalid_argument);

  request = makeRequest();
  request.portfolio_amount = -1.0;
  EXPECT_THROW(mcsim::validate_request(request), std::invalid_argument);

  EXPECT_TRUE(events.empty());
}

// -----------------------------------------------------------------------------
// 11. progress_percent() floors and reaches 100 only at completion.
// -----------------------------------------------------------------------------
TEST_F(SimulationDriverTest, ProgressPercentFloors) {
  EXPECT_EQ(mcsim::progress_percent(1, 3), 33);
  EXPECT_EQ(mcsim::progress_percent(29, 100), 29);
  EXPECT_EQ(mcsim::progress_percent(999, 1000), 99);
  EXPECT_EQ(mcsim::progress_percent(1000, 1000), 100);
}

// -----------------------------------------------------------------------------
// 12. A completion subscriber that throws does not add a failure signal.
// Why: The host has already received done = true; a FailureEvent after it
//      would give the run two terminal messages. The caller still sees
//      SimulationError.
// -----------------------------------------------------------------------------
TEST_F(SimulationDriverTest, ThrowingCompletionSubscriberKeepsOneTerminal) {
  bus.subscribe<mcsim::CompletionEvent>([](const mcsim::CompletionEvent&) {
    throw std::runtime_error("host render failed");
  });

  auto request = makeRequest();
  request.total_simulations = 3;
  request.time_steps = 2;
  request.lookback_period = 3;
  request.sample_prices["AAA"] = {10.0, 10.4, 10.1};

  EXPECT_THROW(driver.run(request, 5), mcsim::SimulationError);

  EXPECT_EQ(countOf<mcsim::CompletionEvent>(), 1);
  EXPECT_EQ(countOf<mcsim::FailureEvent>(), 0);
  EXPECT_TRUE(std::holds_alternative<mcsim::CompletionEvent>(events.back()));
}
