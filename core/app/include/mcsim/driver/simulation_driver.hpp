#pragma once

#include "mcsim/analytics/outcome_analyzer.hpp"
#include "mcsim/analytics/percentile_aggregator.hpp"
#include "mcsim/domain/simulation_request.hpp"
#include "mcsim/eventbus/event_bus.hpp"
#include "mcsim/simulation/i_path_simulator.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <stdexcept>

namespace mcsim {

// -----------------------------------------------------------------------------
// SimulationError
// -----------------------------------------------------------------------------
// Thrown by SimulationDriver when a run aborts because one of its
// simulations (or the final aggregation) threw, or when a subscriber throws
// while the CompletionEvent is published. By the time it reaches the caller
// the run's single terminal event (FailureEvent or CompletionEvent) has
// already been published.
// -----------------------------------------------------------------------------
class SimulationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// RunSettings — the part of a request that governs the repetition loop
// -----------------------------------------------------------------------------
struct RunSettings {
  int total_simulations{1000};
  int batch_size{1};
  std::uint64_t seed{0};
};

// -----------------------------------------------------------------------------
// SimulationDriver
// -----------------------------------------------------------------------------
//
// @brief  Runs a Monte Carlo request end to end: estimate parameters, repeat
//         the path simulator, report progress, aggregate, signal completion.
//
// @details
// Event protocol on the bus, per run:
//
//   ProgressEvent * k   progress = floor(completed / total * 100), one per
//                       batch_size completed simulations plus one for the
//                       final partial batch; the last one has progress 100
//   CompletionEvent     exactly once, after the last ProgressEvent
//     — or —
//   FailureEvent        exactly once, instead of CompletionEvent, when a
//                       simulation throws; SimulationError is then thrown
//
// A subscriber that throws on the CompletionEvent does not turn the run into
// a failure on the bus: no FailureEvent follows, and SimulationError is
// thrown to the caller.
//
// A cancelled run publishes neither terminal event and returns std::nullopt.
//
// Cooperative scheduling:
//   The unit of work is one whole trajectory. Between two simulations the
//   driver checks the cancellation flag and calls std::this_thread::yield(),
//   so the host sees progress incrementally and can stop the run between
//   trajectories. A trajectory is never interrupted.
//
// Randomness:
//   Simulation i draws from Mt19937UniformSource(seed, i). Same seed and
//   same inputs reproduce the same paths and the same summary.
//
// Aggregation:
//   Only after all total_simulations paths are collected. A partial set is
//   never aggregated (neither on failure nor on cancellation).
//
// Ownership:
//   Holds a reference to the EventBus, which must outlive the driver. Each
//   run owns its path collection; it is released when run() returns.
//
// Thread model:
//   run() executes on the calling thread (the SimulationWorker thread in
//   the engine). Events are published on that thread. One driver may be
//   reused for successive runs but not for concurrent ones.
// -----------------------------------------------------------------------------
class SimulationDriver {
 public:
  explicit SimulationDriver(EventBus& bus) : bus_(bus) {}

  // -------------------------------------------------------------------------
  // run(request, run_id, cancel_flag)
  // -------------------------------------------------------------------------
  // @brief  Full pipeline for one request.
  //
  // @param  request      Validated with validate_request() first.
  // @param  run_id       Copied into every event of this run.
  // @param  cancel_flag  Optional; when it reads true between two
  //                      simulations the run stops.
  //
  // @return The result, or std::nullopt if the run was cancelled.
  //
  // @throws std::invalid_argument  request is invalid (nothing published).
  // @throws SimulationError        a simulation failed (FailureEvent
  //                                already published) or a completion
  //                                subscriber threw (CompletionEvent
  //                                already published).
  // -------------------------------------------------------------------------
  std::optional<domain::SimulationResult> run(
      const domain::SimulationRequest& request, std::uint64_t run_id = 0,
      const std::atomic<bool>* cancel_flag = nullptr);

  // -------------------------------------------------------------------------
  // execute(simulator, settings, run_id, cancel_flag)
  // -------------------------------------------------------------------------
  // @brief  The repetition / progress / aggregation loop on an already
  //         built simulator. run() calls this after estimation.
  //
  // Same return value, events and exceptions as run().
  // -------------------------------------------------------------------------
  std::optional<domain::SimulationResult> execute(
      const IPathSimulator& simulator, const RunSettings& settings,
      std::uint64_t run_id = 0,
      const std::atomic<bool>* cancel_flag = nullptr);

 private:
  EventBus& bus_;
  PercentileAggregator aggregator_;
  OutcomeAnalyzer analyzer_;
};

// -----------------------------------------------------------------------------
// validate_request(request)
// -----------------------------------------------------------------------------
// @throws std::invalid_argument naming the first out-of-range field:
//         total_simulations < 1, time_steps < 0, lookback_period < 1,
//         batch_size < 1 or portfolio_amount < 0.
// -----------------------------------------------------------------------------
void validate_request(const domain::SimulationRequest& request);

// floor(completed / total * 100); 100 exactly when completed == total.
int progress_percent(int completed, int total);

}  // namespace mcsim
