#pragma once

#include "mcsim/domain/outcome_summary.hpp"
#include "mcsim/domain/percentile_summary.hpp"
#include "mcsim/domain/simulation_path.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mcsim {

// -----------------------------------------------------------------------------
// ProgressEvent
// -----------------------------------------------------------------------------
// Responsibility: Reports how far a run has got and hands over the
// trajectories completed since the previous ProgressEvent.
// Why in architecture: The driver publishes one after every simulation (or
// every batch_size simulations); the host renders the paths as they arrive.
// progress = floor(completed / total * 100), non-decreasing within a run.
// -----------------------------------------------------------------------------
struct ProgressEvent {
  std::uint64_t run_id{0};
  int progress{0};                            // 0-100
  int completed{0};                           // Simulations finished so far
  int total{0};                               // Simulations in the run
  std::vector<domain::SimulationPath> batch;  // Newly completed paths
};

// -----------------------------------------------------------------------------
// CompletionEvent
// -----------------------------------------------------------------------------
// Responsibility: Terminal success signal of a run, carrying the percentile
// bands (and the outcome summary) computed over all of its trajectories.
// Published exactly once, after the last ProgressEvent of the run.
// -----------------------------------------------------------------------------
struct CompletionEvent {
  std::uint64_t run_id{0};
  int progress{100};
  domain::PercentileSummary final_data;
  domain::OutcomeSummary outcome;
};

// -----------------------------------------------------------------------------
// FailureEvent
// -----------------------------------------------------------------------------
// Responsibility: Terminal failure signal of a run. Replaces the
// CompletionEvent when a simulation throws; no percentile data is produced
// for a failed run.
// -----------------------------------------------------------------------------
struct FailureEvent {
  std::uint64_t run_id{0};
  int progress{0};     // Last progress value reported before the failure
  std::string reason;  // what() of the exception that aborted the run
};

}  // namespace mcsim
