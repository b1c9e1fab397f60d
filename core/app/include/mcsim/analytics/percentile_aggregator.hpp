#pragma once

#include "mcsim/domain/percentile_summary.hpp"
#include "mcsim/domain/simulation_path.hpp"

#include <vector>

namespace mcsim {

// -----------------------------------------------------------------------------
// PercentileAggregator
// -----------------------------------------------------------------------------
//
// @brief  Collapses a complete set of trajectories into one p5 / p50 / p95
//         band per day.
//
// @details
// For each day d in 0 .. time_steps:
//   1. collect paths[k][d].value for every k,
//   2. sort ascending,
//   3. read index floor(n * p) for p = 0.05, 0.50, 0.95.
//
// The index rule is floor(n * p) with no interpolation. It is kept exactly
// as-is so summaries stay numerically comparable with earlier runs; do not
// switch to (n - 1) * p or an interpolated quantile.
//
// Only ever called on the full path set of a run (the driver aggregates
// after the last simulation completes).
//
// Thread model:
//   Stateless; safe to call from any thread.
// -----------------------------------------------------------------------------
class PercentileAggregator {
 public:
  static constexpr double kLowPercentile = 0.05;
  static constexpr double kMedianPercentile = 0.50;
  static constexpr double kHighPercentile = 0.95;

  // -------------------------------------------------------------------------
  // aggregate(paths, time_steps)
  // -------------------------------------------------------------------------
  // @brief  One PercentileBand per day, day 0 first.
  //
  // @throws std::invalid_argument if paths is empty or any path does not
  //         hold exactly time_steps + 1 points.
  // -------------------------------------------------------------------------
  domain::PercentileSummary aggregate(
      const std::vector<domain::SimulationPath>& paths, int time_steps) const;
};

// -----------------------------------------------------------------------------
// percentile_floor(sorted, p)
// -----------------------------------------------------------------------------
// @brief  sorted[floor(n * p)], clamped to the last element.
//
// @param  sorted  Ascending, non-empty.
// @param  p       In [0, 1).
//
// @throws std::invalid_argument if sorted is empty.
// -----------------------------------------------------------------------------
double percentile_floor(const std::vector<double>& sorted, double p);

}  // namespace mcsim
