#pragma once

#include "mcsim/domain/outcome_summary.hpp"
#include "mcsim/domain/simulation_path.hpp"

#include <vector>

namespace mcsim {

// -----------------------------------------------------------------------------
// OutcomeAnalyzer
// -----------------------------------------------------------------------------
//
// @brief  Summarizes where the portfolio ends up: median / worst / best final
//         value, expected return, and the share of trajectories crossing a
//         few gain and loss thresholds.
//
// @details
// Works on the final point of every path. Percentiles use the same
// floor(n * p) rule as PercentileAggregator, so expected_value, worst_case
// and best_case equal the last band of the run's PercentileSummary.
//
// expected_return_pct is 0 when initial_value is 0 (an all-zero portfolio,
// e.g. every asset lacked history).
//
// Thread model:
//   Stateless; safe to call from any thread.
// -----------------------------------------------------------------------------
class OutcomeAnalyzer {
 public:
  // @throws std::invalid_argument if paths is empty or a path is empty.
  domain::OutcomeSummary analyze(
      const std::vector<domain::SimulationPath>& paths,
      double initial_value) const;

  // Same statistics from a plain list of final values (order irrelevant).
  domain::OutcomeSummary analyze_final_values(std::vector<double> final_values,
                                              double initial_value) const;
};

}  // namespace mcsim
