#pragma once

namespace mcsim {
namespace domain {

// -----------------------------------------------------------------------------
// OutcomeSummary — headline statistics of the final-day cross-section
// -----------------------------------------------------------------------------
//
// @brief  What the portfolio is likely to be worth at the end of the
//         horizon, and how likely a few gain/loss thresholds are.
//
// @details
// expected_value, worst_case and best_case are the p50, p5 and p95 of the
// final values, using the same floor(n * p) index rule as the percentile
// bands. All prob_* fields are percentages in [0, 100]. Thresholds are
// strict: a final value exactly equal to the initial value is neither a
// gain nor a loss.
// -----------------------------------------------------------------------------
struct OutcomeSummary {
  double initial_value{0.0};
  double expected_value{0.0};        // p50 of final values
  double worst_case{0.0};            // p5 of final values
  double best_case{0.0};             // p95 of final values
  double expected_return_pct{0.0};   // (expected / initial - 1) * 100

  double prob_positive_return{0.0};  // final > initial
  double prob_return_above_10{0.0};  // final > 1.1 * initial
  double prob_return_above_20{0.0};  // final > 1.2 * initial
  double prob_loss_above_10{0.0};    // final < 0.9 * initial
  double prob_loss_above_20{0.0};    // final < 0.8 * initial
};

}  // namespace domain
}  // namespace mcsim
