#include "mcsim/analytics/outcome_analyzer.hpp"
#include "mcsim/analytics/percentile_aggregator.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace mcsim {

namespace {

// Percentage of values satisfying pred.
template <typename Pred>
double share_pct(const std::vector<double>& values, Pred pred) {
  auto count = std::count_if(values.begin(), values.end(), pred);
  return static_cast<double>(count) / static_cast<double>(values.size()) *
         100.0;
}

}  // namespace

// -----------------------------------------------------------------------------
// analyze(): pull the last point of every path
// -----------------------------------------------------------------------------
domain::OutcomeSummary OutcomeAnalyzer::analyze(
    const std::vector<domain::SimulationPath>& paths,
    double initial_value) const {
  if (paths.empty()) {
    throw std::invalid_argument("OutcomeAnalyzer: no paths to analyze");
  }

  std::vector<double> finals;
  finals.reserve(paths.size());
  for (const auto& path : paths) {
    if (path.empty()) {
      throw std::invalid_argument("OutcomeAnalyzer: empty path");
    }
    finals.push_back(path.back().value);
  }
  return analyze_final_values(std::move(finals), initial_value);
}

// -----------------------------------------------------------------------------
// analyze_final_values()
// -----------------------------------------------------------------------------
domain::OutcomeSummary OutcomeAnalyzer::analyze_final_values(
    std::vector<double> final_values, double initial_value) const {
  if (final_values.empty()) {
    throw std::invalid_argument("OutcomeAnalyzer: no final values");
  }
  std::sort(final_values.begin(), final_values.end());

  domain::OutcomeSummary out;
  out.initial_value = initial_value;
  out.expected_value =
      percentile_floor(final_values, PercentileAggregator::kMedianPercentile);
  out.worst_case =
      percentile_floor(final_values, PercentileAggregator::kLowPercentile);
  out.best_case =
      percentile_floor(final_values, PercentileAggregator::kHighPercentile);
  out.expected_return_pct =
      initial_value != 0.0 ? (out.expected_value / initial_value - 1.0) * 100.0
                           : 0.0;

  const double init = initial_value;
  out.prob_positive_return =
      share_pct(final_values, [init](double v) { return v > init; });
  out.prob_return_above_10 =
      share_pct(final_values, [init](double v) { return v > init * 1.1; });
  out.prob_return_above_20 =
      share_pct(final_values, [init](double v) { return v > init * 1.2; });
  out.prob_loss_above_10 =
      share_pct(final_values, [init](double v) { return v < init * 0.9; });
  out.prob_loss_above_20 =
      share_pct(final_values, [init](double v) { return v < init * 0.8; });

  return out;
}

}  // namespace mcsim
