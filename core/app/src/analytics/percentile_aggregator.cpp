#include "mcsim/analytics/percentile_aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace mcsim {

// -----------------------------------------------------------------------------
// aggregate(): cross-section per day → percentile band
// -----------------------------------------------------------------------------
domain::PercentileSummary PercentileAggregator::aggregate(
    const std::vector<domain::SimulationPath>& paths, int time_steps) const {
  if (paths.empty()) {
    throw std::invalid_argument(
        "PercentileAggregator: cannot aggregate an empty path set");
  }

  const std::size_t expected_len = static_cast<std::size_t>(time_steps) + 1;
  for (const auto& path : paths) {
    if (path.size() != expected_len) {
      throw std::invalid_argument(
          "PercentileAggregator: path length " + std::to_string(path.size()) +
          " does not match time_steps + 1 = " + std::to_string(expected_len));
    }
  }

  domain::PercentileSummary summary;
  summary.reserve(expected_len);

  // Reused across days to avoid one allocation per day.
  std::vector<double> cross_section(paths.size());

  for (std::size_t day = 0; day < expected_len; ++day) {
    for (std::size_t k = 0; k < paths.size(); ++k) {
      cross_section[k] = paths[k][day].value;
    }
    std::sort(cross_section.begin(), cross_section.end());

    domain::PercentileBand band;
    band.day = static_cast<int>(day);
    band.p5 = percentile_floor(cross_section, kLowPercentile);
    band.p50 = percentile_floor(cross_section, kMedianPercentile);
    band.p95 = percentile_floor(cross_section, kHighPercentile);
    summary.push_back(band);
  }

  return summary;
}

// -----------------------------------------------------------------------------
// percentile_floor()
// -----------------------------------------------------------------------------
double percentile_floor(const std::vector<double>& sorted, double p) {
  if (sorted.empty()) {
    throw std::invalid_argument("percentile_floor: empty sample");
  }
  const double n = static_cast<double>(sorted.size());
  auto index = static_cast<std::size_t>(std::floor(n * p));
  if (index >= sorted.size()) {
    index = sorted.size() - 1;
  }
  return sorted[index];
}

}  // namespace mcsim
