#pragma once

#include <vector>

namespace mcsim {
namespace domain {

// -----------------------------------------------------------------------------
// PercentileBand / PercentileSummary
// -----------------------------------------------------------------------------
//
// @brief  The 5th, 50th and 95th percentile of all trajectory values on one
//         day, and the ordered sequence of those bands for a whole run.
//
// @details
// Computed once by the PercentileAggregator after every trajectory of a run
// has completed. Because each band is read from the same sorted
// cross-section, p5 <= p50 <= p95 always holds.
// -----------------------------------------------------------------------------
struct PercentileBand {
  int day{0};
  double p5{0.0};
  double p50{0.0};
  double p95{0.0};
};

using PercentileSummary = std::vector<PercentileBand>;

}  // namespace domain
}  // namespace mcsim
