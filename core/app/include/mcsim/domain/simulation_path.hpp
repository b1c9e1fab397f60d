#pragma once

#include <vector>

namespace mcsim {
namespace domain {

// -----------------------------------------------------------------------------
// PathPoint / SimulationPath
// -----------------------------------------------------------------------------
//
// @brief  One simulated trajectory of total portfolio value.
//
// @details
// A SimulationPath covers day = 0 .. time_steps inclusive, so its size is
// always time_steps + 1. Entry i has day == i. Day 0 holds the initial
// portfolio value (sum of shares * last_price) and is never randomized.
//
// Ownership:
//   Built by exactly one PathSimulator call. The driver moves it into the
//   run's path collection and copies it into the next ProgressEvent batch.
// -----------------------------------------------------------------------------
struct PathPoint {
  int day{0};
  double value{0.0};
};

using SimulationPath = std::vector<PathPoint>;

}  // namespace domain
}  // namespace mcsim
