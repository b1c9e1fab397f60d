#pragma once

#include "mcsim/domain/outcome_summary.hpp"
#include "mcsim/domain/percentile_summary.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcsim {
namespace domain {

// -----------------------------------------------------------------------------
// SimulationRequest — configuration of one Monte Carlo run
// -----------------------------------------------------------------------------
//
// @brief  Everything the driver needs to run: how many trajectories, how
//         many days, the historical prices and the dollar allocation.
//
// @details
// The in-class defaults are the engine-wide defaults. The MessageCodec fills
// a request from the host's JSON input message and leaves absent fields at
// these values.
//
//   total_simulations  number of independent trajectories (>= 1)
//   time_steps         trading days simulated after day 0 (>= 0);
//                      1260 = 5 years of 252 trading days
//   sample_prices      symbol -> ordered daily closes, oldest first
//   allocations        symbol -> percent of portfolio_amount (0-100)
//   lookback_period    most recent closes used for estimation (>= 1)
//   portfolio_amount   total dollars invested at day 0 (>= 0)
//   batch_size         completed trajectories per progress message (>= 1)
//   seed               base seed; when empty the driver draws one from
//                      std::random_device
//
// Thread model:
//   Value type. Moved into the SimulationWorker queue and read only by the
//   worker thread afterwards.
// -----------------------------------------------------------------------------
struct SimulationRequest {
  int total_simulations{1000};
  int time_steps{252 * 5};
  std::map<std::string, std::vector<double>> sample_prices;
  std::map<std::string, double> allocations;
  int lookback_period{252};
  double portfolio_amount{100000.0};
  int batch_size{1};
  std::optional<std::uint64_t> seed;
};

// -----------------------------------------------------------------------------
// SimulationResult — what a completed run hands back to its caller
// -----------------------------------------------------------------------------
struct SimulationResult {
  PercentileSummary final_data;
  OutcomeSummary outcome;
  int simulations_completed{0};
};

}  // namespace domain
}  // namespace mcsim
