#pragma once

#include "mcsim/domain/asset_parameters.hpp"
#include "mcsim/simulation/i_path_simulator.hpp"

#include <vector>

namespace mcsim {

// -----------------------------------------------------------------------------
// PathSimulator — GBM trajectory of total portfolio value
// -----------------------------------------------------------------------------
//
// @brief  Advances every asset of the portfolio under Geometric Brownian
//         Motion with a daily step and records the portfolio value per day.
//
// @details
// Day 0:
//   value = sum(shares * last_price); no random draw.
//
// Day t = 1 .. time_steps, for each asset in symbol order:
//   if volatility > 0:
//       Z = NormalVariateGenerator(source).next()
//       price *= exp((drift - 0.5 * volatility^2) * dt
//                    + volatility * sqrt(dt) * Z)
//   else:
//       price unchanged (drift alone is not applied)
//   value = sum(shares * price)
//
// dt is 1/252 (one trading day in years).
//
// Ownership:
//   Copies the parameters into a vector at construction so the hot loop
//   walks contiguous memory in symbol order. The running price vector and
//   the output path are locals of simulate().
//
// Thread model:
//   Immutable after construction; simulate() is safe to call concurrently
//   with distinct sources.
// -----------------------------------------------------------------------------
class PathSimulator final : public IPathSimulator {
 public:
  PathSimulator(const domain::AssetParameterSet& params, int time_steps);

  domain::SimulationPath simulate(IUniformSource& source) const override;

  int time_steps() const override { return time_steps_; }

  double initial_value() const override { return initial_value_; }

 private:
  std::vector<domain::AssetParameters> assets_;
  int time_steps_;
  double initial_value_{0.0};
};

}  // namespace mcsim
