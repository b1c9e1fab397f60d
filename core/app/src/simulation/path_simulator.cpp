#include "mcsim/simulation/path_simulator.hpp"
#include "mcsim/estimation/parameter_estimator.hpp"
#include "mcsim/random/normal_variate_generator.hpp"

#include <cmath>

namespace mcsim {

namespace {

constexpr double kDt = 1.0 / ParameterEstimator::kTradingDaysPerYear;

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: flatten parameters and pre-compute the day-0 value
// -----------------------------------------------------------------------------
PathSimulator::PathSimulator(const domain::AssetParameterSet& params,
                             int time_steps)
    : time_steps_(time_steps) {
  assets_.reserve(params.size());
  for (const auto& [symbol, asset] : params) {
    assets_.push_back(asset);
    initial_value_ += asset.shares * asset.last_price;
  }
}

// -----------------------------------------------------------------------------
// simulate(): one trajectory
// -----------------------------------------------------------------------------
domain::SimulationPath PathSimulator::simulate(IUniformSource& source) const {
  NormalVariateGenerator normal(source);
  const double sqrt_dt = std::sqrt(kDt);

  // Running price per asset, exclusively owned by this trajectory.
  std::vector<double> prices;
  prices.reserve(assets_.size());
  for (const auto& asset : assets_) {
    prices.push_back(asset.last_price);
  }

  domain::SimulationPath path;
  path.reserve(static_cast<std::size_t>(time_steps_) + 1);
  path.push_back({0, initial_value_});

  for (int day = 1; day <= time_steps_; ++day) {
    double value = 0.0;
    for (std::size_t i = 0; i < assets_.size(); ++i) {
      const auto& asset = assets_[i];
      if (asset.volatility > 0.0) {
        const double z = normal.next();
        const double exponent =
            (asset.drift - 0.5 * asset.volatility * asset.volatility) * kDt +
            asset.volatility * sqrt_dt * z;
        prices[i] *= std::exp(exponent);
      }
      value += asset.shares * prices[i];
    }
    path.push_back({day, value});
  }

  return path;
}

}  // namespace mcsim
