#pragma once

#include "mcsim/domain/asset_parameters.hpp"

#include <map>
#include <string>
#include <vector>

namespace mcsim {

// -----------------------------------------------------------------------------
// ParameterEstimator
// -----------------------------------------------------------------------------
//
// @brief  Turns historical daily closes into annualized GBM parameters and an
//         opening position for every asset of the portfolio.
//
// @details
// Per asset:
//   1. Fewer closes than lookback_period  → zero-contribution asset
//      (drift = volatility = last_price = shares = 0), warning on stderr.
//   2. Otherwise keep the last lookback_period closes and build the daily
//      log-return series. A pair where either close is <= 0 is skipped, not
//      zero-filled.
//   3. mean and sample stddev (n - 1) of the series.
//   4. drift = mean * 252, volatility = stddev * sqrt(252).
//   5. shares = (portfolio_amount * allocation / 100) / last_price, or 0 if
//      last_price <= 0.
//
// Symbols are taken from the price map. A symbol without an allocation is
// treated as a 0 % allocation (warning on stderr); allocation entries for
// symbols without prices are ignored.
//
// Nothing in here is fatal: data gaps degrade the asset, they never abort
// the run.
//
// Thread model:
//   Stateless apart from the configuration captured at construction. Safe to
//   call estimate() concurrently.
// -----------------------------------------------------------------------------
class ParameterEstimator {
 public:
  // Trading days per year used to annualize daily statistics.
  static constexpr int kTradingDaysPerYear = 252;

  ParameterEstimator(int lookback_period, double portfolio_amount)
      : lookback_period_(lookback_period), portfolio_amount_(portfolio_amount) {}

  // -------------------------------------------------------------------------
  // estimate(sample_prices, allocations)
  // -------------------------------------------------------------------------
  // @brief  Builds one AssetParameters per symbol of sample_prices.
  //
  // @param  sample_prices  symbol -> daily closes, oldest first.
  // @param  allocations    symbol -> percent of portfolio_amount.
  //
  // @return Ordered symbol -> AssetParameters map.
  // -------------------------------------------------------------------------
  domain::AssetParameterSet estimate(
      const std::map<std::string, std::vector<double>>& sample_prices,
      const std::map<std::string, double>& allocations) const;

  // Single-asset form of estimate().
  domain::AssetParameters estimate_asset(const std::string& symbol,
                                         const std::vector<double>& prices,
                                         double allocation_percent) const;

 private:
  int lookback_period_;
  double portfolio_amount_;
};

// -----------------------------------------------------------------------------
// Return-series statistics used by the estimator. Exposed for testing.
// -----------------------------------------------------------------------------

// ln(p[i] / p[i-1]) for every adjacent pair with both prices > 0.
std::vector<double> compute_log_returns(const std::vector<double>& prices);

// Arithmetic mean; 0 for an empty series.
double compute_mean(const std::vector<double>& data);

// Sample standard deviation (denominator n - 1); 0 for fewer than 2 values.
double compute_sample_stddev(const std::vector<double>& data, double mean);

}  // namespace mcsim
