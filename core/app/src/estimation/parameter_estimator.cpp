#include "mcsim/estimation/parameter_estimator.hpp"

#include <cmath>
#include <iostream>
#include <numeric>

namespace mcsim {

// -----------------------------------------------------------------------------
// estimate(): one AssetParameters per priced symbol
// -----------------------------------------------------------------------------
domain::AssetParameterSet ParameterEstimator::estimate(
    const std::map<std::string, std::vector<double>>& sample_prices,
    const std::map<std::string, double>& allocations) const {
  domain::AssetParameterSet params;

  for (const auto& [symbol, prices] : sample_prices) {
    double allocation = 0.0;
    auto it = allocations.find(symbol);
    if (it != allocations.end()) {
      allocation = it->second;
    } else {
      std::cerr << "[ParameterEstimator] No allocation for " << symbol
                << ", using 0%.\n";
    }

    params.emplace(symbol, estimate_asset(symbol, prices, allocation));
  }

  return params;
}

// -----------------------------------------------------------------------------
// estimate_asset(): lookback window → annualized drift / volatility
// -----------------------------------------------------------------------------
domain::AssetParameters ParameterEstimator::estimate_asset(
    const std::string& symbol, const std::vector<double>& prices,
    double allocation_percent) const {
  domain::AssetParameters out;
  out.symbol = symbol;

  // --- Insufficient history: zero-contribution asset ------------------------
  if (prices.size() < static_cast<std::size_t>(lookback_period_)) {
    std::cerr << "[ParameterEstimator] Insufficient data for " << symbol
              << " (" << prices.size() << " < " << lookback_period_
              << " prices), using zero drift/volatility.\n";
    return out;
  }

  // --- Most recent lookback_period closes -----------------------------------
  std::vector<double> window(prices.end() - lookback_period_, prices.end());

  std::vector<double> log_returns = compute_log_returns(window);
  double mean = compute_mean(log_returns);
  double stddev = compute_sample_stddev(log_returns, mean);

  out.drift = mean * kTradingDaysPerYear;
  out.volatility = stddev * std::sqrt(static_cast<double>(kTradingDaysPerYear));
  out.last_price = window.back();
  out.shares = out.last_price > 0.0
                   ? (portfolio_amount_ * (allocation_percent / 100.0)) /
                         out.last_price
                   : 0.0;

  return out;
}

// -----------------------------------------------------------------------------
// compute_log_returns()
// -----------------------------------------------------------------------------
std::vector<double> compute_log_returns(const std::vector<double>& prices) {
  std::vector<double> returns;
  if (prices.size() < 2) {
    return returns;
  }
  returns.reserve(prices.size() - 1);

  for (std::size_t i = 1; i < prices.size(); ++i) {
    if (prices[i] > 0.0 && prices[i - 1] > 0.0) {
      returns.push_back(std::log(prices[i] / prices[i - 1]));
    }
  }
  return returns;
}

// -----------------------------------------------------------------------------
// compute_mean()
// -----------------------------------------------------------------------------
double compute_mean(const std::vector<double>& data) {
  if (data.empty()) {
    return 0.0;
  }
  return std::accumulate(data.begin(), data.end(), 0.0) /
         static_cast<double>(data.size());
}

// -----------------------------------------------------------------------------
// compute_sample_stddev()
// -----------------------------------------------------------------------------
double compute_sample_stddev(const std::vector<double>& data, double mean) {
  if (data.size() < 2) {
    return 0.0;
  }

  double sum_sq = 0.0;
  for (double value : data) {
    sum_sq += (value - mean) * (value - mean);
  }
  return std::sqrt(sum_sq / static_cast<double>(data.size() - 1));
}

}  // namespace mcsim
