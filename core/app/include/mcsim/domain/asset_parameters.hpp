#pragma once

#include <map>
#include <string>

namespace mcsim {
namespace domain {

// -----------------------------------------------------------------------------
// AssetParameters — per-symbol GBM inputs
// -----------------------------------------------------------------------------
//
// @brief  Annualized drift and volatility of one asset, plus the position the
//         portfolio opens in it at the start of every trajectory.
//
// @details
// Produced once per simulation run by the ParameterEstimator from the
// asset's historical closing prices, then read (never written) by every
// trajectory of that run.
//
// Zero-contribution asset:
//   When the price history is shorter than the lookback window, every field
//   except symbol is 0. Such an asset adds a constant 0 to the portfolio
//   value on every day of every trajectory.
//
// Thread model:
//   Plain value type. After construction it is shared read-only across all
//   simulations of the run (by const reference), so no locking is needed.
// -----------------------------------------------------------------------------
struct AssetParameters {
  std::string symbol;       // Instrument identifier (e.g. "AAPL")
  double drift{0.0};        // Annualized mean of daily log returns
  double volatility{0.0};   // Annualized sample stddev of daily log returns
  double last_price{0.0};   // Most recent close inside the lookback window
  double shares{0.0};       // Quantity bought with the allocated dollars
};

// Ordered by symbol so that portfolio sums always add assets in the same
// order within a run.
using AssetParameterSet = std::map<std::string, AssetParameters>;

}  // namespace domain
}  // namespace mcsim
