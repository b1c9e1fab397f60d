#pragma once

namespace mcsim {

// -----------------------------------------------------------------------------
// IUniformSource — abstract [0, 1) random stream
// -----------------------------------------------------------------------------
//
// @brief  The only randomness the simulation consumes. Every normal variate
//         is built from draws taken through this interface.
//
// @details
// Two implementations exist:
//   * Mt19937UniformSource  — production stream (std::mt19937_64), one
//                             instance per trajectory
//   * scripted sources in the tests, which replay a fixed list of draws so
//     the Box-Muller re-draw rule can be checked exactly
//
// Thread model:
//   Implementations are NOT thread-safe. Each trajectory owns its own
//   source; sources are never shared between concurrent simulations.
// -----------------------------------------------------------------------------
class IUniformSource {
 public:
  virtual ~IUniformSource() = default;

  // -------------------------------------------------------------------------
  // next_uniform()
  // -------------------------------------------------------------------------
  // @brief  Returns the next value of the stream, in [0, 1).
  // -------------------------------------------------------------------------
  virtual double next_uniform() = 0;
};

}  // namespace mcsim
