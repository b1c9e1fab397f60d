#pragma once

#include "mcsim/random/i_uniform_source.hpp"

namespace mcsim {

// -----------------------------------------------------------------------------
// NormalVariateGenerator
// -----------------------------------------------------------------------------
//
// @brief  Produces standard-normal (mean 0, variance 1) values from a uniform
//         source using the Box-Muller transform.
//
// @details
// Each call draws u, then v, from the source. A draw of exactly 0 is
// discarded and re-drawn (log(0) is undefined), so in the normal case a
// call consumes exactly two draws. The result is
//
//     z = sqrt(-2 ln u) * cos(2 pi v)
//
// The sine-based companion value is discarded: the generator keeps no state
// between calls, so two calls never share a draw.
//
// Ownership:
//   Holds a non-owning reference to the source. The source must outlive the
//   generator (both are locals of one trajectory in PathSimulator).
//
// Thread model:
//   Not thread-safe; same as the underlying source.
// -----------------------------------------------------------------------------
class NormalVariateGenerator {
 public:
  explicit NormalVariateGenerator(IUniformSource& source) : source_(source) {}

  // -------------------------------------------------------------------------
  // next()
  // -------------------------------------------------------------------------
  // @brief  Returns one standard-normal variate.
  //
  // @details
  // Terminates with probability 1: the re-draw loop only repeats while the
  // source returns exactly 0.0.
  // -------------------------------------------------------------------------
  double next();

 private:
  // Draws from source_ until the value is non-zero.
  double draw_non_zero();

  IUniformSource& source_;
};

}  // namespace mcsim
