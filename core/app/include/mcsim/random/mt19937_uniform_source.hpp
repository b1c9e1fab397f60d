#pragma once

#include "mcsim/random/i_uniform_source.hpp"

#include <cstdint>
#include <random>

namespace mcsim {

// -----------------------------------------------------------------------------
// Mt19937UniformSource — seeded Mersenne-Twister uniform stream
// -----------------------------------------------------------------------------
//
// @brief  IUniformSource backed by std::mt19937_64 and
//         std::uniform_real_distribution<double>(0, 1).
//
// @details
// Seeding: the engine state is derived from (seed, stream) through
// std::seed_seq. The driver passes the run's base seed and the simulation
// index, so simulation k of a run always replays the same draws no matter
// which thread runs it or in which order simulations execute.
//
// Thread model:
//   Not thread-safe. One instance per trajectory.
// -----------------------------------------------------------------------------
class Mt19937UniformSource final : public IUniformSource {
 public:
  Mt19937UniformSource(std::uint64_t seed, std::uint64_t stream);

  double next_uniform() override;

 private:
  std::mt19937_64 engine_;
  std::uniform_real_distribution<double> distribution_{0.0, 1.0};
};

}  // namespace mcsim
