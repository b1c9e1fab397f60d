#pragma once

#include "mcsim/domain/simulation_path.hpp"
#include "mcsim/random/i_uniform_source.hpp"

namespace mcsim {

// -----------------------------------------------------------------------------
// IPathSimulator — abstract single-trajectory generator
// -----------------------------------------------------------------------------
//
// @brief  Produces one SimulationPath per call from a caller-owned uniform
//         source.
//
// @details
// The SimulationDriver only talks to this interface, so it can drive:
//   * PathSimulator  — the GBM portfolio simulator
//   * test doubles   — e.g. a simulator that throws on its k-th call to
//                      exercise the run-abort path
// without changing any orchestration code.
//
// Thread model:
//   simulate() is const. Implementations must keep all per-trajectory state
//   on the stack of the call, so one instance can serve concurrent
//   simulations that each bring their own IUniformSource.
// -----------------------------------------------------------------------------
class IPathSimulator {
 public:
  virtual ~IPathSimulator() = default;

  // @brief  Runs one full trajectory, day 0 .. time_steps().
  // @throws Any exception aborts the whole run (see SimulationDriver).
  virtual domain::SimulationPath simulate(IUniformSource& source) const = 0;

  // Number of simulated days after day 0.
  virtual int time_steps() const = 0;

  // Portfolio value on day 0 (identical for every trajectory).
  virtual double initial_value() const = 0;
};

}  // namespace mcsim
