#include "mcsim/random/mt19937_uniform_source.hpp"

namespace mcsim {

// -----------------------------------------------------------------------------
// Constructor: derive the engine state from (seed, stream)
// -----------------------------------------------------------------------------
Mt19937UniformSource::Mt19937UniformSource(std::uint64_t seed,
                                           std::uint64_t stream) {
  // seed_seq takes 32-bit words; split both 64-bit inputs so no bits of the
  // seed or the stream index are lost.
  std::seed_seq seq{static_cast<std::uint32_t>(seed),
                    static_cast<std::uint32_t>(seed >> 32),
                    static_cast<std::uint32_t>(stream),
                    static_cast<std::uint32_t>(stream >> 32)};
  engine_.seed(seq);
}

double Mt19937UniformSource::next_uniform() { return distribution_(engine_); }

}  // namespace mcsim
