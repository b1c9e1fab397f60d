#include "mcsim/random/normal_variate_generator.hpp"

#include <cmath>

namespace mcsim {

namespace {

constexpr double kTwoPi = 6.283185307179586476925286766559;

}  // namespace

// -----------------------------------------------------------------------------
// NormalVariateGenerator::next()
// -----------------------------------------------------------------------------
double NormalVariateGenerator::next() {
  // u is drawn before v. Sources replaying a fixed draw list depend on it.
  const double u = draw_non_zero();
  const double v = draw_non_zero();
  return std::sqrt(-2.0 * std::log(u)) * std::cos(kTwoPi * v);
}

double NormalVariateGenerator::draw_non_zero() {
  double value = 0.0;
  while (value == 0.0) {
    value = source_.next_uniform();
  }
  return value;
}

}  // namespace mcsim
