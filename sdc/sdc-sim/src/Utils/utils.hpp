#ifndef SDC_SIM_UTILS_HPP
#define SDC_SIM_UTILS_HPP

#include <cmath>
#include <concepts>
#include <numbers>

namespace sdc_sim
{

// Helper function for comparing doubles with tolerance
constexpr double TOLERANCE = 1e-10;

template <std::floating_point T>
bool almostEqual(T a, T b, double tolerance = TOLERANCE)
{
  return std::abs(a - b) < tolerance;
}

/// Relative difference |a - b| / |reference|, falling back to the absolute
/// difference when the reference is zero.
template <std::floating_point T>
T relativeDifference(T value, T reference)
{
  T const scale = std::abs(reference);
  if (scale == T{0})
  {
    return std::abs(value - reference);
  }
  return std::abs(value - reference) / scale;
}

/// Wrap an angle to [0, 2pi)
inline double wrapTwoPi(double rad)
{
  constexpr double kTwoPi = 2.0 * std::numbers::pi;
  double result = std::fmod(rad, kTwoPi);
  if (result < 0.0)
  {
    result += kTwoPi;
  }
  // Tiny negative inputs round up to exactly 2pi
  if (result >= kTwoPi)
  {
    result = 0.0;
  }
  return result;
}

/// Clamp to [-1, 1] before acos/asin so roundoff cannot produce NaN
inline double clampUnit(double value)
{
  return std::fmax(-1.0, std::fmin(1.0, value));
}

}  // namespace sdc_sim

#endif  // SDC_SIM_UTILS_HPP
