// Ticket: 0004_orbital_mechanics

#include "sdc-sim/src/Physics/Orbit/OrbitClassifier.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace sdc_sim
{

std::string_view toString(OrbitType type)
{
  switch (type)
  {
    case OrbitType::Circular:
      return "circular";
    case OrbitType::Elliptical:
      return "elliptical";
    case OrbitType::Parabolic:
      return "parabolic";
    case OrbitType::Hyperbolic:
      return "hyperbolic";
  }
  return "unknown";
}

OrbitClassifier::OrbitClassifier() : tolerances_{}
{
}

OrbitClassifier::OrbitClassifier(const Tolerances& tolerances)
  : tolerances_{tolerances}
{
  if (tolerances_.circular < 0.0 || tolerances_.parabolic < 0.0)
  {
    throw std::invalid_argument{"Orbit classification thresholds must be >= 0"};
  }
}

OrbitType OrbitClassifier::classify(double eccentricity) const
{
  if (!(eccentricity >= 0.0))
  {
    throw std::invalid_argument{"Eccentricity must be non-negative, got " +
                                std::to_string(eccentricity)};
  }

  if (eccentricity < tolerances_.circular)
  {
    return OrbitType::Circular;
  }
  if (eccentricity < 1.0)
  {
    return OrbitType::Elliptical;
  }
  if (std::abs(eccentricity - 1.0) < tolerances_.parabolic)
  {
    return OrbitType::Parabolic;
  }
  return OrbitType::Hyperbolic;
}

OrbitType classifyOrbit(double eccentricity)
{
  return OrbitClassifier{}.classify(eccentricity);
}

OrbitType classifyOrbit(double eccentricity,
                        const OrbitClassifier::Tolerances& tolerances)
{
  return OrbitClassifier{tolerances}.classify(eccentricity);
}

}  // namespace sdc_sim
