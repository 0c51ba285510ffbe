// Ticket: 0004_orbital_mechanics

#ifndef SDC_SIM_ORBIT_CLASSIFIER_HPP
#define SDC_SIM_ORBIT_CLASSIFIER_HPP

#include <string_view>

namespace sdc_sim
{

enum class OrbitType
{
  Circular,
  Elliptical,
  Parabolic,
  Hyperbolic
};

std::string_view toString(OrbitType type);

/**
 * @brief Conic classification by eccentricity
 *
 * Rules are applied in order:
 *   e < circular          -> Circular
 *   e < 1                 -> Elliptical
 *   |e - 1| < parabolic   -> Parabolic
 *   otherwise             -> Hyperbolic
 *
 * The thresholds are modeling choices rather than physical boundaries.
 */
class OrbitClassifier
{
public:
  struct Tolerances
  {
    double circular{0.001};
    double parabolic{0.001};
  };

  OrbitClassifier();

  /**
   * @throws std::invalid_argument if a threshold is negative
   */
  explicit OrbitClassifier(const Tolerances& tolerances);

  /**
   * @throws std::invalid_argument if eccentricity is negative or NaN
   */
  [[nodiscard]] OrbitType classify(double eccentricity) const;

  [[nodiscard]] const Tolerances& tolerances() const
  {
    return tolerances_;
  }

private:
  Tolerances tolerances_;
};

/// Classify with the default thresholds (0.001)
OrbitType classifyOrbit(double eccentricity);

OrbitType classifyOrbit(double eccentricity,
                        const OrbitClassifier::Tolerances& tolerances);

}  // namespace sdc_sim

#endif  // SDC_SIM_ORBIT_CLASSIFIER_HPP
