// Ticket: 0004_orbital_mechanics

#ifndef SDC_SIM_ORBITAL_ELEMENTS_HPP
#define SDC_SIM_ORBITAL_ELEMENTS_HPP

namespace sdc_sim
{

/**
 * @brief Classical (Keplerian) orbital elements
 *
 * Lengths in km, angles in radians. semiMajorAxis is +inf for a parabolic
 * orbit and negative for a hyperbolic one.
 *
 * Singular configurations use fixed conventions:
 * - equatorial (no node line): raan = 0 and argumentOfPerigee = 0
 * - circular (no perigee): argumentOfPerigee = 0 and trueAnomaly = 0
 */
struct OrbitalElements
{
  double semiMajorAxis{0.0};      // a [km]
  double eccentricity{0.0};       // e [-]
  double inclination{0.0};        // i in [0, pi] [rad]
  double raan{0.0};               // Omega in [0, 2pi) [rad]
  double argumentOfPerigee{0.0};  // omega in [0, 2pi) [rad]
  double trueAnomaly{0.0};        // nu in [0, 2pi) [rad]
};

/**
 * @brief Thresholds for the singular cases of cartesianToElements()
 */
struct ElementTolerances
{
  /// e below this counts as circular
  double circular{1e-10};
  /// |n| below equatorial * |h| counts as equatorial
  double equatorial{1e-10};
  /// |specific energy| below this counts as parabolic (a = +inf)
  double parabolicEnergy{1e-10};
};

}  // namespace sdc_sim

#endif  // SDC_SIM_ORBITAL_ELEMENTS_HPP
