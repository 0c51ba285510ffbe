// Ticket: 0004_orbital_mechanics

#ifndef SDC_SIM_ORBITAL_MECHANICS_HPP
#define SDC_SIM_ORBITAL_MECHANICS_HPP

#include <Eigen/Dense>

#include "sdc-sim/src/DataTypes/Coordinate.hpp"
#include "sdc-sim/src/DataTypes/Velocity.hpp"
#include "sdc-sim/src/Environment/EarthConstants.hpp"
#include "sdc-sim/src/Physics/Orbit/CartesianState.hpp"
#include "sdc-sim/src/Physics/Orbit/OrbitClassifier.hpp"
#include "sdc-sim/src/Physics/Orbit/OrbitalElements.hpp"

namespace sdc_sim
{

/**
 * @brief Classical elements from an inertial state
 *
 * h = r x v, e_vec = ((v^2 - mu/r) r - (r . v) v) / mu, energy = v^2/2 - mu/r,
 * a = -mu / (2 energy), i = acos(h_z / |h|), n = z x h.
 *
 * Quadrants: raan is reflected when n_y < 0, the argument of perigee when
 * e_z < 0 and the true anomaly when r . v < 0. Singular cases follow the
 * conventions documented on OrbitalElements.
 *
 * @param position ECI position [km]
 * @param velocity ECI velocity [km/s]
 * @param mu Gravitational parameter [km^3/s^2]
 * @throws DegenerateInput if r is zero
 * @throws DegenerateGeometry if h is zero (rectilinear motion)
 * @throws std::invalid_argument if mu is not positive
 */
OrbitalElements cartesianToElements(const Coordinate& position,
                                    const Velocity& velocity,
                                    double mu = earth::kMuEarth,
                                    const ElementTolerances& tolerances = {});

/**
 * @brief Inertial state from classical elements
 *
 * Builds the perifocal state and rotates it with the 3-1-3 composition
 * Rz(raan) Rx(i) Rz(argumentOfPerigee).
 *
 * @throws DegenerateInput for parabolic (infinite a) elements, a non-positive
 *         semi-latus rectum, or a true anomaly beyond a hyperbolic asymptote
 * @throws std::invalid_argument if mu is not positive
 */
CartesianState elementsToCartesian(const OrbitalElements& elements,
                                   double mu = earth::kMuEarth);

/**
 * @brief Two-body equations of motion [v; -mu r / |r|^3]
 * @param state Packed [x, y, z, vx, vy, vz]
 * @throws InvalidDimension if state does not have 6 components
 * @throws DegenerateInput if r is zero
 */
Eigen::VectorXd twoBodyDynamics(const Eigen::VectorXd& state,
                                double mu = earth::kMuEarth);

/**
 * @brief Period 2 pi sqrt(a^3 / mu)
 * @return +inf unless a is finite and positive
 */
double orbitalPeriod(double semiMajorAxis, double mu = earth::kMuEarth);

/// Mean motion sqrt(mu / a^3) [rad/s]; 0 unless a is finite and positive
double meanMotion(double semiMajorAxis, double mu = earth::kMuEarth);

/// Specific orbital energy v^2/2 - mu/r [km^2/s^2]
double specificEnergy(const Coordinate& position,
                      const Velocity& velocity,
                      double mu = earth::kMuEarth);

/// Specific angular momentum r x v [km^2/s]
Eigen::Vector3d specificAngularMomentum(const Coordinate& position,
                                        const Velocity& velocity);

/**
 * @brief Periapsis radius a (1 - e) [km]
 * @throws DegenerateInput if a is infinite
 */
double periapsisRadius(const OrbitalElements& elements);

/// Apoapsis radius a (1 + e) [km]; +inf for e >= 1
double apoapsisRadius(const OrbitalElements& elements);

/// Height above the equatorial radius |r| - R_earth [km]
double altitude(const Coordinate& position);

/// Circular orbit speed sqrt(mu / r) [km/s]
double circularVelocity(double radius, double mu = earth::kMuEarth);

/// Escape speed sqrt(2 mu / r) [km/s]
double escapeVelocity(double radius, double mu = earth::kMuEarth);

/**
 * @brief Elements together with derived diagnostics
 */
struct OrbitSummary
{
  OrbitalElements elements;
  OrbitType type{OrbitType::Circular};
  double specificEnergy{0.0};   // [km^2/s^2]
  double angularMomentum{0.0};  // |h| [km^2/s]
  double period{0.0};           // [s], +inf if not closed
};

OrbitSummary orbitSummary(const Coordinate& position,
                          const Velocity& velocity,
                          double mu = earth::kMuEarth);

}  // namespace sdc_sim

#endif  // SDC_SIM_ORBITAL_MECHANICS_HPP
