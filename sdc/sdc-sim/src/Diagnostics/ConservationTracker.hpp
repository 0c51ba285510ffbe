// Ticket: 0007_conservation_diagnostics

#ifndef SDC_SIM_DIAGNOSTICS_CONSERVATION_TRACKER_HPP
#define SDC_SIM_DIAGNOSTICS_CONSERVATION_TRACKER_HPP

#include <Eigen/Dense>
#include <cstddef>

#include "sdc-sim/src/DataTypes/AngularVelocity.hpp"
#include "sdc-sim/src/DataTypes/Coordinate.hpp"
#include "sdc-sim/src/DataTypes/Velocity.hpp"
#include "sdc-sim/src/Environment/EarthConstants.hpp"
#include "sdc-sim/src/Physics/RigidBody/InertiaTensor.hpp"
#include "sdc-sim/src/Propagation/Trajectory.hpp"

namespace sdc_sim
{

/**
 * @brief Invariant computation for propagated trajectories
 *
 * Provides static methods to compute the quantities that torque-free
 * rotation and two-body motion conserve, and to measure how far a sampled
 * trajectory drifts from its first sample.
 *
 * Attitude invariants are evaluated in body axes. |h| = |I w| is frame
 * independent, so body-frame evaluation is valid even though the vector h
 * itself rotates in body axes.
 */
class ConservationTracker
{
public:
  struct AttitudeInvariants
  {
    Eigen::Vector3d angularMomentum{Eigen::Vector3d::Zero()};  // body [kg m^2/s]
    double angularMomentumMagnitude{0.0};                      // [kg m^2/s]
    double kineticEnergy{0.0};                                 // [J]
  };

  struct OrbitInvariants
  {
    double specificEnergy{0.0};            // [km^2/s^2]
    double angularMomentumMagnitude{0.0};  // [km^2/s]
  };

  /**
   * @brief Largest relative drift of each invariant over a trajectory
   *
   * energyDrift refers to kinetic energy for attitude trajectories and to
   * specific orbital energy for orbit trajectories.
   */
  struct DriftReport
  {
    double angularMomentumDrift{0.0};
    double energyDrift{0.0};
    std::size_t worstSample{0};  // Index of the largest drift of either kind
    bool withinTolerance{true};  // false if any drift is NaN
  };

  static AttitudeInvariants attitudeInvariants(const AngularVelocity& omega,
                                               const InertiaTensor& inertia);

  /**
   * @throws DegenerateInput if position is zero
   */
  static OrbitInvariants orbitInvariants(const Coordinate& position,
                                         const Velocity& velocity,
                                         double mu = earth::kMuEarth);

  /**
   * @brief |current - reference| / |reference|
   *
   * Falls back to the absolute difference when the reference is zero.
   */
  static double relativeDrift(double current, double reference);

  /**
   * @brief Drift of |h| and T relative to the first sample
   * @throws std::invalid_argument if tolerance is negative
   */
  static DriftReport checkAttitude(const AttitudeTrajectory& trajectory,
                                   const InertiaTensor& inertia,
                                   double tolerance = 1e-6);

  /**
   * @brief Drift of |h| and T of every sample relative to an initial state
   *
   * Use this when the samples do not start at the initial time, otherwise
   * drift accumulated before the first sample goes unnoticed.
   *
   * @throws std::invalid_argument if tolerance is negative
   */
  static DriftReport checkAttitude(const AttitudeTrajectory& trajectory,
                                   const InertiaTensor& inertia,
                                   const AttitudeState& initial,
                                   double tolerance = 1e-6);

  /**
   * @brief Drift of specific energy and |h| relative to the first sample
   * @throws std::invalid_argument if tolerance is negative
   */
  static DriftReport checkOrbit(const OrbitTrajectory& trajectory,
                                double mu = earth::kMuEarth,
                                double tolerance = 1e-6);

  /**
   * @brief Drift of specific energy and |h| of every sample relative to an
   *        initial state
   * @throws std::invalid_argument if tolerance is negative
   * @throws DegenerateInput if the initial position is zero
   */
  static DriftReport checkOrbit(const OrbitTrajectory& trajectory,
                                const CartesianState& initial,
                                double mu = earth::kMuEarth,
                                double tolerance = 1e-6);
};

}  // namespace sdc_sim

#endif  // SDC_SIM_DIAGNOSTICS_CONSERVATION_TRACKER_HPP
