// Ticket: 0006_propagation

#ifndef SDC_SIM_ATTITUDE_PROPAGATOR_HPP
#define SDC_SIM_ATTITUDE_PROPAGATOR_HPP

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "sdc-sim/src/Physics/Integration/Integrator.hpp"
#include "sdc-sim/src/Physics/RigidBody/AttitudeState.hpp"
#include "sdc-sim/src/Physics/RigidBody/InertiaTensor.hpp"
#include "sdc-sim/src/Physics/RigidBody/RigidBodyDynamics.hpp"
#include "sdc-sim/src/Propagation/Trajectory.hpp"

namespace sdc_sim
{

/**
 * @brief Propagates the attitude of a rigid body with a pluggable integrator
 *
 * Wires Euler's equations and quaternion kinematics to an Integrator.
 * The integrator is not owned and must outlive the propagator.
 *
 * Log output: start and end of a run at debug, integration failure at
 * error, invariant drift of a torque-free run beyond Config::driftTolerance
 * at warn.
 */
class AttitudePropagator
{
public:
  struct Config
  {
    /// Renormalize the quaternion after every accepted step
    bool renormalizeEachStep{true};
    /// Check |h| and T after torque-free runs
    bool checkConservation{true};
    double driftTolerance{1e-6};
  };

  AttitudePropagator(InertiaTensor inertia, const Integrator& integrator);

  /**
   * @param logger Destination for run diagnostics; nullptr selects
   *        logging::defaultLogger()
   * @throws std::invalid_argument if driftTolerance is negative
   */
  AttitudePropagator(InertiaTensor inertia,
                     const Integrator& integrator,
                     const Config& config,
                     std::shared_ptr<spdlog::logger> logger = nullptr);

  /**
   * @brief Integrate from t0 to tEnd
   *
   * The initial quaternion is normalized before integration. Integration
   * failure is reported in the returned trajectory, not thrown.
   *
   * @param torque External torque model; empty for torque-free motion
   * @throws DegenerateInput if the initial quaternion is zero
   */
  [[nodiscard]] AttitudeTrajectory propagate(
    const AttitudeState& initial,
    double t0,
    double tEnd,
    const std::vector<double>& evaluationTimes = {},
    const TorqueFunction& torque = {}) const;

  [[nodiscard]] const InertiaTensor& inertia() const
  {
    return inertia_;
  }

  [[nodiscard]] const Config& config() const
  {
    return config_;
  }

private:
  InertiaTensor inertia_;
  const Integrator& integrator_;
  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace sdc_sim

#endif  // SDC_SIM_ATTITUDE_PROPAGATOR_HPP
