// Ticket: 0006_propagation

#include "sdc-sim/src/Propagation/AttitudePropagator.hpp"

#include <stdexcept>
#include <utility>

#include "sdc-sim/src/Diagnostics/ConservationTracker.hpp"
#include "sdc-sim/src/Rotation/QuaternionOps.hpp"
#include "sdc-sim/src/Utils/Logging.hpp"

namespace sdc_sim
{

AttitudePropagator::AttitudePropagator(InertiaTensor inertia,
                                       const Integrator& integrator)
  : inertia_{std::move(inertia)},
    integrator_{integrator},
    config_{},
    logger_{logging::defaultLogger()}
{
}

AttitudePropagator::AttitudePropagator(InertiaTensor inertia,
                                       const Integrator& integrator,
                                       const Config& config,
                                       std::shared_ptr<spdlog::logger> logger)
  : inertia_{std::move(inertia)},
    integrator_{integrator},
    config_{config},
    logger_{logger ? std::move(logger) : logging::defaultLogger()}
{
  if (config_.driftTolerance < 0.0)
  {
    throw std::invalid_argument{"driftTolerance must be >= 0"};
  }
}

AttitudeTrajectory AttitudePropagator::propagate(
  const AttitudeState& initial,
  double t0,
  double tEnd,
  const std::vector<double>& evaluationTimes,
  const TorqueFunction& torque) const
{
  AttitudeState start = initial;
  start.orientation = normalizeQuaternion(initial.orientation);

  logger_->debug("Attitude propagation ({}) over [{}, {}] s, {} torque",
                 integrator_.name(),
                 t0,
                 tEnd,
                 torque ? "external" : "no");

  auto derivative = [this, &torque](double t, const Eigen::VectorXd& y)
  { return attitudeDerivative(t, y, inertia_, torque); };

  StateProjection projection;
  if (config_.renormalizeEachStep)
  {
    projection = [](Eigen::VectorXd& y) { y.head<4>().normalize(); };
  }

  IntegrationResult const result = integrator_.integrate(
    derivative, start.toStateVector(), t0, tEnd, evaluationTimes, projection);

  AttitudeTrajectory trajectory = AttitudeTrajectory::fromResult(
    result,
    [](const Eigen::VectorXd& packed)
    { return AttitudeState::fromStateVector(packed); });

  if (!trajectory.success())
  {
    logger_->error("Attitude propagation failed ({}): {}",
                   toString(trajectory.status),
                   trajectory.message);
    return trajectory;
  }

  logger_->debug("Attitude propagation finished: {} samples, {} steps, {} "
                 "evaluations",
                 trajectory.size(),
                 trajectory.acceptedSteps,
                 trajectory.functionEvaluations);

  if (config_.checkConservation && !torque)
  {
    auto const report = ConservationTracker::checkAttitude(
      trajectory, inertia_, start, config_.driftTolerance);
    if (!report.withinTolerance)
    {
      logger_->warn("Torque-free invariants drifted beyond {:.1e}: |h| {:.3e}, "
                    "T {:.3e} (worst at t = {} s)",
                    config_.driftTolerance,
                    report.angularMomentumDrift,
                    report.energyDrift,
                    trajectory.times[report.worstSample]);
    }
  }

  return trajectory;
}

}  // namespace sdc_sim
