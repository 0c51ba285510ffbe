// Ticket: 0006_propagation

#include "sdc-sim/src/Propagation/OrbitPropagator.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "sdc-sim/src/Diagnostics/ConservationTracker.hpp"
#include "sdc-sim/src/Physics/Orbit/OrbitalMechanics.hpp"
#include "sdc-sim/src/Utils/Errors.hpp"
#include "sdc-sim/src/Utils/Logging.hpp"

namespace sdc_sim
{

namespace
{

double validatedMu(double mu)
{
  if (!(mu > 0.0))
  {
    throw std::invalid_argument{
      "Gravitational parameter must be positive, got " + std::to_string(mu)};
  }
  return mu;
}

}  // namespace

OrbitPropagator::OrbitPropagator(double mu, const Integrator& integrator)
  : mu_{validatedMu(mu)},
    integrator_{integrator},
    config_{},
    logger_{logging::defaultLogger()}
{
}

OrbitPropagator::OrbitPropagator(double mu,
                                 const Integrator& integrator,
                                 const Config& config,
                                 std::shared_ptr<spdlog::logger> logger)
  : mu_{validatedMu(mu)},
    integrator_{integrator},
    config_{config},
    logger_{logger ? std::move(logger) : logging::defaultLogger()}
{
  if (config_.driftTolerance < 0.0)
  {
    throw std::invalid_argument{"driftTolerance must be >= 0"};
  }
}

OrbitTrajectory OrbitPropagator::propagate(
  const CartesianState& initial,
  double t0,
  double tEnd,
  const std::vector<double>& evaluationTimes) const
{
  if (initial.position.norm() == 0.0)
  {
    throw DegenerateInput{"Cannot propagate an orbit from r = 0"};
  }

  logger_->debug("Orbit propagation ({}) over [{}, {}] s from |r| = {:.3f} km",
                 integrator_.name(),
                 t0,
                 tEnd,
                 initial.position.norm());

  double const mu = mu_;
  auto derivative = [mu](double /*t*/, const Eigen::VectorXd& y)
  { return twoBodyDynamics(y, mu); };

  IntegrationResult const result = integrator_.integrate(
    derivative, initial.toStateVector(), t0, tEnd, evaluationTimes);

  OrbitTrajectory trajectory = OrbitTrajectory::fromResult(
    result,
    [](const Eigen::VectorXd& packed)
    { return CartesianState::fromStateVector(packed); });

  if (!trajectory.success())
  {
    logger_->error("Orbit propagation failed ({}): {}",
                   toString(trajectory.status),
                   trajectory.message);
    return trajectory;
  }

  logger_->debug(
    "Orbit propagation finished: {} samples, {} steps, {} evaluations",
    trajectory.size(),
    trajectory.acceptedSteps,
    trajectory.functionEvaluations);

  if (config_.checkConservation)
  {
    auto const report = ConservationTracker::checkOrbit(
      trajectory, initial, mu_, config_.driftTolerance);
    if (!report.withinTolerance)
    {
      logger_->warn("Two-body invariants drifted beyond {:.1e}: energy {:.3e}, "
                    "|h| {:.3e} (worst at t = {} s)",
                    config_.driftTolerance,
                    report.energyDrift,
                    report.angularMomentumDrift,
                    trajectory.times[report.worstSample]);
    }
  }

  return trajectory;
}

OrbitTrajectory OrbitPropagator::propagate(
  const OrbitalElements& elements,
  double t0,
  double tEnd,
  const std::vector<double>& evaluationTimes) const
{
  return propagate(elementsToCartesian(elements, mu_), t0, tEnd, evaluationTimes);
}

}  // namespace sdc_sim
