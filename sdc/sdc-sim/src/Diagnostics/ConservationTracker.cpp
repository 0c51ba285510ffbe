// Ticket: 0007_conservation_diagnostics

#include "sdc-sim/src/Diagnostics/ConservationTracker.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include "sdc-sim/src/Physics/Orbit/OrbitalMechanics.hpp"
#include "sdc-sim/src/Physics/RigidBody/RigidBodyDynamics.hpp"
#include "sdc-sim/src/Utils/utils.hpp"

namespace sdc_sim
{

namespace
{

void requireNonNegative(double tolerance)
{
  if (tolerance < 0.0)
  {
    throw std::invalid_argument{"Drift tolerance must be >= 0, got " +
                                std::to_string(tolerance)};
  }
}

// A NaN drift never compares larger than anything, so it is recorded as
// infinite
double finiteOrInfinite(double drift)
{
  return std::isfinite(drift) ? drift
                              : std::numeric_limits<double>::infinity();
}

// Track the running maxima of both drifts and where the worst one occurred
void accumulate(ConservationTracker::DriftReport& report,
                std::size_t sample,
                double momentumDrift,
                double energyDrift)
{
  momentumDrift = finiteOrInfinite(momentumDrift);
  energyDrift = finiteOrInfinite(energyDrift);
  double const worstSoFar =
    std::max(report.angularMomentumDrift, report.energyDrift);
  if (std::max(momentumDrift, energyDrift) > worstSoFar)
  {
    report.worstSample = sample;
  }
  report.angularMomentumDrift =
    std::max(report.angularMomentumDrift, momentumDrift);
  report.energyDrift = std::max(report.energyDrift, energyDrift);
}

}  // namespace

ConservationTracker::AttitudeInvariants ConservationTracker::attitudeInvariants(
  const AngularVelocity& omega,
  const InertiaTensor& inertia)
{
  AttitudeInvariants invariants;
  invariants.angularMomentum = angularMomentum(omega, inertia.matrix());
  invariants.angularMomentumMagnitude = invariants.angularMomentum.norm();
  invariants.kineticEnergy = kineticEnergy(omega, inertia.matrix());
  return invariants;
}

ConservationTracker::OrbitInvariants ConservationTracker::orbitInvariants(
  const Coordinate& position,
  const Velocity& velocity,
  double mu)
{
  OrbitInvariants invariants;
  invariants.specificEnergy = specificEnergy(position, velocity, mu);
  invariants.angularMomentumMagnitude =
    specificAngularMomentum(position, velocity).norm();
  return invariants;
}

double ConservationTracker::relativeDrift(double current, double reference)
{
  return relativeDifference(current, reference);
}

ConservationTracker::DriftReport ConservationTracker::checkAttitude(
  const AttitudeTrajectory& trajectory,
  const InertiaTensor& inertia,
  double tolerance)
{
  requireNonNegative(tolerance);
  if (trajectory.states.empty())
  {
    return DriftReport{};
  }
  return checkAttitude(
    trajectory, inertia, trajectory.states.front(), tolerance);
}

ConservationTracker::DriftReport ConservationTracker::checkAttitude(
  const AttitudeTrajectory& trajectory,
  const InertiaTensor& inertia,
  const AttitudeState& initial,
  double tolerance)
{
  requireNonNegative(tolerance);

  DriftReport report;
  AttitudeInvariants const reference =
    attitudeInvariants(initial.angularVelocity, inertia);

  for (std::size_t i = 0; i < trajectory.states.size(); ++i)
  {
    AttitudeInvariants const current =
      attitudeInvariants(trajectory.states[i].angularVelocity, inertia);
    accumulate(report,
               i,
               relativeDrift(current.angularMomentumMagnitude,
                             reference.angularMomentumMagnitude),
               relativeDrift(current.kineticEnergy, reference.kineticEnergy));
  }

  report.withinTolerance = report.angularMomentumDrift <= tolerance &&
                           report.energyDrift <= tolerance;
  return report;
}

ConservationTracker::DriftReport ConservationTracker::checkOrbit(
  const OrbitTrajectory& trajectory,
  double mu,
  double tolerance)
{
  requireNonNegative(tolerance);
  if (trajectory.states.empty())
  {
    return DriftReport{};
  }
  return checkOrbit(trajectory, trajectory.states.front(), mu, tolerance);
}

ConservationTracker::DriftReport ConservationTracker::checkOrbit(
  const OrbitTrajectory& trajectory,
  const CartesianState& initial,
  double mu,
  double tolerance)
{
  requireNonNegative(tolerance);

  DriftReport report;
  OrbitInvariants const reference =
    orbitInvariants(initial.position, initial.velocity, mu);

  for (std::size_t i = 0; i < trajectory.states.size(); ++i)
  {
    const auto& state = trajectory.states[i];
    OrbitInvariants const current =
      orbitInvariants(state.position, state.velocity, mu);
    accumulate(report,
               i,
               relativeDrift(current.angularMomentumMagnitude,
                             reference.angularMomentumMagnitude),
               relativeDrift(current.specificEnergy, reference.specificEnergy));
  }

  report.withinTolerance = report.angularMomentumDrift <= tolerance &&
                           report.energyDrift <= tolerance;
  return report;
}

}  // namespace sdc_sim
