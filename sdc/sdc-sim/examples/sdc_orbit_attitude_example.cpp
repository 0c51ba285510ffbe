/**
 * @file sdc_orbit_attitude_example.cpp
 * @brief Propagates a low Earth orbit and a nutating spacecraft, printing
 *        elements, frames and conserved quantities
 */

#include <spdlog/spdlog.h>

#include <numbers>
#include <vector>

#include "sdc-sim/src/Diagnostics/ConservationTracker.hpp"
#include "sdc-sim/src/Environment/FrameTransforms.hpp"
#include "sdc-sim/src/Physics/Integration/DormandPrinceIntegrator.hpp"
#include "sdc-sim/src/Physics/Orbit/OrbitalMechanics.hpp"
#include "sdc-sim/src/Physics/RigidBody/AxisymmetricBody.hpp"
#include "sdc-sim/src/Propagation/AttitudePropagator.hpp"
#include "sdc-sim/src/Propagation/OrbitPropagator.hpp"
#include "sdc-sim/src/Rotation/QuaternionOps.hpp"
#include "sdc-sim/src/Utils/Logging.hpp"

using namespace sdc_sim;

int main()
{
  auto logger = logging::defaultLogger();
  logging::setLevel(spdlog::level::debug);

  constexpr double kRadToDeg = 180.0 / std::numbers::pi;

  // Orbit: 7000 km, 7.5 km/s tangential in the equatorial plane
  CartesianState leo;
  leo.position = Coordinate{7000.0, 0.0, 0.0};
  leo.velocity = Velocity{0.0, 7.5, 0.0};

  OrbitSummary const summary = orbitSummary(leo.position, leo.velocity);
  logger->info("Orbit type {}: a = {:.3f} km, e = {:.6f}, T = {:.1f} s",
               toString(summary.type),
               summary.elements.semiMajorAxis,
               summary.elements.eccentricity,
               summary.period);
  logger->info("Periapsis {:.3f} km, apoapsis {:.3f} km, altitude {:.3f} km",
               periapsisRadius(summary.elements),
               apoapsisRadius(summary.elements),
               altitude(leo.position));

  IntegratorConfig config;
  config.absoluteTolerance = 1e-11;
  config.relativeTolerance = 1e-11;
  DormandPrinceIntegrator const dp{config};

  OrbitPropagator const orbitPropagator{earth::kMuEarth, dp};
  std::vector<double> samples;
  for (int i = 0; i <= 4; ++i)
  {
    samples.push_back(summary.period * i / 4.0);
  }

  OrbitTrajectory const orbit =
    orbitPropagator.propagate(leo, 0.0, summary.period, samples);
  orbit.throwIfFailed();

  for (std::size_t i = 0; i < orbit.size(); ++i)
  {
    const auto& state = orbit.states[i];
    Eigen::Vector3d const ecef =
      transformVector(eciToEcef(orbit.times[i]), state.position);
    OrbitalElements const el =
      cartesianToElements(state.position, state.velocity);
    logger->info(
      "t = {:8.1f} s  r_eci = [{:9.2f}, {:9.2f}, {:9.2f}]  "
      "r_ecef = [{:9.2f}, {:9.2f}, {:9.2f}]  nu = {:6.2f} deg",
      orbit.times[i],
      state.position.x(),
      state.position.y(),
      state.position.z(),
      ecef.x(),
      ecef.y(),
      ecef.z(),
      el.trueAnomaly * kRadToDeg);
  }

  auto const orbitDrift = ConservationTracker::checkOrbit(orbit, leo);
  logger->info("Orbit drift: energy {:.2e}, |h| {:.2e}",
               orbitDrift.energyDrift,
               orbitDrift.angularMomentumDrift);

  // Attitude: oblate axisymmetric body with a small transverse rate
  AxisymmetricBody const body{100.0, 50.0};
  AngularVelocity const w0{0.1, 0.05, 1.0};
  NutationParameters const nutation = body.parameters(w0);
  logger->info("{} body: nutation rate {:.3f} rad/s, period {:.3f} s",
               toString(body.shape()),
               nutation.nutationRate,
               nutation.nutationPeriod);

  AttitudeState initial;
  initial.orientation = axisAngleToQuaternion(Eigen::Vector3d::UnitX(), 0.2);
  initial.angularVelocity = w0;

  AttitudePropagator const attitudePropagator{body.inertia(), dp};
  AttitudeTrajectory const attitude =
    attitudePropagator.propagate(initial, 0.0, 20.0, {5.0, 10.0, 15.0, 20.0});
  attitude.throwIfFailed();

  for (std::size_t i = 0; i < attitude.size(); ++i)
  {
    const auto& state = attitude.states[i];
    AngularVelocity const exact = body.solution(w0, attitude.times[i]);
    EulerAngles const angles = quaternionToEuler(state.orientation);
    logger->info(
      "t = {:5.1f} s  roll/pitch/yaw = [{:7.2f}, {:7.2f}, {:7.2f}] deg  "
      "|w - w_exact| = {:.2e}",
      attitude.times[i],
      angles.rollDeg(),
      angles.pitchDeg(),
      angles.yawDeg(),
      (state.angularVelocity - exact).norm());
  }

  auto const attitudeDrift =
    ConservationTracker::checkAttitude(attitude, body.inertia(), initial);
  logger->info("Attitude drift: |h| {:.2e}, T {:.2e}",
               attitudeDrift.angularMomentumDrift,
               attitudeDrift.energyDrift);

  // LVLH basis at the final orbit sample
  const auto& last = orbit.states.back();
  Eigen::Matrix3d const lvlh = eciToLvlh(last.position, last.velocity);
  logger->info("LVLH radial axis in ECI: [{:.6f}, {:.6f}, {:.6f}]",
               lvlh(0, 0),
               lvlh(1, 0),
               lvlh(2, 0));

  return 0;
}
