// Ticket: 0007_conservation_diagnostics

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>

#include "sdc-sim/src/Diagnostics/ConservationTracker.hpp"
#include "sdc-sim/src/Utils/Errors.hpp"

using namespace sdc_sim;

namespace
{

AttitudeState withRate(const AngularVelocity& omega)
{
  AttitudeState state;
  state.angularVelocity = omega;
  return state;
}

}  // namespace

// ========== Invariants ==========

TEST(ConservationTrackerTest, AttitudeInvariantsOfReferenceBody)
{
  InertiaTensor const inertia = InertiaTensor::axisymmetric(100.0, 50.0);
  auto const invariants = ConservationTracker::attitudeInvariants(
    AngularVelocity{0.1, 0.05, 1.0}, inertia);

  EXPECT_DOUBLE_EQ(invariants.angularMomentum.x(), 10.0);
  EXPECT_DOUBLE_EQ(invariants.angularMomentum.y(), 5.0);
  EXPECT_DOUBLE_EQ(invariants.angularMomentum.z(), 50.0);
  EXPECT_NEAR(invariants.angularMomentumMagnitude, std::sqrt(2625.0), 1e-12);
  EXPECT_NEAR(invariants.kineticEnergy, 25.625, 1e-12);
}

TEST(ConservationTrackerTest, OrbitInvariants)
{
  auto const invariants = ConservationTracker::orbitInvariants(
    Coordinate{7000.0, 0.0, 0.0}, Velocity{0.0, 7.5, 0.0});
  EXPECT_NEAR(invariants.specificEnergy, -28.817920257142852, 1e-12);
  EXPECT_DOUBLE_EQ(invariants.angularMomentumMagnitude, 52500.0);

  EXPECT_THROW(ConservationTracker::orbitInvariants(
                 Coordinate{0.0, 0.0, 0.0}, Velocity{0.0, 7.5, 0.0}),
               DegenerateInput);
}

TEST(ConservationTrackerTest, RelativeDrift)
{
  EXPECT_NEAR(ConservationTracker::relativeDrift(1.1, 1.0), 0.1, 1e-15);
  EXPECT_NEAR(ConservationTracker::relativeDrift(-2.2, -2.0), 0.1, 1e-15);
  // Zero reference falls back to the absolute difference
  EXPECT_DOUBLE_EQ(ConservationTracker::relativeDrift(0.5, 0.0), 0.5);
}

// ========== Trajectory checks ==========

TEST(ConservationTrackerTest, AttitudeDriftReport)
{
  InertiaTensor const inertia = InertiaTensor::diagonal(1.0, 1.0, 1.0);

  AttitudeTrajectory trajectory;
  trajectory.times = {0.0, 1.0, 2.0};
  trajectory.states = {withRate(AngularVelocity{1.0, 0.0, 0.0}),
                       withRate(AngularVelocity{0.0, 1.0, 0.0}),
                       withRate(AngularVelocity{0.0, 0.0, 1.01})};

  auto const report = ConservationTracker::checkAttitude(trajectory, inertia);
  EXPECT_NEAR(report.angularMomentumDrift, 0.01, 1e-12);
  EXPECT_NEAR(report.energyDrift, 0.0201, 1e-12);
  EXPECT_EQ(report.worstSample, 2u);
  EXPECT_FALSE(report.withinTolerance);

  auto const lenient =
    ConservationTracker::checkAttitude(trajectory, inertia, 0.05);
  EXPECT_TRUE(lenient.withinTolerance);
}

TEST(ConservationTrackerTest, OrbitDriftReport)
{
  OrbitTrajectory trajectory;
  CartesianState state;
  state.position = Coordinate{7000.0, 0.0, 0.0};
  state.velocity = Velocity{0.0, 7.5, 0.0};
  trajectory.times = {0.0, 10.0};
  trajectory.states = {state, state};

  // Same state rotated by 90 deg: invariants unchanged
  state.position = Coordinate{0.0, 7000.0, 0.0};
  state.velocity = Velocity{-7.5, 0.0, 0.0};
  trajectory.times.push_back(20.0);
  trajectory.states.push_back(state);

  auto const report = ConservationTracker::checkOrbit(trajectory);
  EXPECT_DOUBLE_EQ(report.energyDrift, 0.0);
  EXPECT_DOUBLE_EQ(report.angularMomentumDrift, 0.0);
  EXPECT_TRUE(report.withinTolerance);
}

TEST(ConservationTrackerTest, DriftMeasuredFromInitialStateNotFirstSample)
{
  InertiaTensor const inertia = InertiaTensor::diagonal(1.0, 1.0, 1.0);

  // Samples agree with each other but not with the state they started from
  AttitudeTrajectory trajectory;
  trajectory.times = {19.9, 20.0};
  trajectory.states = {withRate(AngularVelocity{0.0, 0.0, 1.01}),
                       withRate(AngularVelocity{0.0, 1.01, 0.0})};

  auto const fromFirstSample =
    ConservationTracker::checkAttitude(trajectory, inertia);
  EXPECT_DOUBLE_EQ(fromFirstSample.angularMomentumDrift, 0.0);
  EXPECT_TRUE(fromFirstSample.withinTolerance);

  auto const fromInitial = ConservationTracker::checkAttitude(
    trajectory, inertia, withRate(AngularVelocity{1.0, 0.0, 0.0}));
  EXPECT_NEAR(fromInitial.angularMomentumDrift, 0.01, 1e-12);
  EXPECT_NEAR(fromInitial.energyDrift, 0.0201, 1e-12);
  EXPECT_EQ(fromInitial.worstSample, 0u);
  EXPECT_FALSE(fromInitial.withinTolerance);

  CartesianState initial;
  initial.position = Coordinate{7000.0, 0.0, 0.0};
  initial.velocity = Velocity{0.0, 7.5, 0.0};
  CartesianState later = initial;
  later.velocity = Velocity{0.0, 7.6, 0.0};

  OrbitTrajectory orbit;
  orbit.times = {100.0, 200.0};
  orbit.states = {later, later};

  EXPECT_TRUE(ConservationTracker::checkOrbit(orbit).withinTolerance);
  auto const orbitReport = ConservationTracker::checkOrbit(orbit, initial);
  EXPECT_NEAR(orbitReport.angularMomentumDrift, 0.1 / 7.5, 1e-12);
  EXPECT_FALSE(orbitReport.withinTolerance);
}

TEST(ConservationTrackerTest, NonFiniteStateIsOutOfTolerance)
{
  InertiaTensor const inertia = InertiaTensor::diagonal(1.0, 2.0, 3.0);
  double const nan = std::numeric_limits<double>::quiet_NaN();

  AttitudeTrajectory trajectory;
  trajectory.times = {0.0, 1.0, 2.0};
  trajectory.states = {withRate(AngularVelocity{0.1, 0.2, 0.3}),
                       withRate(AngularVelocity{nan, 0.2, 0.3}),
                       withRate(AngularVelocity{0.1, 0.2, 0.3})};

  auto const report =
    ConservationTracker::checkAttitude(trajectory, inertia, 1.0);
  EXPECT_FALSE(report.withinTolerance);
  EXPECT_EQ(report.worstSample, 1u);
  EXPECT_TRUE(std::isinf(report.angularMomentumDrift));

  CartesianState state;
  state.position = Coordinate{7000.0, 0.0, 0.0};
  state.velocity = Velocity{0.0, 7.5, 0.0};
  CartesianState broken = state;
  broken.velocity = Velocity{0.0, nan, 0.0};

  OrbitTrajectory orbit;
  orbit.times = {0.0, 10.0};
  orbit.states = {state, broken};
  EXPECT_FALSE(ConservationTracker::checkOrbit(orbit).withinTolerance);
}

TEST(ConservationTrackerTest, EmptyTrajectoryAndBadTolerance)
{
  InertiaTensor const inertia = InertiaTensor::diagonal(1.0, 2.0, 3.0);
  AttitudeTrajectory const empty;

  auto const report = ConservationTracker::checkAttitude(empty, inertia);
  EXPECT_TRUE(report.withinTolerance);
  EXPECT_DOUBLE_EQ(report.angularMomentumDrift, 0.0);

  EXPECT_THROW(ConservationTracker::checkAttitude(empty, inertia, -1.0),
               std::invalid_argument);
  EXPECT_THROW(ConservationTracker::checkOrbit(OrbitTrajectory{},
                                               earth::kMuEarth,
                                               -1.0),
               std::invalid_argument);
}
