// Ticket: 0006_propagation

#include <gtest/gtest.h>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <memory>
#include <numbers>
#include <stdexcept>
#include <vector>

#include "sdc-sim/src/Diagnostics/ConservationTracker.hpp"
#include "sdc-sim/src/Physics/Integration/DormandPrinceIntegrator.hpp"
#include "sdc-sim/src/Physics/Integration/RungeKutta4Integrator.hpp"
#include "sdc-sim/src/Physics/Orbit/OrbitalMechanics.hpp"
#include "sdc-sim/src/Propagation/OrbitPropagator.hpp"
#include "sdc-sim/src/Utils/Errors.hpp"

using namespace sdc_sim;

class OrbitPropagatorTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    auto nullSink = std::make_shared<spdlog::sinks::null_sink_mt>();
    logger = std::make_shared<spdlog::logger>("orbit_test", nullSink);

    leo.position = Coordinate{7000.0, 0.0, 0.0};
    leo.velocity = Velocity{0.0, 7.5, 0.0};
  }

  static IntegratorConfig tightConfig()
  {
    IntegratorConfig config;
    config.absoluteTolerance = 1e-12;
    config.relativeTolerance = 1e-12;
    return config;
  }

  std::shared_ptr<spdlog::logger> logger;
  CartesianState leo;
};

TEST_F(OrbitPropagatorTest, ReturnsToInitialStateAfterOnePeriod)
{
  DormandPrinceIntegrator const dp{tightConfig()};
  OrbitPropagator const propagator{
    earth::kMuEarth, dp, OrbitPropagator::Config{}, logger};

  double const period =
    orbitalPeriod(cartesianToElements(leo.position, leo.velocity).semiMajorAxis);
  OrbitTrajectory const trajectory = propagator.propagate(leo, 0.0, period);

  ASSERT_TRUE(trajectory.success()) << trajectory.message;
  EXPECT_DOUBLE_EQ(trajectory.times.back(), period);

  CartesianState const& last = trajectory.states.back();
  EXPECT_LT((last.position - leo.position).norm() / leo.position.norm(), 1e-6);
  EXPECT_LT((last.velocity - leo.velocity).norm() / leo.velocity.norm(), 1e-6);

  auto const report = ConservationTracker::checkOrbit(trajectory);
  EXPECT_TRUE(report.withinTolerance);
  EXPECT_LT(report.energyDrift, 1e-6);
  EXPECT_LT(report.angularMomentumDrift, 1e-6);
}

TEST_F(OrbitPropagatorTest, HalfPeriodReachesPeriapsis)
{
  DormandPrinceIntegrator const dp{tightConfig()};
  OrbitPropagator const propagator{
    earth::kMuEarth, dp, OrbitPropagator::Config{}, logger};

  OrbitalElements const elements =
    cartesianToElements(leo.position, leo.velocity);
  double const halfPeriod = 0.5 * orbitalPeriod(elements.semiMajorAxis);

  OrbitTrajectory const trajectory =
    propagator.propagate(leo, 0.0, halfPeriod, {halfPeriod});
  ASSERT_TRUE(trajectory.success());
  ASSERT_EQ(trajectory.size(), 1u);

  // Started at apoapsis on the +x axis, so periapsis lies on the -x axis
  CartesianState const& periapsis = trajectory.states.front();
  EXPECT_NEAR(periapsis.position.x(), -periapsisRadius(elements), 1e-4);
  EXPECT_NEAR(periapsis.position.y(), 0.0, 1e-4);
}

TEST_F(OrbitPropagatorTest, PropagatesFromElements)
{
  OrbitalElements elements;
  elements.semiMajorAxis = 8000.0;
  elements.eccentricity = 0.1;
  elements.inclination = 0.9;
  elements.raan = 1.2;
  elements.argumentOfPerigee = 0.4;
  elements.trueAnomaly = 2.0;

  DormandPrinceIntegrator const dp{tightConfig()};
  OrbitPropagator const propagator{
    earth::kMuEarth, dp, OrbitPropagator::Config{}, logger};

  double const period = orbitalPeriod(elements.semiMajorAxis);
  OrbitTrajectory const trajectory =
    propagator.propagate(elements, 0.0, period, {0.0, period});
  ASSERT_TRUE(trajectory.success());
  ASSERT_EQ(trajectory.size(), 2u);

  CartesianState const expected = elementsToCartesian(elements);
  EXPECT_TRUE(trajectory.states.front().position.isApprox(expected.position,
                                                          1e-14));
  EXPECT_TRUE(
    trajectory.states.back().position.isApprox(expected.position, 1e-6));

  OrbitalElements const after = cartesianToElements(
    trajectory.states.back().position, trajectory.states.back().velocity);
  EXPECT_NEAR(after.inclination, elements.inclination, 1e-9);
  EXPECT_NEAR(after.raan, elements.raan, 1e-9);
}

TEST_F(OrbitPropagatorTest, RungeKutta4AgreesWithDormandPrince)
{
  IntegratorConfig fixed;
  fixed.fixedStep = 5.0;
  RungeKutta4Integrator const rk4{fixed};
  DormandPrinceIntegrator const dp{tightConfig()};

  std::vector<double> const times{600.0, 1200.0, 1800.0};
  OrbitTrajectory const a =
    OrbitPropagator{earth::kMuEarth, rk4, OrbitPropagator::Config{}, logger}
      .propagate(leo, 0.0, 1800.0, times);
  OrbitTrajectory const b =
    OrbitPropagator{earth::kMuEarth, dp, OrbitPropagator::Config{}, logger}
      .propagate(leo, 0.0, 1800.0, times);

  ASSERT_TRUE(a.success());
  ASSERT_TRUE(b.success());
  for (std::size_t i = 0; i < times.size(); ++i)
  {
    EXPECT_LT((a.states[i].position - b.states[i].position).norm(), 1e-4)
      << "t = " << times[i];
  }
}

TEST_F(OrbitPropagatorTest, InvalidSetupThrows)
{
  DormandPrinceIntegrator const dp{};
  EXPECT_THROW((OrbitPropagator{0.0, dp}), std::invalid_argument);
  EXPECT_THROW((OrbitPropagator{-1.0, dp, OrbitPropagator::Config{}, logger}),
               std::invalid_argument);

  OrbitPropagator const propagator{
    earth::kMuEarth, dp, OrbitPropagator::Config{}, logger};
  CartesianState origin;
  origin.position = Coordinate{0.0, 0.0, 0.0};
  origin.velocity = Velocity{1.0, 0.0, 0.0};
  EXPECT_THROW((void)propagator.propagate(origin, 0.0, 10.0), DegenerateInput);
}

TEST_F(OrbitPropagatorTest, InvalidSpanIsReportedInTrajectory)
{
  DormandPrinceIntegrator const dp{};
  OrbitPropagator const propagator{
    earth::kMuEarth, dp, OrbitPropagator::Config{}, logger};

  OrbitTrajectory const trajectory = propagator.propagate(leo, 10.0, 0.0);
  EXPECT_EQ(trajectory.status, IntegrationStatus::InvalidInput);
  EXPECT_TRUE(trajectory.states.empty());
}
