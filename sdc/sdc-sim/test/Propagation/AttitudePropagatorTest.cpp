// Ticket: 0006_propagation

#include <gtest/gtest.h>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include "sdc-sim/src/Diagnostics/ConservationTracker.hpp"
#include "sdc-sim/src/Physics/Integration/DormandPrinceIntegrator.hpp"
#include "sdc-sim/src/Physics/Integration/RungeKutta4Integrator.hpp"
#include "sdc-sim/src/Physics/RigidBody/AxisymmetricBody.hpp"
#include "sdc-sim/src/Propagation/AttitudePropagator.hpp"
#include "sdc-sim/src/Utils/Errors.hpp"

using namespace sdc_sim;

namespace
{

constexpr double kTransverse = 100.0;
constexpr double kSpin = 50.0;

AttitudeState referenceState()
{
  AttitudeState state;
  state.angularVelocity = AngularVelocity{0.1, 0.05, 1.0};
  return state;
}

std::vector<double> uniformGrid(double t0, double tEnd, int intervals)
{
  std::vector<double> grid;
  for (int i = 0; i <= intervals; ++i)
  {
    grid.push_back(t0 + (tEnd - t0) * i / intervals);
  }
  return grid;
}

}  // namespace

class AttitudePropagatorTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    auto nullSink = std::make_shared<spdlog::sinks::null_sink_mt>();
    logger = std::make_shared<spdlog::logger>("attitude_test", nullSink);
  }

  static IntegratorConfig tightConfig()
  {
    IntegratorConfig config;
    config.absoluteTolerance = 1e-10;
    config.relativeTolerance = 1e-10;
    return config;
  }

  InertiaTensor const inertia =
    InertiaTensor::axisymmetric(kTransverse, kSpin);
  std::shared_ptr<spdlog::logger> logger;
};

TEST_F(AttitudePropagatorTest, DormandPrinceMatchesAxisymmetricSolution)
{
  DormandPrinceIntegrator const dp{tightConfig()};
  AttitudePropagator const propagator{
    inertia, dp, AttitudePropagator::Config{}, logger};

  std::vector<double> const grid = uniformGrid(0.0, 20.0, 40);
  AttitudeTrajectory const trajectory =
    propagator.propagate(referenceState(), 0.0, 20.0, grid);

  ASSERT_TRUE(trajectory.success()) << trajectory.message;
  ASSERT_EQ(trajectory.times, grid);

  for (std::size_t i = 0; i < trajectory.size(); ++i)
  {
    AngularVelocity const expected = axisymmetricAnalyticalSolution(
      referenceState().angularVelocity, kTransverse, kSpin, grid[i]);
    EXPECT_TRUE(
      trajectory.states[i].angularVelocity.isApprox(expected, 1e-6))
      << "t = " << grid[i];
    EXPECT_NEAR(trajectory.states[i].orientation.norm(), 1.0, 1e-12);
  }

  auto const report = ConservationTracker::checkAttitude(trajectory, inertia);
  EXPECT_TRUE(report.withinTolerance);
  EXPECT_LT(report.angularMomentumDrift, 1e-6);
  EXPECT_LT(report.energyDrift, 1e-6);
}

TEST_F(AttitudePropagatorTest, RungeKutta4MatchesAxisymmetricSolution)
{
  IntegratorConfig config;
  config.fixedStep = 0.01;
  RungeKutta4Integrator const rk4{config};
  AttitudePropagator const propagator{
    inertia, rk4, AttitudePropagator::Config{}, logger};

  AttitudeTrajectory const trajectory =
    propagator.propagate(referenceState(), 0.0, 20.0);
  ASSERT_TRUE(trajectory.success());
  EXPECT_DOUBLE_EQ(trajectory.times.back(), 20.0);

  AngularVelocity const expected = axisymmetricAnalyticalSolution(
    referenceState().angularVelocity, kTransverse, kSpin, 20.0);
  EXPECT_TRUE(
    trajectory.states.back().angularVelocity.isApprox(expected, 1e-6));

  auto const report = ConservationTracker::checkAttitude(trajectory, inertia);
  EXPECT_TRUE(report.withinTolerance);
}

TEST_F(AttitudePropagatorTest, ConstantSpinTorqueSpinsUpAboutSymmetryAxis)
{
  double const torque = 2.0;
  RungeKutta4Integrator const rk4{};
  AttitudePropagator const propagator{
    inertia, rk4, AttitudePropagator::Config{}, logger};

  TorqueFunction const spinUp = [torque](double, const AttitudeState&)
  { return Eigen::Vector3d{0.0, 0.0, torque}; };

  AttitudeTrajectory const trajectory =
    propagator.propagate(AttitudeState{}, 0.0, 5.0, {5.0}, spinUp);
  ASSERT_TRUE(trajectory.success());

  double const t = 5.0;
  double const rate = torque / kSpin * t;
  double const angle = 0.5 * torque / kSpin * t * t;

  AttitudeState const& last = trajectory.states.back();
  EXPECT_NEAR(last.angularVelocity.z(), rate, 1e-12);
  EXPECT_NEAR(last.angularVelocity.x(), 0.0, 1e-15);
  EXPECT_NEAR(last.orientation.w(), std::cos(0.5 * angle), 1e-8);
  EXPECT_NEAR(last.orientation.z(), std::sin(0.5 * angle), 1e-8);
}

TEST_F(AttitudePropagatorTest, InitialQuaternionIsNormalized)
{
  RungeKutta4Integrator const rk4{};
  AttitudePropagator const propagator{
    inertia, rk4, AttitudePropagator::Config{}, logger};

  AttitudeState initial = referenceState();
  initial.orientation = QuaternionD{2.0, 0.0, 0.0, 0.0};

  AttitudeTrajectory const trajectory = propagator.propagate(initial, 0.0, 0.1);
  ASSERT_TRUE(trajectory.success());
  EXPECT_NEAR(trajectory.states.front().orientation.w(), 1.0, 1e-15);

  initial.orientation = QuaternionD{0.0, 0.0, 0.0, 0.0};
  EXPECT_THROW((void)propagator.propagate(initial, 0.0, 0.1), DegenerateInput);
}

TEST_F(AttitudePropagatorTest, RenormalizationKeepsUnitNorm)
{
  IntegratorConfig coarse;
  coarse.fixedStep = 0.2;
  RungeKutta4Integrator const rk4{coarse};

  AttitudePropagator::Config withProjection;
  AttitudePropagator::Config withoutProjection;
  withoutProjection.renormalizeEachStep = false;

  AttitudeTrajectory const projected =
    AttitudePropagator{inertia, rk4, withProjection, logger}.propagate(
      referenceState(), 0.0, 50.0);
  AttitudeTrajectory const free =
    AttitudePropagator{inertia, rk4, withoutProjection, logger}.propagate(
      referenceState(), 0.0, 50.0);

  ASSERT_TRUE(projected.success());
  ASSERT_TRUE(free.success());

  double const projectedError =
    std::abs(projected.states.back().orientation.norm() - 1.0);
  double const freeError =
    std::abs(free.states.back().orientation.norm() - 1.0);
  EXPECT_LT(projectedError, 1e-14);
  EXPECT_GT(freeError, projectedError);
}

TEST_F(AttitudePropagatorTest, IntegrationFailureIsReportedNotThrown)
{
  IntegratorConfig config;
  config.fixedStep = 0.01;
  config.maxSteps = 10;
  RungeKutta4Integrator const rk4{config};
  AttitudePropagator const propagator{
    inertia, rk4, AttitudePropagator::Config{}, logger};

  AttitudeTrajectory const trajectory =
    propagator.propagate(referenceState(), 0.0, 1.0);
  EXPECT_EQ(trajectory.status, IntegrationStatus::MaxStepsExceeded);
  EXPECT_EQ(trajectory.size(), 11u);
  EXPECT_THROW(trajectory.throwIfFailed(), IntegrationFailure);
}

TEST_F(AttitudePropagatorTest, DriftBeyondToleranceIsLoggedAsWarning)
{
  auto ring = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(8);
  auto capture = std::make_shared<spdlog::logger>("attitude_capture", ring);
  capture->set_pattern("%l %v");

  IntegratorConfig coarse;
  coarse.fixedStep = 1.0;
  RungeKutta4Integrator const rk4{coarse};

  AttitudePropagator::Config config;
  config.driftTolerance = 1e-12;
  AttitudePropagator const propagator{inertia, rk4, config, capture};

  AttitudeTrajectory const trajectory =
    propagator.propagate(referenceState(), 0.0, 30.0);
  ASSERT_TRUE(trajectory.success());

  std::vector<std::string> const lines = ring->last_formatted();
  ASSERT_FALSE(lines.empty());
  EXPECT_NE(lines.back().find("warning"), std::string::npos);
  EXPECT_NE(lines.back().find("drifted"), std::string::npos);
}

TEST_F(AttitudePropagatorTest, DriftBeforeFirstSampleIsLogged)
{
  auto ring = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(8);
  auto capture = std::make_shared<spdlog::logger>("late_capture", ring);
  capture->set_pattern("%l %v");

  IntegratorConfig coarse;
  coarse.fixedStep = 1.0;
  RungeKutta4Integrator const rk4{coarse};
  AttitudePropagator const propagator{
    inertia, rk4, AttitudePropagator::Config{}, capture};

  // Only late samples: the two agree closely, the drift is relative to t0
  AttitudeTrajectory const trajectory =
    propagator.propagate(referenceState(), 0.0, 20.0, {19.9, 20.0});
  ASSERT_TRUE(trajectory.success());
  ASSERT_EQ(trajectory.size(), 2u);

  auto const report = ConservationTracker::checkAttitude(
    trajectory, inertia, referenceState());
  EXPECT_GT(report.energyDrift, 1e-5);
  EXPECT_FALSE(report.withinTolerance);

  std::vector<std::string> const lines = ring->last_formatted();
  ASSERT_FALSE(lines.empty());
  EXPECT_NE(lines.back().find("warning"), std::string::npos);
  EXPECT_NE(lines.back().find("drifted"), std::string::npos);
}

TEST_F(AttitudePropagatorTest, NegativeDriftToleranceThrows)
{
  RungeKutta4Integrator const rk4{};
  AttitudePropagator::Config config;
  config.driftTolerance = -1.0;
  EXPECT_THROW((AttitudePropagator{inertia, rk4, config, logger}),
               std::invalid_argument);
}
