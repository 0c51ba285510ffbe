// Ticket: 0006_propagation

#include <benchmark/benchmark.h>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <memory>
#include <vector>

#include "sdc-sim/src/Physics/Integration/DormandPrinceIntegrator.hpp"
#include "sdc-sim/src/Physics/Integration/RungeKutta4Integrator.hpp"
#include "sdc-sim/src/Physics/Orbit/OrbitalMechanics.hpp"
#include "sdc-sim/src/Propagation/AttitudePropagator.hpp"
#include "sdc-sim/src/Propagation/BatchPropagator.hpp"
#include "sdc-sim/src/Propagation/OrbitPropagator.hpp"

using namespace sdc_sim;

namespace
{

std::shared_ptr<spdlog::logger> quietLogger()
{
  static auto logger = std::make_shared<spdlog::logger>(
    "bench", std::make_shared<spdlog::sinks::null_sink_mt>());
  return logger;
}

CartesianState lowEarthOrbit()
{
  CartesianState state;
  state.position = Coordinate{7000.0, 0.0, 0.0};
  state.velocity = Velocity{0.0, 7.5, 0.0};
  return state;
}

}  // namespace

/**
 * @brief One orbital period of the two-body problem with Dormand-Prince
 *
 * range(0) is -log10 of the integration tolerance.
 */
static void BM_OrbitOnePeriod(benchmark::State& state)
{
  IntegratorConfig config;
  config.absoluteTolerance = std::pow(10.0, -static_cast<double>(state.range(0)));
  config.relativeTolerance = config.absoluteTolerance;
  DormandPrinceIntegrator const dp{config};
  OrbitPropagator::Config propagatorConfig;
  propagatorConfig.checkConservation = false;
  OrbitPropagator const propagator{
    earth::kMuEarth, dp, propagatorConfig, quietLogger()};

  CartesianState const initial = lowEarthOrbit();
  double const period = orbitalPeriod(
    cartesianToElements(initial.position, initial.velocity).semiMajorAxis);

  for (auto _ : state)
  {
    OrbitTrajectory trajectory = propagator.propagate(initial, 0.0, period);
    benchmark::DoNotOptimize(trajectory);
  }
}
BENCHMARK(BM_OrbitOnePeriod)->Arg(8)->Arg(10)->Arg(12);

static void BM_TorqueFreeAttitudeRk4(benchmark::State& state)
{
  IntegratorConfig config;
  config.fixedStep = 0.01;
  RungeKutta4Integrator const rk4{config};
  AttitudePropagator const propagator{InertiaTensor::axisymmetric(100.0, 50.0),
                                      rk4,
                                      AttitudePropagator::Config{},
                                      quietLogger()};

  AttitudeState initial;
  initial.angularVelocity = AngularVelocity{0.1, 0.05, 1.0};

  for (auto _ : state)
  {
    AttitudeTrajectory trajectory =
      propagator.propagate(initial, 0.0, 20.0, {20.0});
    benchmark::DoNotOptimize(trajectory);
  }
}
BENCHMARK(BM_TorqueFreeAttitudeRk4);

/**
 * @brief Batch of independent orbits; range(0) is the worker count
 */
static void BM_OrbitBatch(benchmark::State& state)
{
  DormandPrinceIntegrator const dp{};
  OrbitPropagator::Config propagatorConfig;
  propagatorConfig.checkConservation = false;
  OrbitPropagator const propagator{
    earth::kMuEarth, dp, propagatorConfig, quietLogger()};

  std::vector<OrbitCase> cases(32);
  for (std::size_t i = 0; i < cases.size(); ++i)
  {
    cases[i].initial = lowEarthOrbit();
    cases[i].initial.velocity.z() = 0.01 * static_cast<double>(i);
    cases[i].tEnd = 3000.0;
  }

  BatchPropagator::Config batchConfig;
  batchConfig.workerCount = static_cast<std::size_t>(state.range(0));
  BatchPropagator const batch{batchConfig, quietLogger()};

  for (auto _ : state)
  {
    auto trajectories = batch.propagate(propagator, cases);
    benchmark::DoNotOptimize(trajectories);
  }
}
BENCHMARK(BM_OrbitBatch)->Arg(1)->Arg(2)->Arg(4)->UseRealTime();

BENCHMARK_MAIN();
