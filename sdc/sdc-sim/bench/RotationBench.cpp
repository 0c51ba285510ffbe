// Ticket: 0001_rotation_algebra

#include <benchmark/benchmark.h>

#include <cmath>
#include <numbers>
#include <random>
#include <vector>

#include "sdc-sim/src/Rotation/QuaternionOps.hpp"
#include "sdc-sim/src/Rotation/RotationMatrix.hpp"

using namespace sdc_sim;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

// Random unit quaternions with a fixed seed for deterministic benchmarks
std::vector<QuaternionD> generateQuaternions(std::size_t count)
{
  std::mt19937 rng{42};
  std::uniform_real_distribution<double> uniform{0.0, 1.0};
  constexpr double kTwoPi = 2.0 * std::numbers::pi;

  std::vector<QuaternionD> quaternions;
  quaternions.reserve(count);
  for (std::size_t i = 0; i < count; ++i)
  {
    double const u1 = uniform(rng);
    double const u2 = uniform(rng);
    double const u3 = uniform(rng);
    double const a = std::sqrt(1.0 - u1);
    double const b = std::sqrt(u1);
    quaternions.emplace_back(a * std::sin(kTwoPi * u2),
                             a * std::cos(kTwoPi * u2),
                             b * std::sin(kTwoPi * u3),
                             b * std::cos(kTwoPi * u3));
  }
  return quaternions;
}

}  // namespace

// ============================================================================
// Conversions
// ============================================================================

static void BM_QuaternionMatrixRoundTrip(benchmark::State& state)
{
  auto const quaternions =
    generateQuaternions(static_cast<std::size_t>(state.range(0)));

  for (auto _ : state)
  {
    for (const auto& q : quaternions)
    {
      QuaternionD back = matrixToQuaternion(quaternionToMatrix(q));
      benchmark::DoNotOptimize(back);
    }
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_QuaternionMatrixRoundTrip)->Arg(100)->Arg(1000);

static void BM_Slerp(benchmark::State& state)
{
  auto const quaternions = generateQuaternions(256);

  for (auto _ : state)
  {
    for (std::size_t i = 1; i < quaternions.size(); ++i)
    {
      QuaternionD q = slerp(quaternions[i - 1], quaternions[i], 0.3);
      benchmark::DoNotOptimize(q);
    }
  }
}
BENCHMARK(BM_Slerp);

static void BM_EulerSequenceToMatrix(benchmark::State& state)
{
  Eigen::Vector3d const angles{0.3, -0.7, 1.9};
  for (auto _ : state)
  {
    Eigen::Matrix3d r = eulerSequenceToMatrix(angles, "313");
    benchmark::DoNotOptimize(r);
  }
}
BENCHMARK(BM_EulerSequenceToMatrix);
