// Ticket: 0008_batch_propagation

#ifndef SDC_SIM_BATCH_PROPAGATOR_HPP
#define SDC_SIM_BATCH_PROPAGATOR_HPP

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <stop_token>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "sdc-sim/src/Physics/Orbit/CartesianState.hpp"
#include "sdc-sim/src/Physics/RigidBody/AttitudeState.hpp"
#include "sdc-sim/src/Physics/RigidBody/RigidBodyDynamics.hpp"
#include "sdc-sim/src/Propagation/AttitudePropagator.hpp"
#include "sdc-sim/src/Propagation/OrbitPropagator.hpp"
#include "sdc-sim/src/Propagation/Trajectory.hpp"

namespace sdc_sim
{

/// One independent attitude run of a batch
struct AttitudeCase
{
  AttitudeState initial;
  double t0{0.0};
  double tEnd{0.0};
  std::vector<double> evaluationTimes;
  TorqueFunction torque;
};

/// One independent orbit run of a batch
struct OrbitCase
{
  CartesianState initial;
  double t0{0.0};
  double tEnd{0.0};
  std::vector<double> evaluationTimes;
};

/**
 * @brief Runs independent propagation cases on a pool of worker threads
 *
 * Workers claim cases through an atomic index, so the assignment of cases to
 * threads is not deterministic but results are always returned in input
 * order. Each case must be independent of the others; the propagators and
 * integrators shipped with the library are safe to share between workers.
 *
 * When a case throws, no further cases are started. Once every worker has
 * joined, the exception of the lowest-indexed failing case is rethrown.
 * Integration failure is not an exception and is reported per trajectory.
 */
class BatchPropagator
{
public:
  struct Config
  {
    /// Worker threads; 0 uses std::thread::hardware_concurrency()
    std::size_t workerCount{0};
  };

  BatchPropagator();

  /**
   * @param logger nullptr selects logging::defaultLogger()
   */
  explicit BatchPropagator(const Config& config,
                           std::shared_ptr<spdlog::logger> logger = nullptr);

  /// Number of threads used for a batch of caseCount cases
  [[nodiscard]] std::size_t workerCount(std::size_t caseCount) const;

  /**
   * @brief Evaluate every task and collect the results in input order
   * @tparam Result Default-constructible, move-assignable result type
   */
  template <typename Result>
  std::vector<Result> run(
    const std::vector<std::function<Result()>>& tasks) const;

  [[nodiscard]] std::vector<AttitudeTrajectory> propagate(
    const AttitudePropagator& propagator,
    const std::vector<AttitudeCase>& cases) const;

  [[nodiscard]] std::vector<OrbitTrajectory> propagate(
    const OrbitPropagator& propagator,
    const std::vector<OrbitCase>& cases) const;

private:
  void logSummary(std::size_t caseCount,
                  std::size_t workers,
                  std::size_t failures) const;

  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
};

template <typename Result>
std::vector<Result> BatchPropagator::run(
  const std::vector<std::function<Result()>>& tasks) const
{
  std::size_t const count = tasks.size();
  std::vector<Result> results(count);
  std::vector<std::exception_ptr> errors(count);
  if (count == 0)
  {
    return results;
  }

  std::size_t const workers = workerCount(count);
  std::atomic<std::size_t> next{0};
  std::stop_source stopSource;

  {
    std::vector<std::jthread> pool;
    pool.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w)
    {
      pool.emplace_back(
        [&, stopToken = stopSource.get_token()]
        {
          while (!stopToken.stop_requested())
          {
            std::size_t const index = next.fetch_add(1);
            if (index >= count)
            {
              return;
            }
            try
            {
              results[index] = tasks[index]();
            }
            catch (...)
            {
              errors[index] = std::current_exception();
              stopSource.request_stop();
            }
          }
        });
    }
    // jthreads join on scope exit
  }

  auto const failed =
    std::find_if(errors.begin(),
                 errors.end(),
                 [](const std::exception_ptr& e) { return e != nullptr; });

  logSummary(count,
             workers,
             static_cast<std::size_t>(std::count_if(
               errors.begin(),
               errors.end(),
               [](const std::exception_ptr& e) { return e != nullptr; })));

  if (failed != errors.end())
  {
    std::rethrow_exception(*failed);
  }
  return results;
}

}  // namespace sdc_sim

#endif  // SDC_SIM_BATCH_PROPAGATOR_HPP
