// Ticket: 0008_batch_propagation

#include "sdc-sim/src/Propagation/BatchPropagator.hpp"

#include <utility>

#include "sdc-sim/src/Utils/Logging.hpp"

namespace sdc_sim
{

BatchPropagator::BatchPropagator()
  : config_{}, logger_{logging::defaultLogger()}
{
}

BatchPropagator::BatchPropagator(const Config& config,
                                 std::shared_ptr<spdlog::logger> logger)
  : config_{config},
    logger_{logger ? std::move(logger) : logging::defaultLogger()}
{
}

std::size_t BatchPropagator::workerCount(std::size_t caseCount) const
{
  std::size_t workers = config_.workerCount;
  if (workers == 0)
  {
    workers = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  }
  return std::max<std::size_t>(1, std::min(workers, caseCount));
}

std::vector<AttitudeTrajectory> BatchPropagator::propagate(
  const AttitudePropagator& propagator,
  const std::vector<AttitudeCase>& cases) const
{
  std::vector<std::function<AttitudeTrajectory()>> tasks;
  tasks.reserve(cases.size());
  for (const auto& c : cases)
  {
    tasks.emplace_back(
      [&propagator, &c]
      {
        return propagator.propagate(
          c.initial, c.t0, c.tEnd, c.evaluationTimes, c.torque);
      });
  }
  return run(tasks);
}

std::vector<OrbitTrajectory> BatchPropagator::propagate(
  const OrbitPropagator& propagator,
  const std::vector<OrbitCase>& cases) const
{
  std::vector<std::function<OrbitTrajectory()>> tasks;
  tasks.reserve(cases.size());
  for (const auto& c : cases)
  {
    tasks.emplace_back(
      [&propagator, &c]
      { return propagator.propagate(c.initial, c.t0, c.tEnd, c.evaluationTimes); });
  }
  return run(tasks);
}

void BatchPropagator::logSummary(std::size_t caseCount,
                                 std::size_t workers,
                                 std::size_t failures) const
{
  if (failures == 0)
  {
    logger_->info("Batch of {} cases finished on {} workers", caseCount, workers);
    return;
  }
  logger_->info("Batch of {} cases stopped on {} workers: {} case(s) threw",
                caseCount,
                workers,
                failures);
}

}  // namespace sdc_sim
