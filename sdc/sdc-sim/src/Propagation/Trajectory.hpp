// Ticket: 0006_propagation

#ifndef SDC_SIM_TRAJECTORY_HPP
#define SDC_SIM_TRAJECTORY_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "sdc-sim/src/Physics/Integration/IntegrationResult.hpp"
#include "sdc-sim/src/Physics/Orbit/CartesianState.hpp"
#include "sdc-sim/src/Physics/RigidBody/AttitudeState.hpp"
#include "sdc-sim/src/Utils/Errors.hpp"

namespace sdc_sim
{

/**
 * @brief Time-ordered samples produced by one propagation run
 *
 * Owned by the caller. On failure the samples produced before the failure
 * are kept and status/message describe what went wrong.
 *
 * @tparam State Unpacked state type (AttitudeState, CartesianState)
 */
template <typename State>
struct Trajectory
{
  IntegrationStatus status{IntegrationStatus::Success};
  std::string message;

  std::vector<double> times;
  std::vector<State> states;

  std::size_t acceptedSteps{0};
  std::size_t functionEvaluations{0};

  [[nodiscard]] bool success() const
  {
    return status == IntegrationStatus::Success;
  }

  [[nodiscard]] std::size_t size() const
  {
    return states.size();
  }

  /**
   * @throws IntegrationFailure if status is not Success
   */
  void throwIfFailed() const
  {
    if (!success())
    {
      throw IntegrationFailure{"Propagation failed (" +
                               std::string{toString(status)} +
                               "): " + message};
    }
  }

  /**
   * @brief Copy the status, grid and counters of an integration run and
   *        unpack its states
   */
  template <typename Unpack>
  static Trajectory fromResult(const IntegrationResult& result, Unpack unpack)
  {
    Trajectory trajectory;
    trajectory.status = result.status;
    trajectory.message = result.message;
    trajectory.times = result.times;
    trajectory.acceptedSteps = result.acceptedSteps;
    trajectory.functionEvaluations = result.functionEvaluations;
    trajectory.states.reserve(result.states.size());
    for (const auto& packed : result.states)
    {
      trajectory.states.push_back(unpack(packed));
    }
    return trajectory;
  }
};

using AttitudeTrajectory = Trajectory<AttitudeState>;
using OrbitTrajectory = Trajectory<CartesianState>;

}  // namespace sdc_sim

#endif  // SDC_SIM_TRAJECTORY_HPP
