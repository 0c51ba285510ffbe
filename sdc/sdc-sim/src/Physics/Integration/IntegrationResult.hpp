// Ticket: 0005_numerical_integration

#ifndef SDC_SIM_INTEGRATION_RESULT_HPP
#define SDC_SIM_INTEGRATION_RESULT_HPP

#include <Eigen/Dense>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sdc_sim
{

enum class IntegrationStatus
{
  Success,
  MaxStepsExceeded,
  StepSizeUnderflow,
  NonFiniteState,
  InvalidInput
};

std::string_view toString(IntegrationStatus status);

/**
 * @brief Outcome of one integration run
 *
 * Numerical failure is reported through status rather than thrown. On
 * failure, times and states hold the samples produced before the failure.
 */
struct IntegrationResult
{
  IntegrationStatus status{IntegrationStatus::Success};
  std::string message;

  std::vector<double> times;
  std::vector<Eigen::VectorXd> states;

  std::size_t acceptedSteps{0};
  std::size_t rejectedSteps{0};
  std::size_t functionEvaluations{0};

  [[nodiscard]] bool success() const
  {
    return status == IntegrationStatus::Success;
  }

  /**
   * @brief Convert a failed status into an exception
   * @throws IntegrationFailure if status is not Success
   */
  void throwIfFailed() const;

  /**
   * @brief Last recorded state
   * @throws std::out_of_range if no sample was recorded
   */
  [[nodiscard]] const Eigen::VectorXd& finalState() const;
};

}  // namespace sdc_sim

#endif  // SDC_SIM_INTEGRATION_RESULT_HPP
