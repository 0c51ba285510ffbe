// Ticket: 0005_numerical_integration

#ifndef SDC_SIM_INTEGRATOR_HPP
#define SDC_SIM_INTEGRATOR_HPP

#include <Eigen/Dense>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sdc-sim/src/Physics/Integration/IntegrationResult.hpp"

namespace sdc_sim
{

/// Right-hand side y_dot = f(t, y) of a first-order system
using DerivativeFunction =
  std::function<Eigen::VectorXd(double, const Eigen::VectorXd&)>;

/// In-place correction applied after each accepted step
using StateProjection = std::function<void(Eigen::VectorXd&)>;

/**
 * @brief Abstract interface for integrating an ODE over a time span
 *
 * The state is a dense Eigen::VectorXd so one scheme serves both the
 * 7-component attitude state and the 6-component orbital state.
 * Implementations: RungeKutta4Integrator and DormandPrinceIntegrator.
 *
 * Output grid: when evaluationTimes is non-empty the integrator lands exactly
 * on each of them and only those samples are reported. Otherwise t0 and every
 * accepted step are reported.
 *
 * Only forward integration (tEnd >= t0) is supported.
 *
 * Thread safety: implementations are stateless after construction, so one
 * instance may be shared by concurrent integrate() calls.
 */
class Integrator
{
public:
  virtual ~Integrator() = default;

  /**
   * @brief Integrate y_dot = f(t, y) from t0 to tEnd
   * @param f Derivative function
   * @param y0 Initial state
   * @param t0 Start time [s]
   * @param tEnd End time [s]
   * @param evaluationTimes Strictly increasing output times within [t0, tEnd]
   * @param projection Applied to the state after every accepted step
   * @return Result with status InvalidInput for a malformed request
   */
  [[nodiscard]] virtual IntegrationResult integrate(
    const DerivativeFunction& f,
    const Eigen::VectorXd& y0,
    double t0,
    double tEnd,
    const std::vector<double>& evaluationTimes = {},
    const StateProjection& projection = {}) const = 0;

  [[nodiscard]] virtual std::string_view name() const = 0;

protected:
  Integrator() = default;
  Integrator(const Integrator&) = default;
  Integrator& operator=(const Integrator&) = default;
  Integrator(Integrator&&) noexcept = default;
  Integrator& operator=(Integrator&&) noexcept = default;
};

namespace detail
{

/**
 * @brief Check an integration request
 * @return Description of the first problem found, or std::nullopt
 */
std::optional<std::string> validateRequest(
  const Eigen::VectorXd& y0,
  double t0,
  double tEnd,
  const std::vector<double>& evaluationTimes);

/// Times the integrator must land on: the evaluation times, or just tEnd
std::vector<double> stopTimes(double tEnd,
                              const std::vector<double>& evaluationTimes);

IntegrationResult failedResult(IntegrationStatus status, std::string message);

}  // namespace detail

}  // namespace sdc_sim

#endif  // SDC_SIM_INTEGRATOR_HPP
