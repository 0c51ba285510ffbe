// Ticket: 0005_numerical_integration

#ifndef SDC_SIM_RUNGE_KUTTA4_INTEGRATOR_HPP
#define SDC_SIM_RUNGE_KUTTA4_INTEGRATOR_HPP

#include "sdc-sim/src/Physics/Integration/Integrator.hpp"
#include "sdc-sim/src/Physics/Integration/IntegratorConfig.hpp"

namespace sdc_sim
{

/**
 * @brief Classical fourth-order Runge-Kutta with a fixed step
 *
 *   k1 = f(t, y)
 *   k2 = f(t + h/2, y + h/2 k1)
 *   k3 = f(t + h/2, y + h/2 k2)
 *   k4 = f(t + h, y + h k3)
 *   y_next = y + h/6 (k1 + 2 k2 + 2 k3 + k4)
 *
 * The last step before each stop time is shortened so the stop is hit
 * exactly.
 */
class RungeKutta4Integrator : public Integrator
{
public:
  RungeKutta4Integrator();

  /**
   * @throws std::invalid_argument if fixedStep is not positive and finite or
   *         maxSteps is zero
   */
  explicit RungeKutta4Integrator(const IntegratorConfig& config);

  ~RungeKutta4Integrator() override = default;

  [[nodiscard]] IntegrationResult integrate(
    const DerivativeFunction& f,
    const Eigen::VectorXd& y0,
    double t0,
    double tEnd,
    const std::vector<double>& evaluationTimes = {},
    const StateProjection& projection = {}) const override;

  [[nodiscard]] std::string_view name() const override
  {
    return "rk4";
  }

  [[nodiscard]] const IntegratorConfig& config() const
  {
    return config_;
  }

  /// Single RK4 step of size h from (t, y)
  static Eigen::VectorXd step(const DerivativeFunction& f,
                              double t,
                              const Eigen::VectorXd& y,
                              double h);

  // Rule of Five
  RungeKutta4Integrator(const RungeKutta4Integrator&) = default;
  RungeKutta4Integrator& operator=(const RungeKutta4Integrator&) = default;
  RungeKutta4Integrator(RungeKutta4Integrator&&) noexcept = default;
  RungeKutta4Integrator& operator=(RungeKutta4Integrator&&) noexcept = default;

private:
  IntegratorConfig config_;
};

}  // namespace sdc_sim

#endif  // SDC_SIM_RUNGE_KUTTA4_INTEGRATOR_HPP
