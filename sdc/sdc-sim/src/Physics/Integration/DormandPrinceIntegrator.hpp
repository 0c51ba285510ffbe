// Ticket: 0005_numerical_integration

#ifndef SDC_SIM_DORMAND_PRINCE_INTEGRATOR_HPP
#define SDC_SIM_DORMAND_PRINCE_INTEGRATOR_HPP

#include "sdc-sim/src/Physics/Integration/Integrator.hpp"
#include "sdc-sim/src/Physics/Integration/IntegratorConfig.hpp"

namespace sdc_sim
{

/**
 * @brief Adaptive Dormand-Prince 5(4) embedded Runge-Kutta integrator
 *
 * Seven stages with the FSAL property: the last stage of an accepted step is
 * the first stage of the next, so a step costs six evaluations. When a
 * projection is supplied the first stage is re-evaluated on the projected
 * state instead.
 *
 * Step control uses the RMS norm of the embedded error scaled by
 * atol + rtol * max(|y_i|, |y5_i|):
 * - accepted (err <= 1): h *= clamp(safety * err^-1/5, minShrink, maxGrowth)
 * - rejected: h *= max(safety * err^-1/4, minShrink)
 *
 * A rejected step that would need h < minStep ends the run with
 * StepSizeUnderflow.
 */
class DormandPrinceIntegrator : public Integrator
{
public:
  DormandPrinceIntegrator();

  /**
   * @throws std::invalid_argument if a tolerance is negative, both
   *         tolerances are zero, the step limits are inconsistent or the
   *         controller factors are out of range
   */
  explicit DormandPrinceIntegrator(const IntegratorConfig& config);

  ~DormandPrinceIntegrator() override = default;

  [[nodiscard]] IntegrationResult integrate(
    const DerivativeFunction& f,
    const Eigen::VectorXd& y0,
    double t0,
    double tEnd,
    const std::vector<double>& evaluationTimes = {},
    const StateProjection& projection = {}) const override;

  [[nodiscard]] std::string_view name() const override
  {
    return "dormand-prince";
  }

  [[nodiscard]] const IntegratorConfig& config() const
  {
    return config_;
  }

  // Rule of Five
  DormandPrinceIntegrator(const DormandPrinceIntegrator&) = default;
  DormandPrinceIntegrator& operator=(const DormandPrinceIntegrator&) = default;
  DormandPrinceIntegrator(DormandPrinceIntegrator&&) noexcept = default;
  DormandPrinceIntegrator& operator=(DormandPrinceIntegrator&&) noexcept =
    default;

private:
  [[nodiscard]] double errorNorm(const Eigen::VectorXd& y,
                                 const Eigen::VectorXd& yNext,
                                 const Eigen::VectorXd& errorEstimate) const;

  [[nodiscard]] double initialStep(double span) const;

  IntegratorConfig config_;
};

}  // namespace sdc_sim

#endif  // SDC_SIM_DORMAND_PRINCE_INTEGRATOR_HPP
