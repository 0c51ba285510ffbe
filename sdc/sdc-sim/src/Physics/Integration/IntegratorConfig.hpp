// Ticket: 0005_numerical_integration

#ifndef SDC_SIM_INTEGRATOR_CONFIG_HPP
#define SDC_SIM_INTEGRATOR_CONFIG_HPP

#include <cstddef>
#include <limits>

namespace sdc_sim
{

/**
 * @brief Step-size and tolerance settings shared by the integrators
 *
 * RungeKutta4Integrator only reads fixedStep and maxSteps. The remaining
 * fields drive the adaptive step-size controller of DormandPrinceIntegrator.
 */
struct IntegratorConfig
{
  double fixedStep{0.01};  // [s]

  double initialStep{0.0};  // [s], 0 picks 1% of the span
  double minStep{1e-12};    // [s]
  double maxStep{std::numeric_limits<double>::infinity()};  // [s]

  double absoluteTolerance{1e-9};
  double relativeTolerance{1e-9};

  double safetyFactor{0.9};
  double maxGrowth{5.0};   // largest step increase per accepted step
  double minShrink{0.1};   // largest step decrease per rejected step

  // Accepted plus rejected steps before MaxStepsExceeded
  std::size_t maxSteps{1000000};
};

}  // namespace sdc_sim

#endif  // SDC_SIM_INTEGRATOR_CONFIG_HPP
