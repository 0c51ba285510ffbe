// Ticket: 0005_numerical_integration

#include "sdc-sim/src/Physics/Integration/RungeKutta4Integrator.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace sdc_sim
{

namespace
{

// A remaining interval within this fraction of a step is taken in one go
constexpr double kLandingSlack = 1e-9;

}  // namespace

RungeKutta4Integrator::RungeKutta4Integrator() : config_{}
{
}

RungeKutta4Integrator::RungeKutta4Integrator(const IntegratorConfig& config)
  : config_{config}
{
  if (!(config_.fixedStep > 0.0) || !std::isfinite(config_.fixedStep))
  {
    throw std::invalid_argument{"RK4 step must be positive and finite, got " +
                                std::to_string(config_.fixedStep)};
  }
  if (config_.maxSteps == 0)
  {
    throw std::invalid_argument{"maxSteps must be at least 1"};
  }
}

Eigen::VectorXd RungeKutta4Integrator::step(const DerivativeFunction& f,
                                            double t,
                                            const Eigen::VectorXd& y,
                                            double h)
{
  double const halfStep = 0.5 * h;

  Eigen::VectorXd const k1 = f(t, y);
  Eigen::VectorXd const k2 = f(t + halfStep, y + halfStep * k1);
  Eigen::VectorXd const k3 = f(t + halfStep, y + halfStep * k2);
  Eigen::VectorXd const k4 = f(t + h, y + h * k3);

  return y + (h / 6.0) * (k1 + 2.0 * k2 + 2.0 * k3 + k4);
}

IntegrationResult RungeKutta4Integrator::integrate(
  const DerivativeFunction& f,
  const Eigen::VectorXd& y0,
  double t0,
  double tEnd,
  const std::vector<double>& evaluationTimes,
  const StateProjection& projection) const
{
  if (auto problem = detail::validateRequest(y0, t0, tEnd, evaluationTimes))
  {
    return detail::failedResult(IntegrationStatus::InvalidInput,
                                std::move(*problem));
  }

  bool const dense = evaluationTimes.empty();
  double const h = config_.fixedStep;

  IntegrationResult result;
  double t = t0;
  Eigen::VectorXd y = y0;

  if (dense)
  {
    result.times.push_back(t);
    result.states.push_back(y);
  }

  for (double const stop : detail::stopTimes(tEnd, evaluationTimes))
  {
    while (t < stop)
    {
      if (result.acceptedSteps >= config_.maxSteps)
      {
        result.status = IntegrationStatus::MaxStepsExceeded;
        result.message = "stopped at t = " + std::to_string(t) + " after " +
                         std::to_string(result.acceptedSteps) + " steps";
        return result;
      }

      double const remaining = stop - t;
      bool const landing = remaining <= h * (1.0 + kLandingSlack);
      double const dt = landing ? remaining : h;

      y = step(f, t, y, dt);
      result.functionEvaluations += 4;
      t = landing ? stop : t + dt;

      if (projection)
      {
        projection(y);
      }

      if (!y.allFinite())
      {
        result.status = IntegrationStatus::NonFiniteState;
        result.message =
          "state became non-finite at t = " + std::to_string(t);
        return result;
      }

      ++result.acceptedSteps;
      if (dense)
      {
        result.times.push_back(t);
        result.states.push_back(y);
      }
    }

    if (!dense)
    {
      result.times.push_back(stop);
      result.states.push_back(y);
    }
  }

  return result;
}

}  // namespace sdc_sim
