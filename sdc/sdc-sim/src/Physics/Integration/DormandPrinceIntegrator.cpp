// Ticket: 0005_numerical_integration

#include "sdc-sim/src/Physics/Integration/DormandPrinceIntegrator.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace sdc_sim
{

namespace
{

// Butcher tableau
constexpr double c2 = 1.0 / 5.0;
constexpr double c3 = 3.0 / 10.0;
constexpr double c4 = 4.0 / 5.0;
constexpr double c5 = 8.0 / 9.0;

constexpr double a21 = 1.0 / 5.0;
constexpr double a31 = 3.0 / 40.0;
constexpr double a32 = 9.0 / 40.0;
constexpr double a41 = 44.0 / 45.0;
constexpr double a42 = -56.0 / 15.0;
constexpr double a43 = 32.0 / 9.0;
constexpr double a51 = 19372.0 / 6561.0;
constexpr double a52 = -25360.0 / 2187.0;
constexpr double a53 = 64448.0 / 6561.0;
constexpr double a54 = -212.0 / 729.0;
constexpr double a61 = 9017.0 / 3168.0;
constexpr double a62 = -355.0 / 33.0;
constexpr double a63 = 46732.0 / 5247.0;
constexpr double a64 = 49.0 / 176.0;
constexpr double a65 = -5103.0 / 18656.0;

// Fifth-order weights (also row 7 of the tableau)
constexpr double b1 = 35.0 / 384.0;
constexpr double b3 = 500.0 / 1113.0;
constexpr double b4 = 125.0 / 192.0;
constexpr double b5 = -2187.0 / 6784.0;
constexpr double b6 = 11.0 / 84.0;

// b - b* (fifth minus fourth order weights)
constexpr double e1 = 71.0 / 57600.0;
constexpr double e3 = -71.0 / 16695.0;
constexpr double e4 = 71.0 / 1920.0;
constexpr double e5 = -17253.0 / 339200.0;
constexpr double e6 = 22.0 / 525.0;
constexpr double e7 = -1.0 / 40.0;

// Fraction of the span used as the first step when none is configured
constexpr double kInitialStepFraction = 0.01;

}  // namespace

DormandPrinceIntegrator::DormandPrinceIntegrator() : config_{}
{
}

DormandPrinceIntegrator::DormandPrinceIntegrator(const IntegratorConfig& config)
  : config_{config}
{
  if (config_.absoluteTolerance < 0.0 || config_.relativeTolerance < 0.0)
  {
    throw std::invalid_argument{"Integration tolerances must be >= 0"};
  }
  if (config_.absoluteTolerance == 0.0 && config_.relativeTolerance == 0.0)
  {
    throw std::invalid_argument{
      "At least one integration tolerance must be positive"};
  }
  if (!(config_.minStep > 0.0) || !(config_.maxStep >= config_.minStep))
  {
    throw std::invalid_argument{
      "Step limits must satisfy 0 < minStep <= maxStep"};
  }
  if (config_.initialStep < 0.0)
  {
    throw std::invalid_argument{"initialStep must be >= 0"};
  }
  if (!(config_.safetyFactor > 0.0 && config_.safetyFactor <= 1.0) ||
      !(config_.maxGrowth > 1.0) ||
      !(config_.minShrink > 0.0 && config_.minShrink < 1.0))
  {
    throw std::invalid_argument{
      "Step controller requires 0 < safety <= 1, maxGrowth > 1 and "
      "0 < minShrink < 1"};
  }
  if (config_.maxSteps == 0)
  {
    throw std::invalid_argument{"maxSteps must be at least 1"};
  }
}

double DormandPrinceIntegrator::errorNorm(
  const Eigen::VectorXd& y,
  const Eigen::VectorXd& yNext,
  const Eigen::VectorXd& errorEstimate) const
{
  Eigen::ArrayXd const scale =
    config_.absoluteTolerance +
    config_.relativeTolerance * y.array().abs().max(yNext.array().abs());
  return std::sqrt((errorEstimate.array() / scale).square().mean());
}

double DormandPrinceIntegrator::initialStep(double span) const
{
  double h = config_.initialStep > 0.0 ? config_.initialStep
                                       : kInitialStepFraction * span;
  return std::clamp(h, config_.minStep, config_.maxStep);
}

IntegrationResult DormandPrinceIntegrator::integrate(
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

  IntegrationResult result;
  double t = t0;
  Eigen::VectorXd y = y0;

  if (dense)
  {
    result.times.push_back(t);
    result.states.push_back(y);
  }

  if (tEnd == t0)
  {
    if (!dense)
    {
      result.times.push_back(t0);
      result.states.push_back(y);
    }
    return result;
  }

  Eigen::VectorXd k1 = f(t, y);
  ++result.functionEvaluations;
  if (!k1.allFinite())
  {
    result.status = IntegrationStatus::NonFiniteState;
    result.message = "derivative is not finite at t = " + std::to_string(t);
    return result;
  }

  double h = initialStep(tEnd - t0);

  for (double const stop : detail::stopTimes(tEnd, evaluationTimes))
  {
    while (t < stop)
    {
      if (result.acceptedSteps + result.rejectedSteps >= config_.maxSteps)
      {
        result.status = IntegrationStatus::MaxStepsExceeded;
        result.message = "stopped at t = " + std::to_string(t) + " after " +
                         std::to_string(config_.maxSteps) + " steps";
        return result;
      }

      bool const landing = t + h >= stop;
      double const hTry = landing ? stop - t : h;

      Eigen::VectorXd const k2 = f(t + c2 * hTry, y + hTry * (a21 * k1));
      Eigen::VectorXd const k3 =
        f(t + c3 * hTry, y + hTry * (a31 * k1 + a32 * k2));
      Eigen::VectorXd const k4 =
        f(t + c4 * hTry, y + hTry * (a41 * k1 + a42 * k2 + a43 * k3));
      Eigen::VectorXd const k5 = f(
        t + c5 * hTry,
        y + hTry * (a51 * k1 + a52 * k2 + a53 * k3 + a54 * k4));
      Eigen::VectorXd const k6 =
        f(t + hTry,
          y + hTry * (a61 * k1 + a62 * k2 + a63 * k3 + a64 * k4 + a65 * k5));

      Eigen::VectorXd yNext =
        y + hTry * (b1 * k1 + b3 * k3 + b4 * k4 + b5 * k5 + b6 * k6);
      Eigen::VectorXd const k7 = f(t + hTry, yNext);
      result.functionEvaluations += 6;

      Eigen::VectorXd const errorEstimate =
        hTry * (e1 * k1 + e3 * k3 + e4 * k4 + e5 * k5 + e6 * k6 + e7 * k7);
      double const err = errorNorm(y, yNext, errorEstimate);

      if (!std::isfinite(err) || err > 1.0)
      {
        // Non-finite trial states are treated as a maximal rejection
        ++result.rejectedSteps;
        double const factor =
          std::isfinite(err)
            ? std::max(config_.safetyFactor * std::pow(err, -0.25),
                       config_.minShrink)
            : config_.minShrink;
        h = hTry * factor;
        if (h < config_.minStep)
        {
          result.status = IntegrationStatus::StepSizeUnderflow;
          result.message = "step size " + std::to_string(h) +
                           " fell below minStep at t = " + std::to_string(t);
          return result;
        }
        continue;
      }

      ++result.acceptedSteps;
      t = landing ? stop : t + hTry;

      double const factor =
        err == 0.0 ? config_.maxGrowth
                   : std::clamp(config_.safetyFactor * std::pow(err, -0.2),
                                config_.minShrink,
                                config_.maxGrowth);
      double const proposed = hTry * factor;
      // A step shortened to land on a stop should not shrink the next one
      h = std::min(landing ? std::max(h, proposed) : proposed,
                   config_.maxStep);
      h = std::max(h, config_.minStep);

      if (projection)
      {
        projection(yNext);
        k1 = f(t, yNext);
        ++result.functionEvaluations;
      }
      else
      {
        k1 = k7;
      }
      y = std::move(yNext);

      if (!y.allFinite() || !k1.allFinite())
      {
        result.status = IntegrationStatus::NonFiniteState;
        result.message =
          "state became non-finite at t = " + std::to_string(t);
        return result;
      }

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
