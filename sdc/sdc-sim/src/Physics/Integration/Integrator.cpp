// Ticket: 0005_numerical_integration

#include "sdc-sim/src/Physics/Integration/Integrator.hpp"

#include <cmath>
#include <cstddef>
#include <utility>

namespace sdc_sim::detail
{

std::optional<std::string> validateRequest(
  const Eigen::VectorXd& y0,
  double t0,
  double tEnd,
  const std::vector<double>& evaluationTimes)
{
  if (y0.size() == 0)
  {
    return "initial state is empty";
  }
  if (!y0.allFinite())
  {
    return "initial state is not finite";
  }
  if (!std::isfinite(t0) || !std::isfinite(tEnd))
  {
    return "time span is not finite";
  }
  if (tEnd < t0)
  {
    return "end time precedes start time";
  }

  for (std::size_t i = 0; i < evaluationTimes.size(); ++i)
  {
    double const t = evaluationTimes[i];
    if (!(t >= t0 && t <= tEnd))
    {
      return "evaluation time " + std::to_string(t) +
             " lies outside the integration span";
    }
    if (i > 0 && !(t > evaluationTimes[i - 1]))
    {
      return "evaluation times must be strictly increasing";
    }
  }
  return std::nullopt;
}

std::vector<double> stopTimes(double tEnd,
                              const std::vector<double>& evaluationTimes)
{
  if (evaluationTimes.empty())
  {
    return {tEnd};
  }
  return evaluationTimes;
}

IntegrationResult failedResult(IntegrationStatus status, std::string message)
{
  IntegrationResult result;
  result.status = status;
  result.message = std::move(message);
  return result;
}

}  // namespace sdc_sim::detail
