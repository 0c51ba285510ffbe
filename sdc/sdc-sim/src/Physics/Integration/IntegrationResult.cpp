// Ticket: 0005_numerical_integration

#include "sdc-sim/src/Physics/Integration/IntegrationResult.hpp"

#include <stdexcept>

#include "sdc-sim/src/Utils/Errors.hpp"

namespace sdc_sim
{

std::string_view toString(IntegrationStatus status)
{
  switch (status)
  {
    case IntegrationStatus::Success:
      return "success";
    case IntegrationStatus::MaxStepsExceeded:
      return "max steps exceeded";
    case IntegrationStatus::StepSizeUnderflow:
      return "step size underflow";
    case IntegrationStatus::NonFiniteState:
      return "non-finite state";
    case IntegrationStatus::InvalidInput:
      return "invalid input";
  }
  return "unknown";
}

void IntegrationResult::throwIfFailed() const
{
  if (success())
  {
    return;
  }

  std::string what{"Integration failed ("};
  what += toString(status);
  what += ")";
  if (!message.empty())
  {
    what += ": " + message;
  }
  throw IntegrationFailure{what};
}

const Eigen::VectorXd& IntegrationResult::finalState() const
{
  if (states.empty())
  {
    throw std::out_of_range{"Integration result holds no states"};
  }
  return states.back();
}

}  // namespace sdc_sim
