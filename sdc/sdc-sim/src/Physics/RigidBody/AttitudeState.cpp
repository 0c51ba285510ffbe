// Ticket: 0003_rigid_body_dynamics

#include "sdc-sim/src/Physics/RigidBody/AttitudeState.hpp"

#include <string>

#include "sdc-sim/src/Utils/Errors.hpp"

namespace sdc_sim
{

Eigen::VectorXd AttitudeState::toStateVector() const
{
  Eigen::VectorXd state(kStateSize);
  state.head<4>() = orientation.toScalarFirst();
  state.tail<3>() = angularVelocity;
  return state;
}

AttitudeState AttitudeState::fromStateVector(const Eigen::VectorXd& state)
{
  if (state.size() != kStateSize)
  {
    throw InvalidDimension{"Attitude state requires 7 components, got " +
                           std::to_string(state.size())};
  }

  AttitudeState result;
  result.orientation = QuaternionD::fromScalarFirst(state.head<4>());
  result.angularVelocity = AngularVelocity{state.tail<3>()};
  return result;
}

}  // namespace sdc_sim
