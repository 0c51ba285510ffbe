// Ticket: 0004_orbital_mechanics

#include "sdc-sim/src/Physics/Orbit/CartesianState.hpp"

#include <string>

#include "sdc-sim/src/Utils/Errors.hpp"

namespace sdc_sim
{

Eigen::VectorXd CartesianState::toStateVector() const
{
  Eigen::VectorXd state(kStateSize);
  state.head<3>() = position;
  state.tail<3>() = velocity;
  return state;
}

CartesianState CartesianState::fromStateVector(const Eigen::VectorXd& state)
{
  if (state.size() != kStateSize)
  {
    throw InvalidDimension{"Orbital state requires 6 components, got " +
                           std::to_string(state.size())};
  }

  CartesianState result;
  result.position = Coordinate{state.head<3>()};
  result.velocity = Velocity{state.tail<3>()};
  return result;
}

}  // namespace sdc_sim
