// Ticket: 0004_orbital_mechanics

#ifndef SDC_SIM_CARTESIAN_STATE_HPP
#define SDC_SIM_CARTESIAN_STATE_HPP

#include <Eigen/Dense>

#include "sdc-sim/src/DataTypes/Coordinate.hpp"
#include "sdc-sim/src/DataTypes/Velocity.hpp"

namespace sdc_sim
{

/**
 * @brief Inertial (ECI) position and velocity of an orbiting body
 *
 * Packed state vector (6 components, km and km/s):
 *   [x, y, z, vx, vy, vz]
 */
struct CartesianState
{
  static constexpr Eigen::Index kStateSize = 6;

  Coordinate position;  // [km]
  Velocity velocity;    // [km/s]

  [[nodiscard]] Eigen::VectorXd toStateVector() const;

  /**
   * @brief Unpack a 6-component state vector
   * @throws InvalidDimension if state does not have 6 components
   */
  static CartesianState fromStateVector(const Eigen::VectorXd& state);
};

}  // namespace sdc_sim

#endif  // SDC_SIM_CARTESIAN_STATE_HPP
