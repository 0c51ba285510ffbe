// Ticket: 0003_rigid_body_dynamics

#ifndef SDC_SIM_ATTITUDE_STATE_HPP
#define SDC_SIM_ATTITUDE_STATE_HPP

#include <Eigen/Dense>

#include "sdc-sim/src/DataTypes/AngularVelocity.hpp"
#include "sdc-sim/src/DataTypes/Quaternion.hpp"

namespace sdc_sim
{

/**
 * @brief Rotational state of a rigid body
 *
 * orientation rotates body-frame vectors into the inertial frame;
 * angularVelocity is expressed in body axes.
 *
 * Packed state vector (7 components):
 *   [q0, q1, q2, q3, wx, wy, wz]
 */
struct AttitudeState
{
  static constexpr Eigen::Index kStateSize = 7;

  QuaternionD orientation{};          // Identity (w, x, y, z)
  AngularVelocity angularVelocity{};  // [rad/s]

  [[nodiscard]] Eigen::VectorXd toStateVector() const;

  /**
   * @brief Unpack a 7-component state vector
   * @throws InvalidDimension if state does not have 7 components
   */
  static AttitudeState fromStateVector(const Eigen::VectorXd& state);
};

}  // namespace sdc_sim

#endif  // SDC_SIM_ATTITUDE_STATE_HPP
