// Ticket: 0003_rigid_body_dynamics

#ifndef SDC_SIM_RIGID_BODY_DYNAMICS_HPP
#define SDC_SIM_RIGID_BODY_DYNAMICS_HPP

#include <Eigen/Dense>
#include <functional>

#include "sdc-sim/src/DataTypes/AngularVelocity.hpp"
#include "sdc-sim/src/DataTypes/Quaternion.hpp"
#include "sdc-sim/src/DataTypes/TorqueVector.hpp"
#include "sdc-sim/src/Physics/RigidBody/AttitudeState.hpp"
#include "sdc-sim/src/Physics/RigidBody/InertiaTensor.hpp"

namespace sdc_sim
{

/**
 * @brief External torque model in body axes [N m]
 *
 * Called with the current time and attitude state. An empty function means
 * torque-free motion.
 */
using TorqueFunction =
  std::function<Eigen::Vector3d(double, const AttitudeState&)>;

/**
 * @brief 4x4 skew matrix of a body rate for scalar-first quaternions
 *
 *   Omega(w) = [[ 0, -wx, -wy, -wz],
 *               [wx,   0,  wz, -wy],
 *               [wy, -wz,   0,  wx],
 *               [wz,  wy, -wx,   0]]
 */
Eigen::Matrix4d omegaMatrix(const AngularVelocity& omega);

/**
 * @brief Quaternion rate q_dot = 1/2 Omega(w) q
 *
 * Equivalent to 1/2 q (x) (0, w) for a body-frame rate. Valid for any
 * inertia.
 *
 * @return Scalar-first quaternion derivative
 */
Eigen::Vector4d quaternionKinematics(const QuaternionD& q,
                                     const AngularVelocity& omega);

/**
 * @brief Euler's rotational equation w_dot = I^-1 (tau - w x (I w))
 * @throws SingularInertia if inertia is not invertible
 */
Eigen::Vector3d eulerEquations(const AngularVelocity& omega,
                               const Eigen::Matrix3d& inertia,
                               const TorqueVector& torque = TorqueVector{});

/// Euler's equation using the cached inverse of a validated tensor
Eigen::Vector3d eulerEquations(const AngularVelocity& omega,
                               const InertiaTensor& inertia,
                               const TorqueVector& torque = TorqueVector{});

/// Body-frame angular momentum h = I w [kg m^2/s]
Eigen::Vector3d angularMomentum(const AngularVelocity& omega,
                                const Eigen::Matrix3d& inertia);

/// Rotational kinetic energy T = 1/2 w^T I w [J]
double kineticEnergy(const AngularVelocity& omega,
                     const Eigen::Matrix3d& inertia);

/**
 * @brief Time derivative of the packed 7-component attitude state
 *
 * Returns [q_dot; w_dot] for the integrator.
 *
 * @param t Time [s], forwarded to the torque model
 * @param state Packed [q0, q1, q2, q3, wx, wy, wz]
 * @param torque External torque model; empty for torque-free motion
 * @throws InvalidDimension if state does not have 7 components
 */
Eigen::VectorXd attitudeDerivative(double t,
                                   const Eigen::VectorXd& state,
                                   const InertiaTensor& inertia,
                                   const TorqueFunction& torque = {});

}  // namespace sdc_sim

#endif  // SDC_SIM_RIGID_BODY_DYNAMICS_HPP
