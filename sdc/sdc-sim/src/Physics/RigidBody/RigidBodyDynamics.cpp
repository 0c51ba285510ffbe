// Ticket: 0003_rigid_body_dynamics

#include "sdc-sim/src/Physics/RigidBody/RigidBodyDynamics.hpp"

#include "sdc-sim/src/Utils/Errors.hpp"

namespace sdc_sim
{

Eigen::Matrix4d omegaMatrix(const AngularVelocity& omega)
{
  double const wx = omega.x();
  double const wy = omega.y();
  double const wz = omega.z();

  Eigen::Matrix4d m;
  m << 0.0, -wx, -wy, -wz,  //
    wx, 0.0, wz, -wy,       //
    wy, -wz, 0.0, wx,       //
    wz, wy, -wx, 0.0;
  return m;
}

Eigen::Vector4d quaternionKinematics(const QuaternionD& q,
                                     const AngularVelocity& omega)
{
  return 0.5 * omegaMatrix(omega) * q.toScalarFirst();
}

Eigen::Vector3d eulerEquations(const AngularVelocity& omega,
                               const Eigen::Matrix3d& inertia,
                               const TorqueVector& torque)
{
  Eigen::FullPivLU<Eigen::Matrix3d> const lu{inertia};
  if (!inertia.allFinite() || !lu.isInvertible())
  {
    throw SingularInertia{"Inertia tensor is not invertible"};
  }

  Eigen::Vector3d const gyroscopic = omega.cross(inertia * omega);
  return lu.solve(torque - gyroscopic);
}

Eigen::Vector3d eulerEquations(const AngularVelocity& omega,
                               const InertiaTensor& inertia,
                               const TorqueVector& torque)
{
  Eigen::Vector3d const gyroscopic = omega.cross(inertia.matrix() * omega);
  return inertia.inverse() * (torque - gyroscopic);
}

Eigen::Vector3d angularMomentum(const AngularVelocity& omega,
                                const Eigen::Matrix3d& inertia)
{
  return inertia * omega;
}

double kineticEnergy(const AngularVelocity& omega,
                     const Eigen::Matrix3d& inertia)
{
  return 0.5 * omega.dot(inertia * omega);
}

Eigen::VectorXd attitudeDerivative(double t,
                                   const Eigen::VectorXd& state,
                                   const InertiaTensor& inertia,
                                   const TorqueFunction& torque)
{
  AttitudeState const current = AttitudeState::fromStateVector(state);

  TorqueVector external{};
  if (torque)
  {
    external = torque(t, current);
  }

  Eigen::VectorXd derivative(AttitudeState::kStateSize);
  derivative.head<4>() =
    quaternionKinematics(current.orientation, current.angularVelocity);
  derivative.tail<3>() =
    eulerEquations(current.angularVelocity, inertia, external);
  return derivative;
}

}  // namespace sdc_sim
