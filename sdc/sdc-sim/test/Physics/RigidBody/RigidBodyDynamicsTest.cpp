// Ticket: 0003_rigid_body_dynamics

#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <cmath>

#include "sdc-sim/src/Physics/RigidBody/RigidBodyDynamics.hpp"
#include "sdc-sim/src/Rotation/QuaternionOps.hpp"
#include "sdc-sim/src/Utils/Errors.hpp"

using namespace sdc_sim;

// ========== Quaternion Kinematics ==========

TEST(RigidBodyDynamics, OmegaMatrixIsSkewSymmetric)
{
  Eigen::Matrix4d const m = omegaMatrix(AngularVelocity{0.3, -1.2, 0.7});
  EXPECT_LT((m + m.transpose()).cwiseAbs().maxCoeff(), 1e-15);
  EXPECT_DOUBLE_EQ(m(1, 0), 0.3);
  EXPECT_DOUBLE_EQ(m(0, 2), 1.2);
  EXPECT_DOUBLE_EQ(m(1, 2), 0.7);
}

TEST(RigidBodyDynamics, KinematicsMatchesHamiltonProduct)
{
  QuaternionD const q = normalizeQuaternion(QuaternionD{0.8, 0.1, -0.4, 0.3});
  AngularVelocity const w{0.2, -0.5, 1.3};

  Eigen::Vector4d const viaMatrix = quaternionKinematics(q, w);
  Eigen::Vector4d const viaProduct =
    0.5 * quaternionMultiply(q, QuaternionD{0.0, w.x(), w.y(), w.z()})
            .toScalarFirst();

  EXPECT_LT((viaMatrix - viaProduct).norm(), 1e-15);
}

TEST(RigidBodyDynamics, KinematicsPreservesNormToFirstOrder)
{
  QuaternionD const q = normalizeQuaternion(QuaternionD{0.5, 0.5, -0.5, 0.5});
  Eigen::Vector4d const qDot =
    quaternionKinematics(q, AngularVelocity{1.0, 2.0, 3.0});
  EXPECT_NEAR(q.toScalarFirst().dot(qDot), 0.0, 1e-15);
}

TEST(RigidBodyDynamics, KinematicsOfSpinAboutZ)
{
  // Identity attitude spinning at 2 rad/s about Z: q_dot = (0, 0, 0, 1)
  Eigen::Vector4d const qDot =
    quaternionKinematics(QuaternionD{}, AngularVelocity{0.0, 0.0, 2.0});
  EXPECT_DOUBLE_EQ(qDot[0], 0.0);
  EXPECT_DOUBLE_EQ(qDot[3], 1.0);
}

// ========== Euler's Equations ==========

TEST(RigidBodyDynamics, EulerEquationsTorqueFreePrincipalSpin)
{
  // Spin about a principal axis is an equilibrium
  Eigen::Matrix3d const inertia = Eigen::Vector3d{10.0, 20.0, 30.0}.asDiagonal();
  Eigen::Vector3d const wDot =
    eulerEquations(AngularVelocity{0.0, 0.0, 5.0}, inertia);
  EXPECT_LT(wDot.norm(), 1e-15);
}

TEST(RigidBodyDynamics, EulerEquationsGyroscopicCoupling)
{
  Eigen::Matrix3d const inertia = Eigen::Vector3d{100.0, 100.0, 50.0}.asDiagonal();
  AngularVelocity const w{0.1, 0.05, 1.0};
  Eigen::Vector3d const wDot = eulerEquations(w, inertia);

  // I_t w1_dot = (I_t - I_s) w2 w3
  EXPECT_NEAR(wDot.x(), (100.0 - 50.0) * 0.05 * 1.0 / 100.0, 1e-15);
  EXPECT_NEAR(wDot.y(), (50.0 - 100.0) * 0.1 * 1.0 / 100.0, 1e-15);
  EXPECT_NEAR(wDot.z(), 0.0, 1e-15);
}

TEST(RigidBodyDynamics, EulerEquationsAppliesTorque)
{
  Eigen::Matrix3d const inertia = Eigen::Vector3d{2.0, 4.0, 5.0}.asDiagonal();
  Eigen::Vector3d const wDot =
    eulerEquations(AngularVelocity{}, inertia, TorqueVector{1.0, 2.0, 3.0});
  EXPECT_DOUBLE_EQ(wDot.x(), 0.5);
  EXPECT_DOUBLE_EQ(wDot.y(), 0.5);
  EXPECT_DOUBLE_EQ(wDot.z(), 0.6);
}

TEST(RigidBodyDynamics, EulerEquationsOverloadsAgree)
{
  Eigen::Matrix3d m;
  m << 10.0, 1.0, 0.5,  //
    1.0, 12.0, -0.3,    //
    0.5, -0.3, 8.0;
  InertiaTensor const inertia{m};
  AngularVelocity const w{0.3, -0.2, 0.9};
  TorqueVector const tau{0.01, 0.0, -0.02};

  EXPECT_LT((eulerEquations(w, m, tau) - eulerEquations(w, inertia, tau)).norm(),
            1e-14);
}

TEST(RigidBodyDynamics, EulerEquationsSingularInertiaThrows)
{
  Eigen::Matrix3d singular = Eigen::Matrix3d::Identity();
  singular(2, 2) = 0.0;
  EXPECT_THROW(eulerEquations(AngularVelocity{1.0, 0.0, 0.0}, singular),
               SingularInertia);
}

// ========== Conserved Quantities ==========

TEST(RigidBodyDynamics, AngularMomentumAndEnergy)
{
  Eigen::Matrix3d const inertia = Eigen::Vector3d{100.0, 100.0, 50.0}.asDiagonal();
  AngularVelocity const w{0.1, 0.05, 1.0};

  Eigen::Vector3d const h = angularMomentum(w, inertia);
  EXPECT_DOUBLE_EQ(h.x(), 10.0);
  EXPECT_DOUBLE_EQ(h.y(), 5.0);
  EXPECT_DOUBLE_EQ(h.z(), 50.0);
  EXPECT_NEAR(h.norm(), 51.234753829797995, 1e-12);
  EXPECT_NEAR(kineticEnergy(w, inertia), 25.625, 1e-12);
}

TEST(RigidBodyDynamics, EnergyRateVanishesWithoutTorque)
{
  Eigen::Matrix3d m;
  m << 10.0, 1.0, 0.5,  //
    1.0, 12.0, -0.3,    //
    0.5, -0.3, 8.0;
  AngularVelocity const w{0.3, -0.2, 0.9};
  Eigen::Vector3d const wDot = eulerEquations(w, m);

  // dT/dt = w . (I w_dot) = w . (-w x I w) = 0
  EXPECT_NEAR(w.dot(m * wDot), 0.0, 1e-15);
}

// ========== Packed State ==========

TEST(RigidBodyDynamics, AttitudeStatePacking)
{
  AttitudeState state;
  state.orientation = QuaternionD{0.5, 0.5, 0.5, 0.5};
  state.angularVelocity = AngularVelocity{0.1, 0.2, 0.3};

  Eigen::VectorXd const packed = state.toStateVector();
  ASSERT_EQ(packed.size(), 7);
  EXPECT_DOUBLE_EQ(packed[0], 0.5);
  EXPECT_DOUBLE_EQ(packed[6], 0.3);

  AttitudeState const unpacked = AttitudeState::fromStateVector(packed);
  EXPECT_TRUE(unpacked.orientation.isApprox(state.orientation, 1e-15));
  EXPECT_DOUBLE_EQ(unpacked.angularVelocity.y(), 0.2);
}

TEST(RigidBodyDynamics, AttitudeStateWrongSizeThrows)
{
  EXPECT_THROW(AttitudeState::fromStateVector(Eigen::VectorXd::Zero(6)),
               InvalidDimension);
}

TEST(RigidBodyDynamics, AttitudeDerivativeCombinesKinematicsAndDynamics)
{
  InertiaTensor const inertia = InertiaTensor::axisymmetric(100.0, 50.0);
  AttitudeState state;
  state.angularVelocity = AngularVelocity{0.1, 0.05, 1.0};

  Eigen::VectorXd const derivative =
    attitudeDerivative(0.0, state.toStateVector(), inertia);

  Eigen::Vector4d const qDot =
    quaternionKinematics(state.orientation, state.angularVelocity);
  Eigen::Vector3d const wDot = eulerEquations(state.angularVelocity, inertia);

  EXPECT_LT((derivative.head<4>() - qDot).norm(), 1e-15);
  EXPECT_LT((derivative.tail<3>() - wDot).norm(), 1e-15);
}

TEST(RigidBodyDynamics, AttitudeDerivativeUsesTorqueModel)
{
  InertiaTensor const inertia = InertiaTensor::diagonal(2.0, 2.0, 2.0);
  AttitudeState const state{};

  double seenTime = -1.0;
  TorqueFunction const torque = [&seenTime](double t, const AttitudeState&)
  {
    seenTime = t;
    return Eigen::Vector3d{0.0, 4.0, 0.0};
  };

  Eigen::VectorXd const derivative =
    attitudeDerivative(3.5, state.toStateVector(), inertia, torque);
  EXPECT_DOUBLE_EQ(seenTime, 3.5);
  EXPECT_DOUBLE_EQ(derivative[5], 2.0);
}

TEST(RigidBodyDynamics, AttitudeDerivativeWrongSizeThrows)
{
  InertiaTensor const inertia = InertiaTensor::diagonal(1.0, 1.0, 1.0);
  EXPECT_THROW(attitudeDerivative(0.0, Eigen::VectorXd::Zero(4), inertia),
               InvalidDimension);
}
