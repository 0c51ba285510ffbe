// Ticket: 0001_rotation_algebra

#ifndef SDC_SIM_QUATERNION_OPS_HPP
#define SDC_SIM_QUATERNION_OPS_HPP

#include <Eigen/Dense>
#include <span>

#include "sdc-sim/src/DataTypes/EulerAngles.hpp"
#include "sdc-sim/src/DataTypes/Quaternion.hpp"
#include "sdc-sim/src/Rotation/RotationMatrix.hpp"

namespace sdc_sim
{

/**
 * @brief SLERP tuning
 *
 * When cos(theta) between the inputs exceeds linearThreshold (about
 * 0.0255 deg for 0.9995) the interpolation falls back to normalized linear
 * interpolation, avoiding division by a near-zero sin(theta).
 */
struct SlerpConfig
{
  double linearThreshold{0.9995};
};

/**
 * @brief Build a quaternion from 4 scalar-first values [q0, q1, q2, q3]
 * @throws InvalidDimension if values does not hold exactly 4 entries
 */
QuaternionD quaternionFromArray(std::span<const double> values);

/**
 * @brief Hamilton product q1 (x) q2
 *
 * As a composition of rotations, q2 is applied first and q1 second. The
 * product is not commutative.
 */
QuaternionD quaternionMultiply(const QuaternionD& q1, const QuaternionD& q2);

QuaternionD quaternionConjugate(const QuaternionD& q);

/**
 * @brief Multiplicative inverse conj(q) / |q|^2
 * @throws DegenerateInput for the zero quaternion
 */
QuaternionD quaternionInverse(const QuaternionD& q);

/**
 * @brief Scale to unit norm
 * @throws DegenerateInput for the zero quaternion
 */
QuaternionD normalizeQuaternion(const QuaternionD& q);

/**
 * @brief Active rotation matrix of a quaternion
 *
 * The input is normalized first, so quaternionToMatrix(q) * v equals
 * rotateVector(q, v).
 *
 * @throws DegenerateInput for the zero quaternion
 */
Eigen::Matrix3d quaternionToMatrix(const QuaternionD& q);

/**
 * @brief Unit quaternion of a rotation matrix (Shepperd's method)
 *
 * The branch is chosen by the largest of trace, R11, R22 and R33 so the
 * divisor is never small. The result has a non-negative scalar part.
 *
 * @throws InvalidRotation if the matrix fails isValidRotation()
 */
QuaternionD matrixToQuaternion(const Eigen::Matrix3d& rotation,
                               const RotationTolerances& tolerances = {});

/**
 * @brief Spherical linear interpolation between two attitudes
 *
 * Inputs are normalized. If q1 . q2 < 0 then q2 is negated first so the
 * shorter arc is followed.
 *
 * @param t Interpolation parameter in [0, 1]
 * @throws std::invalid_argument if t is outside [0, 1]
 * @throws DegenerateInput if either input is the zero quaternion
 */
QuaternionD slerp(const QuaternionD& q1,
                  const QuaternionD& q2,
                  double t,
                  const SlerpConfig& config = {});

/**
 * @brief Rotate a vector: vec(q (x) (0, v) (x) q^-1)
 * @throws DegenerateInput for the zero quaternion
 */
Eigen::Vector3d rotateVector(const QuaternionD& q, const Eigen::Vector3d& v);

/// Unit quaternion of the 3-2-1 attitude Rz(yaw) Ry(pitch) Rx(roll)
QuaternionD quaternionFromEuler(const EulerAngles& angles);

/**
 * @brief 3-2-1 angles of a quaternion
 *
 * Pitch is clamped to [-pi/2, pi/2]; roll and yaw are in (-pi, pi].
 *
 * @throws DegenerateInput for the zero quaternion
 */
EulerAngles quaternionToEuler(const QuaternionD& q);

/**
 * @brief Rotation by angle about an axis
 * @throws DegenerateInput for a zero axis
 */
QuaternionD axisAngleToQuaternion(const Eigen::Vector3d& axis, double angle);

}  // namespace sdc_sim

#endif  // SDC_SIM_QUATERNION_OPS_HPP
