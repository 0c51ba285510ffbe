// Ticket: 0001_rotation_algebra

#ifndef SDC_SIM_ROTATION_MATRIX_HPP
#define SDC_SIM_ROTATION_MATRIX_HPP

#include <Eigen/Dense>
#include <array>
#include <span>
#include <string_view>

#include "sdc-sim/src/DataTypes/EulerAngles.hpp"

namespace sdc_sim
{

/// Principal axis of an elementary rotation
enum class Axis
{
  X,
  Y,
  Z
};

/**
 * @brief Acceptance bounds for treating a 3x3 matrix as a proper rotation
 *
 * orthogonality bounds max |(R^T R - I)_ij|; determinant bounds |det(R) - 1|.
 */
struct RotationTolerances
{
  double orthogonality{1e-6};
  double determinant{1e-6};
};

/**
 * @brief Active right-handed rotation about a principal axis
 *
 * Rz(a) = [[cos a, -sin a, 0], [sin a, cos a, 0], [0, 0, 1]]; applying the
 * result to a vector rotates the vector by +angle about the axis.
 *
 * @param axis Rotation axis
 * @param angle Rotation angle [rad]
 */
Eigen::Matrix3d elementaryRotation(Axis axis, double angle);

/**
 * @brief Compose three elementary rotations in the order named by a sequence
 *
 * The sequence is three axis digits ('1' = X, '2' = Y, '3' = Z) with no two
 * consecutive axes equal, e.g. "321" or "313". The result is
 *
 *   R = R_a1(angles[0]) * R_a2(angles[1]) * R_a3(angles[2])
 *
 * so "321" with (psi, theta, phi) gives Rz(psi) Ry(theta) Rx(phi).
 *
 * @throws UnsupportedSequence if the sequence is not one of the 12 valid
 *         Euler/Tait-Bryan orderings
 */
Eigen::Matrix3d eulerSequenceToMatrix(const Eigen::Vector3d& angles,
                                      std::string_view sequence);

/**
 * @brief 3-2-1 shortcut taking (roll, pitch, yaw)
 *
 * Equivalent to eulerSequenceToMatrix({yaw, pitch, roll}, "321").
 */
Eigen::Matrix3d eulerAnglesToMatrix(const EulerAngles& angles);

/**
 * @brief Extract Euler angles from a rotation matrix
 *
 * Returns angles in the same order eulerSequenceToMatrix() consumes them.
 * Supported sequences are "321" and "313". At gimbal lock the third angle is
 * set to zero and the combined rotation is assigned to the first.
 *
 * @throws UnsupportedSequence for any other sequence
 */
Eigen::Vector3d matrixToEulerSequence(const Eigen::Matrix3d& rotation,
                                      std::string_view sequence);

/**
 * @brief Check orthogonality and unit determinant within tolerance
 *
 * Non-finite entries always fail.
 */
[[nodiscard]] bool isValidRotation(const Eigen::Matrix3d& rotation,
                                   const RotationTolerances& tolerances = {});

/**
 * @brief Build a 3x3 matrix from 9 values in row-major order
 * @throws InvalidDimension if values does not hold exactly 9 entries
 */
Eigen::Matrix3d rotationMatrixFromArray(std::span<const double> values);

namespace detail
{

/// Parse a sequence string into axes; throws UnsupportedSequence
std::array<Axis, 3> parseSequence(std::string_view sequence);

}  // namespace detail

}  // namespace sdc_sim

#endif  // SDC_SIM_ROTATION_MATRIX_HPP
