#ifndef SDC_SIM_QUATERNION_HPP
#define SDC_SIM_QUATERNION_HPP

#include <Eigen/Dense>

#include "sdc-sim/src/DataTypes/QuatDBase.hpp"

namespace sdc_sim
{

/**
 * @brief Quaternion type with scalar-first packing
 *
 * Thin wrapper around Eigen::Quaterniond providing:
 * - Access to underlying Eigen quaternion via eigen()
 * - fromScalarFirst/toScalarFirst for [q0, q1, q2, q3] state vectors
 *
 * A unit quaternion represents an attitude. The wrapper does not enforce
 * unit norm; use normalizeQuaternion() after composition chains.
 */
struct QuaternionD final : detail::QuatDBase<QuaternionD>
{
  using QuatDBase::QuatDBase;
  using QuatDBase::operator=;

  QuaternionD() = default;

  static QuaternionD fromScalarFirst(const Eigen::Vector4d& q)
  {
    return QuaternionD{q[0], q[1], q[2], q[3]};
  }

  [[nodiscard]] Eigen::Vector4d toScalarFirst() const
  {
    return Eigen::Vector4d{w(), x(), y(), z()};
  }

  // Rule of Zero
  QuaternionD(const QuaternionD&) = default;
  QuaternionD(QuaternionD&&) noexcept = default;
  QuaternionD& operator=(const QuaternionD&) = default;
  QuaternionD& operator=(QuaternionD&&) noexcept = default;
  ~QuaternionD() = default;
};

}  // namespace sdc_sim

#endif  // SDC_SIM_QUATERNION_HPP
