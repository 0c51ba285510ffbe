// Shared base of the attitude quaternion types

#ifndef SDC_SIM_QUATD_BASE_HPP
#define SDC_SIM_QUATD_BASE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <Eigen/Geometry>

namespace sdc_sim::detail
{

/**
 * @brief Hamilton quaternion held by value around an Eigen::Quaterniond
 *
 * Arithmetic that returns a quaternion yields Derived, so products of
 * attitudes stay in the strong type.
 *
 * Hamilton convention: q = w + xi + yj + zk. Component constructors take the
 * scalar first, which is also the order used at every public API boundary.
 * Eigen stores the coefficients as (x, y, z, w) internally.
 *
 * @tparam Derived Concrete quaternion type
 */
template <typename Derived>
class QuatDBase
{
public:
  // Identity attitude
  QuatDBase() : quat_{Eigen::Quaterniond::Identity()}
  {
  }

  // Construct from components (w, x, y, z)
  QuatDBase(double w, double x, double y, double z) : quat_{w, x, y, z}
  {
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  QuatDBase(const Eigen::Quaterniond& quat) : quat_{quat}
  {
  }

  QuatDBase& operator=(const Eigen::Quaterniond& other)
  {
    quat_ = other;
    return *this;
  }

  [[nodiscard]] double w() const
  {
    return quat_.w();
  }
  [[nodiscard]] double x() const
  {
    return quat_.x();
  }
  [[nodiscard]] double y() const
  {
    return quat_.y();
  }
  [[nodiscard]] double z() const
  {
    return quat_.z();
  }

  // Stored Eigen quaternion, for Eigen geometry calls
  [[nodiscard]] const Eigen::Quaterniond& eigen() const
  {
    return quat_;
  }

  // Vector (imaginary) part
  [[nodiscard]] Eigen::Vector3d vec() const
  {
    return quat_.vec();
  }

  // Hamilton product, this (x) other: other is applied first
  [[nodiscard]] Derived operator*(const QuatDBase& other) const
  {
    return Derived{quat_ * other.quat_};
  }

  [[nodiscard]] Derived operator-() const
  {
    return Derived{-quat_.w(), -quat_.x(), -quat_.y(), -quat_.z()};
  }

  [[nodiscard]] double dot(const QuatDBase& other) const
  {
    return quat_.dot(other.quat_);
  }

  [[nodiscard]] double norm() const
  {
    return quat_.norm();
  }

  [[nodiscard]] double squaredNorm() const
  {
    return quat_.squaredNorm();
  }

  /// Component-wise comparison within tolerance (does not identify q and -q)
  [[nodiscard]] bool isApprox(const QuatDBase& other, double tolerance) const
  {
    return (quat_.coeffs() - other.quat_.coeffs()).norm() < tolerance;
  }

  // Rule of Zero
  QuatDBase(const QuatDBase&) = default;
  QuatDBase(QuatDBase&&) noexcept = default;
  QuatDBase& operator=(const QuatDBase&) = default;
  QuatDBase& operator=(QuatDBase&&) noexcept = default;
  ~QuatDBase() = default;

protected:
  Eigen::Quaterniond quat_;
};

}  // namespace sdc_sim::detail

// NOLINTEND(bugprone-crtp-constructor-accessibility)

#endif  // SDC_SIM_QUATD_BASE_HPP
