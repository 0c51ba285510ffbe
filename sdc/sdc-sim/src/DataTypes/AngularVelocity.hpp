#ifndef SDC_SIM_ANGULAR_VELOCITY_HPP
#define SDC_SIM_ANGULAR_VELOCITY_HPP

#include <cmath>

#include "sdc-sim/src/DataTypes/Vec3DBase.hpp"

namespace sdc_sim
{

/**
 * @brief Body-frame angular velocity [rad/s] without normalization
 *
 * Components are (omega1, omega2, omega3) about the body principal axes.
 * For axisymmetric bodies the third axis is the symmetry (spin) axis, so
 * spin() and transverse() give the natural decomposition used by the
 * torque-free nutation solution.
 *
 * Rates can exceed 2pi rad/s and are never wrapped.
 */
struct AngularVelocity final : detail::Vec3DBase<AngularVelocity>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  AngularVelocity() = default;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  AngularVelocity(const Eigen::MatrixBase<OtherDerived>& other)
    : Vec3DBase{other}
  {
  }

  /// Spin component about the third body axis
  [[nodiscard]] double spin() const
  {
    return z();
  }

  /// Magnitude of the component perpendicular to the third body axis
  [[nodiscard]] double transverse() const
  {
    return std::hypot(x(), y());
  }

  // Rule of Zero
  AngularVelocity(const AngularVelocity&) = default;
  AngularVelocity(AngularVelocity&&) noexcept = default;
  AngularVelocity& operator=(const AngularVelocity&) = default;
  AngularVelocity& operator=(AngularVelocity&&) noexcept = default;
  ~AngularVelocity() = default;
};

}  // namespace sdc_sim

#endif  // SDC_SIM_ANGULAR_VELOCITY_HPP
