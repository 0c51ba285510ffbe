#ifndef SDC_SIM_VELOCITY_HPP
#define SDC_SIM_VELOCITY_HPP

#include "sdc-sim/src/DataTypes/Vec3DBase.hpp"

namespace sdc_sim
{

/**
 * @brief 3D velocity vector type [km/s for orbital states]
 */
struct Velocity final : detail::Vec3DBase<Velocity>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  Velocity() = default;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Velocity(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }

  // Rule of Zero
  Velocity(const Velocity&) = default;
  Velocity(Velocity&&) noexcept = default;
  Velocity& operator=(const Velocity&) = default;
  Velocity& operator=(Velocity&&) noexcept = default;
  ~Velocity() = default;
};

}  // namespace sdc_sim

#endif  // SDC_SIM_VELOCITY_HPP
