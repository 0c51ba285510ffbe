#ifndef SDC_SIM_COORDINATE_HPP
#define SDC_SIM_COORDINATE_HPP

#include "sdc-sim/src/DataTypes/Vec3DBase.hpp"

namespace sdc_sim
{

/**
 * @brief 3D position vector
 *
 * Orbital positions are expressed in [km]; body-frame geometry in [m].
 * The frame is implied by the owning state (ECI unless stated otherwise).
 */
struct Coordinate final : detail::Vec3DBase<Coordinate>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  Coordinate() = default;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Coordinate(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }

  // Rule of Zero
  Coordinate(const Coordinate&) = default;
  Coordinate(Coordinate&&) noexcept = default;
  Coordinate& operator=(const Coordinate&) = default;
  Coordinate& operator=(Coordinate&&) noexcept = default;
  ~Coordinate() = default;
};

}  // namespace sdc_sim

#endif  // SDC_SIM_COORDINATE_HPP
