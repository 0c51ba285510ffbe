#ifndef SDC_SIM_TORQUE_VECTOR_HPP
#define SDC_SIM_TORQUE_VECTOR_HPP

#include "sdc-sim/src/DataTypes/Vec3DBase.hpp"

namespace sdc_sim
{

/**
 * @brief 3D torque vector type [N*m], body frame
 */
struct TorqueVector final : detail::Vec3DBase<TorqueVector>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  TorqueVector() = default;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  TorqueVector(const Eigen::MatrixBase<OtherDerived>& other)
    : Vec3DBase{other}
  {
  }

  // Rule of Zero
  TorqueVector(const TorqueVector&) = default;
  TorqueVector(TorqueVector&&) noexcept = default;
  TorqueVector& operator=(const TorqueVector&) = default;
  TorqueVector& operator=(TorqueVector&&) noexcept = default;
  ~TorqueVector() = default;
};

}  // namespace sdc_sim

#endif  // SDC_SIM_TORQUE_VECTOR_HPP
