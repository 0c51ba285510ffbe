// Shared base of the strong-typed 3-vectors (position, velocity, rates)

#ifndef SDC_SIM_VEC3D_BASE_HPP
#define SDC_SIM_VEC3D_BASE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <Eigen/Dense>
#include <span>
#include <string>

#include "sdc-sim/src/Utils/Errors.hpp"

namespace sdc_sim::detail
{

/**
 * @brief Eigen::Vector3d with a distinct C++ type per physical quantity
 *
 * Coordinate [km], Velocity [km/s], AngularVelocity [rad/s] and
 * TorqueVector [N m] derive from this so that a position cannot be passed
 * where a velocity is expected, while Eigen arithmetic still applies.
 * Construction from raw arrays checks the component count and unit()
 * rejects the zero vector.
 *
 * @tparam Derived Concrete quantity type returned by unit() and fromArray()
 */
template <typename Derived>
class Vec3DBase : public Eigen::Vector3d
{
public:
  static constexpr Eigen::Index X = 0;
  static constexpr Eigen::Index Y = 1;
  static constexpr Eigen::Index Z = 2;

  Vec3DBase() : Eigen::Vector3d{0.0, 0.0, 0.0}
  {
  }

  Vec3DBase(double x, double y, double z) : Eigen::Vector3d{x, y, z}
  {
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::Vector3d& vec) : Eigen::Vector3d{vec}
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector3d{other}
  {
  }

  template <typename OtherDerived>
  Vec3DBase& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector3d::operator=(other);
    return *this;
  }

  /**
   * @brief Build from a raw component array
   * @throws InvalidDimension if the array does not hold exactly 3 values
   */
  static Derived fromArray(std::span<const double> values)
  {
    if (values.size() != 3)
    {
      throw InvalidDimension{"3D vector requires 3 components, got " +
                             std::to_string(values.size())};
    }
    return Derived{values[0], values[1], values[2]};
  }

  /**
   * @brief Unit vector in the same direction
   * @throws DegenerateInput for a zero vector
   */
  [[nodiscard]] Derived unit() const
  {
    double const n = this->norm();
    if (n == 0.0)
    {
      throw DegenerateInput{"Cannot take the direction of a zero vector"};
    }
    return Derived{static_cast<const Eigen::Vector3d&>(*this) / n};
  }

  // Rule of Zero
  Vec3DBase(const Vec3DBase&) = default;
  Vec3DBase(Vec3DBase&&) noexcept = default;
  Vec3DBase& operator=(const Vec3DBase&) = default;
  Vec3DBase& operator=(Vec3DBase&&) noexcept = default;
  ~Vec3DBase() = default;
};

}  // namespace sdc_sim::detail

// NOLINTEND(bugprone-crtp-constructor-accessibility)

#endif  // SDC_SIM_VEC3D_BASE_HPP
