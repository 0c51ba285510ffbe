#ifndef SDC_SIM_EULER_ANGLES_HPP
#define SDC_SIM_EULER_ANGLES_HPP

#include <Eigen/Dense>
#include <cmath>
#include <numbers>

namespace sdc_sim
{

/**
 * @brief 3-2-1 (yaw-pitch-roll) Euler angles [rad]
 *
 * Component order is (phi, theta, psi):
 * - roll  (phi):   rotation about X (component 0)
 * - pitch (theta): rotation about Y (component 1)
 * - yaw   (psi):   rotation about Z (component 2)
 *
 * The attitude they describe is R = Rz(yaw) * Ry(pitch) * Rx(roll).
 *
 * Values are stored as given; use normalized() to wrap to (-pi, pi].
 */
class EulerAngles final : public Eigen::Vector3d
{
public:
  // Level attitude
  EulerAngles() : Eigen::Vector3d{0.0, 0.0, 0.0}
  {
  }

  // Constructor with roll, pitch, yaw values (in radians)
  EulerAngles(double roll, double pitch, double yaw)
    : Eigen::Vector3d{roll, pitch, yaw}
  {
  }

  template <typename OtherDerived>
  EulerAngles(const Eigen::MatrixBase<OtherDerived>&
                other)  // NOLINT(google-explicit-constructor)
    : Eigen::Vector3d{other}
  {
  }

  template <typename OtherDerived>
  EulerAngles& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector3d::operator=(other);
    return *this;
  }

  [[nodiscard]] double roll() const
  {
    return (*this)[0];
  }

  [[nodiscard]] double pitch() const
  {
    return (*this)[1];
  }

  [[nodiscard]] double yaw() const
  {
    return (*this)[2];
  }

  [[nodiscard]] double rollDeg() const
  {
    return roll() * 180.0 / std::numbers::pi;
  }

  [[nodiscard]] double pitchDeg() const
  {
    return pitch() * 180.0 / std::numbers::pi;
  }

  [[nodiscard]] double yawDeg() const
  {
    return yaw() * 180.0 / std::numbers::pi;
  }

  static EulerAngles fromDegrees(double rollDeg, double pitchDeg, double yawDeg)
  {
    constexpr double kDegToRad = std::numbers::pi / 180.0;
    return EulerAngles{rollDeg * kDegToRad, pitchDeg * kDegToRad,
                       yawDeg * kDegToRad};
  }

  // Explicit full normalization to (-pi, pi]
  [[nodiscard]] EulerAngles normalized() const
  {
    return EulerAngles{
      normalizeAngle(roll()), normalizeAngle(pitch()), normalizeAngle(yaw())};
  }

  // Rule of Zero
  EulerAngles(const EulerAngles&) = default;
  EulerAngles(EulerAngles&&) noexcept = default;
  EulerAngles& operator=(const EulerAngles&) = default;
  EulerAngles& operator=(EulerAngles&&) noexcept = default;
  ~EulerAngles() = default;

private:
  /// Normalize angle to (-pi, pi]
  static double normalizeAngle(double rad)
  {
    double const result =
      std::fmod(rad + std::numbers::pi, 2.0 * std::numbers::pi);
    if (result <= 0.0)
    {
      return result + std::numbers::pi;
    }
    return result - std::numbers::pi;
  }
};

}  // namespace sdc_sim

#endif  // SDC_SIM_EULER_ANGLES_HPP
