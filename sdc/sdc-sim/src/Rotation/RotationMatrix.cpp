// Ticket: 0001_rotation_algebra

#include "sdc-sim/src/Rotation/RotationMatrix.hpp"

#include <cmath>
#include <string>

#include "sdc-sim/src/Utils/Errors.hpp"
#include "sdc-sim/src/Utils/utils.hpp"

namespace sdc_sim
{

namespace
{

// Below this cos(middle angle) the first and third axes coincide
constexpr double kGimbalLockThreshold = 1e-9;

}  // namespace

namespace detail
{

std::array<Axis, 3> parseSequence(std::string_view sequence)
{
  if (sequence.size() != 3)
  {
    throw UnsupportedSequence{"Euler sequence must have 3 axes, got '" +
                              std::string{sequence} + "'"};
  }

  std::array<Axis, 3> axes{};
  for (std::size_t i = 0; i < 3; ++i)
  {
    switch (sequence[i])
    {
      case '1':
        axes[i] = Axis::X;
        break;
      case '2':
        axes[i] = Axis::Y;
        break;
      case '3':
        axes[i] = Axis::Z;
        break;
      default:
        throw UnsupportedSequence{"Unknown axis in Euler sequence '" +
                                  std::string{sequence} + "'"};
    }
  }

  if (axes[0] == axes[1] || axes[1] == axes[2])
  {
    throw UnsupportedSequence{"Consecutive repeated axis in Euler sequence '" +
                              std::string{sequence} + "'"};
  }
  return axes;
}

}  // namespace detail

Eigen::Matrix3d elementaryRotation(Axis axis, double angle)
{
  double const c = std::cos(angle);
  double const s = std::sin(angle);

  Eigen::Matrix3d r;
  switch (axis)
  {
    case Axis::X:
      r << 1.0, 0.0, 0.0, 0.0, c, -s, 0.0, s, c;
      break;
    case Axis::Y:
      r << c, 0.0, s, 0.0, 1.0, 0.0, -s, 0.0, c;
      break;
    case Axis::Z:
      r << c, -s, 0.0, s, c, 0.0, 0.0, 0.0, 1.0;
      break;
  }
  return r;
}

Eigen::Matrix3d eulerSequenceToMatrix(const Eigen::Vector3d& angles,
                                      std::string_view sequence)
{
  auto const axes = detail::parseSequence(sequence);
  return elementaryRotation(axes[0], angles[0]) *
         elementaryRotation(axes[1], angles[1]) *
         elementaryRotation(axes[2], angles[2]);
}

Eigen::Matrix3d eulerAnglesToMatrix(const EulerAngles& angles)
{
  return eulerSequenceToMatrix(
    Eigen::Vector3d{angles.yaw(), angles.pitch(), angles.roll()}, "321");
}

Eigen::Vector3d matrixToEulerSequence(const Eigen::Matrix3d& rotation,
                                      std::string_view sequence)
{
  const auto& r = rotation;

  if (sequence == "321")
  {
    // R = Rz(psi) Ry(theta) Rx(phi); R(2,0) = -sin(theta)
    double const theta = std::asin(clampUnit(-r(2, 0)));
    if (std::hypot(r(0, 0), r(1, 0)) < kGimbalLockThreshold)
    {
      return Eigen::Vector3d{std::atan2(-r(0, 1), r(1, 1)), theta, 0.0};
    }
    return Eigen::Vector3d{std::atan2(r(1, 0), r(0, 0)),
                           theta,
                           std::atan2(r(2, 1), r(2, 2))};
  }

  if (sequence == "313")
  {
    // R = Rz(alpha) Rx(beta) Rz(gamma); R(2,2) = cos(beta)
    double const beta = std::acos(clampUnit(r(2, 2)));
    if (std::hypot(r(0, 2), r(1, 2)) < kGimbalLockThreshold)
    {
      return Eigen::Vector3d{std::atan2(r(1, 0), r(0, 0)), beta, 0.0};
    }
    return Eigen::Vector3d{std::atan2(r(0, 2), -r(1, 2)),
                           beta,
                           std::atan2(r(2, 0), r(2, 1))};
  }

  // Valid but unimplemented orderings get a distinct message
  detail::parseSequence(sequence);
  throw UnsupportedSequence{"Angle extraction is not implemented for '" +
                            std::string{sequence} + "'"};
}

bool isValidRotation(const Eigen::Matrix3d& rotation,
                     const RotationTolerances& tolerances)
{
  if (!rotation.allFinite())
  {
    return false;
  }

  double const orthogonalityError =
    (rotation.transpose() * rotation - Eigen::Matrix3d::Identity())
      .cwiseAbs()
      .maxCoeff();
  double const determinantError = std::abs(rotation.determinant() - 1.0);

  return orthogonalityError <= tolerances.orthogonality &&
         determinantError <= tolerances.determinant;
}

Eigen::Matrix3d rotationMatrixFromArray(std::span<const double> values)
{
  if (values.size() != 9)
  {
    throw InvalidDimension{"Rotation matrix requires 9 values, got " +
                           std::to_string(values.size())};
  }

  Eigen::Matrix3d m;
  for (Eigen::Index row = 0; row < 3; ++row)
  {
    for (Eigen::Index col = 0; col < 3; ++col)
    {
      m(row, col) = values[static_cast<std::size_t>(row * 3 + col)];
    }
  }
  return m;
}

}  // namespace sdc_sim
