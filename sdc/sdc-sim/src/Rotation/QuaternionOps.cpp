// Ticket: 0001_rotation_algebra

#include "sdc-sim/src/Rotation/QuaternionOps.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "sdc-sim/src/Utils/Errors.hpp"
#include "sdc-sim/src/Utils/utils.hpp"

namespace sdc_sim
{

namespace
{

Eigen::Vector4d packed(const QuaternionD& q)
{
  return q.toScalarFirst();
}

}  // namespace

QuaternionD quaternionFromArray(std::span<const double> values)
{
  if (values.size() != 4)
  {
    throw InvalidDimension{"Quaternion requires 4 components, got " +
                           std::to_string(values.size())};
  }
  return QuaternionD{values[0], values[1], values[2], values[3]};
}

QuaternionD quaternionMultiply(const QuaternionD& q1, const QuaternionD& q2)
{
  return q1 * q2;
}

QuaternionD quaternionConjugate(const QuaternionD& q)
{
  return QuaternionD{q.w(), -q.x(), -q.y(), -q.z()};
}

QuaternionD quaternionInverse(const QuaternionD& q)
{
  double const n2 = q.squaredNorm();
  if (n2 == 0.0)
  {
    throw DegenerateInput{"Cannot invert the zero quaternion"};
  }
  return QuaternionD::fromScalarFirst(packed(quaternionConjugate(q)) / n2);
}

QuaternionD normalizeQuaternion(const QuaternionD& q)
{
  double const n = q.norm();
  if (n == 0.0)
  {
    throw DegenerateInput{"Cannot normalize the zero quaternion"};
  }
  return QuaternionD::fromScalarFirst(packed(q) / n);
}

Eigen::Matrix3d quaternionToMatrix(const QuaternionD& q)
{
  return normalizeQuaternion(q).eigen().toRotationMatrix();
}

QuaternionD matrixToQuaternion(const Eigen::Matrix3d& rotation,
                               const RotationTolerances& tolerances)
{
  if (!isValidRotation(rotation, tolerances))
  {
    throw InvalidRotation{
      "Matrix is not a proper rotation (orthogonality or determinant check "
      "failed)"};
  }

  const auto& r = rotation;
  double const trace = r.trace();

  double w = 0.0;
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;

  // Shepperd: pick the largest of trace, R11, R22, R33
  if (trace >= r(0, 0) && trace >= r(1, 1) && trace >= r(2, 2))
  {
    w = 0.5 * std::sqrt(1.0 + trace);
    double const k = 0.25 / w;
    x = (r(2, 1) - r(1, 2)) * k;
    y = (r(0, 2) - r(2, 0)) * k;
    z = (r(1, 0) - r(0, 1)) * k;
  }
  else if (r(0, 0) >= r(1, 1) && r(0, 0) >= r(2, 2))
  {
    x = 0.5 * std::sqrt(1.0 + r(0, 0) - r(1, 1) - r(2, 2));
    double const k = 0.25 / x;
    w = (r(2, 1) - r(1, 2)) * k;
    y = (r(0, 1) + r(1, 0)) * k;
    z = (r(0, 2) + r(2, 0)) * k;
  }
  else if (r(1, 1) >= r(2, 2))
  {
    y = 0.5 * std::sqrt(1.0 - r(0, 0) + r(1, 1) - r(2, 2));
    double const k = 0.25 / y;
    w = (r(0, 2) - r(2, 0)) * k;
    x = (r(0, 1) + r(1, 0)) * k;
    z = (r(1, 2) + r(2, 1)) * k;
  }
  else
  {
    z = 0.5 * std::sqrt(1.0 - r(0, 0) - r(1, 1) + r(2, 2));
    double const k = 0.25 / z;
    w = (r(1, 0) - r(0, 1)) * k;
    x = (r(0, 2) + r(2, 0)) * k;
    y = (r(1, 2) + r(2, 1)) * k;
  }

  QuaternionD q{w, x, y, z};
  if (q.w() < 0.0)
  {
    q = -q;
  }
  return normalizeQuaternion(q);
}

QuaternionD slerp(const QuaternionD& q1,
                  const QuaternionD& q2,
                  double t,
                  const SlerpConfig& config)
{
  if (!(t >= 0.0 && t <= 1.0))
  {
    throw std::invalid_argument{"slerp parameter must lie in [0, 1], got " +
                                std::to_string(t)};
  }

  Eigen::Vector4d const a = packed(normalizeQuaternion(q1));
  Eigen::Vector4d b = packed(normalizeQuaternion(q2));

  double cosTheta = a.dot(b);
  if (cosTheta < 0.0)
  {
    b = -b;
    cosTheta = -cosTheta;
  }

  if (cosTheta > config.linearThreshold)
  {
    Eigen::Vector4d const lerp = a + t * (b - a);
    return QuaternionD::fromScalarFirst(lerp.normalized());
  }

  double const theta = std::acos(clampUnit(cosTheta));
  double const sinTheta = std::sin(theta);
  double const wa = std::sin((1.0 - t) * theta) / sinTheta;
  double const wb = std::sin(t * theta) / sinTheta;

  return QuaternionD::fromScalarFirst((wa * a + wb * b).normalized());
}

Eigen::Vector3d rotateVector(const QuaternionD& q, const Eigen::Vector3d& v)
{
  QuaternionD const pure{0.0, v.x(), v.y(), v.z()};
  return quaternionMultiply(quaternionMultiply(q, pure), quaternionInverse(q))
    .vec();
}

QuaternionD quaternionFromEuler(const EulerAngles& angles)
{
  double const cr = std::cos(0.5 * angles.roll());
  double const sr = std::sin(0.5 * angles.roll());
  double const cp = std::cos(0.5 * angles.pitch());
  double const sp = std::sin(0.5 * angles.pitch());
  double const cy = std::cos(0.5 * angles.yaw());
  double const sy = std::sin(0.5 * angles.yaw());

  return QuaternionD{cr * cp * cy + sr * sp * sy,
                     sr * cp * cy - cr * sp * sy,
                     cr * sp * cy + sr * cp * sy,
                     cr * cp * sy - sr * sp * cy};
}

EulerAngles quaternionToEuler(const QuaternionD& q)
{
  QuaternionD const u = normalizeQuaternion(q);
  double const w = u.w();
  double const x = u.x();
  double const y = u.y();
  double const z = u.z();

  double const roll =
    std::atan2(2.0 * (w * x + y * z), 1.0 - 2.0 * (x * x + y * y));
  double const pitch = std::asin(clampUnit(2.0 * (w * y - z * x)));
  double const yaw =
    std::atan2(2.0 * (w * z + x * y), 1.0 - 2.0 * (y * y + z * z));

  return EulerAngles{roll, pitch, yaw};
}

QuaternionD axisAngleToQuaternion(const Eigen::Vector3d& axis, double angle)
{
  double const n = axis.norm();
  if (n == 0.0)
  {
    throw DegenerateInput{"Rotation axis must be non-zero"};
  }

  Eigen::Vector3d const u = axis / n;
  double const s = std::sin(0.5 * angle);
  return QuaternionD{std::cos(0.5 * angle), s * u.x(), s * u.y(), s * u.z()};
}

}  // namespace sdc_sim
