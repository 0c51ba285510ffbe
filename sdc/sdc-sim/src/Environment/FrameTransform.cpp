#include "sdc-sim/src/Environment/FrameTransform.hpp"

#include <stdexcept>
#include <string>

#include "sdc-sim/src/Environment/FrameTransforms.hpp"
#include "sdc-sim/src/Rotation/QuaternionOps.hpp"
#include "sdc-sim/src/Rotation/RotationMatrix.hpp"
#include "sdc-sim/src/Utils/Errors.hpp"

namespace sdc_sim
{

FrameTransform::FrameTransform(FrameId frame)
  : source_{frame},
    target_{frame},
    rotation_{Eigen::Matrix3d::Identity()},
    origin_{}
{
}

FrameTransform::FrameTransform(FrameId source,
                               FrameId target,
                               const Eigen::Matrix3d& rotation,
                               const Coordinate& origin)
  : source_{source}, target_{target}, rotation_{rotation}, origin_{origin}
{
  if (!isValidRotation(rotation_))
  {
    throw InvalidRotation{"Frame transform " + std::string{toString(source)} +
                          " -> " + std::string{toString(target)} +
                          " requires a proper rotation matrix"};
  }
}

Coordinate FrameTransform::transformPoint(const Coordinate& sourcePoint) const
{
  // Translate to target origin, then rotate into target axes
  return rotation_ * (sourcePoint - origin_);
}

Eigen::Vector3d FrameTransform::transformDirection(
  const Eigen::Vector3d& sourceVector) const
{
  return rotation_ * sourceVector;
}

void FrameTransform::transformBatch(Eigen::Matrix3Xd& points) const
{
  points.colwise() -= static_cast<const Eigen::Vector3d&>(origin_);
  points.applyOnTheLeft(rotation_);
}

FrameTransform FrameTransform::inverse() const
{
  Coordinate const sourceOrigin = -(rotation_ * origin_);
  return FrameTransform{target_, source_, rotation_.transpose(), sourceOrigin};
}

FrameTransform FrameTransform::then(const FrameTransform& next) const
{
  if (next.source_ != target_)
  {
    throw std::invalid_argument{
      "Cannot chain " + std::string{toString(source_)} + " -> " +
      std::string{toString(target_)} + " with " +
      std::string{toString(next.source_)} + " -> " +
      std::string{toString(next.target_)}};
  }

  Coordinate const combinedOrigin =
    origin_ + rotation_.transpose() * next.origin_;
  return FrameTransform{
    source_, next.target_, next.rotation_ * rotation_, combinedOrigin};
}

FrameTransform eciToEcefTransform(double t)
{
  return FrameTransform{FrameId::ECI, FrameId::ECEF, eciToEcef(t)};
}

FrameTransform eciToLvlhTransform(const Coordinate& position,
                                  const Velocity& velocity)
{
  return FrameTransform{FrameId::ECI,
                        FrameId::LVLH,
                        eciToLvlh(position, velocity).transpose(),
                        position};
}

FrameTransform eciToBodyTransform(const QuaternionD& attitude)
{
  return FrameTransform{
    FrameId::ECI, FrameId::Body, quaternionToMatrix(attitude).transpose()};
}

}  // namespace sdc_sim
