#include "sdc-sim/src/Environment/FrameTransforms.hpp"

#include "sdc-sim/src/Environment/EarthConstants.hpp"
#include "sdc-sim/src/Rotation/RotationMatrix.hpp"
#include "sdc-sim/src/Utils/Errors.hpp"

namespace sdc_sim
{

namespace
{

// |r x v| below this fraction of |r||v| counts as parallel
constexpr double kParallelTolerance = 1e-12;

}  // namespace

Eigen::Matrix3d eciToLvlh(const Coordinate& position, const Velocity& velocity)
{
  double const rNorm = position.norm();
  if (rNorm == 0.0)
  {
    throw DegenerateGeometry{"LVLH frame undefined for zero position"};
  }

  Eigen::Vector3d const h = position.cross(velocity);
  double const hNorm = h.norm();
  if (hNorm <= kParallelTolerance * rNorm * velocity.norm())
  {
    throw DegenerateGeometry{
      "LVLH frame undefined: position and velocity are parallel"};
  }

  Eigen::Vector3d const radial = position / rNorm;
  Eigen::Vector3d const normal = h / hNorm;
  Eigen::Vector3d const transverse = normal.cross(radial);

  Eigen::Matrix3d basis;
  basis.col(0) = radial;
  basis.col(1) = transverse;
  basis.col(2) = normal;
  return basis;
}

Eigen::Matrix3d eciToEcef(double t)
{
  return eciToEcefFromGmst(earth::kEarthRotationRate * t);
}

Eigen::Matrix3d ecefToEci(double t)
{
  return eciToEcef(t).transpose();
}

Eigen::Matrix3d eciToEcefFromGmst(double gmst)
{
  // The ECEF axes are the ECI axes actively rotated by gmst about Z
  return elementaryRotation(Axis::Z, gmst).transpose();
}

Eigen::Matrix3d ecefToEciFromGmst(double gmst)
{
  return elementaryRotation(Axis::Z, gmst);
}

Eigen::Vector3d transformVector(const Eigen::Matrix3d& rotation,
                                const Eigen::Vector3d& vector)
{
  return rotation * vector;
}

Eigen::Matrix3d transformTensor(const Eigen::Matrix3d& rotation,
                                const Eigen::Matrix3d& tensor)
{
  return rotation * tensor * rotation.transpose();
}

}  // namespace sdc_sim
