#ifndef SDC_SIM_FRAME_TRANSFORM_HPP
#define SDC_SIM_FRAME_TRANSFORM_HPP

#include <Eigen/Dense>

#include "sdc-sim/src/DataTypes/Coordinate.hpp"
#include "sdc-sim/src/DataTypes/Quaternion.hpp"
#include "sdc-sim/src/DataTypes/Velocity.hpp"
#include "sdc-sim/src/Environment/ReferenceFrame.hpp"

namespace sdc_sim
{

/**
 * @brief Rigid transformation between two tagged reference frames
 *
 * Maps coordinates expressed in the source frame to the target frame:
 *
 *   p_target = R * (p_source - origin)
 *
 * where R maps source components to target components and origin is the
 * target frame origin expressed in source coordinates. Directions (velocity,
 * angular momentum, ...) are rotated only.
 *
 * Instances are immutable; composition and inversion return new values.
 */
class FrameTransform
{
public:
  /**
   * @brief Identity transform within a single frame
   */
  explicit FrameTransform(FrameId frame);

  /**
   * @brief Constructor with rotation and target origin
   * @param source Frame of the input coordinates
   * @param target Frame of the output coordinates
   * @param rotation Source-to-target component rotation
   * @param origin Target origin in source coordinates
   * @throws InvalidRotation if rotation is not a proper rotation matrix
   */
  FrameTransform(FrameId source,
                 FrameId target,
                 const Eigen::Matrix3d& rotation,
                 const Coordinate& origin = Coordinate{});

  /**
   * @brief Transform a point (rotation and translation)
   * @param sourcePoint Point in the source frame
   * @return Point in the target frame
   */
  [[nodiscard]] Coordinate transformPoint(const Coordinate& sourcePoint) const;

  /**
   * @brief Transform a direction vector (rotation only)
   *
   * Use this for velocities, forces or any vector that represents a
   * direction rather than a position.
   */
  [[nodiscard]] Eigen::Vector3d transformDirection(
    const Eigen::Vector3d& sourceVector) const;

  /**
   * @brief Batch transform points in place
   *
   * Each column is one point. All columns are transformed in a single matrix
   * operation.
   *
   * @param points 3xN matrix of source-frame points (modified in place)
   */
  void transformBatch(Eigen::Matrix3Xd& points) const;

  /// Target-to-source transform
  [[nodiscard]] FrameTransform inverse() const;

  /**
   * @brief Compose with a transform that starts where this one ends
   *
   * a.then(b) maps a.source() directly to b.target().
   *
   * @throws std::invalid_argument if next.source() != target()
   */
  [[nodiscard]] FrameTransform then(const FrameTransform& next) const;

  [[nodiscard]] FrameId source() const
  {
    return source_;
  }

  [[nodiscard]] FrameId target() const
  {
    return target_;
  }

  [[nodiscard]] const Eigen::Matrix3d& rotation() const
  {
    return rotation_;
  }

  [[nodiscard]] const Coordinate& origin() const
  {
    return origin_;
  }

private:
  FrameId source_;
  FrameId target_;
  Eigen::Matrix3d rotation_;  ///< Source-to-target component rotation
  Coordinate origin_;         ///< Target origin in source coordinates
};

/// ECI to ECEF after t seconds of Earth rotation (common origin)
FrameTransform eciToEcefTransform(double t);

/**
 * @brief ECI to the LVLH frame centered on a spacecraft
 * @throws DegenerateGeometry if r is zero or r and v are parallel
 */
FrameTransform eciToLvlhTransform(const Coordinate& position,
                                  const Velocity& velocity);

/**
 * @brief ECI to body components for a spacecraft attitude
 *
 * The attitude quaternion rotates body vectors into ECI (v_eci = q v_body),
 * so the returned rotation is its transpose.
 *
 * @throws DegenerateInput for the zero quaternion
 */
FrameTransform eciToBodyTransform(const QuaternionD& attitude);

}  // namespace sdc_sim

#endif  // SDC_SIM_FRAME_TRANSFORM_HPP
