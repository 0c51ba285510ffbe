#ifndef SDC_SIM_FRAME_TRANSFORMS_HPP
#define SDC_SIM_FRAME_TRANSFORMS_HPP

#include <Eigen/Dense>

#include "sdc-sim/src/DataTypes/Coordinate.hpp"
#include "sdc-sim/src/DataTypes/Velocity.hpp"

namespace sdc_sim
{

/**
 * @brief LVLH basis of an orbiting spacecraft expressed in ECI
 *
 * Columns are the radial unit vector r/|r|, the transverse unit vector
 * h_hat x r_hat and the orbit normal h/|h|, with h = r x v. The matrix maps
 * LVLH components to ECI components; its transpose maps ECI to LVLH.
 *
 * @param position ECI position [km]
 * @param velocity ECI velocity [km/s]
 * @throws DegenerateGeometry if r is zero or r and v are parallel
 */
Eigen::Matrix3d eciToLvlh(const Coordinate& position, const Velocity& velocity);

/**
 * @brief ECI to ECEF component transformation after t seconds
 *
 * Passive rotation about Z by Omega_earth * t (ECI and ECEF aligned at
 * t = 0), i.e. v_ecef = eciToEcef(t) * v_eci.
 */
Eigen::Matrix3d eciToEcef(double t);

/// Transpose of eciToEcef(t)
Eigen::Matrix3d ecefToEci(double t);

/// ECI to ECEF for an explicit Greenwich sidereal angle [rad]
Eigen::Matrix3d eciToEcefFromGmst(double gmst);

/// Transpose of eciToEcefFromGmst(gmst)
Eigen::Matrix3d ecefToEciFromGmst(double gmst);

/// Re-express a vector: R * v
Eigen::Vector3d transformVector(const Eigen::Matrix3d& rotation,
                                const Eigen::Vector3d& vector);

/**
 * @brief Re-express a second-order tensor: R * M * R^T
 *
 * Used for inertia tensors and covariance matrices.
 */
Eigen::Matrix3d transformTensor(const Eigen::Matrix3d& rotation,
                                const Eigen::Matrix3d& tensor);

}  // namespace sdc_sim

#endif  // SDC_SIM_FRAME_TRANSFORMS_HPP
