// Convenience header for all vector types

#ifndef SDC_SIM_VECTOR_TYPES_HPP
#define SDC_SIM_VECTOR_TYPES_HPP

/**
 * @file VectorTypes.hpp
 * @brief Convenience header including all vector data types
 *
 * This header provides a single include point for all sdc-sim vector types.
 */

// Base templates
#include "sdc-sim/src/DataTypes/QuatDBase.hpp"
#include "sdc-sim/src/DataTypes/Vec3DBase.hpp"

// Domain-specific types
#include "sdc-sim/src/DataTypes/AngularVelocity.hpp"
#include "sdc-sim/src/DataTypes/Coordinate.hpp"
#include "sdc-sim/src/DataTypes/EulerAngles.hpp"
#include "sdc-sim/src/DataTypes/Quaternion.hpp"
#include "sdc-sim/src/DataTypes/TorqueVector.hpp"
#include "sdc-sim/src/DataTypes/Velocity.hpp"

#endif  // SDC_SIM_VECTOR_TYPES_HPP
