#ifndef SDC_SIM_EARTH_CONSTANTS_HPP
#define SDC_SIM_EARTH_CONSTANTS_HPP

namespace sdc_sim
{

/**
 * @brief Earth model constants
 *
 * Orbital quantities use km and s; these values are part of the public units
 * contract and must not be rescaled.
 */
namespace earth
{

/// Gravitational parameter mu [km^3/s^2]
inline constexpr double kMuEarth = 398600.4418;

/// Equatorial radius [km]
inline constexpr double kEarthRadius = 6378.137;

/// Sidereal rotation rate [rad/s]
inline constexpr double kEarthRotationRate = 7.292115e-5;

/// Julian date of the J2000.0 epoch
inline constexpr double kJ2000JulianDate = 2451545.0;

/// Seconds per Julian day
inline constexpr double kSecondsPerDay = 86400.0;

}  // namespace earth

}  // namespace sdc_sim

#endif  // SDC_SIM_EARTH_CONSTANTS_HPP
