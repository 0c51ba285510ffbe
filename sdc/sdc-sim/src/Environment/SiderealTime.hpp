#ifndef SDC_SIM_SIDEREAL_TIME_HPP
#define SDC_SIM_SIDEREAL_TIME_HPP

namespace sdc_sim
{

/**
 * @brief Greenwich sidereal angle after t seconds of uniform Earth rotation
 *
 * theta = gmst0 + Omega_earth * t, wrapped to [0, 2pi).
 *
 * @param t Seconds since the epoch at which the angle was gmst0
 * @param gmst0 Sidereal angle at the epoch [rad]
 */
double greenwichSiderealAngle(double t, double gmst0 = 0.0);

/**
 * @brief Greenwich mean sidereal time of a Julian date (IAU-1982)
 * @return GMST in [0, 2pi) [rad]
 */
double gmstFromJulianDate(double julianDate);

/// Julian date offset by a number of seconds
double addSecondsToJulianDate(double julianDate, double seconds);

}  // namespace sdc_sim

#endif  // SDC_SIM_SIDEREAL_TIME_HPP
