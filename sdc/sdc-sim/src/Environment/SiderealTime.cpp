#include "sdc-sim/src/Environment/SiderealTime.hpp"

#include <numbers>

#include "sdc-sim/src/Environment/EarthConstants.hpp"
#include "sdc-sim/src/Utils/utils.hpp"

namespace sdc_sim
{

double greenwichSiderealAngle(double t, double gmst0)
{
  return wrapTwoPi(gmst0 + earth::kEarthRotationRate * t);
}

double gmstFromJulianDate(double julianDate)
{
  // Julian centuries since J2000.0
  double const T = (julianDate - earth::kJ2000JulianDate) / 36525.0;

  // GMST in seconds of time
  double const gmstSeconds = 67310.54841 +
                             (876600.0 * 3600.0 + 8640184.812866) * T +
                             0.093104 * T * T - 6.2e-6 * T * T * T;

  return wrapTwoPi(gmstSeconds * 2.0 * std::numbers::pi /
                   earth::kSecondsPerDay);
}

double addSecondsToJulianDate(double julianDate, double seconds)
{
  return julianDate + seconds / earth::kSecondsPerDay;
}

}  // namespace sdc_sim
