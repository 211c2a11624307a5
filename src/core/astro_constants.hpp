/**
 * Astronomical Constants
 *
 * Epochs and distances shared by the solar, lunar and phase computations.
 */

#ifndef LUNAR_ASTRO_CONSTANTS_HPP
#define LUNAR_ASTRO_CONSTANTS_HPP

namespace lunar {

// J2000.0 epoch (2000 January 1.5 TD)
constexpr double J2000_EPOCH_JD = 2451545.0;
constexpr double DAYS_PER_JULIAN_CENTURY = 36525.0;

constexpr double HOURS_PER_DAY = 24.0;
constexpr double SECONDS_PER_DAY = 86400.0;

// First Gregorian day, 1582 October 15.0
constexpr double GREGORIAN_START_JD = 2299160.5;

// Astronomical unit (km)
constexpr double AU_KM = 149597870.7;

// Constant term of the lunar distance series (km)
constexpr double MOON_MEAN_DISTANCE_KM = 385000.56;

// Scale of the lunar series amplitudes
constexpr double LUNAR_ANGLE_UNIT = 1.0e-6;      // degrees per table unit
constexpr double LUNAR_DISTANCE_UNIT = 1.0e-3;   // km per table unit

}  // namespace lunar

#endif  // LUNAR_ASTRO_CONSTANTS_HPP
