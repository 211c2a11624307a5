/**
 * Solar Ephemeris
 *
 * Low-precision apparent Sun position using the Meeus algorithm
 * (Astronomical Algorithms, ch. 25). Accuracy ~0.01 degrees, enough for
 * the Moon's phase and bright-limb angle.
 * Follows the same interface pattern as LunarEphemeris.
 */

#ifndef LUNAR_SOLAR_EPHEMERIS_HPP
#define LUNAR_SOLAR_EPHEMERIS_HPP

#include "core/angle.hpp"
#include "coordinate/ecliptic_transform.hpp"

namespace lunar {

/**
 * Geocentric Sun position and the intermediate quantities behind it
 */
struct SolarPosition {
    Degrees mean_longitude;        // L0
    Degrees mean_anomaly;          // M
    Degrees equation_of_center;    // C
    Degrees true_longitude;        // L0 + C
    Degrees true_anomaly;          // M + C
    Degrees apparent_longitude;    // nutation and aberration applied
    double eccentricity;           // of Earth's orbit
    Degrees obliquity;             // used for the equatorial rotation
    EquatorialPosition equatorial;
    double distance_au;
    double distance_km;
};

class SolarEphemeris {
public:
    /**
     * Geometric mean longitude of the Sun, mean equinox of date
     * @param T Julian centuries since J2000.0
     * @return Degrees in [0, 360)
     */
    static Degrees mean_longitude(double T);

    /**
     * Mean anomaly of the Sun
     * @param T Julian centuries since J2000.0
     * @return Degrees in [0, 360)
     */
    static Degrees mean_anomaly(double T);

    /**
     * Eccentricity of Earth's orbit
     */
    static double eccentricity(double T);

    /**
     * Sun's equation of center
     * @param T Julian centuries since J2000.0
     * @param M Mean anomaly
     */
    static Degrees equation_of_center(double T, Degrees M);

    /**
     * Earth-Sun distance in AU
     * @param e Eccentricity of Earth's orbit
     * @param true_anomaly Sun's true anomaly
     */
    static double radius_vector(double e, Degrees true_anomaly);

    /**
     * Full apparent position of the Sun
     * @param T Julian centuries since J2000.0
     * @throws NumericError if T is not finite
     */
    static SolarPosition position(double T);
};

}  // namespace lunar

#endif  // LUNAR_SOLAR_EPHEMERIS_HPP
