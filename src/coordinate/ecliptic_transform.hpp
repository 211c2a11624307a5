#ifndef LUNAR_ECLIPTIC_TRANSFORM_HPP
#define LUNAR_ECLIPTIC_TRANSFORM_HPP

#include "core/angle.hpp"

namespace lunar {

/**
 * @brief Geocentric equatorial coordinates
 */
struct EquatorialPosition {
    Degrees right_ascension;   // [0, 360)
    Degrees declination;       // [-90, 90]
};

/**
 * @brief Geocentric ecliptic coordinates
 */
struct EclipticPosition {
    Degrees longitude;         // [0, 360)
    Degrees latitude;
    double distance_km;
};

/**
 * @brief Nutation in longitude and in obliquity
 */
struct NutationAngles {
    Degrees delta_psi;         // in longitude
    Degrees delta_epsilon;     // in obliquity
};

/**
 * @brief Ecliptic <-> equatorial rotation and the quantities it depends on
 *
 * Meeus, Astronomical Algorithms, ch. 13 and 22.
 */
class EclipticTransform {
public:
    /**
     * @brief Mean obliquity of the ecliptic (Laskar)
     * Valid over +/-10000 years around J2000.
     * @param T Julian centuries since J2000.0
     */
    static Degrees mean_obliquity(double T);

    /**
     * @brief Nutation from the four leading terms (0.5" in psi, 0.1" in epsilon)
     * @param T Julian centuries since J2000.0
     */
    static NutationAngles nutation(double T);

    /**
     * @brief Mean obliquity plus nutation in obliquity
     */
    static Degrees true_obliquity(double T);

    /**
     * @brief Longitude of the ascending node of the Moon's mean orbit
     * Low-precision form used by the solar apparent-position corrections.
     */
    static Degrees lunar_node_longitude(double T);

    /**
     * @brief Rotate ecliptic longitude/latitude into right ascension/declination
     * @param longitude Ecliptic longitude
     * @param latitude Ecliptic latitude
     * @param obliquity Obliquity of the ecliptic to rotate by
     * @return Equatorial position, right ascension reduced to [0, 360)
     */
    static EquatorialPosition ecliptic_to_equatorial(Degrees longitude,
                                                     Degrees latitude,
                                                     Degrees obliquity);
};

}  // namespace lunar

#endif  // LUNAR_ECLIPTIC_TRANSFORM_HPP
