/**
 * Lunar Ephemeris
 *
 * Geocentric Moon position from the truncated ELP-2000/82 series given by
 * Meeus, "Astronomical Algorithms" ch. 47. Accuracy ~10" in longitude,
 * 4" in latitude.
 */

#ifndef LUNAR_LUNAR_EPHEMERIS_HPP
#define LUNAR_LUNAR_EPHEMERIS_HPP

#include "core/angle.hpp"
#include "coordinate/ecliptic_transform.hpp"

namespace lunar {

/**
 * Fundamental arguments of the lunar theory at one instant.
 * All angles reduced to [0, 360).
 */
struct LunarArguments {
    Degrees mean_longitude;         // L'
    Degrees mean_elongation;        // D
    Degrees sun_mean_anomaly;       // M
    Degrees moon_mean_anomaly;      // M'
    Degrees argument_of_latitude;   // F
    Degrees a1;                     // Venus
    Degrees a2;                     // Jupiter
    Degrees a3;
    double eccentricity_factor;     // E
};

/**
 * Moon position with the series sums that produced it
 */
struct LunarPosition {
    LunarArguments arguments;
    double sigma_l;                 // 1e-6 degree
    double sigma_b;                 // 1e-6 degree
    double sigma_r;                 // 1e-3 km
    EclipticPosition ecliptic;      // geometric, mean equinox of date
    NutationAngles nutation;
    Degrees apparent_longitude;     // longitude + delta psi
    Degrees obliquity;              // true obliquity
    EquatorialPosition equatorial;  // apparent
};

class LunarEphemeris {
public:
    /**
     * Evaluate L', D, M, M', F, A1-A3 and E
     * @param T Julian centuries since J2000.0
     */
    static LunarArguments fundamental_arguments(double T);

    /**
     * Correction for the decreasing eccentricity of Earth's orbit,
     * applied once per unit of |multiple of M| in a series term
     */
    static double eccentricity_factor(double T);

    /**
     * Sum of the longitude terms plus the Venus/Jupiter/flattening additives
     * @return Σl in units of 1e-6 degree
     */
    static double sum_longitude(const LunarArguments& args);

    /**
     * Sum of the latitude terms plus additives
     * @return Σb in units of 1e-6 degree
     */
    static double sum_latitude(const LunarArguments& args);

    /**
     * Sum of the distance terms
     * @return Σr in units of 1e-3 km
     */
    static double sum_distance(const LunarArguments& args);

    /**
     * Full geocentric position of the Moon
     * @param T Julian centuries since J2000.0
     * @throws NumericError if T is not finite
     */
    static LunarPosition position(double T);

private:
    // E, E^2 or 1 depending on the multiple of M
    static double eccentricity_weight(int m, double E);
};

}  // namespace lunar

#endif  // LUNAR_LUNAR_EPHEMERIS_HPP
