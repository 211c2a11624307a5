/**
 * Solar Ephemeris Implementation
 *
 * Low-precision solar position using Meeus, "Astronomical Algorithms".
 * Computes ecliptic longitude via mean anomaly + equation of center,
 * applies the low-accuracy nutation/aberration correction, then rotates
 * to equatorial coordinates via the corrected obliquity.
 */

#include "solar_ephemeris.hpp"
#include "core/astro_constants.hpp"
#include "core/lunar_error.hpp"

namespace lunar {

Degrees SolarEphemeris::mean_longitude(double T) {
    return Degrees(280.46646 + 36000.76983 * T + 0.0003032 * T * T).normalized();
}

Degrees SolarEphemeris::mean_anomaly(double T) {
    return Degrees(357.52911 + 35999.05029 * T - 0.0001537 * T * T).normalized();
}

double SolarEphemeris::eccentricity(double T) {
    return 0.016708634 - 0.000042037 * T - 0.0000001267 * T * T;
}

Degrees SolarEphemeris::equation_of_center(double T, Degrees M) {
    return Degrees((1.914602 - 0.004817 * T - 0.000014 * T * T) * sin(M)
                 + (0.019993 - 0.000101 * T) * sin(2.0 * M)
                 + 0.000289 * sin(3.0 * M));
}

double SolarEphemeris::radius_vector(double e, Degrees true_anomaly) {
    return 1.000001018 * (1.0 - e * e) / (1.0 + e * cos(true_anomaly));
}

SolarPosition SolarEphemeris::position(double T) {
    require_finite(T, "Julian centuries");

    SolarPosition sun;
    sun.mean_longitude = mean_longitude(T);
    sun.mean_anomaly = mean_anomaly(T);
    sun.equation_of_center = equation_of_center(T, sun.mean_anomaly);

    sun.true_longitude = (sun.mean_longitude + sun.equation_of_center).normalized();
    sun.true_anomaly = (sun.mean_anomaly + sun.equation_of_center).normalized();

    sun.eccentricity = eccentricity(T);
    sun.distance_au = radius_vector(sun.eccentricity, sun.true_anomaly);
    sun.distance_km = sun.distance_au * AU_KM;

    // Apparent longitude and the obliquity that goes with it
    Degrees omega = EclipticTransform::lunar_node_longitude(T);
    sun.apparent_longitude =
        (sun.true_longitude - Degrees(0.00569) - Degrees(0.00478 * sin(omega))).normalized();
    sun.obliquity = EclipticTransform::mean_obliquity(T) + Degrees(0.00256 * cos(omega));

    // Sun's ecliptic latitude never exceeds 1.2"; taken as zero
    sun.equatorial = EclipticTransform::ecliptic_to_equatorial(
        sun.apparent_longitude, Degrees(0.0), sun.obliquity);

    return sun;
}

}  // namespace lunar
