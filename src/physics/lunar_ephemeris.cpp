/**
 * Lunar Ephemeris Implementation
 *
 * Algorithm (Meeus ch. 47):
 *   1. Fundamental arguments L', D, M, M', F as quartic polynomials in T
 *   2. Σl, Σr over Table 47.A and Σb over Table 47.B, each term weighted
 *      by E^|k| for k the multiple of M
 *   3. Additive terms for Venus (A1), Jupiter (A2) and the flattening
 *      of the Earth (L' - F, A3)
 *   4. λ = L' + Σl, β = Σb, Δ = 385000.56 km + Σr
 *   5. Nutation applied to λ, rotation by the true obliquity
 */

#include "lunar_ephemeris.hpp"
#include "lunar_periodic_terms.hpp"
#include "core/astro_constants.hpp"
#include "core/lunar_error.hpp"
#include <cstdlib>

namespace lunar {

// Polynomial coefficients in T, constant term first
static const double MEAN_LONGITUDE[] = {
    218.3164477, 481267.88123421, -0.0015786, 1.0 / 538841.0, -1.0 / 65194000.0
};
static const double MEAN_ELONGATION[] = {
    297.8501921, 445267.1114034, -0.0018819, 1.0 / 545868.0, -1.0 / 113065000.0
};
static const double SUN_MEAN_ANOMALY[] = {
    357.5291092, 35999.0502909, -0.0001536, 1.0 / 24490000.0
};
static const double MOON_MEAN_ANOMALY[] = {
    134.9633964, 477198.8675055, 0.0087414, 1.0 / 69699.0, -1.0 / 14712000.0
};
static const double ARGUMENT_OF_LATITUDE[] = {
    93.2720950, 483202.0175233, -0.0036539, -1.0 / 3526000.0, 1.0 / 863310000.0
};

LunarArguments LunarEphemeris::fundamental_arguments(double T) {
    LunarArguments args;
    args.mean_longitude = Degrees(polynomial(MEAN_LONGITUDE, T)).normalized();
    args.mean_elongation = Degrees(polynomial(MEAN_ELONGATION, T)).normalized();
    args.sun_mean_anomaly = Degrees(polynomial(SUN_MEAN_ANOMALY, T)).normalized();
    args.moon_mean_anomaly = Degrees(polynomial(MOON_MEAN_ANOMALY, T)).normalized();
    args.argument_of_latitude = Degrees(polynomial(ARGUMENT_OF_LATITUDE, T)).normalized();

    args.a1 = Degrees(119.75 + 131.849 * T).normalized();
    args.a2 = Degrees(53.09 + 479264.290 * T).normalized();
    args.a3 = Degrees(313.45 + 481266.484 * T).normalized();

    args.eccentricity_factor = eccentricity_factor(T);
    return args;
}

double LunarEphemeris::eccentricity_factor(double T) {
    return 1.0 - 0.002516 * T - 0.0000074 * T * T;
}

double LunarEphemeris::eccentricity_weight(int m, double E) {
    switch (std::abs(m)) {
        case 0:  return 1.0;
        case 1:  return E;
        case 2:  return E * E;
        default: throw NumericError("Unexpected multiple of M in lunar series: " +
                                    std::to_string(m));
    }
}

// Argument D*d + M*m + M'*m' + F*f of one series term
static Degrees term_argument(const LunarArguments& args, int d, int m, int m_prime, int f) {
    return d * args.mean_elongation
         + m * args.sun_mean_anomaly
         + m_prime * args.moon_mean_anomaly
         + f * args.argument_of_latitude;
}

double LunarEphemeris::sum_longitude(const LunarArguments& args) {
    const LongitudeDistanceTerm* terms = longitude_distance_terms();
    double E = args.eccentricity_factor;

    double sigma = 0.0;
    for (std::size_t i = 0; i < LONGITUDE_DISTANCE_TERM_COUNT; i++) {
        const auto& t = terms[i];
        Degrees arg = term_argument(args, t.d, t.m, t.m_prime, t.f);
        sigma += t.sigma_l * eccentricity_weight(t.m, E) * sin(arg);
    }

    const Degrees& L = args.mean_longitude;
    const Degrees& F = args.argument_of_latitude;
    sigma += 3958.0 * sin(args.a1)
           + 1962.0 * sin(L - F)
           + 318.0 * sin(args.a2);

    return sigma;
}

double LunarEphemeris::sum_latitude(const LunarArguments& args) {
    const LatitudeTerm* terms = latitude_terms();
    double E = args.eccentricity_factor;

    double sigma = 0.0;
    for (std::size_t i = 0; i < LATITUDE_TERM_COUNT; i++) {
        const auto& t = terms[i];
        Degrees arg = term_argument(args, t.d, t.m, t.m_prime, t.f);
        sigma += t.sigma_b * eccentricity_weight(t.m, E) * sin(arg);
    }

    const Degrees& L = args.mean_longitude;
    const Degrees& F = args.argument_of_latitude;
    const Degrees& Mp = args.moon_mean_anomaly;
    sigma += -2235.0 * sin(L)
           + 382.0 * sin(args.a3)
           + 175.0 * sin(args.a1 - F)
           + 175.0 * sin(args.a1 + F)
           + 127.0 * sin(L - Mp)
           - 115.0 * sin(L + Mp);

    return sigma;
}

double LunarEphemeris::sum_distance(const LunarArguments& args) {
    const LongitudeDistanceTerm* terms = longitude_distance_terms();
    double E = args.eccentricity_factor;

    double sigma = 0.0;
    for (std::size_t i = 0; i < LONGITUDE_DISTANCE_TERM_COUNT; i++) {
        const auto& t = terms[i];
        if (t.sigma_r == 0.0) continue;
        Degrees arg = term_argument(args, t.d, t.m, t.m_prime, t.f);
        sigma += t.sigma_r * eccentricity_weight(t.m, E) * cos(arg);
    }
    return sigma;
}

LunarPosition LunarEphemeris::position(double T) {
    require_finite(T, "Julian centuries");

    LunarPosition moon;
    moon.arguments = fundamental_arguments(T);
    moon.sigma_l = sum_longitude(moon.arguments);
    moon.sigma_b = sum_latitude(moon.arguments);
    moon.sigma_r = sum_distance(moon.arguments);

    moon.ecliptic.longitude =
        (moon.arguments.mean_longitude + Degrees(moon.sigma_l * LUNAR_ANGLE_UNIT)).normalized();
    moon.ecliptic.latitude = Degrees(moon.sigma_b * LUNAR_ANGLE_UNIT);
    moon.ecliptic.distance_km = MOON_MEAN_DISTANCE_KM + moon.sigma_r * LUNAR_DISTANCE_UNIT;

    // Apparent place: nutation in longitude, true obliquity
    moon.nutation = EclipticTransform::nutation(T);
    moon.apparent_longitude = (moon.ecliptic.longitude + moon.nutation.delta_psi).normalized();
    moon.obliquity = EclipticTransform::true_obliquity(T);

    moon.equatorial = EclipticTransform::ecliptic_to_equatorial(
        moon.apparent_longitude, moon.ecliptic.latitude, moon.obliquity);

    return moon;
}

}  // namespace lunar
