#include "coordinate/ecliptic_transform.hpp"
#include <cmath>

namespace lunar {

// Laskar's series in U = T / 100, coefficients in arcseconds
static const double OBLIQUITY_ARCSEC[] = {
    84381.448,      // 23°26'21.448"
    -4680.93,
    -1.55,
    1999.25,
    -51.38,
    -249.67,
    -39.05,
    7.12,
    27.87,
    5.79,
    2.45
};

Degrees EclipticTransform::mean_obliquity(double T) {
    double U = T / 100.0;
    return Degrees::from_arcseconds(polynomial(OBLIQUITY_ARCSEC, U));
}

Degrees EclipticTransform::lunar_node_longitude(double T) {
    return Degrees(125.04 - 1934.136 * T);
}

NutationAngles EclipticTransform::nutation(double T) {
    Degrees omega = lunar_node_longitude(T);

    // Mean longitudes of the Sun and Moon
    Degrees L(280.4665 + 36000.7698 * T);
    Degrees L_moon(218.3165 + 481267.8813 * T);

    double psi_arcsec = -17.20 * sin(omega)
                        - 1.32 * sin(2.0 * L)
                        - 0.23 * sin(2.0 * L_moon)
                        + 0.21 * sin(2.0 * omega);

    double eps_arcsec = 9.20 * cos(omega)
                        + 0.57 * cos(2.0 * L)
                        + 0.10 * cos(2.0 * L_moon)
                        - 0.09 * cos(2.0 * omega);

    NutationAngles result;
    result.delta_psi = Degrees::from_arcseconds(psi_arcsec);
    result.delta_epsilon = Degrees::from_arcseconds(eps_arcsec);
    return result;
}

Degrees EclipticTransform::true_obliquity(double T) {
    return mean_obliquity(T) + nutation(T).delta_epsilon;
}

EquatorialPosition EclipticTransform::ecliptic_to_equatorial(Degrees longitude,
                                                             Degrees latitude,
                                                             Degrees obliquity) {
    double sin_eps = sin(obliquity);
    double cos_eps = cos(obliquity);
    double sin_lon = sin(longitude);

    // Meeus (13.3), (13.4)
    double y = sin_lon * cos_eps - tan(latitude) * sin_eps;
    double x = cos(longitude);
    double sin_dec = sin(latitude) * cos_eps + cos(latitude) * sin_eps * sin_lon;

    // Rounding can push |sin_dec| a hair past 1 at the poles
    sin_dec = std::fmax(-1.0, std::fmin(1.0, sin_dec));

    EquatorialPosition result;
    result.right_ascension = atan2_deg(y, x).normalized();
    result.declination = asin_deg(sin_dec);
    return result;
}

}  // namespace lunar
