/**
 * Lunar Phase Implementation
 *
 * Meeus, "Astronomical Algorithms" ch. 48:
 *   ψ from the cosine rule on the two equatorial positions
 *   i = atan2(R sin ψ, Δ - R cos ψ)
 *   k = (1 + cos i) / 2
 *   χ = atan2(cos δ0 sin(α0 - α), sin δ0 cos δ - cos δ0 sin δ cos(α0 - α))
 */

#include "lunar_phase.hpp"
#include "core/lunar_error.hpp"
#include <cmath>

namespace lunar {

namespace {

void require_finite_position(const EquatorialPosition& p, const char* body) {
    if (!std::isfinite(p.right_ascension.value) || !std::isfinite(p.declination.value)) {
        throw NumericError(std::string("Non-finite equatorial position for ") + body);
    }
}

void require_positive_distance(double distance_km, const char* body) {
    if (!std::isfinite(distance_km) || distance_km <= 0.0) {
        throw NumericError(std::string("Degenerate distance for ") + body + ": " +
                           std::to_string(distance_km) + " km");
    }
}

}  // anonymous namespace

Degrees LunarPhase::geocentric_elongation(const EquatorialPosition& sun,
                                          const EquatorialPosition& moon) {
    Degrees d_ra = sun.right_ascension - moon.right_ascension;

    double cos_psi = sin(sun.declination) * sin(moon.declination)
                   + cos(sun.declination) * cos(moon.declination) * cos(d_ra);

    // Rounding can step just outside [-1, 1] when the bodies align
    cos_psi = std::fmax(-1.0, std::fmin(1.0, cos_psi));
    return acos_deg(cos_psi);
}

Degrees LunarPhase::elongation_from_ecliptic(const EclipticPosition& moon,
                                             Degrees sun_longitude) {
    double cos_psi = cos(moon.latitude) * cos(moon.longitude - sun_longitude);
    cos_psi = std::fmax(-1.0, std::fmin(1.0, cos_psi));
    return acos_deg(cos_psi);
}

Degrees LunarPhase::phase_angle(Degrees elongation, double sun_distance_km,
                                double moon_distance_km) {
    require_positive_distance(sun_distance_km, "Sun");
    require_positive_distance(moon_distance_km, "Moon");

    double R = sun_distance_km;
    double delta = moon_distance_km;

    // atan2 picks the quadrant from the sign of (Δ - R cos ψ); sin ψ >= 0
    // keeps the result in [0, 180]
    return atan2_deg(R * sin(elongation), delta - R * cos(elongation));
}

double LunarPhase::illuminated_fraction(Degrees phase_angle) {
    double k = (1.0 + cos(phase_angle)) / 2.0;
    return std::fmax(0.0, std::fmin(1.0, k));
}

Degrees LunarPhase::bright_limb_angle(const EquatorialPosition& sun,
                                      const EquatorialPosition& moon) {
    Degrees d_ra = sun.right_ascension - moon.right_ascension;

    double y = cos(sun.declination) * sin(d_ra);
    double x = sin(sun.declination) * cos(moon.declination)
             - cos(sun.declination) * sin(moon.declination) * cos(d_ra);

    return atan2_deg(y, x).normalized();
}

Degrees LunarPhase::approximate_phase_angle(double T) {
    LunarArguments args = LunarEphemeris::fundamental_arguments(T);
    const Degrees& D = args.mean_elongation;
    const Degrees& M = args.sun_mean_anomaly;
    const Degrees& Mp = args.moon_mean_anomaly;

    Degrees i = Degrees(180.0) - D
              - Degrees(6.289 * sin(Mp))
              + Degrees(2.100 * sin(M))
              - Degrees(1.274 * sin(2.0 * D - Mp))
              - Degrees(0.658 * sin(2.0 * D))
              - Degrees(0.214 * sin(2.0 * Mp))
              - Degrees(0.110 * sin(D));

    // Fold into [0, 180]; only cos i matters for the phase
    Degrees folded = i.normalized();
    if (folded.value > 180.0) {
        folded = Degrees(360.0) - folded;
    }
    return folded;
}

PhaseResult LunarPhase::phase(const BodyPosition& sun, const BodyPosition& moon) {
    require_finite_position(sun.equatorial, "Sun");
    require_finite_position(moon.equatorial, "Moon");

    PhaseResult result;
    result.elongation = geocentric_elongation(sun.equatorial, moon.equatorial);
    result.phase_angle = phase_angle(result.elongation, sun.distance_km, moon.distance_km);
    result.illuminated_fraction = illuminated_fraction(result.phase_angle);
    result.position_angle = bright_limb_angle(sun.equatorial, moon.equatorial);

    require_finite(result.illuminated_fraction, "illuminated fraction");
    require_finite(result.position_angle.value, "bright limb position angle");
    return result;
}

// ─────────────────────────────────────────────────────────────
// Composed entry points
// ─────────────────────────────────────────────────────────────

double to_julian_day(int year, int month, double day) {
    return TimeUtils::to_julian_day(year, month, day);
}

PhaseSnapshot snapshot_for_julian_day(double jd) {
    require_finite(jd, "Julian Day");

    PhaseSnapshot snap;
    snap.jd = jd;
    snap.T = TimeUtils::julian_centuries(jd);
    snap.sun = SolarEphemeris::position(snap.T);
    snap.moon = LunarEphemeris::position(snap.T);

    BodyPosition sun_body{snap.sun.equatorial, snap.sun.distance_km};
    BodyPosition moon_body{snap.moon.equatorial, snap.moon.ecliptic.distance_km};
    snap.phase = LunarPhase::phase(sun_body, moon_body);
    return snap;
}

PhaseResult phase_for_julian_day(double jd) {
    return snapshot_for_julian_day(jd).phase;
}

PhaseResult phase_for_date(int year, int month, double day) {
    return phase_for_julian_day(TimeUtils::to_julian_day(year, month, day));
}

PhaseResult phase_for_date(const CivilDateTime& date) {
    return phase_for_julian_day(TimeUtils::to_julian_day(date));
}

SolarPosition sun_coordinates_for_date(const CivilDateTime& date) {
    return SolarEphemeris::position(TimeUtils::julian_centuries(TimeUtils::to_julian_day(date)));
}

LunarPosition moon_coordinates_for_date(const CivilDateTime& date) {
    return LunarEphemeris::position(TimeUtils::julian_centuries(TimeUtils::to_julian_day(date)));
}

}  // namespace lunar
