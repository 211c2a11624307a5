/**
 * Lunar Phase
 *
 * Illuminated fraction of the Moon's disk and position angle of its bright
 * limb from geocentric Sun and Moon positions (Meeus ch. 48), plus the
 * composed date -> phase entry points.
 *
 * Everything here is a pure function of its arguments; concurrent callers
 * need no coordination.
 */

#ifndef LUNAR_LUNAR_PHASE_HPP
#define LUNAR_LUNAR_PHASE_HPP

#include "core/angle.hpp"
#include "coordinate/ecliptic_transform.hpp"
#include "coordinate/time_utils.hpp"
#include "physics/solar_ephemeris.hpp"
#include "physics/lunar_ephemeris.hpp"

namespace lunar {

/**
 * Equatorial position with the body's distance from Earth's center
 */
struct BodyPosition {
    EquatorialPosition equatorial;
    double distance_km;
};

struct PhaseResult {
    double illuminated_fraction;    // k in [0, 1]
    Degrees position_angle;         // χ of the bright limb, [0, 360)
    Degrees phase_angle;            // i, Sun-Moon-Earth, [0, 180]
    Degrees elongation;             // ψ, Moon-Sun seen from Earth, [0, 180]
};

/**
 * Everything computed for one instant
 */
struct PhaseSnapshot {
    double jd;
    double T;
    SolarPosition sun;
    LunarPosition moon;
    PhaseResult phase;
};

class LunarPhase {
public:
    /**
     * Geocentric elongation from equatorial coordinates
     * cos ψ = sin δ0 sin δ + cos δ0 cos δ cos(α0 - α)
     */
    static Degrees geocentric_elongation(const EquatorialPosition& sun,
                                         const EquatorialPosition& moon);

    /**
     * Geocentric elongation from ecliptic coordinates, taking the Sun's
     * latitude as zero: cos ψ = cos β cos(λ - λ0)
     */
    static Degrees elongation_from_ecliptic(const EclipticPosition& moon,
                                            Degrees sun_longitude);

    /**
     * Selenocentric elongation of Earth from the Sun
     * @param elongation Geocentric elongation ψ
     * @param sun_distance_km Earth-Sun distance R
     * @param moon_distance_km Earth-Moon distance Δ, same unit as R
     * @return i in [0, 180]
     * @throws NumericError on a non-positive or non-finite distance
     */
    static Degrees phase_angle(Degrees elongation, double sun_distance_km,
                               double moon_distance_km);

    /**
     * k = (1 + cos i) / 2, clamped to [0, 1] against rounding at syzygy
     */
    static double illuminated_fraction(Degrees phase_angle);

    /**
     * Position angle of the midpoint of the bright limb, from north through east
     * @return χ in [0, 360)
     */
    static Degrees bright_limb_angle(const EquatorialPosition& sun,
                                     const EquatorialPosition& moon);

    /**
     * Phase angle straight from the lunar arguments (Meeus 48.4).
     * Ignores the Moon's latitude: within about 1 degree of the full
     * computation away from new and full moon, a few degrees near them.
     * @param T Julian centuries since J2000.0
     * @return i in [0, 180]
     */
    static Degrees approximate_phase_angle(double T);

    /**
     * Combine Sun and Moon positions into a PhaseResult
     * @throws NumericError on degenerate input (zero distance, NaN)
     */
    static PhaseResult phase(const BodyPosition& sun, const BodyPosition& moon);
};

// ─────────────────────────────────────────────────────────────
// Composed entry points: civil date -> JD -> T -> Sun, Moon -> phase
// ─────────────────────────────────────────────────────────────

double to_julian_day(int year, int month, double day);

PhaseSnapshot snapshot_for_julian_day(double jd);

PhaseResult phase_for_julian_day(double jd);

/**
 * @throws DomainError on an invalid calendar date
 */
PhaseResult phase_for_date(int year, int month, double day);
PhaseResult phase_for_date(const CivilDateTime& date);

SolarPosition sun_coordinates_for_date(const CivilDateTime& date);
LunarPosition moon_coordinates_for_date(const CivilDateTime& date);

}  // namespace lunar

#endif  // LUNAR_LUNAR_PHASE_HPP
