/**
 * Angle Types and Operations
 *
 * Distinct Degrees/Radians value types with explicit conversion.
 * Series and API boundaries speak Degrees; the trig helpers below convert
 * to Radians at the call site so std::sin never sees a degree value.
 * Header-only.
 */

#ifndef LUNAR_ANGLE_HPP
#define LUNAR_ANGLE_HPP

#include <cmath>
#include <cstddef>

namespace lunar {

constexpr double PI = 3.14159265358979323846;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;
constexpr double ARCSEC_PER_DEG = 3600.0;

struct Degrees;

/**
 * @brief Angle in radians
 */
struct Radians {
    double value;

    constexpr Radians() : value(0.0) {}
    constexpr explicit Radians(double v) : value(v) {}

    Degrees to_degrees() const;
};

/**
 * @brief Angle in degrees
 */
struct Degrees {
    double value;

    constexpr Degrees() : value(0.0) {}
    constexpr explicit Degrees(double v) : value(v) {}

    static constexpr Degrees from_arcseconds(double arcsec) {
        return Degrees(arcsec / ARCSEC_PER_DEG);
    }

    Radians to_radians() const { return Radians(value * DEG_TO_RAD); }

    // Reduce to [0, 360)
    Degrees normalized() const {
        double d = std::fmod(value, 360.0);
        if (d < 0.0) d += 360.0;
        // fmod of a tiny negative value can round up to exactly 360
        if (d >= 360.0) d = 0.0;
        return Degrees(d);
    }

    double arcseconds() const { return value * ARCSEC_PER_DEG; }
};

inline Degrees Radians::to_degrees() const {
    return Degrees(value * RAD_TO_DEG);
}

// ═══════════════════════════════════════════════════════════════
// Degrees operators
// ═══════════════════════════════════════════════════════════════

inline Degrees operator+(Degrees a, Degrees b) { return Degrees(a.value + b.value); }
inline Degrees operator-(Degrees a, Degrees b) { return Degrees(a.value - b.value); }
inline Degrees operator-(Degrees a)            { return Degrees(-a.value); }
inline Degrees operator*(double s, Degrees a)  { return Degrees(s * a.value); }
inline Degrees operator*(Degrees a, double s)  { return Degrees(a.value * s); }

inline Degrees& operator-=(Degrees& a, Degrees b) {
    a.value -= b.value;
    return a;
}

// ═══════════════════════════════════════════════════════════════
// Trigonometry at the unit boundary
// ═══════════════════════════════════════════════════════════════

inline double sin(Degrees a) { return std::sin(a.to_radians().value); }
inline double cos(Degrees a) { return std::cos(a.to_radians().value); }
inline double tan(Degrees a) { return std::tan(a.to_radians().value); }

inline double sin(Radians a) { return std::sin(a.value); }
inline double cos(Radians a) { return std::cos(a.value); }

inline Degrees asin_deg(double x) { return Radians(std::asin(x)).to_degrees(); }
inline Degrees acos_deg(double x) { return Radians(std::acos(x)).to_degrees(); }

inline Degrees atan2_deg(double y, double x) {
    return Radians(std::atan2(y, x)).to_degrees();
}

// Evaluate c0 + c1*T + c2*T^2 + ... (Horner)
template <std::size_t N>
inline double polynomial(const double (&coeffs)[N], double t) {
    double result = 0.0;
    for (std::size_t i = N; i-- > 0;) {
        result = result * t + coeffs[i];
    }
    return result;
}

}  // namespace lunar

#endif  // LUNAR_ANGLE_HPP
