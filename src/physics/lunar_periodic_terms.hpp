/**
 * Lunar Periodic Terms
 *
 * ELP-2000/82 truncation tabulated by Meeus, "Astronomical Algorithms"
 * Tables 47.A and 47.B. Each row gives the integer multiples of the four
 * fundamental arguments (D, M, M', F) and the amplitudes of its sine
 * (longitude, latitude: 1e-6 degree) or cosine (distance: 1e-3 km) term.
 *
 * Rows are immutable static data; nothing writes to them after load.
 */

#ifndef LUNAR_PERIODIC_TERMS_HPP
#define LUNAR_PERIODIC_TERMS_HPP

#include <cstddef>

namespace lunar {

/**
 * Row of Table 47.A: contributes to both longitude and distance
 */
struct LongitudeDistanceTerm {
    int d;              // Mean elongation D
    int m;              // Sun's mean anomaly M
    int m_prime;        // Moon's mean anomaly M'
    int f;              // Argument of latitude F
    double sigma_l;     // sine amplitude, 1e-6 degree
    double sigma_r;     // cosine amplitude, 1e-3 km
};

/**
 * Row of Table 47.B: contributes to latitude
 */
struct LatitudeTerm {
    int d;
    int m;
    int m_prime;
    int f;
    double sigma_b;     // sine amplitude, 1e-6 degree
};

constexpr std::size_t LONGITUDE_DISTANCE_TERM_COUNT = 60;
constexpr std::size_t LATITUDE_TERM_COUNT = 60;

const LongitudeDistanceTerm* longitude_distance_terms();
const LatitudeTerm* latitude_terms();

}  // namespace lunar

#endif  // LUNAR_PERIODIC_TERMS_HPP
