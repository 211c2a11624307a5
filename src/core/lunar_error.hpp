/**
 * Error taxonomy for the ephemeris core.
 *
 * DomainError: a calendar or clock field outside its valid range.
 * NumericError: degenerate geometry (zero distance, NaN/Inf input or result).
 */

#ifndef LUNAR_ERROR_HPP
#define LUNAR_ERROR_HPP

#include <cmath>
#include <stdexcept>
#include <string>

namespace lunar {

class DomainError : public std::domain_error {
public:
    explicit DomainError(const std::string& msg) : std::domain_error(msg) {}
};

class NumericError : public std::runtime_error {
public:
    explicit NumericError(const std::string& msg) : std::runtime_error(msg) {}
};

// Throws NumericError if value is NaN or infinite
inline double require_finite(double value, const char* what) {
    if (!std::isfinite(value)) {
        throw NumericError(std::string("Non-finite value for ") + what);
    }
    return value;
}

}  // namespace lunar

#endif  // LUNAR_ERROR_HPP
