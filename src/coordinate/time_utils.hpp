#ifndef LUNAR_TIME_UTILS_HPP
#define LUNAR_TIME_UTILS_HPP

#include <string>

namespace lunar {

/**
 * @brief Calendar in force for a civil date
 */
enum class Calendar {
    JULIAN,      // Proleptic Julian, before 1582 October 15
    GREGORIAN    // From 1582 October 15 onward
};

/**
 * @brief Civil date with the time of day folded into the day
 *
 * Astronomical year numbering: year 0 is 1 BCE, -1 is 2 BCE.
 * day runs over [0, days_in_month + 1); its fraction is the time since
 * midnight divided by 24 h.
 */
struct CivilDateTime {
    int year;
    int month;      // 1-12
    double day;

    CivilDateTime() : year(2000), month(1), day(1.5) {}
    CivilDateTime(int y, int m, double d) : year(y), month(m), day(d) {}
};

/**
 * @brief Calendar and Julian Day conversions (Meeus, Astronomical Algorithms, ch. 7)
 */
class TimeUtils {
public:
    /**
     * @brief Calendar used for a given date
     * Dates before 1582-10-15 are Julian, later ones Gregorian.
     */
    static Calendar calendar_for(int year, int month, double day);

    static bool is_leap_year(int year, Calendar calendar);

    /**
     * @brief Number of days in a month, per the calendar in force that year
     * @throws DomainError if month is outside 1-12
     */
    static int days_in_month(int year, int month);

    /**
     * @brief Check every field of a civil date
     * @throws DomainError on month outside 1-12, day < 0, day beyond the end
     *         of the month, non-finite day, or a day inside the 1582 gap
     */
    static void validate(const CivilDateTime& date);

    /**
     * @brief Convert a civil date to Julian Day
     * @param date Validated or unvalidated date (validated here)
     * @return Julian Day (days since 4713 BCE January 1, 12h)
     * @throws DomainError on an invalid date
     */
    static double to_julian_day(const CivilDateTime& date);
    static double to_julian_day(int year, int month, double day);

    /**
     * @brief Julian centuries since J2000.0
     */
    static double julian_centuries(double jd);

    /**
     * @brief Convert a Julian Day back to a civil date
     * Julian calendar below JD 2299160.5, Gregorian from there on.
     * @throws DomainError for a negative or non-finite JD
     */
    static CivilDateTime julian_day_to_civil(double jd);

    /**
     * @brief Combine clock fields into a fractional day of month
     * @throws DomainError if hour, minute or second is out of range
     */
    static double fractional_day(int day, int hour, int minute, double second);

    /**
     * @brief Convert Julian Day to ISO 8601 string
     * @param jd Julian Day
     * @return e.g. "1992-04-12T00:00:00", "-1000-07-12T12:00:00"
     */
    static std::string jd_to_iso8601(double jd);
};

}  // namespace lunar

#endif  // LUNAR_TIME_UTILS_HPP
