#include "coordinate/time_utils.hpp"
#include "core/astro_constants.hpp"
#include "core/lunar_error.hpp"
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <iomanip>

namespace lunar {

Calendar TimeUtils::calendar_for(int year, int month, double day) {
    if (year != 1582) {
        return year > 1582 ? Calendar::GREGORIAN : Calendar::JULIAN;
    }
    if (month != 10) {
        return month > 10 ? Calendar::GREGORIAN : Calendar::JULIAN;
    }
    return day >= 15.0 ? Calendar::GREGORIAN : Calendar::JULIAN;
}

bool TimeUtils::is_leap_year(int year, Calendar calendar) {
    // Floored modulo so that BCE years follow the same 4-year cycle
    auto mod = [](int a, int n) { return ((a % n) + n) % n; };

    if (calendar == Calendar::JULIAN) {
        return mod(year, 4) == 0;
    }
    return (mod(year, 4) == 0 && mod(year, 100) != 0) || mod(year, 400) == 0;
}

int TimeUtils::days_in_month(int year, int month) {
    static const int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

    if (month < 1 || month > 12) {
        throw DomainError("Month out of range 1-12: " + std::to_string(month));
    }
    if (month == 2 && is_leap_year(year, calendar_for(year, month, 1.0))) {
        return 29;
    }
    return DAYS[month - 1];
}

void TimeUtils::validate(const CivilDateTime& date) {
    if (!std::isfinite(date.day)) {
        throw DomainError("Day of month is not a finite number");
    }

    int length = days_in_month(date.year, date.month);

    if (date.day < 0.0) {
        throw DomainError("Day of month is negative: " + std::to_string(date.day));
    }
    if (date.day >= length + 1.0) {
        std::ostringstream msg;
        msg << "Day " << date.day << " beyond end of month " << date.month
            << " of year " << date.year << " (" << length << " days)";
        throw DomainError(msg.str());
    }

    // 1582 October 5-14 were skipped by the Gregorian reform
    if (date.year == 1582 && date.month == 10 && date.day >= 5.0 && date.day < 15.0) {
        throw DomainError("Date falls in the Gregorian reform gap (1582-10-05 to 1582-10-14)");
    }
}

double TimeUtils::to_julian_day(const CivilDateTime& date) {
    validate(date);

    // January and February count as months 13 and 14 of the previous year
    int y = date.year;
    int m = date.month;
    if (m <= 2) {
        y -= 1;
        m += 12;
    }

    // Gregorian leap-century correction
    double b = 0.0;
    if (calendar_for(date.year, date.month, date.day) == Calendar::GREGORIAN) {
        int a = y / 100;
        b = 2 - a + a / 4;
    }

    // floor, not truncation: y + 4716 goes negative before 4716 BCE
    return std::floor(365.25 * (y + 4716))
         + std::floor(30.6001 * (m + 1))
         + date.day + b - 1524.5;
}

double TimeUtils::to_julian_day(int year, int month, double day) {
    return to_julian_day(CivilDateTime(year, month, day));
}

double TimeUtils::julian_centuries(double jd) {
    return (jd - J2000_EPOCH_JD) / DAYS_PER_JULIAN_CENTURY;
}

CivilDateTime TimeUtils::julian_day_to_civil(double jd) {
    if (!std::isfinite(jd) || jd < 0.0) {
        throw DomainError("Julian Day outside the convertible range: " + std::to_string(jd));
    }

    double jd_plus = jd + 0.5;
    double Z = std::floor(jd_plus);
    double F = jd_plus - Z;

    double A;
    if (Z < GREGORIAN_START_JD + 0.5) {
        A = Z;
    } else {
        double alpha = std::floor((Z - 1867216.25) / 36524.25);
        A = Z + 1.0 + alpha - std::floor(alpha / 4.0);
    }

    double B = A + 1524.0;
    double C = std::floor((B - 122.1) / 365.25);
    double D = std::floor(365.25 * C);
    double E = std::floor((B - D) / 30.6001);

    CivilDateTime date;
    date.day = B - D - std::floor(30.6001 * E) + F;
    date.month = static_cast<int>(E < 14.0 ? E - 1.0 : E - 13.0);
    date.year = static_cast<int>(date.month > 2 ? C - 4716.0 : C - 4715.0);
    return date;
}

double TimeUtils::fractional_day(int day, int hour, int minute, double second) {
    if (day < 0) {
        throw DomainError("Day of month is negative: " + std::to_string(day));
    }
    if (hour < 0 || hour > 23) {
        throw DomainError("Hour out of range 0-23: " + std::to_string(hour));
    }
    if (minute < 0 || minute > 59) {
        throw DomainError("Minute out of range 0-59: " + std::to_string(minute));
    }
    if (!(second >= 0.0 && second < 60.0)) {
        throw DomainError("Second out of range [0, 60): " + std::to_string(second));
    }
    return day + (hour + minute / 60.0 + second / 3600.0) / HOURS_PER_DAY;
}

std::string TimeUtils::jd_to_iso8601(double jd) {
    // Round to the nearest second first so 23:59:59.7 rolls into the next day
    double jd_rounded = std::floor((jd + 0.5) * SECONDS_PER_DAY + 0.5) / SECONDS_PER_DAY - 0.5;
    CivilDateTime date = julian_day_to_civil(jd_rounded);

    int day = static_cast<int>(std::floor(date.day));
    double time_frac = date.day - day;
    int total_seconds = static_cast<int>(std::lround(time_frac * SECONDS_PER_DAY));
    if (total_seconds >= static_cast<int>(SECONDS_PER_DAY)) {
        total_seconds = static_cast<int>(SECONDS_PER_DAY) - 1;
    }
    int hour = total_seconds / 3600;
    int minute = (total_seconds % 3600) / 60;
    int second = total_seconds % 60;

    // ISO 8601 expanded years: "-1000", "0000"
    std::ostringstream oss;
    if (date.year < 0) {
        oss << '-';
    }
    oss << std::setfill('0')
        << std::setw(4) << std::abs(date.year) << "-"
        << std::setw(2) << date.month << "-"
        << std::setw(2) << day << "T"
        << std::setw(2) << hour << ":"
        << std::setw(2) << minute << ":"
        << std::setw(2) << second;

    return oss.str();
}

}  // namespace lunar
