/**
 * Command-line options for the lunar_phase tool.
 */

#ifndef LUNAR_CLI_OPTIONS_HPP
#define LUNAR_CLI_OPTIONS_HPP

#include "coordinate/time_utils.hpp"
#include <ostream>
#include <string>

namespace lunar {

struct CliOptions {
    // Start date, from --date or --year/--month/--day
    bool has_year = false;
    bool has_month = false;
    bool has_day = false;
    int year = 0;
    int month = 1;
    double day = 1.0;

    // Time of day, from --time or --hour/--minute/--second
    bool has_time = false;
    int hour = 0;
    int minute = 0;
    double second = 0.0;

    std::string dates_path;         // --dates: one date per line
    bool has_days = false;
    bool has_step = false;
    int days = 1;                   // rows to tabulate from the start date
    double step_hours = 24.0;       // spacing of tabulated rows

    bool json = false;
    bool art = false;
    std::string output_path;        // empty = stdout
    bool verbose = false;
    bool show_help = false;
};

class CliParser {
public:
    /**
     * Parse argv into options.
     * @throws std::invalid_argument on an unknown flag, a missing or malformed
     *         value, or a contradictory combination
     */
    static CliOptions parse(int argc, const char* const argv[]);

    /**
     * "YYYY-MM-DD" with an optional fractional day; a leading '-' marks a
     * BCE (astronomical) year, e.g. "-1000-07-12.5"
     */
    static CivilDateTime parse_date(const std::string& text);

    /**
     * "HH:MM" or "HH:MM:SS[.sss]"
     */
    static void parse_time(const std::string& text, int& hour, int& minute, double& second);

    /**
     * Start date with the time of day folded into the day
     * @throws std::invalid_argument if no complete date was given
     * @throws DomainError if the date is invalid
     */
    static CivilDateTime start_date(const CliOptions& options);

    static void print_usage(std::ostream& os, const char* prog);
};

}  // namespace lunar

#endif  // LUNAR_CLI_OPTIONS_HPP
