#ifndef LUNAR_DATE_LIST_PARSER_HPP
#define LUNAR_DATE_LIST_PARSER_HPP

#include "coordinate/time_utils.hpp"
#include <istream>
#include <string>
#include <vector>

namespace lunar {

/**
 * @brief One date read from a date-list file
 */
struct DateEntry {
    int line_number;
    CivilDateTime date;
};

/**
 * @brief Parser for date-list files
 *
 * One date per line:  year month day [hour [minute [second]]]
 * Blank lines and lines starting with '#' are skipped. A line that fails to
 * parse or names an invalid date is reported on stderr and skipped.
 *
 *   # total lunar eclipse
 *   2018 7 27 20 22
 *   -1000 7 12.5
 */
class DateListParser {
public:
    /**
     * @brief Parse a date-list file
     * @throws std::runtime_error if the file cannot be opened
     */
    static std::vector<DateEntry> parse_file(const std::string& filename);

    /**
     * @brief Parse date lines from a stream
     * @param source Name used in warnings
     */
    static std::vector<DateEntry> parse_stream(std::istream& in, const std::string& source);

    /**
     * @brief Parse a single line
     * @throws std::invalid_argument on malformed fields
     * @throws DomainError if the fields do not form a valid date
     */
    static CivilDateTime parse_line(const std::string& line);

private:
    static int parse_int(const std::string& token, const char* field);
    static double parse_real(const std::string& token, const char* field);
};

}  // namespace lunar

#endif  // LUNAR_DATE_LIST_PARSER_HPP
