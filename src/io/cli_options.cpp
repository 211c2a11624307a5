#include "io/cli_options.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace lunar {

namespace {

int to_int(const std::string& text, const std::string& what) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != text.size()) {
        throw std::invalid_argument("Invalid " + what + ": '" + text + "'");
    }
    return value;
}

double to_real(const std::string& text, const std::string& what) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != text.size() || !std::isfinite(value)) {
        throw std::invalid_argument("Invalid " + what + ": '" + text + "'");
    }
    return value;
}

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream iss(text);
    while (std::getline(iss, part, sep)) {
        parts.push_back(part);
    }
    // getline drops a trailing empty field
    if (!text.empty() && text.back() == sep) {
        parts.push_back("");
    }
    return parts;
}

}  // anonymous namespace

CliOptions CliParser::parse(int argc, const char* const argv[]) {
    CliOptions opts;

    auto next = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + flag);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
        } else if (arg == "--date") {
            CivilDateTime d = parse_date(next(i, arg));
            opts.year = d.year;
            opts.month = d.month;
            opts.day = d.day;
            opts.has_year = opts.has_month = opts.has_day = true;
        } else if (arg == "--time") {
            parse_time(next(i, arg), opts.hour, opts.minute, opts.second);
            opts.has_time = true;
        } else if (arg == "--year") {
            opts.year = to_int(next(i, arg), "year");
            opts.has_year = true;
        } else if (arg == "--month") {
            opts.month = to_int(next(i, arg), "month");
            opts.has_month = true;
        } else if (arg == "--day") {
            opts.day = to_real(next(i, arg), "day");
            opts.has_day = true;
        } else if (arg == "--hour") {
            opts.hour = to_int(next(i, arg), "hour");
            opts.has_time = true;
        } else if (arg == "--minute") {
            opts.minute = to_int(next(i, arg), "minute");
            opts.has_time = true;
        } else if (arg == "--second") {
            opts.second = to_real(next(i, arg), "second");
            opts.has_time = true;
        } else if (arg == "--dates") {
            opts.dates_path = next(i, arg);
        } else if (arg == "--days") {
            opts.days = to_int(next(i, arg), "day count");
            opts.has_days = true;
        } else if (arg == "--step") {
            opts.step_hours = to_real(next(i, arg), "step");
            opts.has_step = true;
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--art") {
            opts.art = true;
        } else if (arg == "--output" || arg == "-o") {
            opts.output_path = next(i, arg);
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    if (opts.show_help) return opts;

    bool any_date_field = opts.has_year || opts.has_month || opts.has_day;
    bool full_date = opts.has_year && opts.has_month && opts.has_day;

    if (!opts.dates_path.empty()) {
        if (any_date_field || opts.has_time) {
            throw std::invalid_argument("--dates cannot be combined with a single date");
        }
        if (opts.has_days || opts.has_step) {
            throw std::invalid_argument("--days and --step cannot be combined with --dates");
        }
    } else if (!full_date) {
        throw std::invalid_argument(any_date_field
            ? "Incomplete date: --year, --month and --day are all required"
            : "A date is required (--date, --year/--month/--day, or --dates)");
    }

    if (opts.days < 1) {
        throw std::invalid_argument("--days must be at least 1");
    }
    if (opts.step_hours <= 0.0) {
        throw std::invalid_argument("--step must be positive");
    }

    if (opts.art) {
        if (opts.json) {
            throw std::invalid_argument("--art cannot be combined with --json");
        }
        if (!opts.dates_path.empty() || opts.days > 1) {
            throw std::invalid_argument("--art draws a single date; drop --dates or --days");
        }
    }

    return opts;
}

CivilDateTime CliParser::parse_date(const std::string& text) {
    bool negative = !text.empty() && text[0] == '-';
    std::vector<std::string> parts = split(negative ? text.substr(1) : text, '-');

    if (parts.size() != 3) {
        throw std::invalid_argument("Invalid date '" + text + "', expected YYYY-MM-DD[.ddd]");
    }

    CivilDateTime date;
    date.year = to_int(parts[0], "year in date '" + text + "'");
    if (negative) date.year = -date.year;
    date.month = to_int(parts[1], "month in date '" + text + "'");
    date.day = to_real(parts[2], "day in date '" + text + "'");
    return date;
}

void CliParser::parse_time(const std::string& text, int& hour, int& minute, double& second) {
    std::vector<std::string> parts = split(text, ':');
    if (parts.size() < 2 || parts.size() > 3) {
        throw std::invalid_argument("Invalid time '" + text + "', expected HH:MM[:SS]");
    }
    hour = to_int(parts[0], "hour in time '" + text + "'");
    minute = to_int(parts[1], "minute in time '" + text + "'");
    second = parts.size() == 3 ? to_real(parts[2], "second in time '" + text + "'") : 0.0;
}

CivilDateTime CliParser::start_date(const CliOptions& options) {
    if (!(options.has_year && options.has_month && options.has_day)) {
        throw std::invalid_argument("No start date given");
    }

    CivilDateTime date(options.year, options.month, options.day);
    if (options.has_time) {
        if (date.day != std::floor(date.day)) {
            throw std::invalid_argument("A fractional day cannot be combined with a time of day");
        }
        date.day = TimeUtils::fractional_day(static_cast<int>(date.day),
                                             options.hour, options.minute, options.second);
    }

    TimeUtils::validate(date);
    return date;
}

void CliParser::print_usage(std::ostream& os, const char* prog) {
    os << "Usage: " << prog << " --date YYYY-MM-DD[.ddd] [--time HH:MM[:SS]] [options]\n"
       << "       " << prog << " --year Y --month M --day D [--hour h --minute m --second s]\n"
       << "       " << prog << " --dates <file> [options]\n"
       << "\n"
       << "Computes the Moon's illuminated fraction and the position angle of its\n"
       << "bright limb. Negative years are astronomical (0 = 1 BCE).\n"
       << "\n"
       << "Options:\n"
       << "  --days N          Tabulate N rows from the start date (default: 1, not with --dates)\n"
       << "  --step H          Hours between rows (default: 24)\n"
       << "  --json            JSON report\n"
       << "  --art             ASCII rendering of the lit disk (single date, table only)\n"
       << "  --output <path>   Write the report to a file (default: stdout)\n"
       << "  --verbose         Intermediate values to stderr\n"
       << "  --help            Show this message\n";
}

}  // namespace lunar
