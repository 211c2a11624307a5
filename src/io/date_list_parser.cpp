#include "io/date_list_parser.hpp"
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace lunar {

std::vector<DateEntry> DateListParser::parse_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open date list: " + filename);
    }
    return parse_stream(file, filename);
}

std::vector<DateEntry> DateListParser::parse_stream(std::istream& in, const std::string& source) {
    std::vector<DateEntry> entries;
    std::string line;
    int line_number = 0;

    while (std::getline(in, line)) {
        line_number++;

        // Skip blank lines and comments
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') continue;

        try {
            entries.push_back(DateEntry{line_number, parse_line(line)});
        } catch (const std::exception& e) {
            std::cerr << "WARNING: " << source << ":" << line_number
                      << ": skipping date: " << e.what() << std::endl;
        }
    }

    return entries;
}

CivilDateTime DateListParser::parse_line(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }

    if (tokens.size() < 3 || tokens.size() > 6) {
        throw std::invalid_argument("expected 'year month day [hour [minute [second]]]', got " +
                                    std::to_string(tokens.size()) + " fields");
    }

    CivilDateTime date;
    date.year = parse_int(tokens[0], "year");
    date.month = parse_int(tokens[1], "month");
    date.day = parse_real(tokens[2], "day");

    if (tokens.size() > 3) {
        // Clock fields given: the day must be a whole number
        if (date.day != std::floor(date.day)) {
            throw std::invalid_argument("fractional day combined with a time of day");
        }
        int hour = parse_int(tokens[3], "hour");
        int minute = tokens.size() > 4 ? parse_int(tokens[4], "minute") : 0;
        double second = tokens.size() > 5 ? parse_real(tokens[5], "second") : 0.0;
        date.day = TimeUtils::fractional_day(static_cast<int>(date.day), hour, minute, second);
    }

    TimeUtils::validate(date);
    return date;
}

int DateListParser::parse_int(const std::string& token, const char* field) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(token, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("bad ") + field + ": '" + token + "'");
    }
    if (consumed != token.size()) {
        throw std::invalid_argument(std::string("bad ") + field + ": '" + token + "'");
    }
    return value;
}

double DateListParser::parse_real(const std::string& token, const char* field) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(token, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("bad ") + field + ": '" + token + "'");
    }
    if (consumed != token.size()) {
        throw std::invalid_argument(std::string("bad ") + field + ": '" + token + "'");
    }
    return value;
}

}  // namespace lunar
