/**
 * Phase Report
 *
 * Text table and JSON output for one or more PhaseSnapshots.
 *
 * JSON format:
 * {
 *   "version": 1,
 *   "results": [
 *     {
 *       "date": "1992-04-12T00:00:00",
 *       "jd": 2448724.5,
 *       "illuminated_fraction": 0.678569,
 *       "position_angle": 285.04,
 *       "phase_angle": 69.08,
 *       "elongation": 110.79,
 *       "moon": { "longitude", "latitude", "distance_km",
 *                 "right_ascension", "declination" },
 *       "sun":  { "apparent_longitude", "distance_au", "distance_km",
 *                 "right_ascension", "declination" }
 *     }
 *   ]
 * }
 */

#ifndef LUNAR_PHASE_REPORT_HPP
#define LUNAR_PHASE_REPORT_HPP

#include "physics/lunar_phase.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace lunar {

struct PhaseRecord {
    std::string label;          // date as displayed
    PhaseSnapshot snapshot;
};

/**
 * ISO 8601 label for a Julian Day; "JD <value>" where the calendar
 * inverse does not apply (before 4712 BCE)
 */
std::string label_for_julian_day(double jd);

void write_phase_json(const std::vector<PhaseRecord>& records, std::ostream& os);

void write_phase_table(const std::vector<PhaseRecord>& records, std::ostream& os);

/**
 * Intermediate values of one snapshot, for --verbose
 */
void write_phase_details(const PhaseRecord& record, std::ostream& os);

}  // namespace lunar

#endif  // LUNAR_PHASE_REPORT_HPP
