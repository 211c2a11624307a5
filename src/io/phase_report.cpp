#include "io/phase_report.hpp"
#include "io/json_writer.hpp"
#include <iomanip>
#include <sstream>

namespace lunar {

std::string label_for_julian_day(double jd) {
    if (jd >= 0.0) {
        return TimeUtils::jd_to_iso8601(jd);
    }
    std::ostringstream oss;
    oss << "JD " << std::fixed << std::setprecision(5) << jd;
    return oss.str();
}

void write_phase_json(const std::vector<PhaseRecord>& records, std::ostream& os) {
    JsonWriter w(os);
    w.begin_object();
    w.kv("version", 1);
    w.key("results").begin_array();

    for (const auto& rec : records) {
        const PhaseSnapshot& s = rec.snapshot;

        w.begin_object();
        w.kv("date", rec.label);
        w.kv("jd", s.jd);
        w.kv("illuminated_fraction", s.phase.illuminated_fraction);
        w.kv("position_angle", s.phase.position_angle.value);
        w.kv("phase_angle", s.phase.phase_angle.value);
        w.kv("elongation", s.phase.elongation.value);

        w.key("moon").begin_object();
          w.kv("longitude", s.moon.ecliptic.longitude.value);
          w.kv("latitude", s.moon.ecliptic.latitude.value);
          w.kv("distance_km", s.moon.ecliptic.distance_km);
          w.kv("right_ascension", s.moon.equatorial.right_ascension.value);
          w.kv("declination", s.moon.equatorial.declination.value);
        w.end_object();

        w.key("sun").begin_object();
          w.kv("apparent_longitude", s.sun.apparent_longitude.value);
          w.kv("distance_au", s.sun.distance_au);
          w.kv("distance_km", s.sun.distance_km);
          w.kv("right_ascension", s.sun.equatorial.right_ascension.value);
          w.kv("declination", s.sun.equatorial.declination.value);
        w.end_object();

        w.end_object();
    }

    w.end_array();
    w.end_object();
    w.finish();
}

void write_phase_table(const std::vector<PhaseRecord>& records, std::ostream& os) {
    std::ios::fmtflags flags = os.flags();
    std::streamsize precision = os.precision();

    os << std::left << std::setw(22) << "Date"
       << std::right << std::setw(16) << "JD"
       << std::setw(11) << "Illum %"
       << std::setw(11) << "Limb PA"
       << std::setw(11) << "Phase i"
       << std::setw(13) << "Dist km" << "\n";

    for (const auto& rec : records) {
        const PhaseSnapshot& s = rec.snapshot;
        os << std::left << std::setw(22) << rec.label
           << std::right << std::fixed
           << std::setw(16) << std::setprecision(5) << s.jd
           << std::setw(11) << std::setprecision(2) << s.phase.illuminated_fraction * 100.0
           << std::setw(11) << std::setprecision(2) << s.phase.position_angle.value
           << std::setw(11) << std::setprecision(2) << s.phase.phase_angle.value
           << std::setw(13) << std::setprecision(1) << s.moon.ecliptic.distance_km
           << "\n";
    }
    os.flags(flags);
    os.precision(precision);
}

void write_phase_details(const PhaseRecord& record, std::ostream& os) {
    const PhaseSnapshot& s = record.snapshot;
    const LunarArguments& a = s.moon.arguments;
    std::ios::fmtflags flags = os.flags();
    std::streamsize precision = os.precision();

    os << std::fixed << std::setprecision(6)
       << "=== " << record.label << " ===\n"
       << "JD " << s.jd << "  T " << std::setprecision(12) << s.T << "\n"
       << std::setprecision(6)
       << "Sun:  L0 " << s.sun.mean_longitude.value
       << "  M " << s.sun.mean_anomaly.value
       << "  C " << s.sun.equation_of_center.value
       << "  lambda " << s.sun.apparent_longitude.value
       << "  R " << s.sun.distance_au << " AU\n"
       << "      RA " << s.sun.equatorial.right_ascension.value
       << "  Dec " << s.sun.equatorial.declination.value
       << "  eps " << s.sun.obliquity.value << "\n"
       << "Moon: L' " << a.mean_longitude.value
       << "  D " << a.mean_elongation.value
       << "  M " << a.sun_mean_anomaly.value
       << "  M' " << a.moon_mean_anomaly.value
       << "  F " << a.argument_of_latitude.value
       << "  E " << a.eccentricity_factor << "\n"
       << "      Sl " << std::setprecision(0) << s.moon.sigma_l
       << "  Sb " << s.moon.sigma_b
       << "  Sr " << s.moon.sigma_r << "\n"
       << std::setprecision(6)
       << "      lambda " << s.moon.ecliptic.longitude.value
       << "  beta " << s.moon.ecliptic.latitude.value
       << "  Delta " << std::setprecision(1) << s.moon.ecliptic.distance_km << " km\n"
       << std::setprecision(6)
       << "      RA " << s.moon.equatorial.right_ascension.value
       << "  Dec " << s.moon.equatorial.declination.value << "\n"
       << "Phase: psi " << s.phase.elongation.value
       << "  i " << s.phase.phase_angle.value
       << "  k " << s.phase.illuminated_fraction
       << "  chi " << s.phase.position_angle.value << "\n";
    os.flags(flags);
    os.precision(precision);
}

}  // namespace lunar
