#include "io/cli_runner.hpp"
#include "io/date_list_parser.hpp"
#include "io/phase_art.hpp"
#include "core/astro_constants.hpp"
#include "core/lunar_error.hpp"
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>

namespace lunar {

namespace {

constexpr int ART_RADIUS = 10;

}  // anonymous namespace

std::vector<PhaseRecord> compute_records(const CliOptions& options, std::ostream& err) {
    std::vector<PhaseRecord> records;

    if (!options.dates_path.empty()) {
        auto entries = DateListParser::parse_file(options.dates_path);
        if (options.verbose) {
            err << "Read " << entries.size() << " dates from " << options.dates_path << "\n";
        }
        for (const auto& entry : entries) {
            double jd = TimeUtils::to_julian_day(entry.date);
            records.push_back({label_for_julian_day(jd), snapshot_for_julian_day(jd)});
        }
        return records;
    }

    CivilDateTime start = CliParser::start_date(options);
    double jd0 = TimeUtils::to_julian_day(start);
    double step_days = options.step_hours / HOURS_PER_DAY;

    for (int n = 0; n < options.days; n++) {
        double jd = jd0 + n * step_days;
        records.push_back({label_for_julian_day(jd), snapshot_for_julian_day(jd)});
    }
    return records;
}

void write_report(const std::vector<PhaseRecord>& records, const CliOptions& options,
                  std::ostream& out) {
    if (options.json) {
        write_phase_json(records, out);
        return;
    }

    write_phase_table(records, out);

    if (options.art) {
        for (const auto& rec : records) {
            out << "\n";
            for (const auto& row : render_disk(rec.snapshot.phase, ART_RADIUS)) {
                out << row << "\n";
            }
        }
    }
}

int run_cli(int argc, const char* const argv[], std::ostream& out, std::ostream& err) {
    const char* prog = argc > 0 ? argv[0] : "lunar_phase";
    CliOptions config;

    try {
        config = CliParser::parse(argc, argv);
    } catch (const std::invalid_argument& e) {
        err << "Error: " << e.what() << "\n\n";
        CliParser::print_usage(err, prog);
        return EXIT_USAGE;
    }

    if (config.show_help) {
        CliParser::print_usage(out, prog);
        return EXIT_OK;
    }

    if (config.verbose) {
        err << "=== Lunar Phase ===\n"
            << "Source: " << (config.dates_path.empty() ? "command line" : config.dates_path) << "\n"
            << "Rows: " << config.days << " every " << config.step_hours << "h\n"
            << "Format: " << (config.json ? "json" : "table") << "\n"
            << "Output: " << (config.output_path.empty() ? "stdout" : config.output_path)
            << "\n\n";
    }

    auto t_start = std::chrono::high_resolution_clock::now();

    std::vector<PhaseRecord> records;
    try {
        records = compute_records(config, err);
    } catch (const DomainError& e) {
        err << "Error: " << e.what() << "\n";
        return EXIT_DOMAIN;
    } catch (const NumericError& e) {
        err << "Error: " << e.what() << "\n";
        return EXIT_DOMAIN;
    } catch (const std::exception& e) {
        // unreadable date file, fractional day with --time
        err << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    if (config.verbose) {
        for (const auto& rec : records) {
            write_phase_details(rec, err);
        }
        double elapsed = std::chrono::duration<double>(
            std::chrono::high_resolution_clock::now() - t_start).count();
        err << "\nComputed " << records.size() << " dates in " << elapsed << "s\n";
    }

    if (records.empty()) {
        err << "WARNING: no valid dates to report\n";
    }

    if (config.output_path.empty()) {
        write_report(records, config, out);
    } else {
        std::ofstream file(config.output_path);
        if (!file.is_open()) {
            err << "Error: cannot open output file: " << config.output_path << "\n";
            return EXIT_USAGE;
        }
        write_report(records, config, file);
        if (config.verbose) {
            err << "Written to: " << config.output_path << "\n";
        }
    }

    return EXIT_OK;
}

}  // namespace lunar
