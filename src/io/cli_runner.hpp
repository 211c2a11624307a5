/**
 * Parse, compute and report flow of the lunar_phase tool.
 */

#ifndef LUNAR_CLI_RUNNER_HPP
#define LUNAR_CLI_RUNNER_HPP

#include "io/cli_options.hpp"
#include "io/phase_report.hpp"
#include <ostream>
#include <vector>

namespace lunar {

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;    // bad options, unreadable input, unwritable output
constexpr int EXIT_DOMAIN = 2;   // invalid calendar date or degenerate geometry

/**
 * Run the tool on argv.
 * @param out Report destination when no --output is given; usage for --help
 * @param err Errors, usage after a parse error, and --verbose progress
 * @return EXIT_OK, EXIT_USAGE or EXIT_DOMAIN
 */
int run_cli(int argc, const char* const argv[], std::ostream& out, std::ostream& err);

/**
 * One record per requested date, from --dates or the --days/--step range.
 * @throws DomainError, NumericError from the computation
 * @throws std::runtime_error if the date list cannot be read
 */
std::vector<PhaseRecord> compute_records(const CliOptions& options, std::ostream& err);

/**
 * JSON, or the table followed by the disk when --art is set.
 */
void write_report(const std::vector<PhaseRecord>& records, const CliOptions& options,
                  std::ostream& out);

}  // namespace lunar

#endif  // LUNAR_CLI_RUNNER_HPP
