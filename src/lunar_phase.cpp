/**
 * lunar_phase: illuminated fraction and bright-limb angle of the Moon.
 *
 * Computes geocentric Sun and Moon positions for one or more dates and
 * reports the phase as a text table, JSON, or an ASCII picture of the disk.
 *
 * Usage:
 *   lunar_phase --date 1992-04-12 [--time 20:00] [--days N] [--step H]
 *               [--json | --art] [--output <path>] [--verbose]
 *   lunar_phase --dates <file> [--json] [--output <path>] [--verbose]
 */

#include "io/cli_runner.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    return lunar::run_cli(argc, argv, std::cout, std::cerr);
}
