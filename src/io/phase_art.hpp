/**
 * ASCII rendering of the Moon's lit disk, as seen in the sky
 * (north up, east to the left).
 */

#ifndef LUNAR_PHASE_ART_HPP
#define LUNAR_PHASE_ART_HPP

#include "physics/lunar_phase.hpp"
#include <string>
#include <vector>

namespace lunar {

constexpr char ART_LIT = '#';
constexpr char ART_DARK = '.';

/**
 * Render the disk as rows of text.
 * @param phase Phase angle and bright-limb position angle to draw
 * @param radius Disk radius in rows; each row is 4 * radius + 1 columns
 *        (terminal cells are about twice as tall as wide)
 * @return 2 * radius + 1 rows; cells outside the disk are spaces
 * @throws std::invalid_argument if radius < 1
 */
std::vector<std::string> render_disk(const PhaseResult& phase, int radius);

}  // namespace lunar

#endif  // LUNAR_PHASE_ART_HPP
