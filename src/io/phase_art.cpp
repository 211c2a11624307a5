#include "io/phase_art.hpp"
#include <cmath>
#include <stdexcept>

namespace lunar {

std::vector<std::string> render_disk(const PhaseResult& phase, int radius) {
    if (radius < 1) {
        throw std::invalid_argument("Disk radius must be at least 1 row");
    }

    // Unit vector toward the bright limb on screen: position angle runs from
    // north (up) through east (left)
    double limb_x = -sin(phase.position_angle);
    double limb_y = cos(phase.position_angle);

    // Sun direction in the Moon's frame: u toward the bright limb, w toward
    // the observer
    double sun_u = sin(phase.phase_angle);
    double sun_w = cos(phase.phase_angle);

    int width = 4 * radius + 1;
    std::vector<std::string> rows;
    rows.reserve(2 * radius + 1);

    for (int row = 0; row <= 2 * radius; row++) {
        std::string line(width, ' ');
        // Sample at half-cell insets so no drawn cell sits exactly on the rim
        double y = (radius - row) / (radius + 0.5);

        for (int col = 0; col < width; col++) {
            double x = (col - 2 * radius) / (2.0 * radius + 1.0);
            double rho2 = x * x + y * y;
            if (rho2 >= 1.0) continue;

            double u = x * limb_x + y * limb_y;
            double w = std::sqrt(1.0 - rho2);
            line[col] = (u * sun_u + w * sun_w > 0.0) ? ART_LIT : ART_DARK;
        }
        rows.push_back(line);
    }

    return rows;
}

}  // namespace lunar
