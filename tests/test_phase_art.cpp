/**
 * @file test_phase_art.cpp
 * @brief Tests for the ASCII disk rendering.
 */

#include <gtest/gtest.h>
#include <stdexcept>
#include "io/phase_art.hpp"

using namespace lunar;

namespace {

PhaseResult make_phase(double phase_angle, double position_angle) {
    PhaseResult p;
    p.phase_angle = Degrees(phase_angle);
    p.position_angle = Degrees(position_angle);
    p.illuminated_fraction = LunarPhase::illuminated_fraction(p.phase_angle);
    p.elongation = Degrees(180.0 - phase_angle);
    return p;
}

int count_cells(const std::vector<std::string>& rows, char c) {
    int n = 0;
    for (const auto& row : rows) {
        for (char cell : row) {
            if (cell == c) n++;
        }
    }
    return n;
}

}  // namespace

class PhaseArtTest : public ::testing::Test {};

TEST_F(PhaseArtTest, Dimensions) {
    auto rows = render_disk(make_phase(90.0, 270.0), 5);
    ASSERT_EQ(rows.size(), 11u);
    for (const auto& row : rows) {
        EXPECT_EQ(row.size(), 21u);
    }
    // Corners lie outside the disk, center inside
    EXPECT_EQ(rows[0][0], ' ');
    EXPECT_EQ(rows[10][20], ' ');
    EXPECT_NE(rows[5][10], ' ');
}

TEST_F(PhaseArtTest, FullMoonAllLit) {
    auto rows = render_disk(make_phase(0.0, 0.0), 6);
    EXPECT_GT(count_cells(rows, ART_LIT), 0);
    EXPECT_EQ(count_cells(rows, ART_DARK), 0);
}

TEST_F(PhaseArtTest, NewMoonAllDark) {
    auto rows = render_disk(make_phase(180.0, 0.0), 6);
    EXPECT_GT(count_cells(rows, ART_DARK), 0);
    EXPECT_EQ(count_cells(rows, ART_LIT), 0);
}

TEST_F(PhaseArtTest, QuarterLitTowardBrightLimb) {
    // Bright limb toward the west (270): right half lit, east-left convention
    const int r = 5;
    auto rows = render_disk(make_phase(90.0, 270.0), r);
    for (const auto& row : rows) {
        for (int col = 0; col < 4 * r + 1; col++) {
            if (row[col] == ' ') continue;
            if (col > 2 * r) {
                EXPECT_EQ(row[col], ART_LIT) << col;
            } else if (col < 2 * r) {
                EXPECT_EQ(row[col], ART_DARK) << col;
            }
        }
    }
}

TEST_F(PhaseArtTest, LitAreaGrowsWithFraction) {
    int crescent = count_cells(render_disk(make_phase(135.0, 90.0), 8), ART_LIT);
    int quarter = count_cells(render_disk(make_phase(90.0, 90.0), 8), ART_LIT);
    int gibbous = count_cells(render_disk(make_phase(45.0, 90.0), 8), ART_LIT);
    EXPECT_LT(crescent, quarter);
    EXPECT_LT(quarter, gibbous);
}

TEST_F(PhaseArtTest, InvalidRadius) {
    EXPECT_THROW(render_disk(make_phase(90.0, 0.0), 0), std::invalid_argument);
}
