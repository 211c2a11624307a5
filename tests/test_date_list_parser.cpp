/**
 * @file test_date_list_parser.cpp
 * @brief Tests for reading date-list files.
 */

#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include "io/date_list_parser.hpp"
#include "core/lunar_error.hpp"

using namespace lunar;

class DateListParserTest : public ::testing::Test {};

TEST_F(DateListParserTest, ParseLineForms) {
    CivilDateTime d = DateListParser::parse_line("1992 4 12");
    EXPECT_EQ(d.year, 1992);
    EXPECT_EQ(d.month, 4);
    EXPECT_DOUBLE_EQ(d.day, 12.0);

    d = DateListParser::parse_line("  -1000\t7  12.5 ");
    EXPECT_EQ(d.year, -1000);
    EXPECT_EQ(d.month, 7);
    EXPECT_DOUBLE_EQ(d.day, 12.5);

    d = DateListParser::parse_line("2018 7 27 20 22");
    EXPECT_NEAR(d.day, 27.848611, 1e-6);

    d = DateListParser::parse_line("2018 7 27 20");
    EXPECT_NEAR(d.day, 27.0 + 20.0 / 24.0, 1e-12);

    d = DateListParser::parse_line("2000 1 1 12 0 30.5");
    EXPECT_NEAR(d.day, 1.5 + 30.5 / 86400.0, 1e-12);
}

TEST_F(DateListParserTest, ParseLineRejects) {
    EXPECT_THROW(DateListParser::parse_line("2023 1"), std::invalid_argument);
    EXPECT_THROW(DateListParser::parse_line("2023 1 1 0 0 0 0"), std::invalid_argument);
    EXPECT_THROW(DateListParser::parse_line("2023 Jan 1"), std::invalid_argument);
    EXPECT_THROW(DateListParser::parse_line("2023 1 1x"), std::invalid_argument);
    EXPECT_THROW(DateListParser::parse_line("2023 1 1.5 12"), std::invalid_argument);

    EXPECT_THROW(DateListParser::parse_line("2023 2 30"), DomainError);
    EXPECT_THROW(DateListParser::parse_line("1582 10 10"), DomainError);
    EXPECT_THROW(DateListParser::parse_line("2023 1 1 24"), DomainError);
}

TEST_F(DateListParserTest, StreamSkipsCommentsAndBadLines) {
    std::istringstream in(
        "# eclipses\n"
        "2018 7 27 20 22\n"
        "\n"
        "   \t\n"
        "2023 2 30\n"
        "  # indented comment\n"
        "not a date\n"
        "-1000 7 12.5\n");

    std::vector<DateEntry> entries = DateListParser::parse_stream(in, "test");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].line_number, 2);
    EXPECT_EQ(entries[0].date.year, 2018);
    EXPECT_EQ(entries[1].line_number, 8);
    EXPECT_EQ(entries[1].date.year, -1000);
}

TEST_F(DateListParserTest, WindowsLineEndings) {
    std::istringstream in("1992 4 12\r\n2000 1 1.5\r\n");
    std::vector<DateEntry> entries = DateListParser::parse_stream(in, "crlf");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_DOUBLE_EQ(entries[1].date.day, 1.5);
}

TEST_F(DateListParserTest, EmptyStream) {
    std::istringstream in("");
    EXPECT_TRUE(DateListParser::parse_stream(in, "empty").empty());
}

TEST_F(DateListParserTest, MissingFileThrows) {
    EXPECT_THROW(DateListParser::parse_file("/nonexistent/lunar_dates.txt"), std::runtime_error);
}
