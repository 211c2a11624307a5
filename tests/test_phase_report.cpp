/**
 * @file test_phase_report.cpp
 * @brief Tests for the JSON writer and the phase report formats.
 */

#include <gtest/gtest.h>
#include <cmath>
#include <iomanip>
#include <sstream>
#include "io/json_writer.hpp"
#include "io/phase_report.hpp"

using namespace lunar;

class JsonWriterTest : public ::testing::Test {};

TEST_F(JsonWriterTest, NestedDocument) {
    std::ostringstream os;
    JsonWriter w(os);
    w.begin_object();
    w.kv("a", 1);
    w.key("b").begin_array();
      w.value(1.5);
      w.value("x");
    w.end_array();
    w.key("c").begin_object();
    w.end_object();
    w.end_object();
    w.finish();

    EXPECT_EQ(os.str(),
              "{\n"
              "  \"a\": 1,\n"
              "  \"b\": [\n"
              "    1.5,\n"
              "    \"x\"\n"
              "  ],\n"
              "  \"c\": {}\n"
              "}\n");
}

TEST_F(JsonWriterTest, EscapesAndSpecialValues) {
    std::ostringstream os;
    JsonWriter w(os, 0);
    w.begin_array();
    w.value("q\"b\\n\n");
    w.value(std::nan(""));
    w.value(true);
    w.end_array();

    std::string text = os.str();
    EXPECT_NE(text.find("\"q\\\"b\\\\n\\n\""), std::string::npos);
    EXPECT_NE(text.find("null"), std::string::npos);
    EXPECT_NE(text.find("true"), std::string::npos);
}

TEST_F(JsonWriterTest, FinishClosesOpenScopes) {
    std::ostringstream os;
    JsonWriter w(os, 0);
    w.begin_object();
    w.key("list").begin_array();
    w.value(2);
    w.finish();

    std::string text = os.str();
    EXPECT_EQ(text.back(), '\n');
    EXPECT_NE(text.find("]"), std::string::npos);
    EXPECT_NE(text.find("}"), std::string::npos);
}

class PhaseReportTest : public ::testing::Test {
protected:
    std::vector<PhaseRecord> records_;

    void SetUp() override {
        double jd = 2448724.5;  // 1992-04-12 0h
        records_.push_back({label_for_julian_day(jd), snapshot_for_julian_day(jd)});
    }
};

TEST_F(PhaseReportTest, Labels) {
    EXPECT_EQ(label_for_julian_day(2448724.5), "1992-04-12T00:00:00");
    EXPECT_EQ(label_for_julian_day(-10.25), "JD -10.25000");
}

TEST_F(PhaseReportTest, JsonReport) {
    std::ostringstream os;
    write_phase_json(records_, os);
    std::string text = os.str();

    EXPECT_EQ(text.front(), '{');
    EXPECT_NE(text.find("\"version\": 1"), std::string::npos);
    EXPECT_NE(text.find("\"results\": ["), std::string::npos);
    EXPECT_NE(text.find("\"date\": \"1992-04-12T00:00:00\""), std::string::npos);
    EXPECT_NE(text.find("\"jd\": 2448724.5"), std::string::npos);
    EXPECT_NE(text.find("\"illuminated_fraction\": 0.67856"), std::string::npos);
    EXPECT_NE(text.find("\"longitude\": 133.16265"), std::string::npos);
    EXPECT_NE(text.find("\"moon\": {"), std::string::npos);
    EXPECT_NE(text.find("\"sun\": {"), std::string::npos);
    EXPECT_NE(text.find("\"distance_au\""), std::string::npos);
}

TEST_F(PhaseReportTest, JsonReportEmpty) {
    std::ostringstream os;
    write_phase_json({}, os);
    EXPECT_NE(os.str().find("\"results\": []"), std::string::npos);
}

TEST_F(PhaseReportTest, TableReport) {
    std::ostringstream os;
    write_phase_table(records_, os);
    std::string text = os.str();

    EXPECT_NE(text.find("Illum %"), std::string::npos);
    EXPECT_NE(text.find("1992-04-12T00:00:00"), std::string::npos);
    EXPECT_NE(text.find("2448724.50000"), std::string::npos);
    EXPECT_NE(text.find("67.86"), std::string::npos);
    EXPECT_NE(text.find("285.04"), std::string::npos);
}

TEST_F(PhaseReportTest, Details) {
    std::ostringstream os;
    write_phase_details(records_[0], os);
    std::string text = os.str();

    EXPECT_NE(text.find("=== 1992-04-12T00:00:00 ==="), std::string::npos);
    EXPECT_NE(text.find("Sl -1127527"), std::string::npos);
    EXPECT_NE(text.find("k 0.678569"), std::string::npos);
}

TEST_F(PhaseReportTest, StreamFormatRestored) {
    std::ostringstream os;
    os << std::setprecision(3);
    std::ios::fmtflags before = os.flags();
    write_phase_table(records_, os);
    write_phase_details(records_[0], os);

    EXPECT_EQ(os.precision(), 3);
    EXPECT_EQ(os.flags(), before);

    std::ostringstream tail;
    tail.copyfmt(os);
    tail << 0.123456;
    EXPECT_EQ(tail.str(), "0.123");
}
