/*
 * Copyright (c) 2026 NetSynth contributors
 * 
 * This file is part of the NetSynth library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

#include <gtest/gtest.h>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include <netsynth/netsynth.h>

using netsynth::Sample;
using netsynth::SampleTable;

namespace {

    SampleTable tableOf(std::vector<Sample> rows) {
        return SampleTable(std::move(rows));
    }

    bool mentions(const netsynth::ValidationReport& report, const std::string& text) {
        for (const auto& issue : report.issues) {
            if (issue.find(text) != std::string::npos) return true;
        }
        return false;
    }

} // namespace

TEST(ValidationTest, GeneratedTablePasses) {
    SampleTable table = netsynth::generate(5000, 42);
    netsynth::ValidationReport report = netsynth::validate(table);
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.rows_checked, 5000u);
    EXPECT_TRUE(report.issues.empty());
}

TEST(ValidationTest, ReloadedCsvPasses) {
    // server_delay reconstructed as ttfb - rtt stays within tolerance
    SampleTable table = netsynth::generate(2000, 8);
    std::stringstream ss;
    netsynth::SampleCsvWriter writer;
    ASSERT_TRUE(writer.open(ss));
    writer.write(table);
    writer.close();

    netsynth::SampleCsvReader reader;
    ASSERT_TRUE(reader.open(ss));
    EXPECT_TRUE(netsynth::validate(reader.readAll()).ok());
}

TEST(ValidationTest, CustomParametersRespected) {
    netsynth::ModelParameters p;
    p.loss_min = 0.05;
    p.loss_max = 0.1;
    p.throughput_floor = 1.0;
    SampleTable table = netsynth::SampleGenerator(p).generate(3000, 4);
    EXPECT_TRUE(netsynth::validate(table, p).ok());
    // the default loss band does not cover these rows
    EXPECT_FALSE(netsynth::validate(table).ok());
}

TEST(ValidationTest, DetectsEachViolation) {
    SampleTable table = tableOf({
        {30.0, 20.0, 50.0, 0.0, 125.0},     // 0 ok
        {-1.0, 20.0, 19.0, 0.0, 125.0},     // 1 rtt
        {30.0, 0.0, 30.0, 0.0, 125.0},      // 2 server_delay
        {30.0, 20.0, 60.0, 0.0, 125.0},     // 3 ttfb mismatch
        {30.0, 20.0, 50.0, 0.5, 125.0},     // 4 loss out of band
        {30.0, 20.0, 50.0, 0.0, 0.001},     // 5 below floor
        {30.0, 20.0, 50.0, std::numeric_limits<double>::quiet_NaN(), 125.0},   // 6 NaN
        {30.0, -40.0, -10.0, 0.0, 125.0},   // 7 ttfb < rtt
    });
    netsynth::ValidationReport report = netsynth::validate(table);
    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.rows_checked, 8u);

    EXPECT_FALSE(mentions(report, "row 0:"));
    EXPECT_TRUE(mentions(report, "row 1: rtt must be positive"));
    EXPECT_TRUE(mentions(report, "row 2: server_delay must be positive"));
    EXPECT_TRUE(mentions(report, "row 3: ttfb differs"));
    EXPECT_TRUE(mentions(report, "row 4: loss"));
    EXPECT_TRUE(mentions(report, "row 5: throughput"));
    EXPECT_TRUE(mentions(report, "row 6: loss is not finite"));
    EXPECT_TRUE(mentions(report, "row 7: ttfb"));
    EXPECT_TRUE(mentions(report, "below rtt"));
}

TEST(ValidationTest, IssueListCapped) {
    std::vector<Sample> rows(50, Sample{30.0, 20.0, 50.0, 0.0, 0.0});
    netsynth::ValidationReport report = netsynth::validate(tableOf(std::move(rows)));
    EXPECT_EQ(report.violation_count, 50u);
    EXPECT_EQ(report.issues.size(), netsynth::ValidationReport::MAX_ISSUES);

    std::ostringstream os;
    netsynth::printValidation(report, os);
    EXPECT_NE(os.str().find("50 violation(s) in 50 rows"), std::string::npos) << os.str();
    EXPECT_NE(os.str().find("... 30 more"), std::string::npos) << os.str();
}

TEST(ValidationTest, PrintOk) {
    std::ostringstream os;
    netsynth::printValidation(netsynth::validate(netsynth::generate(10, 1)), os);
    EXPECT_EQ(os.str(), "Validation: OK (10 rows)\n");
}

TEST(ValidationTest, EmptyTableIsOk) {
    netsynth::ValidationReport report = netsynth::validate(SampleTable{});
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.rows_checked, 0u);
}
