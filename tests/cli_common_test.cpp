/*
 * Copyright (c) 2026 NetSynth contributors
 * 
 * This file is part of the NetSynth library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

/**
 * @file cli_common_test.cpp
 * @brief Option parsing helpers shared by netsynthGenerator and netsynthSummary
 */

#include <gtest/gtest.h>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>

#include "cli_common.h"

using netsynth_cli::parseNumber;

TEST(CliCommonTest, ParseUnsigned) {
    EXPECT_EQ(parseNumber<size_t>("500", "-n"), 500u);
    EXPECT_EQ(parseNumber<size_t>("+7", "-n"), 7u);
    EXPECT_THROW(parseNumber<size_t>("-1", "-n"), std::runtime_error);
    EXPECT_THROW(parseNumber<size_t>("12abc", "-n"), std::runtime_error);
    EXPECT_THROW(parseNumber<size_t>("", "-n"), std::runtime_error);
    EXPECT_THROW(parseNumber<size_t>("99999999999999999999999", "-n"), std::runtime_error);
}

TEST(CliCommonTest, ParseSignedSeed) {
    EXPECT_EQ(parseNumber<int64_t>("42", "--seed"), 42);
    EXPECT_EQ(parseNumber<int64_t>("-9", "--seed"), -9);
    EXPECT_EQ(parseNumber<int64_t>("-9223372036854775808", "--seed"), INT64_MIN);
}

TEST(CliCommonTest, ParseDouble) {
    EXPECT_DOUBLE_EQ(parseNumber<double>("0.85", "--clean-prob"), 0.85);
    EXPECT_DOUBLE_EQ(parseNumber<double>("5e3", "--loss-weight"), 5000.0);
    EXPECT_THROW(parseNumber<double>("nan", "--loss-weight"), std::runtime_error);
    EXPECT_THROW(parseNumber<double>("inf", "--loss-weight"), std::runtime_error);
    EXPECT_THROW(parseNumber<double>("0,85", "--clean-prob"), std::runtime_error);
}

TEST(CliCommonTest, ErrorNamesOption) {
    try {
        parseNumber<double>("fast", "--rtt-median");
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("--rtt-median"), std::string::npos) << e.what();
        EXPECT_NE(std::string(e.what()).find("'fast'"), std::string::npos) << e.what();
    }
}

TEST(CliCommonTest, ParseDelimiter) {
    EXPECT_EQ(netsynth_cli::parseDelimiter(","), ',');
    EXPECT_EQ(netsynth_cli::parseDelimiter(";"), ';');
    EXPECT_EQ(netsynth_cli::parseDelimiter("tab"), '\t');
    EXPECT_EQ(netsynth_cli::parseDelimiter("\\t"), '\t');
    EXPECT_THROW(netsynth_cli::parseDelimiter(""), std::runtime_error);
    EXPECT_THROW(netsynth_cli::parseDelimiter(";;"), std::runtime_error);
    EXPECT_THROW(netsynth_cli::parseDelimiter("\""), std::runtime_error);
}

TEST(CliCommonTest, FormatBytes) {
    EXPECT_EQ(netsynth_cli::formatBytes(512), "512 bytes");
    EXPECT_EQ(netsynth_cli::formatBytes(2048), "2.00 KB");
    EXPECT_EQ(netsynth_cli::formatBytes(3 * 1024 * 1024 + 512 * 1024), "3.50 MB");
}

TEST(CliCommonTest, ColumnSummaryListsUnits) {
    std::ostringstream os;
    netsynth_cli::printColumnSummary("Output", {netsynth::Column::RTT, netsynth::Column::THROUGHPUT}, os);
    const std::string text = os.str();
    EXPECT_NE(text.find("Output (2 columns)"), std::string::npos) << text;
    EXPECT_NE(text.find("rtt"), std::string::npos);
    EXPECT_NE(text.find("Mbps"), std::string::npos);
}

TEST(CliCommonTest, OptionValueConsumesNextArgument) {
    char prog[] = "tool", opt[] = "--delimiter", val[] = ";";
    char* argv[] = {prog, opt, val};
    int i = 1;
    EXPECT_EQ(netsynth_cli::optionValue(3, argv, i, "--delimiter"), ";");
    EXPECT_EQ(i, 2);
}

TEST(CliCommonTest, OptionValueMissingNamesOption) {
    char prog[] = "tool", opt[] = "--delimiter";
    char* argv[] = {prog, opt};
    int i = 1;
    try {
        netsynth_cli::optionValue(2, argv, i, "--delimiter");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& ex) {
        EXPECT_EQ(std::string(ex.what()), "Missing value for option --delimiter");
    }
    EXPECT_EQ(i, 1);
}

TEST(CliCommonTest, ModelFieldCoversEveryOverride) {
    netsynth::ModelParameters p;
    EXPECT_EQ(netsynth_cli::modelField(p, "--rtt-median"),        &p.rtt.median);
    EXPECT_EQ(netsynth_cli::modelField(p, "--rtt-sigma"),         &p.rtt.sigma);
    EXPECT_EQ(netsynth_cli::modelField(p, "--delay-median"),      &p.server_delay.median);
    EXPECT_EQ(netsynth_cli::modelField(p, "--delay-sigma"),       &p.server_delay.sigma);
    EXPECT_EQ(netsynth_cli::modelField(p, "--clean-probability"), &p.clean_probability);
    EXPECT_EQ(netsynth_cli::modelField(p, "--loss-min"),          &p.loss_min);
    EXPECT_EQ(netsynth_cli::modelField(p, "--loss-max"),          &p.loss_max);
    EXPECT_EQ(netsynth_cli::modelField(p, "--loss-weight"),       &p.loss_weight);
    EXPECT_EQ(netsynth_cli::modelField(p, "--throughput-scale"),  &p.throughput_scale);
    EXPECT_EQ(netsynth_cli::modelField(p, "--noise-min"),         &p.noise_min);
    EXPECT_EQ(netsynth_cli::modelField(p, "--noise-max"),         &p.noise_max);
    EXPECT_EQ(netsynth_cli::modelField(p, "--throughput-floor"),  &p.throughput_floor);
    EXPECT_EQ(netsynth_cli::modelField(p, "--strict"),    nullptr);
    EXPECT_EQ(netsynth_cli::modelField(p, "--delimiter"), nullptr);
    EXPECT_EQ(netsynth_cli::modelField(p, "data.csv"),    nullptr);
}

TEST(CliCommonTest, ModelOverridesSelectValidationBounds) {
    netsynth::ModelParameters p;
    *netsynth_cli::modelField(p, "--loss-min") = netsynth_cli::parseNumber<double>("0.03", "--loss-min");
    *netsynth_cli::modelField(p, "--loss-max") = netsynth_cli::parseNumber<double>("0.05", "--loss-max");
    ASSERT_NO_THROW(p.validate());

    netsynth::SampleTable table = netsynth::SampleGenerator(p).generate(500, 42);
    ASSERT_GT(table.congestedCount(), 0u);
    EXPECT_TRUE(netsynth::validate(table, p).ok());
    EXPECT_FALSE(netsynth::validate(table).ok());
}

TEST(CliCommonTest, ModelUsageListsDefaults) {
    std::ostringstream os;
    netsynth_cli::printModelOptions(os);
    const std::string text = os.str();
    EXPECT_NE(text.find("--rtt-median MS"), std::string::npos) << text;
    EXPECT_NE(text.find("--throughput-floor MBPS"), std::string::npos) << text;
    EXPECT_NE(text.find("(default: 0.85)"), std::string::npos) << text;
    EXPECT_NE(text.find("(default: 5000)"), std::string::npos) << text;
}
