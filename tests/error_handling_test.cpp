/*
 * Copyright (c) 2026 NetSynth contributors
 * 
 * This file is part of the NetSynth library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

/**
 * @file error_handling_test.cpp
 * @brief Error signaling across the NetSynth API
 * 
 * Tests cover:
 * - Invalid generation arguments (exceptions)
 * - Numeric degeneracy (exceptions)
 * - I/O failures (bool + getErrorMsg)
 * - Exception hierarchy, so callers can catch std:: types
 */

#include <gtest/gtest.h>
#include <netsynth/netsynth.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ErrorHandlingTest : public ::testing::Test {
protected:
    fs::path test_dir_;
    
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = fs::temp_directory_path() / "netsynth_error_test"
                    / (std::string(info->test_suite_name()) + "_" + info->name());
        fs::create_directories(test_dir_);
    }
    
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
    }
};

// Test 1: zero rows is an invalid argument, serial and parallel
TEST_F(ErrorHandlingTest, Generate_ZeroCount) {
    netsynth::SampleGenerator gen;
    EXPECT_THROW(gen.generate(0, 42), netsynth::InvalidArgumentError);
    EXPECT_THROW(gen.generateParallel(0, 42, 4), netsynth::InvalidArgumentError);
    EXPECT_THROW(netsynth::generate(0), std::invalid_argument);
}

// Test 2: message is descriptive
TEST_F(ErrorHandlingTest, Generate_ZeroCountMessage) {
    try {
        netsynth::generate(0, 1);
        FAIL() << "Expected InvalidArgumentError";
    } catch (const netsynth::InvalidArgumentError& e) {
        EXPECT_NE(std::string(e.what()).find("at least 1"), std::string::npos) << e.what();
    }
}

// Test 3: single row is the smallest valid table
TEST_F(ErrorHandlingTest, Generate_SingleRow) {
    netsynth::SampleTable table = netsynth::generate(1, 42);
    ASSERT_EQ(table.size(), 1u);
    EXPECT_NEAR(table[0].rtt, 42.167495957359876, 1e-9);
}

// Test 4: degenerate cost surfaces as NumericDegeneracyError
TEST_F(ErrorHandlingTest, Throughput_DegenerateCost) {
    try {
        netsynth::SampleGenerator::baseThroughput(0.0, 10000.0);
        FAIL() << "Expected NumericDegeneracyError";
    } catch (const netsynth::NumericDegeneracyError& e) {
        EXPECT_NE(std::string(e.what()).find("positive and finite"), std::string::npos) << e.what();
    }
}

// Test 5: table bounds checking
TEST_F(ErrorHandlingTest, Table_AtOutOfRange) {
    netsynth::SampleTable table = netsynth::generate(3, 1);
    EXPECT_NO_THROW(table.at(2));
    EXPECT_THROW(table.at(3), std::out_of_range);
    EXPECT_THROW(netsynth::SampleTable{}.at(0), std::out_of_range);
}

// Test 6: unknown column names
TEST_F(ErrorHandlingTest, Column_UnknownName) {
    EXPECT_EQ(netsynth::columnFromName("Throughput"), netsynth::Column::THROUGHPUT);
    EXPECT_EQ(netsynth::columnFromName("SERVER_DELAY"), netsynth::Column::SERVER_DELAY);
    EXPECT_THROW(netsynth::columnFromName("jitter"), std::runtime_error);
    EXPECT_THROW(netsynth::columnFromName(""), std::runtime_error);
}

// Test 7: reader on a directory
TEST_F(ErrorHandlingTest, Reader_DirectoryPath) {
    netsynth::SampleCsvReader reader;
    EXPECT_FALSE(reader.open(test_dir_));
    EXPECT_FALSE(reader.isOpen());
    EXPECT_NE(reader.getErrorMsg().find("not a regular file"), std::string::npos) << reader.getErrorMsg();
    EXPECT_FALSE(reader.readNext());
}

// Test 8: garbage behind an LZ4 magic number
TEST_F(ErrorHandlingTest, Reader_CorruptLz4) {
    const fs::path path = test_dir_ / "broken.csv.lz4";
    {
        std::ofstream out(path, std::ios::binary);
        const char bytes[] = {'\x04', '\x22', '\x4D', '\x18', '\x00', '\x00', '\x00'};
        out.write(bytes, sizeof(bytes));
    }
    netsynth::SampleCsvReader reader;
    EXPECT_FALSE(reader.open(path));
    EXPECT_NE(reader.getErrorMsg().find("LZ4"), std::string::npos) << reader.getErrorMsg();
    EXPECT_THROW(netsynth::readTable(path), std::runtime_error);
}

// Test 9: writeTable reports open failures as exceptions
TEST_F(ErrorHandlingTest, WriteTable_NoOverwrite) {
    const fs::path path = test_dir_ / "taken.csv";
    netsynth::SampleTable table = netsynth::generate(5, 1);
    netsynth::writeTable(table, path);
    EXPECT_THROW(netsynth::writeTable(table, path, false), std::runtime_error);
    EXPECT_NO_THROW(netsynth::writeTable(table, path, true));
}

// Test 10: writer can be reused after close
TEST_F(ErrorHandlingTest, Writer_ReopenAfterClose) {
    netsynth::SampleCsvWriter writer;
    ASSERT_TRUE(writer.open(test_dir_ / "one.csv", true));
    writer.write(netsynth::generate(4, 1));
    EXPECT_EQ(writer.rowCount(), 4u);
    writer.close();
    EXPECT_FALSE(writer.isOpen());
    EXPECT_EQ(writer.rowCount(), 0u);

    ASSERT_TRUE(writer.open(test_dir_ / "two.csv", true)) << writer.getErrorMsg();
    EXPECT_TRUE(writer.getErrorMsg().empty());
    writer.close();
}

// Test 11: destructor closes and flushes an open compressed writer
TEST_F(ErrorHandlingTest, Writer_DestructorFinishesFrame) {
    const fs::path path = test_dir_ / "auto.csv.lz4";
    {
        netsynth::SampleCsvWriter writer;
        ASSERT_TRUE(writer.open(path, true));
        writer.write(netsynth::generate(100, 2));
    }
    EXPECT_EQ(netsynth::readTable(path).size(), 100u);
}

// Test 12: version string
TEST_F(ErrorHandlingTest, Version_Format) {
    const std::string v = netsynth::getVersion();
    EXPECT_EQ(v, std::to_string(netsynth::VERSION_MAJOR) + "." +
                 std::to_string(netsynth::VERSION_MINOR) + "." +
                 std::to_string(netsynth::VERSION_PATCH));
}
