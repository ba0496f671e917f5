/*
 * Copyright (c) 2026 NetSynth contributors
 * 
 * This file is part of the NetSynth library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

/**
 * @file compression_test.cpp
 * @brief LZ4 frame Compressor / DeCompressor and compressed CSV files
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <netsynth/netsynth.h>

namespace fs = std::filesystem;

namespace {

    std::vector<char> csvLikePayload(size_t rows) {
        std::string text = "rtt,ttfb,loss,throughput\n";
        for (size_t i = 0; i < rows; ++i) {
            text += std::to_string(20.0 + static_cast<double>(i % 97) * 0.25) + "," +
                    std::to_string(40.0 + static_cast<double>(i % 89) * 0.5) + ",0," +
                    std::to_string(100.0 + static_cast<double>(i % 13)) + "\n";
        }
        return std::vector<char>(text.begin(), text.end());
    }

} // namespace

class CompressionTest : public ::testing::Test {
protected:
    fs::path tmpDir_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmpDir_ = fs::temp_directory_path() / "netsynth_lz4_test"
                  / (std::string(info->test_suite_name()) + "_" + info->name());
        fs::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(tmpDir_, ec);
    }

    fs::path tmpFile(const std::string& name) const {
        return tmpDir_ / name;
    }
};

TEST_F(CompressionTest, OneShotRoundTrip) {
    const std::vector<char> input = csvLikePayload(20000);
    netsynth::Compressor compressor;
    std::vector<char> encoded = compressor.compress(input);

    EXPECT_LT(encoded.size(), input.size());
    EXPECT_LE(encoded.size(), netsynth::Compressor::getMaxCompressedSize(input.size()));
    EXPECT_TRUE(netsynth::isLz4Frame(encoded));

    netsynth::DeCompressor decompressor;
    EXPECT_EQ(decompressor.decompress(encoded), input);
    // context is reusable
    EXPECT_EQ(decompressor.decompress(encoded), input);
}

TEST_F(CompressionTest, StreamingMatchesInput) {
    const std::vector<char> input = csvLikePayload(5000);
    netsynth::Compressor compressor;
    std::vector<char> encoded;
    compressor.beginCompression(encoded);
    const size_t step = 1000;
    for (size_t pos = 0; pos < input.size(); pos += step) {
        const size_t len = std::min(step, input.size() - pos);
        compressor.compressUpdate(encoded, std::span<const char>(input.data() + pos, len));
    }
    compressor.endCompression(encoded);

    netsynth::DeCompressor decompressor;
    EXPECT_EQ(decompressor.decompress(encoded), input);
}

TEST_F(CompressionTest, EmptyInput) {
    netsynth::Compressor compressor;
    std::vector<char> encoded = compressor.compress({});
    EXPECT_TRUE(netsynth::isLz4Frame(encoded));
    netsynth::DeCompressor decompressor;
    EXPECT_TRUE(decompressor.decompress(encoded).empty());
}

TEST_F(CompressionTest, MagicDetection) {
    const char lz4Magic[] = {'\x04', '\x22', '\x4D', '\x18'};
    const char text[] = {'r', 't', 't', ','};
    EXPECT_TRUE(netsynth::isLz4Frame(lz4Magic));
    EXPECT_FALSE(netsynth::isLz4Frame(text));
    EXPECT_FALSE(netsynth::isLz4Frame(std::span<const char>(lz4Magic, 3)));
}

TEST_F(CompressionTest, TruncatedFrameThrows) {
    const std::vector<char> input = csvLikePayload(5000);
    netsynth::Compressor compressor;
    std::vector<char> encoded = compressor.compress(input);
    encoded.resize(encoded.size() / 2);

    netsynth::DeCompressor decompressor;
    EXPECT_THROW(decompressor.decompress(encoded), std::runtime_error);
}

TEST_F(CompressionTest, CorruptHeaderThrows) {
    const std::vector<char> input = csvLikePayload(100);
    netsynth::Compressor compressor;
    std::vector<char> encoded = compressor.compress(input);
    encoded[4] = static_cast<char>(encoded[4] ^ 0x5A);   // frame descriptor flags

    netsynth::DeCompressor decompressor;
    EXPECT_THROW(decompressor.decompress(encoded), std::runtime_error);
}

TEST_F(CompressionTest, CorruptPayloadThrows) {
    const std::vector<char> input = csvLikePayload(5000);
    netsynth::Compressor compressor;
    std::vector<char> encoded = compressor.compress(input);
    encoded[encoded.size() / 2] = static_cast<char>(encoded[encoded.size() / 2] ^ 0xFF);

    netsynth::DeCompressor decompressor;
    EXPECT_THROW(decompressor.decompress(encoded), std::runtime_error);
}

TEST_F(CompressionTest, ConcatenatedFramesDecodeInOrder) {
    const std::vector<char> first  = csvLikePayload(3000);
    const std::vector<char> second = csvLikePayload(700);
    netsynth::Compressor compressor;
    std::vector<char> encoded = compressor.compress(first);
    const std::vector<char> tail = compressor.compress(second);
    encoded.insert(encoded.end(), tail.begin(), tail.end());

    std::vector<char> expected = first;
    expected.insert(expected.end(), second.begin(), second.end());

    netsynth::DeCompressor decompressor;
    EXPECT_EQ(decompressor.decompress(encoded), expected);
}

TEST_F(CompressionTest, TrailingBytesAfterFrameThrow) {
    const std::vector<char> input = csvLikePayload(1000);
    netsynth::Compressor compressor;
    const std::vector<char> frame = compressor.compress(input);
    netsynth::DeCompressor decompressor;

    std::vector<char> withText = frame;
    const std::string junk = "rtt,ttfb\n";
    withText.insert(withText.end(), junk.begin(), junk.end());
    EXPECT_THROW(decompressor.decompress(withText), std::runtime_error);

    // fewer bytes than a frame magic
    std::vector<char> withShortTail = frame;
    withShortTail.push_back('x');
    withShortTail.push_back('y');
    EXPECT_THROW(decompressor.decompress(withShortTail), std::runtime_error);

    // decoder recovers for the next call
    EXPECT_EQ(decompressor.decompress(frame), input);
}

TEST_F(CompressionTest, CompressedCsvRoundTrip) {
    netsynth::SampleTable table = netsynth::generate(3000, 42);
    const fs::path path = tmpFile("cdn.csv.lz4");

    netsynth::SampleCsvWriter writer;
    ASSERT_TRUE(writer.open(path, true)) << writer.getErrorMsg();
    EXPECT_TRUE(writer.isCompressed());
    writer.write(table);
    writer.close();

    // on-disk bytes are a real LZ4 frame
    std::ifstream raw(path, std::ios::binary);
    std::vector<char> bytes((std::istreambuf_iterator<char>(raw)), std::istreambuf_iterator<char>());
    ASSERT_GE(bytes.size(), 4u);
    EXPECT_TRUE(netsynth::isLz4Frame(bytes));

    netsynth::SampleTable loaded = netsynth::readTable(path);
    ASSERT_EQ(loaded.size(), table.size());
    for (size_t i = 0; i < table.size(); ++i) {
        ASSERT_EQ(loaded[i].rtt, table[i].rtt) << "row " << i;
        ASSERT_EQ(loaded[i].ttfb, table[i].ttfb) << "row " << i;
        ASSERT_EQ(loaded[i].loss, table[i].loss) << "row " << i;
        ASSERT_EQ(loaded[i].throughput, table[i].throughput) << "row " << i;
    }
}

TEST_F(CompressionTest, CompressedAndPlainDecodeToSameText) {
    netsynth::SampleTable table = netsynth::generate(500, 7);
    const fs::path plain = tmpFile("cdn.csv");
    const fs::path packed = tmpFile("cdn.csv.lz4");
    netsynth::writeTable(table, plain);
    netsynth::writeTable(table, packed);

    std::ifstream plainIn(plain, std::ios::binary);
    std::vector<char> text((std::istreambuf_iterator<char>(plainIn)), std::istreambuf_iterator<char>());
    std::ifstream packedIn(packed, std::ios::binary);
    std::vector<char> frame((std::istreambuf_iterator<char>(packedIn)), std::istreambuf_iterator<char>());

    netsynth::DeCompressor decompressor;
    EXPECT_EQ(decompressor.decompress(frame), text);
}
