/*
 * Copyright (c) 2026 NetSynth contributors
 * 
 * This file is part of the NetSynth library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

#pragma once

/**
 * @file csv_reader.h
 * @brief SampleCsvReader - load persisted sample tables for analysis.
 *
 * Design:
 *   - The header line decides the column mapping; rtt, ttfb, loss and
 *     throughput are required in any order, server_delay is optional and
 *     reconstructed as ttfb - rtt when absent
 *   - Column names match case-insensitively ("RTT,TTFB,Loss,Throughput" works)
 *   - std::from_chars() for all numeric cells (no locale)
 *   - LZ4 frame input is detected by its magic number and decoded up front
 *   - A malformed line is skipped; getErrorMsg() names it and
 *     skippedLines() counts it
 *
 * Usage:
 *     netsynth::SampleCsvReader reader;
 *     reader.open("synthetic_cdn_data.csv");
 *     while (reader.readNext()) {
 *         const netsynth::Sample& s = reader.row();
 *     }
 *     reader.close();
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "definitions.h"
#include "sample.h"
#include "sample_table.h"

namespace netsynth {

    class SampleCsvReader {
    public:
        using FilePath          = std::filesystem::path;

    private:
        std::string             err_msg_;            // last error message description
        FilePath                file_path_;           // path to the input file
        std::ifstream           file_;                // plain text input
        std::istringstream      mem_;                 // decoded LZ4 input
        std::istream*           is_ = nullptr;        // active source

        char                    delimiter_ = ',';     // field delimiter
        char                    decimal_sep_ = '.';   // decimal separator

        // position of each Column in the file, indexed by Column
        std::array<std::optional<size_t>, COLUMN_COUNT> positions_;
        size_t                  field_count_ = 0;

        Sample                  row_;                 // current row
        size_t                  row_pos_ = 0;         // data rows read
        size_t                  file_line_ = 0;       // 1-based raw line counter
        size_t                  skipped_ = 0;         // malformed lines skipped

        std::string             line_buf_;
        std::vector<std::string_view> cells_;
        std::string             num_buf_;

    public:
        explicit SampleCsvReader(char delimiter = ',', char decimalSep = '.');
        ~SampleCsvReader();

        SampleCsvReader(const SampleCsvReader&) = delete;
        SampleCsvReader& operator=(const SampleCsvReader&) = delete;

        void                    close();
        const std::string&      getErrorMsg() const             { return err_msg_; }
        const FilePath&         filePath() const                { return file_path_; }
        bool                    isOpen() const                  { return is_ != nullptr; }
        bool                    open(const FilePath& filepath);
        bool                    open(std::istream& is);
        bool                    readNext();
        const Sample&           row() const                     { return row_; }
        size_t                  rowPos() const                  { return row_pos_; }
        size_t                  fileLine() const                { return file_line_; }
        size_t                  skippedLines() const            { return skipped_; }
        bool                    hasServerDelay() const;

        /// Read all remaining rows into a table.
        SampleTable             readAll();

    private:
        bool                    readHeader();
        void                    splitLine(const std::string& line);
        bool                    parseCells();
        bool                    parseNumber(std::string_view cell, double& out);
        void                    resetState();
    };

    /// Load a whole table; throws std::runtime_error when the file cannot be opened.
    SampleTable readTable(const std::filesystem::path& path, char delimiter = ',');

} // namespace netsynth
