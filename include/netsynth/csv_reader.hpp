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
 * @file csv_reader.hpp
 * @brief SampleCsvReader implementations.
 */

#include "csv_reader.h"
#include "compression.hpp"
#include "sample_table.hpp"
#include <charconv>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace netsynth {

    // ── Constructor / Destructor ────────────────────────────────────────

    inline SampleCsvReader::SampleCsvReader(char delimiter, char decimalSep)
        : delimiter_(delimiter)
        , decimal_sep_(decimalSep)
    {
        if (delimiter_ == decimal_sep_) {
            throw std::invalid_argument("CSV delimiter and decimal separator must differ");
        }
        line_buf_.reserve(256);
        cells_.reserve(COLUMN_COUNT);
    }

    inline SampleCsvReader::~SampleCsvReader() {
        if (isOpen()) {
            close();
        }
    }

    // ── Lifecycle ───────────────────────────────────────────────────────

    inline void SampleCsvReader::resetState() {
        positions_.fill(std::nullopt);
        field_count_ = 0;
        row_ = Sample{};
        row_pos_ = 0;
        file_line_ = 0;
        skipped_ = 0;
    }

    inline void SampleCsvReader::close() {
        if (!isOpen()) {
            return;
        }
        if (file_.is_open()) {
            file_.close();
        }
        mem_.str(std::string());
        mem_.clear();
        is_ = nullptr;
        file_path_.clear();
        resetState();
    }

    inline bool SampleCsvReader::open(const FilePath& filepath) {
        err_msg_.clear();

        if (isOpen()) {
            err_msg_ = "Warning: File is already open: " + file_path_.string();
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << err_msg_ << std::endl;
            }
            return false;
        }

        try {
            FilePath absolutePath = std::filesystem::absolute(filepath);

            if (!std::filesystem::exists(absolutePath)) {
                throw std::runtime_error("Error: File does not exist: " + absolutePath.string());
            }
            if (!std::filesystem::is_regular_file(absolutePath)) {
                throw std::runtime_error("Error: Path is not a regular file: " + absolutePath.string());
            }

            std::error_code ec;
            auto perms = std::filesystem::status(absolutePath, ec).permissions();
            if (ec || (perms & std::filesystem::perms::owner_read) == std::filesystem::perms::none) {
                throw std::runtime_error("Error: No read permission for file: " + absolutePath.string());
            }

            file_.open(absolutePath, std::ios::in | std::ios::binary);
            if (!file_.is_open()) {
                throw std::runtime_error("Error: Cannot open file for reading: " + absolutePath.string());
            }

            char head[4] = {0, 0, 0, 0};
            file_.read(head, sizeof(head));
            const auto headLen = static_cast<size_t>(file_.gcount());
            file_.clear();
            file_.seekg(0);

            resetState();
            if (isLz4Frame({head, headLen})) {
                std::vector<char> encoded((std::istreambuf_iterator<char>(file_)),
                                          std::istreambuf_iterator<char>());
                file_.close();
                DeCompressor decompressor;
                std::vector<char> text = decompressor.decompress(encoded);
                mem_.clear();
                mem_.str(std::string(text.begin(), text.end()));
                is_ = &mem_;
            } else {
                is_ = &file_;
            }
            file_path_ = absolutePath;

            if (!readHeader()) {
                throw std::runtime_error("Failed to read CSV header: " + err_msg_);
            }
            return true;

        } catch (const std::exception& ex) {
            err_msg_ = ex.what();
            if (file_.is_open()) {
                file_.close();
            }
            is_ = nullptr;
            file_path_.clear();
            return false;
        }
    }

    inline bool SampleCsvReader::open(std::istream& is) {
        err_msg_.clear();

        if (isOpen()) {
            err_msg_ = "Warning: Reader is already open";
            return false;
        }

        resetState();
        is_ = &is;
        file_path_.clear();
        if (!readHeader()) {
            is_ = nullptr;
            return false;
        }
        return true;
    }

    inline bool SampleCsvReader::hasServerDelay() const {
        return positions_[static_cast<size_t>(Column::SERVER_DELAY)].has_value();
    }

    // ── Reading ─────────────────────────────────────────────────────────

    inline bool SampleCsvReader::readNext() {
        if (!isOpen()) {
            return false;
        }

        while (std::getline(*is_, line_buf_)) {
            file_line_++;

            if (!line_buf_.empty() && line_buf_.back() == '\r') {
                line_buf_.pop_back();
            }
            if (line_buf_.empty()) {
                continue;
            }

            splitLine(line_buf_);
            if (!parseCells()) {
                err_msg_ = "Warning: Failed to parse CSV line at file line " +
                           std::to_string(file_line_) + " (data row " + std::to_string(row_pos_) + ")";
                if constexpr (DEBUG_OUTPUTS) {
                    std::cerr << err_msg_ << std::endl;
                }
                skipped_++;
                continue;
            }

            row_pos_++;
            return true;
        }
        return false;
    }

    inline SampleTable SampleCsvReader::readAll() {
        std::vector<Sample> rows;
        while (readNext()) {
            rows.push_back(row_);
        }
        return SampleTable(std::move(rows));
    }

    // ── Private helpers ─────────────────────────────────────────────────

    /// Map header names to columns; unknown names are ignored, duplicates rejected
    inline bool SampleCsvReader::readHeader() {
        std::string headerLine;
        if (!std::getline(*is_, headerLine)) {
            err_msg_ = "Error: CSV file is empty (no header line)";
            return false;
        }
        file_line_++;

        // Strip UTF-8 BOM
        if (headerLine.size() >= 3 &&
            static_cast<unsigned char>(headerLine[0]) == 0xEF &&
            static_cast<unsigned char>(headerLine[1]) == 0xBB &&
            static_cast<unsigned char>(headerLine[2]) == 0xBF) {
            headerLine.erase(0, 3);
        }
        if (!headerLine.empty() && headerLine.back() == '\r') {
            headerLine.pop_back();
        }

        splitLine(headerLine);
        field_count_ = cells_.size();

        for (size_t i = 0; i < cells_.size(); ++i) {
            std::string_view name = cells_[i];
            while (!name.empty() && (name.front() == ' ' || name.front() == '"')) name.remove_prefix(1);
            while (!name.empty() && (name.back() == ' ' || name.back() == '"')) name.remove_suffix(1);

            Column column;
            try {
                column = columnFromName(name);
            } catch (const std::runtime_error&) {
                if constexpr (DEBUG_OUTPUTS) {
                    std::cerr << "Warning: Ignoring CSV column '" << name << "'" << std::endl;
                }
                continue;
            }

            auto& slot = positions_[static_cast<size_t>(column)];
            if (slot) {
                err_msg_ = "Error: Duplicate column '" + std::string(columnName(column)) + "' in CSV header";
                return false;
            }
            slot = i;
        }

        for (Column required : OBSERVED_COLUMNS) {
            if (!positions_[static_cast<size_t>(required)]) {
                err_msg_ = "Error: CSV header lacks required column '" + std::string(columnName(required)) + "'";
                return false;
            }
        }
        return true;
    }

    inline void SampleCsvReader::splitLine(const std::string& line) {
        cells_.clear();
        const char* data = line.data();
        size_t len = line.size();
        size_t start = 0;
        bool inQuotes = false;

        for (size_t i = 0; i <= len; ++i) {
            if (i == len || (!inQuotes && data[i] == delimiter_)) {
                cells_.emplace_back(data + start, i - start);
                start = i + 1;
            } else if (data[i] == '"') {
                inQuotes = !inQuotes;
            }
        }
    }

    inline bool SampleCsvReader::parseNumber(std::string_view cell, double& out) {
        while (!cell.empty() && (cell.front() == ' ' || cell.front() == '"')) cell.remove_prefix(1);
        while (!cell.empty() && (cell.back() == ' ' || cell.back() == '"')) cell.remove_suffix(1);
        if (cell.empty()) {
            return false;
        }

        if (decimal_sep_ != '.') {
            num_buf_.assign(cell.data(), cell.size());
            for (char& c : num_buf_) {
                if (c == decimal_sep_) { c = '.'; break; }
            }
            cell = num_buf_;
        }

        auto [ptr, ec] = std::from_chars(cell.data(), cell.data() + cell.size(), out);
        return ec == std::errc{} && ptr == cell.data() + cell.size();
    }

    inline bool SampleCsvReader::parseCells() {
        if (cells_.size() != field_count_) {
            return false;
        }

        Sample s;
        for (Column column : ALL_COLUMNS) {
            const auto& pos = positions_[static_cast<size_t>(column)];
            if (!pos) {
                continue;
            }
            double value = 0.0;
            if (!parseNumber(cells_[*pos], value)) {
                return false;
            }
            switch (column) {
                case Column::RTT:          s.rtt = value; break;
                case Column::TTFB:         s.ttfb = value; break;
                case Column::SERVER_DELAY: s.server_delay = value; break;
                case Column::LOSS:         s.loss = value; break;
                case Column::THROUGHPUT:   s.throughput = value; break;
            }
        }
        if (!hasServerDelay()) {
            s.server_delay = s.ttfb - s.rtt;
        }

        row_ = s;
        return true;
    }

    inline SampleTable readTable(const std::filesystem::path& path, char delimiter) {
        SampleCsvReader reader(delimiter);
        if (!reader.open(path)) {
            throw std::runtime_error(reader.getErrorMsg());
        }
        SampleTable table = reader.readAll();
        reader.close();
        return table;
    }

} // namespace netsynth
