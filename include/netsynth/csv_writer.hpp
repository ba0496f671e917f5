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
 * @file csv_writer.hpp
 * @brief SampleCsvWriter implementations.
 */

#include "csv_writer.h"
#include "compression.hpp"
#include "sample_table.hpp"
#include <charconv>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace netsynth {

    namespace detail {

        inline bool hasLz4Extension(const std::filesystem::path& path) {
            return path.extension() == ".lz4";
        }

    } // namespace detail

    // ── Constructor / Destructor ────────────────────────────────────────

    inline SampleCsvWriter::SampleCsvWriter(const CsvOptions& options)
        : options_(options)
    {
        if (options_.delimiter == options_.decimal_separator) {
            throw std::invalid_argument("CSV delimiter and decimal separator must differ");
        }
        if (options_.include_server_delay) {
            columns_ = {Column::RTT, Column::TTFB, Column::SERVER_DELAY, Column::LOSS, Column::THROUGHPUT};
        } else {
            columns_.assign(OBSERVED_COLUMNS.begin(), OBSERVED_COLUMNS.end());
        }
        buf_.reserve(256);
    }

    inline SampleCsvWriter::~SampleCsvWriter() {
        if (isOpen()) {
            try {
                close();
            } catch (const std::exception& ex) {
                err_msg_ = std::string("Error closing file: ") + ex.what();
                if constexpr (DEBUG_OUTPUTS) {
                    std::cerr << err_msg_ << std::endl;
                }
            }
        }
    }

    // ── Lifecycle ───────────────────────────────────────────────────────

    inline void SampleCsvWriter::close() {
        if (os_ == nullptr) {
            return;
        }
        // release the sink even when the final flush fails, then report
        std::string error;
        if (compressor_) {
            try {
                flushCompressed(true);
            } catch (const std::runtime_error& ex) {
                error = ex.what();
            }
            compressor_.reset();
        }
        os_->flush();
        if (error.empty() && !os_->good()) {
            error = "Error: Failed writing CSV data to " + sinkName();
        }
        if (stream_.is_open()) {
            stream_.close();
        }
        os_ = nullptr;
        file_path_.clear();
        row_cnt_ = 0;

        if (!error.empty()) {
            err_msg_ = error;
            throw std::runtime_error(error);
        }
    }

    inline bool SampleCsvWriter::open(const FilePath& filepath, bool overwrite) {
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

            // Create parent directory if needed
            FilePath parentDir = absolutePath.parent_path();
            if (!parentDir.empty() && !std::filesystem::exists(parentDir)) {
                std::error_code ec;
                if (!std::filesystem::create_directories(parentDir, ec)) {
                    err_msg_ = "Error: Cannot create directory: " + parentDir.string() +
                              " (Error: " + ec.message() + ")";
                    throw std::runtime_error(err_msg_);
                }
            }

            if (std::filesystem::exists(absolutePath) && !overwrite) {
                err_msg_ = "Warning: File already exists: " + absolutePath.string() +
                          ". Use overwrite=true to replace it.";
                throw std::runtime_error(err_msg_);
            }

            std::error_code ec;
            auto perms = std::filesystem::status(parentDir, ec).permissions();
            if (ec || (perms & std::filesystem::perms::owner_write) == std::filesystem::perms::none) {
                err_msg_ = "Error: No write permission for directory: " + parentDir.string();
                throw std::runtime_error(err_msg_);
            }

            const bool compressed = detail::hasLz4Extension(absolutePath);
            const auto mode = compressed ? (std::ios::out | std::ios::trunc | std::ios::binary)
                                         : (std::ios::out | std::ios::trunc);
            stream_.open(absolutePath, mode);
            if (!stream_.good()) {
                err_msg_ = "Error: Cannot open file for writing: " + absolutePath.string();
                throw std::runtime_error(err_msg_);
            }

            os_ = &stream_;
            file_path_ = absolutePath;
            row_cnt_ = 0;

            if (compressed) {
                compressor_ = std::make_unique<Compressor>();
                pending_.clear();
                encoded_.clear();
                compressor_->beginCompression(encoded_);
            }

            if (options_.include_header) {
                writeHeader();
            }
            return true;

        } catch (const std::filesystem::filesystem_error& ex) {
            if (err_msg_.empty()) {
                err_msg_ = std::string("Filesystem error: ") + ex.what();
            }
        } catch (const std::exception& ex) {
            if (err_msg_.empty()) {
                err_msg_ = std::string("Error opening file: ") + ex.what();
            }
        }

        if constexpr (DEBUG_OUTPUTS) {
            std::cerr << err_msg_ << std::endl;
        }
        compressor_.reset();
        if (stream_.is_open()) {
            stream_.close();
        }
        os_ = nullptr;
        file_path_.clear();
        return false;
    }

    // ── Stream open (stdout / external ostream) ────────────────────────

    inline bool SampleCsvWriter::open(std::ostream& os) {
        err_msg_.clear();

        if (isOpen()) {
            err_msg_ = "Warning: Writer is already open";
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << err_msg_ << std::endl;
            }
            return false;
        }
        if (!os.good()) {
            err_msg_ = "Error: Output stream is not writable";
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << err_msg_ << std::endl;
            }
            return false;
        }

        os_ = &os;
        file_path_.clear();
        row_cnt_ = 0;

        if (options_.include_header) {
            writeHeader();
        }
        return true;
    }

    // ── Writing ─────────────────────────────────────────────────────────

    inline void SampleCsvWriter::write(const Sample& sample) {
        if (os_ == nullptr) {
            throw std::runtime_error("Error: Writer is not open");
        }

        buf_.clear();
        for (size_t i = 0; i < columns_.size(); ++i) {
            if (i > 0) buf_.push_back(options_.delimiter);
            appendDouble(sample.get(columns_[i]));
        }
        buf_.push_back('\n');
        emit();
        row_cnt_++;
    }

    inline void SampleCsvWriter::write(const SampleTable& table) {
        for (const auto& sample : table) {
            write(sample);
        }
    }

    inline std::string SampleCsvWriter::headerLine() const {
        std::string line;
        for (size_t i = 0; i < columns_.size(); ++i) {
            if (i > 0) line.push_back(options_.delimiter);
            line += columnName(columns_[i]);
        }
        return line;
    }

    // ── Private helpers ─────────────────────────────────────────────────

    inline void SampleCsvWriter::writeHeader() {
        const std::string line = headerLine();
        buf_.assign(line.begin(), line.end());
        buf_.push_back('\n');
        emit();
    }

    /// Hand the row buffer to the sink, through the LZ4 encoder if active
    inline void SampleCsvWriter::emit() {
        if (!compressor_) {
            os_->write(buf_.data(), static_cast<std::streamsize>(buf_.size()));
            if (!os_->good()) {
                throw std::runtime_error("Error: Failed writing CSV data to " + sinkName());
            }
            return;
        }
        pending_.insert(pending_.end(), buf_.begin(), buf_.end());
        if (pending_.size() >= LZ4_BLOCK_SIZE_KB * 1024) {
            flushCompressed(false);
        }
    }

    inline void SampleCsvWriter::flushCompressed(bool final) {
        compressor_->compressUpdate(encoded_, pending_);
        pending_.clear();
        if (final) {
            compressor_->endCompression(encoded_);
        }
        os_->write(encoded_.data(), static_cast<std::streamsize>(encoded_.size()));
        encoded_.clear();
        if (!os_->good()) {
            throw std::runtime_error("Error: Failed writing compressed data to " + sinkName());
        }
    }

    inline std::string SampleCsvWriter::sinkName() const {
        return file_path_.empty() ? std::string("<stream>") : file_path_.string();
    }

    /// Shortest round-trip representation, decimal separator replaced if configured
    inline void SampleCsvWriter::appendDouble(double value) {
        constexpr size_t kMaxDigits = 32;
        size_t oldSize = buf_.size();
        buf_.resize(oldSize + kMaxDigits);
        auto [ptr, ec] = std::to_chars(buf_.data() + oldSize,
                                        buf_.data() + oldSize + kMaxDigits, value);
        if (ec != std::errc{}) {
            throw std::runtime_error("Error: Cannot format value");
        }
        size_t newSize = static_cast<size_t>(ptr - buf_.data());

        if (options_.decimal_separator != '.') {
            for (size_t i = oldSize; i < newSize; ++i) {
                if (buf_[i] == '.') {
                    buf_[i] = options_.decimal_separator;
                    break;
                }
            }
        }
        buf_.resize(newSize);
    }

    inline void writeTable(const SampleTable& table,
                           const std::filesystem::path& path,
                           bool overwrite,
                           const CsvOptions& options) {
        SampleCsvWriter writer(options);
        if (!writer.open(path, overwrite)) {
            throw std::runtime_error(writer.getErrorMsg());
        }
        writer.write(table);
        writer.close();
    }

} // namespace netsynth
