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
 * @file csv_writer.h
 * @brief SampleCsvWriter - persist samples as delimited text.
 *
 * Design:
 *   - std::to_chars() shortest round-trip formatting, so a table written and
 *     read back is bit-identical
 *   - Single os.write() per row (buffered in a reusable char vector)
 *   - Configurable delimiter (default ',') and decimal separator (default '.')
 *   - Header "rtt,ttfb,loss,throughput", optionally with server_delay after ttfb
 *   - Paths ending in ".lz4" are written as one LZ4 frame
 *
 * Usage:
 *     netsynth::SampleCsvWriter writer;
 *     if (!writer.open("synthetic_cdn_data.csv", true)) {
 *         std::cerr << writer.getErrorMsg() << "\n";
 *     }
 *     writer.write(table);
 *     writer.close();
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "compression.h"
#include "definitions.h"
#include "sample.h"
#include "sample_table.h"

namespace netsynth {

    struct CsvOptions {
        char delimiter            = ',';
        char decimal_separator    = '.';
        bool include_header       = true;
        bool include_server_delay = false;
    };

    class SampleCsvWriter {
    public:
        using FilePath          = std::filesystem::path;

    private:
        std::string             err_msg_;           // last error message description
        FilePath                file_path_;          // path to the output file
        std::ofstream           stream_;             // owned file stream
        std::ostream*           os_ = nullptr;       // active sink (stream_ or external)

        CsvOptions              options_;
        std::vector<Column>     columns_;            // columns in output order
        uint64_t                row_cnt_ = 0;        // total rows written

        std::vector<char>       buf_;                // reusable per-row serialization buffer

        std::unique_ptr<Compressor> compressor_;     // set while writing an .lz4 file
        std::vector<char>       pending_;            // text awaiting compression
        std::vector<char>       encoded_;            // compressed bytes awaiting write

    public:
        explicit SampleCsvWriter(const CsvOptions& options = CsvOptions{});
        ~SampleCsvWriter();

        SampleCsvWriter(const SampleCsvWriter&) = delete;
        SampleCsvWriter& operator=(const SampleCsvWriter&) = delete;

        /// Flush and release the sink; throws std::runtime_error if buffered data could not be written.
        void                    close();
        const std::string&      getErrorMsg() const             { return err_msg_; }
        const FilePath&         filePath() const                { return file_path_; }
        bool                    isOpen() const                  { return os_ != nullptr; }
        bool                    isCompressed() const            { return compressor_ != nullptr; }
        bool                    open(const FilePath& filepath, bool overwrite = false);
        bool                    open(std::ostream& os);
        const CsvOptions&       options() const                 { return options_; }
        const std::vector<Column>& columns() const              { return columns_; }
        size_t                  rowCount() const                { return row_cnt_; }
        void                    write(const Sample& sample);
        void                    write(const SampleTable& table);

        /// Header line without trailing newline, e.g. "rtt,ttfb,loss,throughput".
        std::string             headerLine() const;

    private:
        void                    writeHeader();
        void                    emit();
        void                    flushCompressed(bool final);
        void                    appendDouble(double value);
        std::string             sinkName() const;
    };

    /// Write a whole table; throws std::runtime_error when the file cannot be opened.
    void writeTable(const SampleTable& table,
                    const std::filesystem::path& path,
                    bool overwrite = true,
                    const CsvOptions& options = CsvOptions{});

} // namespace netsynth
