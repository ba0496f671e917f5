/*
 * Copyright (c) 2026 NetSynth contributors
 * 
 * This file is part of the NetSynth library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

/**
 * @file netsynthGenerator.cpp
 * @brief CLI tool to generate a synthetic CDN performance dataset
 *
 * Produces a deterministic, reproducible CSV table of rtt, ttfb, loss and
 * throughput from the causal network model, with every model constant
 * overridable from the command line.
 *
 * Default: 500 rows, seed 42, written to synthetic_cdn_data.csv.
 */

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <netsynth/netsynth.h>
#include "cli_common.h"

// ── Configuration ───────────────────────────────────────────────────

struct Config {
    std::string output_file   = netsynth::DEFAULT_OUTPUT_FILE;
    size_t      rows          = netsynth::DEFAULT_SAMPLE_COUNT;
    int64_t     seed          = netsynth::DEFAULT_SEED;
    size_t      threads       = 1;

    netsynth::ModelParameters params;
    netsynth::CsvOptions      csv;

    // Flags
    bool        overwrite     = false;
    bool        summary       = false;
    bool        print_params  = false;
    bool        verbose       = false;
    bool        help          = false;
};

// ── Usage ───────────────────────────────────────────────────────────

static void printUsage(const char* prog) {
    std::cout
        << "Usage: " << prog
        << " [OPTIONS] [-o OUTPUT_FILE]\n\n"

        << "Generate a synthetic network performance dataset (rtt, ttfb, loss, throughput).\n\n"

        << "Dataset:\n"
        << "  -n, --rows N               Number of rows (default: " << netsynth::DEFAULT_SAMPLE_COUNT << ")\n"
        << "  -s, --seed S               Random seed, any 64-bit integer (default: " << netsynth::DEFAULT_SEED << ")\n"
        << "  -j, --threads N            Worker threads, 0 = all cores (default: 1)\n\n"

        << "Output:\n"
        << "  -o, --output FILE          Output CSV file (default: " << netsynth::DEFAULT_OUTPUT_FILE << ")\n"
        << "                             '-' writes to stdout; a .lz4 suffix writes an LZ4 frame\n"
        << "  --with-server-delay        Add the latent server_delay column after ttfb\n"
        << "  --delimiter C              Field delimiter (default: ',', 'tab' for tab)\n"
        << "  --no-header                Omit the header line\n"
        << "  -f, --overwrite            Overwrite output file if it exists\n\n"

        << "Model:\n";
    netsynth_cli::printModelOptions(std::cout);
    std::cout
        << "\n"

        << "General:\n"
        << "  --summary                  Print descriptive statistics after writing\n"
        << "  --print-params             Print the effective model parameters\n"
        << "  -v, --verbose              Verbose progress output\n"
        << "  -h, --help                 Show this help message\n\n"

        << "Examples:\n"
        << "  " << prog << "\n"
        << "  " << prog << " -n 100000 -s 7 -j 0 -o large.csv.lz4\n"
        << "  " << prog << " --loss-weight 10000 --clean-probability 0.7 --summary -o stressed.csv\n"
        << "  " << prog << " -n 10 -o -\n";
}

// ── Argument parsing ────────────────────────────────────────────────

static Config parseArgs(int argc, char* argv[]) {
    using netsynth_cli::parseNumber;
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() { return netsynth_cli::optionValue(argc, argv, i, arg); };

        if (arg == "-h" || arg == "--help") {
            cfg.help = true;
            return cfg;
        } else if (arg == "-v" || arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "-f" || arg == "--overwrite") {
            cfg.overwrite = true;
        } else if (arg == "--summary") {
            cfg.summary = true;
        } else if (arg == "--print-params") {
            cfg.print_params = true;
        } else if (arg == "--with-server-delay") {
            cfg.csv.include_server_delay = true;
        } else if (arg == "--no-header") {
            cfg.csv.include_header = false;
        } else if (arg == "--delimiter") {
            cfg.csv.delimiter = netsynth_cli::parseDelimiter(value());
        } else if (arg == "-o" || arg == "--output") {
            cfg.output_file = value();
        } else if (arg == "-n" || arg == "--rows") {
            int64_t n = parseNumber<int64_t>(value(), arg);
            if (n < 1) {
                throw std::runtime_error("Row count must be at least 1.");
            }
            cfg.rows = static_cast<size_t>(n);
        } else if (arg == "-s" || arg == "--seed") {
            cfg.seed = parseNumber<int64_t>(value(), arg);
        } else if (arg == "-j" || arg == "--threads") {
            int64_t t = parseNumber<int64_t>(value(), arg);
            if (t < 0) {
                throw std::runtime_error("Thread count must be non-negative.");
            }
            cfg.threads = static_cast<size_t>(t);
        } else if (double* field = netsynth_cli::modelField(cfg.params, arg)) {
            *field = parseNumber<double>(value(), arg);
        } else if (arg.starts_with("-") && arg != "-") {
            throw std::runtime_error("Unknown option: " + arg);
        } else {
            cfg.output_file = arg;
        }
    }

    if (cfg.csv.delimiter == cfg.csv.decimal_separator) {
        throw std::runtime_error("Delimiter must differ from the decimal separator '.'.");
    }
    return cfg;
}

// ── Main ────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);

        if (cfg.help) {
            printUsage(argv[0]);
            return 0;
        }

        // Throws InvalidArgumentError naming the bad parameter
        netsynth::SampleGenerator generator(cfg.params);
        const bool to_stdout = (cfg.output_file == "-");

        if (cfg.verbose || cfg.print_params) {
            std::cerr << "Rows:      " << cfg.rows << "\n"
                      << "Seed:      " << cfg.seed << "\n"
                      << "Threads:   " << (cfg.threads == 0 ? std::string("all") : std::to_string(cfg.threads)) << "\n"
                      << "Model parameters:\n" << generator.params();
        }

        // ── Validate output path ────────────────────────────────────
        if (!to_stdout && !cfg.overwrite && std::filesystem::exists(cfg.output_file)) {
            std::cerr << "Error: Output file already exists: "
                      << cfg.output_file
                      << "\n       Use -f / --overwrite to replace.\n";
            return 1;
        }

        // ── Generate ────────────────────────────────────────────────
        auto start_time = std::chrono::steady_clock::now();

        netsynth::SampleTable table = generator.generateParallel(cfg.rows, cfg.seed, cfg.threads);

        auto gen_time = std::chrono::steady_clock::now();
        if (cfg.verbose) {
            std::cerr << "Generated " << table.size() << " rows in "
                      << std::chrono::duration_cast<std::chrono::milliseconds>(gen_time - start_time).count()
                      << " ms\n";
        }

        // ── Write ───────────────────────────────────────────────────
        netsynth::SampleCsvWriter writer(cfg.csv);
        const bool opened = to_stdout ? writer.open(std::cout)
                                      : writer.open(cfg.output_file, cfg.overwrite);
        if (!opened) {
            std::cerr << "Error: " << writer.getErrorMsg() << "\n";
            return 1;
        }
        if (cfg.verbose) {
            netsynth_cli::printColumnSummary("Layout", writer.columns());
        }

        for (size_t r = 0; r < table.size(); ++r) {
            writer.write(table[r]);
            if (cfg.verbose && ((r + 1) & 0xFFFF) == 0) {
                std::cerr << "  Written " << (r + 1) << " / "
                          << table.size() << " rows...\n";
            }
        }
        const bool compressed = writer.isCompressed();
        const std::string output_path = to_stdout ? std::string("<stdout>") : writer.filePath().string();
        writer.close();

        auto end_time = std::chrono::steady_clock::now();
        auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                               end_time - start_time).count();
        if (duration_ms == 0) duration_ms = 1;

        // ── Summary ─────────────────────────────────────────────────
        double duration_s  = static_cast<double>(duration_ms) / 1000.0;
        double krows_per_s = (static_cast<double>(table.size()) / 1000.0) / duration_s;

        std::cerr << "\n=== netsynthGenerator Summary ===\n"
                  << "  Rows written: " << table.size() << "\n"
                  << "  Seed:         " << cfg.seed << "\n"
                  << "  Columns:      " << writer.headerLine() << "\n";
        if (!to_stdout) {
            auto file_size = std::filesystem::file_size(output_path);
            std::cerr << "  Encoding:     " << (compressed ? "csv + lz4 frame" : "csv") << "\n"
                      << "  File size:    " << file_size << " bytes ("
                      << netsynth_cli::formatBytes(file_size) << ")\n";
        }
        std::cerr << "  Wall time:    " << duration_ms << " ms\n"
                  << "  Throughput:   " << std::fixed << std::setprecision(1)
                  << krows_per_s << " krows/s\n"
                  << "  Output:       " << output_path << "\n";

        if (cfg.summary) {
            std::cerr << "\n=== Summary Statistics ===\n";
            netsynth::printSummary(netsynth::summarize(table), std::cerr);
        }
        return 0;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
