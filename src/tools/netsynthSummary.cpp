/*
 * Copyright (c) 2026 NetSynth contributors
 * 
 * This file is part of the NetSynth library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

/**
 * @file netsynthSummary.cpp
 * @brief CLI tool to analyse a persisted sample table
 * 
 * Reads a CSV (or LZ4-framed CSV) table and prints descriptive statistics,
 * the congested-row fraction, the RTT/throughput correlation, the full
 * correlation matrix, and a domain validation report. Model overrides select
 * the parameters the table is validated against (loss band, throughput floor).
 */

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <netsynth/netsynth.h>
#include "cli_common.h"

struct Config {
    std::string input_file;
    char delimiter = ',';
    netsynth::ModelParameters params;
    bool strict = false;
    bool help = false;
};

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] INPUT_FILE\n\n";
    std::cout << "Print statistics and a validation report for a synthetic sample table.\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  INPUT_FILE     CSV file with rtt, ttfb, loss, throughput columns\n";
    std::cout << "                 (LZ4-framed input is detected automatically)\n\n";
    std::cout << "Options:\n";
    std::cout << "  --delimiter C           Field delimiter (default: ',', 'tab' for tab)\n";
    std::cout << "  --strict                Exit with status 2 if validation fails\n";
    std::cout << "  -h, --help              Show this help message\n\n";
    std::cout << "Model (parameters the table was generated with):\n";
    netsynth_cli::printModelOptions(std::cout);
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " synthetic_cdn_data.csv\n";
    std::cout << "  " << program_name << " --strict large.csv.lz4\n";
}

Config parseArgs(int argc, char* argv[]) {
    Config config;
    
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() { return netsynth_cli::optionValue(argc, argv, i, arg); };
        
        if (arg == "-h" || arg == "--help") {
            config.help = true;
            return config;
        } else if (arg == "--strict") {
            config.strict = true;
        } else if (arg == "--delimiter") {
            config.delimiter = netsynth_cli::parseDelimiter(value());
        } else if (double* field = netsynth_cli::modelField(config.params, arg)) {
            *field = netsynth_cli::parseNumber<double>(value(), arg);
        } else if (arg.starts_with("-")) {
            throw std::runtime_error("Unknown option: " + arg);
        } else {
            if (config.input_file.empty()) {
                config.input_file = arg;
            } else {
                throw std::runtime_error("Too many arguments. Only one input file expected.");
            }
        }
    }
    
    if (config.input_file.empty() && !config.help) {
        throw std::runtime_error("Input file is required");
    }
    
    return config;
}

int main(int argc, char* argv[]) {
    try {
        Config config = parseArgs(argc, argv);
        
        if (config.help) {
            printUsage(argv[0]);
            return 0;
        }
        config.params.validate();
        
        if (!std::filesystem::exists(config.input_file)) {
            std::cerr << "Error: File does not exist: " << config.input_file << std::endl;
            return 1;
        }

        netsynth::SampleCsvReader reader(config.delimiter);
        if (!reader.open(config.input_file)) {
            std::cerr << "Error: " << reader.getErrorMsg() << std::endl;
            return 1;
        }
        const bool has_server_delay = reader.hasServerDelay();
        netsynth::SampleTable table = reader.readAll();
        const size_t skipped = reader.skippedLines();
        const size_t lines = reader.fileLine();
        const std::filesystem::path path = reader.filePath();
        reader.close();

        std::cout << "Sample table: " << path.string() << "\n";
        std::cout << "File size: " << netsynth_cli::formatBytes(std::filesystem::file_size(path)) << "\n";
        std::cout << "Rows: " << table.size();
        if (skipped > 0) {
            std::cout << " (" << skipped << " of " << lines << " line(s) malformed and skipped)";
        }
        std::cout << "\n";
        if (!has_server_delay) {
            std::cout << "server_delay: reconstructed as ttfb - rtt\n";
        }
        std::cout << "\n";

        if (table.empty()) {
            std::cerr << "Error: No data rows in " << config.input_file << std::endl;
            return 1;
        }

        netsynth::printSummary(netsynth::summarize(table), std::cout);
        std::cout << "\n";

        auto report = netsynth::validate(table, config.params);
        netsynth::printValidation(report, std::cout);

        if (config.strict && !report.ok()) {
            return 2;
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
