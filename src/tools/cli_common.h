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
 * @file cli_common.h
 * @brief Shared utilities for NetSynth CLI tools
 *
 * Provides standardised helpers used across all CLI tools:
 *   - formatBytes()            : byte count → "1.23 MB" / "456 KB" / "789 bytes"
 *   - parseNumber<T>()         : strict std::from_chars parsing of option values
 *   - parseDelimiter()         : "," / ";" / "\t" / "tab" → char
 *   - optionValue()            : value following an option, or a "Missing value" error
 *   - modelField()             : model override option → ModelParameters field
 *   - printModelOptions()      : usage lines for the model overrides
 *   - printColumnSummary()     : column table (name, unit) to any ostream
 *
 * Tools opt-in to specific helpers via ordinary #include.
 */

#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>
#include <netsynth/netsynth.h>

namespace netsynth_cli {

// ── formatBytes ────────────────────────────────────────────────────

/// Format a byte count as human-readable string.
inline std::string formatBytes(uintmax_t bytes) {
    std::ostringstream oss;
    if (bytes >= 1024 * 1024) {
        oss << std::fixed << std::setprecision(2)
            << (static_cast<double>(bytes) / (1024.0 * 1024.0)) << " MB";
    } else if (bytes >= 1024) {
        oss << std::fixed << std::setprecision(2)
            << (static_cast<double>(bytes) / 1024.0) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

// ── parseNumber ────────────────────────────────────────────────────

/// Parse a whole option value.  Throws std::runtime_error naming the option
/// on empty input, trailing characters or overflow.
template<typename T>
T parseNumber(std::string_view text, const std::string& option) {
    static_assert(std::is_arithmetic_v<T>, "parseNumber requires an arithmetic type");
    T value{};
    const char* first = text.data();
    const char* last  = text.data() + text.size();
    if (!text.empty() && text.front() == '+') {
        ++first;
    }
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc{} || ptr != last) {
        throw std::runtime_error("Invalid value for " + option + ": '" + std::string(text) + "'");
    }
    if constexpr (std::is_floating_point_v<T>) {
        if (!std::isfinite(value)) {
            throw std::runtime_error("Invalid value for " + option + ": '" + std::string(text) + "'");
        }
    }
    return value;
}

// ── parseDelimiter ─────────────────────────────────────────────────

inline char parseDelimiter(const std::string& text) {
    if (text == "\\t" || text == "tab") return '\t';
    if (text.size() == 1 && text[0] != '"' && text[0] != '\n' && text[0] != '\r') return text[0];
    throw std::runtime_error("Invalid delimiter '" + text + "'. Expected a single character or 'tab'.");
}

// ── optionValue ────────────────────────────────────────────────────

/// Consume the argument after argv[i]. Throws if the option is the last argument.
inline std::string optionValue(int argc, char* argv[], int& i, const std::string& option) {
    if (i + 1 >= argc) {
        throw std::runtime_error("Missing value for option " + option);
    }
    return argv[++i];
}

// ── Model overrides ────────────────────────────────────────────────

struct ModelOption {
    const char*                          name;
    const char*                          metavar;
    const char*                          help;
    double netsynth::ModelParameters::*  field;
};

inline constexpr ModelOption MODEL_OPTIONS[] = {
    {"--clean-probability", "P",    "Probability of a loss-free row",       &netsynth::ModelParameters::clean_probability},
    {"--loss-min",          "F",    "Lower bound of congested loss",        &netsynth::ModelParameters::loss_min},
    {"--loss-max",          "F",    "Upper bound of congested loss",        &netsynth::ModelParameters::loss_max},
    {"--loss-weight",       "W",    "Cost weight of loss",                  &netsynth::ModelParameters::loss_weight},
    {"--throughput-scale",  "K",    "Throughput numerator",                 &netsynth::ModelParameters::throughput_scale},
    {"--noise-min",         "F",    "Lower noise factor",                   &netsynth::ModelParameters::noise_min},
    {"--noise-max",         "F",    "Upper noise factor",                   &netsynth::ModelParameters::noise_max},
    {"--throughput-floor",  "MBPS", "Minimum throughput",                   &netsynth::ModelParameters::throughput_floor},
};

/// Field addressed by a model override option, nullptr for any other argument.
inline double* modelField(netsynth::ModelParameters& params, std::string_view option) {
    if (option == "--rtt-median")   return &params.rtt.median;
    if (option == "--rtt-sigma")    return &params.rtt.sigma;
    if (option == "--delay-median") return &params.server_delay.median;
    if (option == "--delay-sigma")  return &params.server_delay.sigma;
    for (const auto& opt : MODEL_OPTIONS) {
        if (option == opt.name) return &(params.*opt.field);
    }
    return nullptr;
}

/// Usage lines for every model override, with the default values.
inline void printModelOptions(std::ostream& os) {
    const netsynth::ModelParameters d;
    auto line = [&os](const std::string& flag, const char* help, double def) {
        os << "  " << std::left << std::setw(27) << flag << help << " (default: " << def << ")\n";
    };
    line("--rtt-median MS",   "Median RTT",                       d.rtt.median);
    line("--rtt-sigma S",     "Log-space sigma of RTT",           d.rtt.sigma);
    line("--delay-median MS", "Median server delay",              d.server_delay.median);
    line("--delay-sigma S",   "Log-space sigma of server delay",  d.server_delay.sigma);
    for (const auto& opt : MODEL_OPTIONS) {
        line(std::string(opt.name) + " " + opt.metavar, opt.help, d.*opt.field);
    }
}

// ── printColumnSummary ─────────────────────────────────────────────

/// Print vertical column table: index, name and unit.
inline void printColumnSummary(const std::string& label,
                               const std::vector<netsynth::Column>& columns,
                               std::ostream& os = std::cerr) {
    os << label << " (" << columns.size() << " columns)\n";
    os << "  " << std::right << std::setw(3) << "Idx"
       << "  " << std::left  << std::setw(12) << "Name"
       << "  " << std::left  << "Unit" << "\n";
    os << "  " << std::string(3, '-')
       << "  " << std::string(12, '-')
       << "  " << std::string(8, '-') << "\n";
    for (size_t i = 0; i < columns.size(); ++i) {
        os << "  " << std::right << std::setw(3) << i
           << "  " << std::left  << std::setw(12) << netsynth::columnName(columns[i])
           << "  " << std::left  << netsynth::columnUnit(columns[i]) << "\n";
    }
}

} // namespace netsynth_cli
