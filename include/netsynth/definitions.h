/*
 * Copyright (c) 2026 NetSynth contributors
 * 
 * This file is part of the NetSynth library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

#pragma once

/* This file holds all constants and definitions used throughout the NetSynth library */
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace netsynth {

    // Version information
    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    inline std::string getVersion() {
        return std::to_string(VERSION_MAJOR) + "." +
               std::to_string(VERSION_MINOR) + "." +
               std::to_string(VERSION_PATCH);
    }

#ifdef NETSYNTH_DEBUG_OUTPUTS
    constexpr bool DEBUG_OUTPUTS = true;
#else
    constexpr bool DEBUG_OUTPUTS = false;
#endif

    // Invocation defaults
    constexpr size_t      DEFAULT_SAMPLE_COUNT = 500;
    constexpr int64_t     DEFAULT_SEED         = 42;
    constexpr const char* DEFAULT_OUTPUT_FILE  = "synthetic_cdn_data.csv";
    constexpr size_t      LZ4_BLOCK_SIZE_KB    = 64;      // chunk size fed to the LZ4 frame encoder

    // Column identifiers, in table order
    enum class Column : uint8_t {
        RTT          = 0,
        TTFB         = 1,
        SERVER_DELAY = 2,
        LOSS         = 3,
        THROUGHPUT   = 4
    };

    constexpr size_t COLUMN_COUNT = 5;

    constexpr std::array<Column, COLUMN_COUNT> ALL_COLUMNS = {
        Column::RTT, Column::TTFB, Column::SERVER_DELAY, Column::LOSS, Column::THROUGHPUT
    };

    // Columns persisted by default; server_delay is opt-in
    constexpr std::array<Column, 4> OBSERVED_COLUMNS = {
        Column::RTT, Column::TTFB, Column::LOSS, Column::THROUGHPUT
    };

    constexpr std::string_view columnName(Column column) {
        switch (column) {
            case Column::RTT:          return "rtt";
            case Column::TTFB:         return "ttfb";
            case Column::SERVER_DELAY: return "server_delay";
            case Column::LOSS:         return "loss";
            case Column::THROUGHPUT:   return "throughput";
        }
        return "undefined";
    }

    constexpr std::string_view columnUnit(Column column) {
        switch (column) {
            case Column::RTT:          return "ms";
            case Column::TTFB:         return "ms";
            case Column::SERVER_DELAY: return "ms";
            case Column::LOSS:         return "fraction";
            case Column::THROUGHPUT:   return "Mbps";
        }
        return "";
    }

    /// Case-insensitive lookup, accepts the capitalised names of older exports ("RTT", "Loss").
    inline Column columnFromName(std::string_view name) {
        auto equalsIgnoreCase = [](std::string_view a, std::string_view b) {
            if (a.size() != b.size()) return false;
            for (size_t i = 0; i < a.size(); ++i) {
                char ca = (a[i] >= 'A' && a[i] <= 'Z') ? static_cast<char>(a[i] - 'A' + 'a') : a[i];
                char cb = (b[i] >= 'A' && b[i] <= 'Z') ? static_cast<char>(b[i] - 'A' + 'a') : b[i];
                if (ca != cb) return false;
            }
            return true;
        };
        for (Column c : ALL_COLUMNS) {
            if (equalsIgnoreCase(name, columnName(c))) {
                return c;
            }
        }
        throw std::runtime_error("Unknown column name: '" + std::string(name) + "'");
    }

} // namespace netsynth
