/*
 * Copyright (c) 2026 NetSynth contributors
 * 
 * This file is part of the NetSynth library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

#pragma once

#include "summary.h"
#include "sample_table.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <ostream>
#include <string>
#include <vector>

namespace netsynth {

    inline double quantileSorted(std::span<const double> sorted, double q) {
        if (sorted.empty()) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        const double pos = q * static_cast<double>(sorted.size() - 1);
        const size_t lo = static_cast<size_t>(std::floor(pos));
        const size_t hi = std::min(lo + 1, sorted.size() - 1);
        const double frac = pos - static_cast<double>(lo);
        return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
    }

    inline ColumnStats describe(std::span<const double> values) {
        ColumnStats s;
        s.count = values.size();
        if (values.empty()) {
            const double nan = std::numeric_limits<double>::quiet_NaN();
            s.mean = s.std = s.min = s.p25 = s.p50 = s.p75 = s.max = nan;
            return s;
        }

        double sum = 0.0;
        for (double v : values) sum += v;
        s.mean = sum / static_cast<double>(values.size());

        if (values.size() > 1) {
            double ss = 0.0;
            for (double v : values) ss += (v - s.mean) * (v - s.mean);
            s.std = std::sqrt(ss / static_cast<double>(values.size() - 1));
        } else {
            s.std = std::numeric_limits<double>::quiet_NaN();
        }

        std::vector<double> sorted(values.begin(), values.end());
        std::sort(sorted.begin(), sorted.end());
        s.min = sorted.front();
        s.max = sorted.back();
        s.p25 = quantileSorted(sorted, 0.25);
        s.p50 = quantileSorted(sorted, 0.50);
        s.p75 = quantileSorted(sorted, 0.75);
        return s;
    }

    inline double pearson(std::span<const double> x, std::span<const double> y) {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        if (x.size() != y.size() || x.size() < 2) {
            return nan;
        }

        const double n = static_cast<double>(x.size());
        double mx = 0.0, my = 0.0;
        for (size_t i = 0; i < x.size(); ++i) {
            mx += x[i];
            my += y[i];
        }
        mx /= n;
        my /= n;

        double sxy = 0.0, sxx = 0.0, syy = 0.0;
        for (size_t i = 0; i < x.size(); ++i) {
            const double dx = x[i] - mx;
            const double dy = y[i] - my;
            sxy += dx * dy;
            sxx += dx * dx;
            syy += dy * dy;
        }
        if (sxx == 0.0 || syy == 0.0) {
            return nan;
        }
        return sxy / std::sqrt(sxx * syy);
    }

    inline TableSummary summarize(const SampleTable& table) {
        TableSummary summary;
        summary.rows = table.size();

        std::array<std::vector<double>, COLUMN_COUNT> cols;
        for (Column c : ALL_COLUMNS) {
            cols[static_cast<size_t>(c)] = table.column(c);
            summary.columns[static_cast<size_t>(c)] = describe(cols[static_cast<size_t>(c)]);
        }

        summary.congested_rows = table.congestedCount();
        summary.congested_fraction = table.empty()
            ? 0.0
            : static_cast<double>(summary.congested_rows) / static_cast<double>(table.size());

        for (size_t i = 0; i < CORRELATION_COLUMNS.size(); ++i) {
            for (size_t j = 0; j < CORRELATION_COLUMNS.size(); ++j) {
                summary.correlation[i][j] = pearson(cols[static_cast<size_t>(CORRELATION_COLUMNS[i])],
                                                    cols[static_cast<size_t>(CORRELATION_COLUMNS[j])]);
            }
        }
        summary.rtt_throughput_corr = pearson(cols[static_cast<size_t>(Column::RTT)],
                                              cols[static_cast<size_t>(Column::THROUGHPUT)]);
        return summary;
    }

    inline void printSummary(const TableSummary& summary, std::ostream& os) {
        const auto flags = os.flags();
        const auto prec  = os.precision();

        // ── Descriptive statistics (one column per metric) ──────────────
        constexpr int kLabel = 8;
        constexpr int kCell  = 14;
        os << std::left << std::setw(kLabel) << "";
        for (Column c : ALL_COLUMNS) {
            os << std::right << std::setw(kCell) << columnName(c);
        }
        os << "\n";

        auto printRow = [&](const char* label, auto getter) {
            os << std::left << std::setw(kLabel) << label;
            for (Column c : ALL_COLUMNS) {
                os << std::right << std::setw(kCell) << std::fixed << std::setprecision(6)
                   << getter(summary.stats(c));
            }
            os << "\n";
        };
        os << std::left << std::setw(kLabel) << "count";
        for (Column c : ALL_COLUMNS) {
            os << std::right << std::setw(kCell) << summary.stats(c).count;
        }
        os << "\n";
        printRow("mean", [](const ColumnStats& s) { return s.mean; });
        printRow("std",  [](const ColumnStats& s) { return s.std; });
        printRow("min",  [](const ColumnStats& s) { return s.min; });
        printRow("25%",  [](const ColumnStats& s) { return s.p25; });
        printRow("50%",  [](const ColumnStats& s) { return s.p50; });
        printRow("75%",  [](const ColumnStats& s) { return s.p75; });
        printRow("max",  [](const ColumnStats& s) { return s.max; });

        // ── Data characteristics ────────────────────────────────────────
        os << "\n" << std::fixed << std::setprecision(1)
           << "Samples with packet loss: " << summary.congested_rows
           << " (" << summary.congested_fraction * 100.0 << "%)\n"
           << std::setprecision(2)
           << "Mean RTT:                 " << summary.stats(Column::RTT).mean << " ms\n"
           << "Mean TTFB:                " << summary.stats(Column::TTFB).mean << " ms\n"
           << "Mean Throughput:          " << summary.stats(Column::THROUGHPUT).mean << " Mbps\n"
           << std::setprecision(3)
           << "RTT-Throughput Corr.:     " << summary.rtt_throughput_corr << "\n";

        // ── Correlation matrix ──────────────────────────────────────────
        os << "\nPearson correlation\n" << std::left << std::setw(kLabel + 4) << "";
        for (Column c : CORRELATION_COLUMNS) {
            os << std::right << std::setw(kCell) << columnName(c);
        }
        os << "\n";
        for (size_t i = 0; i < CORRELATION_COLUMNS.size(); ++i) {
            os << std::left << std::setw(kLabel + 4) << columnName(CORRELATION_COLUMNS[i]);
            for (size_t j = 0; j < CORRELATION_COLUMNS.size(); ++j) {
                os << std::right << std::setw(kCell) << std::setprecision(3) << summary.correlation[i][j];
            }
            os << "\n";
        }

        os.flags(flags);
        os.precision(prec);
    }

} // namespace netsynth
