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
 * @file summary.h
 * @brief Descriptive statistics and correlations over a SampleTable.
 *
 * Matches the conventions of common data-frame tooling so numbers can be
 * compared directly: sample standard deviation (n - 1), quantiles by linear
 * interpolation between order statistics, Pearson correlation.
 */

#include <array>
#include <cstddef>
#include <iosfwd>
#include <span>

#include "definitions.h"
#include "sample_table.h"

namespace netsynth {

    struct ColumnStats {
        size_t count = 0;
        double mean  = 0.0;
        double std   = 0.0;
        double min   = 0.0;
        double p25   = 0.0;
        double p50   = 0.0;
        double p75   = 0.0;
        double max   = 0.0;
    };

    /// Columns covered by the correlation matrix, in matrix order.
    constexpr std::array<Column, 4> CORRELATION_COLUMNS = OBSERVED_COLUMNS;

    struct TableSummary {
        size_t                              rows = 0;
        std::array<ColumnStats, COLUMN_COUNT> columns{};     // indexed by Column
        size_t                              congested_rows = 0;
        double                              congested_fraction = 0.0;
        double                              rtt_throughput_corr = 0.0;
        std::array<std::array<double, 4>, 4> correlation{};  // CORRELATION_COLUMNS x CORRELATION_COLUMNS

        const ColumnStats& stats(Column column) const { return columns[static_cast<size_t>(column)]; }
    };

    /// Count 0 and NaN everywhere else for empty input.
    ColumnStats  describe(std::span<const double> values);

    /// Linear-interpolation quantile of already sorted values, q in [0, 1].
    double       quantileSorted(std::span<const double> sorted, double q);

    /// NaN for mismatched sizes, fewer than two values, or zero variance.
    double       pearson(std::span<const double> x, std::span<const double> y);

    TableSummary summarize(const SampleTable& table);

    void         printSummary(const TableSummary& summary, std::ostream& os);

} // namespace netsynth
