/*
 * Copyright (c) 2026 NetSynth contributors
 * 
 * This file is part of the NetSynth library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

#pragma once

#include "validation.h"
#include "sample_table.hpp"
#include <algorithm>
#include <cmath>
#include <ostream>
#include <string>

namespace netsynth {

    inline ValidationReport validate(const SampleTable& table, const ModelParameters& params) {
        ValidationReport report;
        report.rows_checked = table.size();

        auto fail = [&report](size_t row, const std::string& what) {
            report.violation_count++;
            if (report.issues.size() < ValidationReport::MAX_ISSUES) {
                report.issues.push_back("row " + std::to_string(row) + ": " + what);
            }
        };

        for (size_t r = 0; r < table.size(); ++r) {
            const Sample& s = table[r];

            bool finite = true;
            for (Column c : ALL_COLUMNS) {
                if (!std::isfinite(s.get(c))) {
                    fail(r, std::string(columnName(c)) + " is not finite");
                    finite = false;
                }
            }
            if (!finite) {
                continue;
            }

            if (!(s.rtt > 0.0)) {
                fail(r, "rtt must be positive, got " + std::to_string(s.rtt));
            }
            if (!(s.server_delay > 0.0)) {
                fail(r, "server_delay must be positive, got " + std::to_string(s.server_delay));
            }
            if (s.ttfb < s.rtt) {
                fail(r, "ttfb (" + std::to_string(s.ttfb) + ") below rtt (" + std::to_string(s.rtt) + ")");
            }
            const double expected = s.rtt + s.server_delay;
            if (std::abs(s.ttfb - expected) > TTFB_TOLERANCE * std::max(1.0, std::abs(expected))) {
                fail(r, "ttfb differs from rtt + server_delay");
            }
            if (s.loss != 0.0 && (s.loss < params.loss_min || s.loss > params.loss_max)) {
                fail(r, "loss " + std::to_string(s.loss) + " outside {0} U [" +
                        std::to_string(params.loss_min) + ", " + std::to_string(params.loss_max) + "]");
            }
            if (s.throughput < params.throughput_floor) {
                fail(r, "throughput " + std::to_string(s.throughput) + " below floor " +
                        std::to_string(params.throughput_floor));
            }
        }
        return report;
    }

    inline void printValidation(const ValidationReport& report, std::ostream& os) {
        if (report.ok()) {
            os << "Validation: OK (" << report.rows_checked << " rows)\n";
            return;
        }
        os << "Validation: " << report.violation_count << " violation(s) in "
           << report.rows_checked << " rows\n";
        for (const auto& issue : report.issues) {
            os << "  - " << issue << "\n";
        }
        if (report.violation_count > report.issues.size()) {
            os << "  ... " << (report.violation_count - report.issues.size()) << " more\n";
        }
    }

} // namespace netsynth
