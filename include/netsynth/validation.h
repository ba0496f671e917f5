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
 * @file validation.h
 * @brief Check a table against the domain contract consumers rely on:
 *        rtt > 0, server_delay > 0, ttfb == rtt + server_delay (>= rtt),
 *        loss == 0 or within [loss_min, loss_max], throughput >= floor.
 */

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include "model_params.h"
#include "sample_table.h"

namespace netsynth {

    struct ValidationReport {
        static constexpr size_t MAX_ISSUES = 20;

        size_t                   rows_checked = 0;
        size_t                   violation_count = 0;    // all violations, not just the listed ones
        std::vector<std::string> issues;                 // first MAX_ISSUES descriptions

        bool ok() const { return violation_count == 0; }
    };

    /// Relative tolerance for ttfb == rtt + server_delay (covers CSV tables without server_delay).
    constexpr double TTFB_TOLERANCE = 1e-9;

    ValidationReport validate(const SampleTable& table, const ModelParameters& params = ModelParameters{});

    void printValidation(const ValidationReport& report, std::ostream& os);

} // namespace netsynth
