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
 * @file sample_table.h
 * @brief Immutable, generation-ordered table of samples.
 *
 * A SampleTable is produced once (by SampleGenerator or SampleCsvReader) and
 * then only read.  It carries the seed and model parameters it was generated
 * with, when known, so downstream consumers can report provenance.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "definitions.h"
#include "model_params.h"
#include "sample.h"

namespace netsynth {

    class SampleTable {
    public:
        using const_iterator = std::vector<Sample>::const_iterator;

    private:
        std::vector<Sample>             rows_;
        std::optional<int64_t>          seed_;
        std::optional<ModelParameters>  params_;

    public:
        SampleTable() = default;
        explicit SampleTable(std::vector<Sample>&& rows,
                             std::optional<int64_t> seed = std::nullopt,
                             std::optional<ModelParameters> params = std::nullopt);

        size_t                  size() const                    { return rows_.size(); }
        bool                    empty() const                   { return rows_.empty(); }
        const Sample&           operator[](size_t index) const  { return rows_[index]; }
        const Sample&           at(size_t index) const;
        const_iterator          begin() const                   { return rows_.begin(); }
        const_iterator          end() const                     { return rows_.end(); }
        std::span<const Sample> rows() const                    { return rows_; }

        /// Copy of one column in row order.
        std::vector<double>     column(Column column) const;

        const std::optional<int64_t>&         seed() const      { return seed_; }
        const std::optional<ModelParameters>& params() const    { return params_; }

        /// Number of rows in the congested (loss > 0) regime.
        size_t                  congestedCount() const;

        /// Row-wise equality; provenance is ignored.
        bool                    sameRows(const SampleTable& other) const { return rows_ == other.rows_; }
    };

} // namespace netsynth
