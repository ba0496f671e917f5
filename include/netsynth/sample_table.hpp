/*
 * Copyright (c) 2026 NetSynth contributors
 * 
 * This file is part of the NetSynth library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

#pragma once

#include "sample_table.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace netsynth {

    inline SampleTable::SampleTable(std::vector<Sample>&& rows,
                                    std::optional<int64_t> seed,
                                    std::optional<ModelParameters> params)
        : rows_(std::move(rows))
        , seed_(seed)
        , params_(std::move(params))
    {
    }

    inline const Sample& SampleTable::at(size_t index) const {
        if (index >= rows_.size()) {
            throw std::out_of_range("Row index " + std::to_string(index) +
                                    " out of range (table has " + std::to_string(rows_.size()) + " rows)");
        }
        return rows_[index];
    }

    inline std::vector<double> SampleTable::column(Column column) const {
        std::vector<double> values;
        values.reserve(rows_.size());
        for (const auto& row : rows_) {
            values.push_back(row.get(column));
        }
        return values;
    }

    inline size_t SampleTable::congestedCount() const {
        return static_cast<size_t>(std::count_if(rows_.begin(), rows_.end(),
                                                 [](const Sample& s) { return s.isCongested(); }));
    }

} // namespace netsynth
