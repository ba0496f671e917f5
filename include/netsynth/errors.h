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
 * @file errors.h
 * @brief Exception types thrown by the generator core.
 *
 * I/O classes (SampleCsvWriter, SampleCsvReader) report open failures through
 * a bool return plus getErrorMsg(); the types below are reserved for the pure
 * generation path, where a failure always aborts the whole call.
 */

#include <stdexcept>
#include <string>

namespace netsynth {

    /// Caller supplied an unusable argument (sample count < 1, invalid model parameter).
    class InvalidArgumentError : public std::invalid_argument {
    public:
        explicit InvalidArgumentError(const std::string& what)
            : std::invalid_argument(what) {}
    };

    /// A derived quantity left its mathematical domain (total cost <= 0 or non-finite).
    class NumericDegeneracyError : public std::domain_error {
    public:
        explicit NumericDegeneracyError(const std::string& what)
            : std::domain_error(what) {}
    };

} // namespace netsynth
