/*
 * Copyright (c) 2026 NetSynth contributors
 * 
 * This file is part of the NetSynth library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

#pragma once

#include "generator.h"
#include "errors.h"
#include "model_params.hpp"
#include "random_stream.hpp"
#include "sample_table.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace netsynth {

    inline SampleGenerator::SampleGenerator(const ModelParameters& params)
        : params_(params)
    {
        params_.validate();
    }

    // ── Model formulas ──────────────────────────────────────────────────

    inline double SampleGenerator::totalCost(double rtt, double ttfb, double loss, double lossWeight) {
        return rtt + ttfb + loss * lossWeight;
    }

    inline double SampleGenerator::baseThroughput(double totalCost, double scale) {
        if (!(totalCost > 0.0) || !std::isfinite(totalCost)) {
            throw NumericDegeneracyError("Total cost must be positive and finite, got " +
                                         std::to_string(totalCost));
        }
        return scale / totalCost;
    }

    inline double SampleGenerator::noisyThroughput(double base, double noiseFactor, double floor) {
        return std::max(base * noiseFactor, floor);
    }

    // ── Row derivation ──────────────────────────────────────────────────

    inline Sample SampleGenerator::deriveSample(RandomStream& rng) const {
        Sample s;
        s.rtt          = rng.logNormal(params_.rtt.mu(), params_.rtt.sigma);
        s.server_delay = rng.logNormal(params_.server_delay.mu(), params_.server_delay.sigma);
        s.ttfb         = s.rtt + s.server_delay;

        if (rng.bernoulli(params_.clean_probability)) {
            s.loss = 0.0;
        } else {
            s.loss = rng.uniform(params_.loss_min, params_.loss_max);
        }

        const double cost  = totalCost(s.rtt, s.ttfb, s.loss, params_.loss_weight);
        const double base  = baseThroughput(cost, params_.throughput_scale);
        const double noise = rng.uniform(params_.noise_min, params_.noise_max);
        s.throughput       = noisyThroughput(base, noise, params_.throughput_floor);
        return s;
    }

    inline Sample SampleGenerator::generateRow(int64_t seed, uint64_t rowIndex) const {
        RandomStream rng = RandomStream::forRow(seed, rowIndex);
        return deriveSample(rng);
    }

    inline void SampleGenerator::fillRange(Sample* out, int64_t seed, size_t first, size_t last) const {
        for (size_t r = first; r < last; ++r) {
            out[r] = generateRow(seed, r);
        }
    }

    // ── Table generation ────────────────────────────────────────────────

    inline SampleTable SampleGenerator::generate(size_t count, int64_t seed) const {
        if (count < 1) {
            throw InvalidArgumentError("Sample count must be at least 1");
        }

        std::vector<Sample> rows(count);
        fillRange(rows.data(), seed, 0, count);
        return SampleTable(std::move(rows), seed, params_);
    }

    inline SampleTable SampleGenerator::generateParallel(size_t count, int64_t seed, size_t threads) const {
        if (count < 1) {
            throw InvalidArgumentError("Sample count must be at least 1");
        }
        if (threads == 0) {
            threads = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        threads = std::min(threads, count);
        if (threads == 1) {
            return generate(count, seed);
        }

        std::vector<Sample> rows(count);
        std::vector<std::exception_ptr> errors(threads);
        // destroyed before rows/errors; joins the started workers if a later spawn throws
        detail::WorkerGroup workers;
        workers.reserve(threads);

        const size_t chunk = count / threads;
        const size_t extra = count % threads;
        size_t first = 0;
        for (size_t t = 0; t < threads; ++t) {
            const size_t last = first + chunk + (t < extra ? 1 : 0);
            workers.spawn([this, &rows, &errors, seed, first, last, t]() {
                try {
                    fillRange(rows.data(), seed, first, last);
                } catch (...) {
                    errors[t] = std::current_exception();
                }
            });
            first = last;
        }

        workers.joinAll();
        for (const auto& err : errors) {
            if (err) {
                std::rethrow_exception(err);
            }
        }

        if constexpr (DEBUG_OUTPUTS) {
            std::cerr << "Generated " << count << " rows on " << threads << " threads" << std::endl;
        }
        return SampleTable(std::move(rows), seed, params_);
    }

    inline SampleTable generate(size_t count, int64_t seed) {
        return SampleGenerator().generate(count, seed);
    }

} // namespace netsynth
