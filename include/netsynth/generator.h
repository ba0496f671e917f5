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
 * @file generator.h
 * @brief SampleGenerator - the causal network model.
 *
 * Each row is derived from its own RandomStream (seeded from (seed, rowIndex))
 * in this fixed order:
 *
 *   draw  1-2  rtt          = LogNormal(rtt.mu, rtt.sigma)                 Box-Muller
 *   draw  3-4  server_delay = LogNormal(server_delay.mu, server_delay.sigma)
 *              ttfb         = rtt + server_delay
 *   draw  5    regime       : u < clean_probability -> loss = 0
 *   draw (6)   loss         = U(loss_min, loss_max)                        congested rows only
 *   draw  6/7  noise        = U(noise_min, noise_max)
 *              throughput   = max(scale / (rtt + ttfb + loss * loss_weight) * noise, floor)
 *
 * Changing the order or the number of draws changes every table; treat it as
 * part of the file format.
 *
 * Because rows never share a stream, generate(n, seed) is a prefix of
 * generate(n', seed) for n' > n, and generateParallel() returns exactly the
 * same table as generate().
 */

#include <cstddef>
#include <cstdint>
#include <thread>
#include <utility>
#include <vector>

#include "model_params.h"
#include "random_stream.h"
#include "sample.h"
#include "sample_table.h"

namespace netsynth {

    namespace detail {

        /// Owns worker threads. Every started thread is joined on destruction,
        /// also when an exception (e.g. a failed spawn) unwinds the owner.
        class WorkerGroup {
            std::vector<std::thread> threads_;

        public:
            WorkerGroup() = default;
            ~WorkerGroup() { joinAll(); }

            WorkerGroup(const WorkerGroup&) = delete;
            WorkerGroup& operator=(const WorkerGroup&) = delete;

            void    reserve(size_t count)           { threads_.reserve(count); }
            size_t  size() const                    { return threads_.size(); }

            template<typename Fn>
            void spawn(Fn&& fn) {
                threads_.emplace_back(std::forward<Fn>(fn));
            }

            void joinAll() {
                for (auto& t : threads_) {
                    if (t.joinable()) {
                        t.join();
                    }
                }
            }
        };

    } // namespace detail

    class SampleGenerator {
        ModelParameters         params_;

    public:
        /// Validates params; throws InvalidArgumentError.
        explicit SampleGenerator(const ModelParameters& params = ModelParameters{});

        const ModelParameters&  params() const                  { return params_; }

        SampleTable             generate(size_t count, int64_t seed) const;
        SampleTable             generateParallel(size_t count, int64_t seed, size_t threads = 0) const;
        Sample                  generateRow(int64_t seed, uint64_t rowIndex) const;

        /// Derive one row from an already positioned stream.
        Sample                  deriveSample(RandomStream& rng) const;

        // ── Model formulas ──────────────────────────────────────────────
        static double           totalCost(double rtt, double ttfb, double loss, double lossWeight);
        static double           baseThroughput(double totalCost, double scale);
        static double           noisyThroughput(double base, double noiseFactor, double floor);

    private:
        void                    fillRange(Sample* out, int64_t seed, size_t first, size_t last) const;
    };

    /// Generate `count` rows with the default model.
    SampleTable generate(size_t count = DEFAULT_SAMPLE_COUNT, int64_t seed = DEFAULT_SEED);

} // namespace netsynth
