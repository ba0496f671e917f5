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
 * @file random_stream.h
 * @brief Deterministic pseudo-random stream with pinned variate algorithms.
 *
 * std::normal_distribution and friends are implementation-defined, so the
 * same seed yields different tables on libstdc++, libc++ and MSVC.  This
 * stream fixes every step instead:
 *
 *   engine   SplitMix64 (64-bit state, one word per draw)
 *   uniform  (u64 >> 11) + 0.5, scaled by 2^-53  -> open interval (0, 1)
 *   normal   Box-Muller, cosine branch only      -> exactly 2 draws
 *
 * Streams are cheap to create; the generator derives one per row from
 * (seed, rowIndex) via deriveSeed().
 */

#include <cstdint>

namespace netsynth {

    class RandomStream {
    public:
        explicit RandomStream(uint64_t state) : state_(state) {}

        /// Independent stream for one row of a table generated with `seed`.
        static RandomStream forRow(int64_t seed, uint64_t rowIndex);

        /// Stateless 64-bit finalizer (Murmur3 fmix64).
        static constexpr uint64_t mix(uint64_t h);

        /// Sub-seed for row `rowIndex` of a table generated with `seed`.
        static constexpr uint64_t deriveSeed(int64_t seed, uint64_t rowIndex);

        uint64_t                nextU64();
        double                  uniform01();
        double                  uniform(double lo, double hi);
        bool                    bernoulli(double p);
        double                  normal();
        double                  normal(double mean, double stddev);
        double                  logNormal(double mu, double sigma);

        /// Number of 64-bit words consumed so far.
        uint64_t                drawCount() const               { return draws_; }

    private:
        uint64_t                state_;
        uint64_t                draws_ = 0;
    };

} // namespace netsynth
