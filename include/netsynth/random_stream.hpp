/*
 * Copyright (c) 2026 NetSynth contributors
 * 
 * This file is part of the NetSynth library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

#pragma once

#include "random_stream.h"
#include <cmath>
#include <numbers>

namespace netsynth {

    constexpr uint64_t RandomStream::mix(uint64_t h) {
        h ^= h >> 33;
        h *= 0xff51afd7ed558ccdULL;
        h ^= h >> 33;
        h *= 0xc4ceb9fe1a85ec53ULL;
        h ^= h >> 33;
        return h;
    }

    constexpr uint64_t RandomStream::deriveSeed(int64_t seed, uint64_t rowIndex) {
        const uint64_t rowHash = mix(rowIndex * 0x9E3779B97F4A7C15ULL + 0x632BE59BD9B4E019ULL);
        return mix(static_cast<uint64_t>(seed) ^ rowHash);
    }

    inline RandomStream RandomStream::forRow(int64_t seed, uint64_t rowIndex) {
        return RandomStream(deriveSeed(seed, rowIndex));
    }

    inline uint64_t RandomStream::nextU64() {
        ++draws_;
        uint64_t z = (state_ += 0x9E3779B97F4A7C15ULL);
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }

    inline double RandomStream::uniform01() {
        // 53 significant bits, offset by half a step so neither 0 nor 1 is reachable
        return (static_cast<double>(nextU64() >> 11) + 0.5) / static_cast<double>(1ULL << 53);
    }

    inline double RandomStream::uniform(double lo, double hi) {
        return lo + (hi - lo) * uniform01();
    }

    inline bool RandomStream::bernoulli(double p) {
        return uniform01() < p;
    }

    inline double RandomStream::normal() {
        const double u1 = uniform01();
        const double u2 = uniform01();
        return std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * std::numbers::pi * u2);
    }

    inline double RandomStream::normal(double mean, double stddev) {
        return mean + stddev * normal();
    }

    inline double RandomStream::logNormal(double mu, double sigma) {
        return std::exp(normal(mu, sigma));
    }

} // namespace netsynth
