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
 * @file model_params.h
 * @brief Tunable constants of the causal network model.
 *
 * Every literal that shapes the generated data lives here so sensitivity
 * experiments can override it without touching the generation logic.
 * The defaults reproduce the reference CDN model:
 *
 *   rtt          ~ LogNormal(ln 30, 0.5)        [ms]
 *   server_delay ~ LogNormal(ln 20, 0.8)        [ms]
 *   ttfb         = rtt + server_delay           [ms]
 *   loss         = 0 with p = 0.85, else U(0.001, 0.02)
 *   throughput   = max(10000 / (rtt + ttfb + 5000 * loss) * U(0.9, 1.1), 0.01)   [Mbps]
 */

#include <iosfwd>
#include <string>

namespace netsynth {

    /**
     * @brief Log-normal distribution, parameterised by its median and log-space sigma.
     *
     * The underlying normal has mean mu() = ln(median) and standard deviation sigma.
     */
    struct LogNormalParams {
        double median = 1.0;
        double sigma  = 0.0;

        double mu() const;
        double mean() const;

        bool operator==(const LogNormalParams& other) const = default;
    };

    struct ModelParameters {
        LogNormalParams rtt            {30.0, 0.5};
        LogNormalParams server_delay   {20.0, 0.8};

        double clean_probability = 0.85;        // P(loss == 0)
        double loss_min          = 0.001;       // congested regime lower bound
        double loss_max          = 0.02;        // congested regime upper bound
        double loss_weight       = 5000.0;      // ms-equivalent cost of a unit loss fraction
        double throughput_scale  = 10000.0;     // numerator of the cost model
        double noise_min         = 0.9;         // multiplicative measurement noise band
        double noise_max         = 1.1;
        double throughput_floor  = 0.01;        // Mbps

        /// Throws InvalidArgumentError naming the first offending parameter.
        void validate() const;

        bool operator==(const ModelParameters& other) const = default;
    };

    std::ostream& operator<<(std::ostream& os, const ModelParameters& params);

} // namespace netsynth
