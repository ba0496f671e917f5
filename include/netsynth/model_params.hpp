/*
 * Copyright (c) 2026 NetSynth contributors
 * 
 * This file is part of the NetSynth library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

#pragma once

#include "model_params.h"
#include "errors.h"
#include <cmath>
#include <iomanip>
#include <ostream>

namespace netsynth {

    inline double LogNormalParams::mu() const {
        return std::log(median);
    }

    inline double LogNormalParams::mean() const {
        return median * std::exp(0.5 * sigma * sigma);
    }

    namespace detail {

        inline void requireFinite(double value, const char* name) {
            if (!std::isfinite(value)) {
                throw InvalidArgumentError(std::string("Model parameter '") + name + "' must be finite");
            }
        }

        inline void requirePositive(double value, const char* name) {
            requireFinite(value, name);
            if (value <= 0.0) {
                throw InvalidArgumentError(std::string("Model parameter '") + name +
                                           "' must be positive, got " + std::to_string(value));
            }
        }

        inline void requireNonNegative(double value, const char* name) {
            requireFinite(value, name);
            if (value < 0.0) {
                throw InvalidArgumentError(std::string("Model parameter '") + name +
                                           "' must be non-negative, got " + std::to_string(value));
            }
        }

    } // namespace detail

    inline void ModelParameters::validate() const {
        detail::requirePositive(rtt.median, "rtt.median");
        detail::requireNonNegative(rtt.sigma, "rtt.sigma");
        detail::requirePositive(server_delay.median, "server_delay.median");
        detail::requireNonNegative(server_delay.sigma, "server_delay.sigma");

        detail::requireNonNegative(clean_probability, "clean_probability");
        if (clean_probability > 1.0) {
            throw InvalidArgumentError("Model parameter 'clean_probability' must be within [0, 1], got " +
                                       std::to_string(clean_probability));
        }

        detail::requirePositive(loss_min, "loss_min");
        detail::requirePositive(loss_max, "loss_max");
        if (loss_min > loss_max) {
            throw InvalidArgumentError("Model parameter 'loss_min' exceeds 'loss_max'");
        }
        if (loss_max > 1.0) {
            throw InvalidArgumentError("Model parameter 'loss_max' must not exceed 1, got " +
                                       std::to_string(loss_max));
        }

        detail::requireNonNegative(loss_weight, "loss_weight");
        detail::requirePositive(throughput_scale, "throughput_scale");

        detail::requirePositive(noise_min, "noise_min");
        detail::requirePositive(noise_max, "noise_max");
        if (noise_min > noise_max) {
            throw InvalidArgumentError("Model parameter 'noise_min' exceeds 'noise_max'");
        }

        detail::requirePositive(throughput_floor, "throughput_floor");
    }

    inline std::ostream& operator<<(std::ostream& os, const ModelParameters& p) {
        const auto flags = os.flags();
        const auto prec  = os.precision();
        os << std::setprecision(6)
           << "  rtt:               LogNormal(median=" << p.rtt.median << " ms, sigma=" << p.rtt.sigma << ")\n"
           << "  server_delay:      LogNormal(median=" << p.server_delay.median << " ms, sigma=" << p.server_delay.sigma << ")\n"
           << "  clean_probability: " << p.clean_probability << "\n"
           << "  loss range:        [" << p.loss_min << ", " << p.loss_max << "]\n"
           << "  loss_weight:       " << p.loss_weight << "\n"
           << "  throughput_scale:  " << p.throughput_scale << "\n"
           << "  noise band:        [" << p.noise_min << ", " << p.noise_max << "]\n"
           << "  throughput_floor:  " << p.throughput_floor << " Mbps\n";
        os.flags(flags);
        os.precision(prec);
        return os;
    }

} // namespace netsynth
