/*
 * Copyright (c) 2026 NetSynth contributors
 * 
 * This file is part of the NetSynth library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

#pragma once

#include "definitions.h"

namespace netsynth {

    /**
     * @brief One synthetic measurement.
     *
     * server_delay is the latent driver of ttfb; it is kept on the row so
     * tests and debugging can check ttfb == rtt + server_delay.
     */
    struct Sample {
        double rtt          = 0.0;      // ms
        double server_delay = 0.0;      // ms
        double ttfb         = 0.0;      // ms
        double loss         = 0.0;      // fraction
        double throughput   = 0.0;      // Mbps

        double get(Column column) const {
            switch (column) {
                case Column::RTT:          return rtt;
                case Column::TTFB:         return ttfb;
                case Column::SERVER_DELAY: return server_delay;
                case Column::LOSS:         return loss;
                case Column::THROUGHPUT:   return throughput;
            }
            throw std::out_of_range("Invalid column");
        }

        bool isCongested() const { return loss > 0.0; }

        bool operator==(const Sample& other) const = default;
    };

} // namespace netsynth
