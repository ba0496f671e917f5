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
 * @file netsynth.h
 * @brief NetSynth - synthetic network performance data - Main Header
 * 
 * A C++20 header-only library that manufactures reproducible tables of
 * correlated network metrics (RTT, TTFB, packet loss, throughput) from a
 * fixed causal model, for testing multi-metric server-selection heuristics.
 * 
 * This header includes all NetSynth components:
 * - ModelParameters: tunable model constants
 * - RandomStream: seeded stream with pinned variate algorithms
 * - SampleGenerator: the causal model
 * - SampleTable: immutable result table
 * - SampleCsvWriter / SampleCsvReader: CSV persistence (optionally LZ4 framed)
 * - summarize / validate: analysis helpers
 */

// Core definitions first
#include "definitions.h"
#include "errors.h"

// Component declarations
#include "compression.h"
#include "csv_reader.h"
#include "csv_writer.h"
#include "generator.h"
#include "model_params.h"
#include "random_stream.h"
#include "sample.h"
#include "sample_table.h"
#include "summary.h"
#include "validation.h"

// Include implementations
#include "compression.hpp"
#include "csv_reader.hpp"
#include "csv_writer.hpp"
#include "generator.hpp"
#include "model_params.hpp"
#include "random_stream.hpp"
#include "sample_table.hpp"
#include "summary.hpp"
#include "validation.hpp"
