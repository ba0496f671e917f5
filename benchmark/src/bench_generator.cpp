/*
 * Copyright (c) 2026 NetSynth contributors
 * 
 * This file is part of the NetSynth library.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file bench_generator.cpp
 * @brief Micro-benchmarks for sample generation, CSV persistence and summaries.
 *
 * Generation is reported in rows/s; the serial variant is the baseline for
 * the thread-scaling runs of generateParallel().
 */

#include <benchmark/benchmark.h>
#include <netsynth/netsynth.h>
#include <cstdint>
#include <filesystem>
#include <sstream>
#include <string>

using namespace netsynth;
namespace fs = std::filesystem;

// ============================================================================
// Random stream
// ============================================================================

static void BM_RandomStream_Normal(benchmark::State& state) {
    RandomStream rng(0x1234);
    for (auto _ : state) {
        double z = rng.normal();
        benchmark::DoNotOptimize(z);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RandomStream_Normal);

static void BM_Generator_Row(benchmark::State& state) {
    SampleGenerator gen;
    uint64_t row = 0;
    for (auto _ : state) {
        Sample s = gen.generateRow(DEFAULT_SEED, row++);
        benchmark::DoNotOptimize(s);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Generator_Row);

// ============================================================================
// Table generation
// ============================================================================

static void BM_Generator_Serial(benchmark::State& state) {
    const size_t N = static_cast<size_t>(state.range(0));
    SampleGenerator gen;
    for (auto _ : state) {
        SampleTable table = gen.generate(N, DEFAULT_SEED);
        benchmark::DoNotOptimize(table);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(N));
}
BENCHMARK(BM_Generator_Serial)->Arg(500)->Arg(100000)->Arg(1000000);

static void BM_Generator_Parallel(benchmark::State& state) {
    const size_t N = 1000000;
    const size_t threads = static_cast<size_t>(state.range(0));
    SampleGenerator gen;
    for (auto _ : state) {
        SampleTable table = gen.generateParallel(N, DEFAULT_SEED, threads);
        benchmark::DoNotOptimize(table);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(N));
}
BENCHMARK(BM_Generator_Parallel)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->UseRealTime();

// ============================================================================
// Persistence
// ============================================================================

static void BM_CsvWriter_Memory(benchmark::State& state) {
    const size_t N = static_cast<size_t>(state.range(0));
    SampleTable table = generate(N, DEFAULT_SEED);
    size_t bytes = 0;
    for (auto _ : state) {
        std::ostringstream os;
        SampleCsvWriter writer;
        if (!writer.open(os)) {
            state.SkipWithError(writer.getErrorMsg().c_str());
            break;
        }
        writer.write(table);
        writer.close();
        bytes = os.str().size();
        benchmark::DoNotOptimize(bytes);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(N));
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(bytes));
}
BENCHMARK(BM_CsvWriter_Memory)->Arg(10000)->Arg(100000);

static void BM_CsvWriter_File(benchmark::State& state) {
    const size_t N = 100000;
    const bool compressed = state.range(0) != 0;
    const fs::path dir = fs::temp_directory_path() / "netsynth_bench";
    fs::create_directories(dir);
    const fs::path path = dir / (compressed ? "bench.csv.lz4" : "bench.csv");
    SampleTable table = generate(N, DEFAULT_SEED);

    for (auto _ : state) {
        writeTable(table, path, true);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(N));
    state.counters["file_bytes"] = static_cast<double>(fs::file_size(path));
    fs::remove_all(dir);
}
BENCHMARK(BM_CsvWriter_File)->Arg(0)->Arg(1);

static void BM_CsvReader_Memory(benchmark::State& state) {
    const size_t N = static_cast<size_t>(state.range(0));
    std::ostringstream os;
    {
        SampleCsvWriter writer;
        if (!writer.open(os)) {
            state.SkipWithError(writer.getErrorMsg().c_str());
            return;
        }
        writer.write(generate(N, DEFAULT_SEED));
        writer.close();
    }
    const std::string text = os.str();

    for (auto _ : state) {
        std::istringstream is(text);
        SampleCsvReader reader;
        if (!reader.open(is)) {
            state.SkipWithError(reader.getErrorMsg().c_str());
            break;
        }
        SampleTable table = reader.readAll();
        benchmark::DoNotOptimize(table);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(N));
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_CsvReader_Memory)->Arg(10000)->Arg(100000);

// ============================================================================
// Analysis
// ============================================================================

static void BM_Summarize(benchmark::State& state) {
    const size_t N = static_cast<size_t>(state.range(0));
    SampleTable table = generate(N, DEFAULT_SEED);
    for (auto _ : state) {
        TableSummary summary = summarize(table);
        benchmark::DoNotOptimize(summary);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(N));
}
BENCHMARK(BM_Summarize)->Arg(500)->Arg(100000);

BENCHMARK_MAIN();
