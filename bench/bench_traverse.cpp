/**
 * @file  bench/bench_traverse.cpp
 * @brief Google Benchmark suite for AdjustedArray traversal.
 *
 * Benchmarks
 * ----------
 *   BM_Traverse_Unadjusted     — window emission cost alone
 *   BM_Traverse_DailySplits    — one multiply per row, full-height regions
 *   BM_Traverse_Labels         — label buffer with an overwrite per row
 *   BM_Construct_Masked        — mask application + schedule validation
 *
 * Build (CMake):
 *   cmake -DADJARR_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_traverse
 *   ./build/bench_traverse --benchmark_format=json
 *
 * Throughput units: items/second (windows emitted).
 */

#include "benchmark/benchmark.h"

#include "adjarr/adjusted_array.hpp"

#include <string>

using namespace adjarr;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static constexpr Index COLS   = 64;
static constexpr Index WINDOW = 20;

static Float64Matrix make_prices(Index rows) {
    return Float64Matrix::Constant(rows, COLS, 100.0);
}

/// One split per row on a rotating column, reaching back to row 0.
static AdjustmentSchedule make_splits(Index rows) {
    AdjustmentSchedule adj;
    for (Index r = 1; r < rows; ++r) {
        const Index col = r % COLS;
        adj[r].push_back(Float64Multiply(0, r, col, col, 0.5));
    }
    return adj;
}

// ── Traversal benchmarks ───────────────────────────────────────────────────────

static void BM_Traverse_Unadjusted(benchmark::State& state) {
    const Index rows = state.range(0);
    const auto array = AdjustedArray::from_float64(make_prices(rows), NOMASK, {});
    for (auto _ : state) {
        double acc = 0.0;
        for (const Window& window : array.traverse(WINDOW)) {
            acc += window.float64()(0, 0);
        }
        benchmark::DoNotOptimize(acc);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(rows - WINDOW + 1));
}
BENCHMARK(BM_Traverse_Unadjusted)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

static void BM_Traverse_DailySplits(benchmark::State& state) {
    const Index rows = state.range(0);
    const auto array = AdjustedArray::from_float64(make_prices(rows), NOMASK, make_splits(rows));
    for (auto _ : state) {
        double acc = 0.0;
        for (const Window& window : array.traverse(WINDOW)) {
            acc += window.float64().sum();
        }
        benchmark::DoNotOptimize(acc);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(rows - WINDOW + 1));
}
BENCHMARK(BM_Traverse_DailySplits)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

static void BM_Traverse_Labels(benchmark::State& state) {
    const Index rows = state.range(0);
    StringRows tickers(static_cast<std::size_t>(rows));
    for (auto& row : tickers) {
        for (Index c = 0; c < COLS; ++c) {
            row.push_back("T" + std::to_string(c));
        }
    }
    AdjustmentSchedule renames;
    for (Index r = 1; r < rows; ++r) {
        const Index col = r % COLS;
        renames[r].push_back(ObjectOverwrite(0, r, col, col, "R" + std::to_string(r)));
    }
    const auto array = AdjustedArray::from_strings(tickers, NOMASK, renames, "");

    for (auto _ : state) {
        Index missing = 0;
        for (const Window& window : array.traverse(WINDOW)) {
            missing += window.labels().is_missing().count();
        }
        benchmark::DoNotOptimize(missing);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(rows - WINDOW + 1));
}
BENCHMARK(BM_Traverse_Labels)->RangeMultiplier(4)->Range(256, 4096)->Unit(benchmark::kMicrosecond);

// ── Construction benchmark ─────────────────────────────────────────────────────

static void BM_Construct_Masked(benchmark::State& state) {
    const Index rows = state.range(0);
    const Float64Matrix prices = make_prices(rows);
    Mask mask = Mask::Constant(rows, COLS, true);
    mask.col(0).setConstant(false);
    const AdjustmentSchedule splits = make_splits(rows);

    for (auto _ : state) {
        auto array = AdjustedArray::from_float64(prices, mask, splits);
        benchmark::DoNotOptimize(array.shape());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(rows));
}
BENCHMARK(BM_Construct_Masked)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
