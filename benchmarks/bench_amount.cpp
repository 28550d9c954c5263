/**
 * @file bench_amount.cpp
 * @brief Micro-benchmarks for amount parsing, formatting and arithmetic
 */

#include <benchmark/benchmark.h>

#include <cpe/common/amount.hpp>

#include <string>
#include <vector>

using namespace cpe;

// ============================================================================
// Parsing
// ============================================================================

static void BM_AmountParse(benchmark::State& state) {
    const std::vector<std::string> inputs{
        "1", "1.5", "2.0002", "12345.6789", "0.0001", " 42.42 ", "1000000", "3."
    };

    std::size_t i = 0;
    for (auto _ : state) {
        Amount a = Amount::parse(inputs[i++ % inputs.size()]);
        benchmark::DoNotOptimize(a);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_AmountParse);

static void BM_AmountParseRejected(benchmark::State& state) {
    for (auto _ : state) {
        try {
            Amount a = Amount::parse("1.00001");
            benchmark::DoNotOptimize(a);
        } catch (const InvalidInputError& e) {
            benchmark::DoNotOptimize(e.code());
        }
    }
}
BENCHMARK(BM_AmountParseRejected);

// ============================================================================
// Formatting
// ============================================================================

static void BM_AmountToString(benchmark::State& state) {
    Amount a = Amount::parse("12345.6789");

    for (auto _ : state) {
        std::string s = a.to_string();
        benchmark::DoNotOptimize(s.data());
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_AmountToString);

// ============================================================================
// Checked arithmetic
// ============================================================================

static void BM_AmountCheckedAdd(benchmark::State& state) {
    Amount step = Amount::from_ticks(1);

    for (auto _ : state) {
        Amount sum;
        for (int i = 0; i < 1000; ++i) {
            sum += step;
        }
        benchmark::DoNotOptimize(sum);
    }

    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(BM_AmountCheckedAdd);

BENCHMARK_MAIN();
