// bench/bench_mapping.cpp - Benchmarks for the real embedding and its inverse search.

#include <random>

#include <benchmark/benchmark.h>

#include <e0/e0lib.hpp>

namespace {

static void BM_EmbeddingCold(benchmark::State& state) {
    const auto value = e0::io::calculate("w^(w^3*2+w)*5+w^w*7+w^4+11");
    e0::mapping::embedding map;
    for (auto _ : state) {
        map.clear_cache();
        e0::core::operation_budget budget;
        double image = map.f(value, budget);
        benchmark::DoNotOptimize(image);
    }
}
BENCHMARK(BM_EmbeddingCold);

static void BM_EmbeddingMemoized(benchmark::State& state) {
    const auto value = e0::io::calculate("w^(w^3*2+w)*5+w^w*7+w^4+11");
    e0::mapping::embedding map;
    for (auto _ : state) {
        e0::core::operation_budget budget;
        double image = map.f(value, budget);
        benchmark::DoNotOptimize(image);
    }
}
BENCHMARK(BM_EmbeddingMemoized);

static void BM_InverseSearch(benchmark::State& state) {
    e0::mapping::embedding map;
    std::mt19937_64 rng(0xfeedbeef);
    std::uniform_real_distribution<double> dist(0.0, static_cast<double>(state.range(0)));
    for (auto _ : state) {
        e0::core::operation_budget budget;
        auto shape = map.f_inverse(dist(rng), budget);
        benchmark::DoNotOptimize(shape);
    }
}
BENCHMARK(BM_InverseSearch)->Arg(13)->Arg(40)->Arg(49);

} // namespace

BENCHMARK_MAIN();
