// bench/bench_ordinal_ops.cpp - Benchmark for CNF comparison and arithmetic.

#include <cstdint>
#include <random>
#include <vector>

#include <benchmark/benchmark.h>

#include <e0/e0lib.hpp>

namespace {

    enum class Operation : std::uint64_t {
        Compare,
        Add,
        Multiply,
        Power,
    };

    constexpr std::uint64_t seed_offset(Operation op) noexcept {
        return 0xa5a5a5a5a5a5a5a5ull + (static_cast<std::uint64_t>(op) << 4);
    }

    std::vector<e0::core::cnf_ordinal> make_operands(std::mt19937_64 &rng, std::size_t count) {
        std::vector<e0::core::cnf_ordinal> values;
        values.reserve(count);
        for (std::size_t index = 0; index < count; ++index) {
            values.push_back(e0::util::random_cnf(rng, 1, 3, 2));
        }
        return values;
    }

    void bench_ordinal_operation(benchmark::State &state, Operation op, std::uint64_t seed) {
        std::mt19937_64 rng(seed + static_cast<std::uint64_t>(state.thread_index()));
        const auto operands = make_operands(rng, 64);
        std::size_t cursor = 0;
        for (auto _ : state) {
            const auto &lhs = operands[cursor % operands.size()];
            const auto &rhs = operands[(cursor * 7 + 3) % operands.size()];
            ++cursor;
            e0::core::operation_budget budget(e0::core::operation_budget::DEFAULT_LIMIT * 100);
            switch (op) {
            case Operation::Compare: {
                auto ordering = e0::core::compare(lhs, rhs, budget);
                benchmark::DoNotOptimize(ordering);
                break;
            }
            case Operation::Add: {
                auto sum = e0::core::add(lhs, rhs, budget);
                benchmark::DoNotOptimize(sum);
                break;
            }
            case Operation::Multiply: {
                auto product = e0::core::multiply(lhs, rhs, budget);
                benchmark::DoNotOptimize(product);
                break;
            }
            case Operation::Power: {
                const e0::core::cnf_ordinal small(cursor % 5);
                auto result = e0::core::power(lhs, small, budget);
                benchmark::DoNotOptimize(result);
                break;
            }
            }
        }
    }

    static void BM_NaturalPower(benchmark::State &state) {
        const e0::core::natural base(3U);
        const auto exponent = static_cast<std::uint64_t>(state.range(0));
        for (auto _ : state) {
            auto value = e0::core::natural::pow(base, exponent);
            benchmark::DoNotOptimize(value);
        }
    }

    static void BM_CalculateTower(benchmark::State &state) {
        for (auto _ : state) {
            auto value = e0::io::calculate("w^^12+w^^11*3+(w+1)^(w+2)");
            benchmark::DoNotOptimize(value);
        }
    }

    static void BM_Simplify(benchmark::State &state) {
        const auto value = e0::io::calculate("w^(w^(w*3+2)*7+w^5)*12+w^(w+1)+12345");
        const auto limit = static_cast<std::size_t>(state.range(0));
        for (auto _ : state) {
            e0::core::operation_budget budget;
            auto result = e0::approx::simplify(value, limit, budget);
            benchmark::DoNotOptimize(result);
        }
    }

} // namespace

BENCHMARK_CAPTURE(bench_ordinal_operation, compare, Operation::Compare, seed_offset(Operation::Compare));
BENCHMARK_CAPTURE(bench_ordinal_operation, add, Operation::Add, seed_offset(Operation::Add));
BENCHMARK_CAPTURE(bench_ordinal_operation, multiply, Operation::Multiply, seed_offset(Operation::Multiply));
BENCHMARK_CAPTURE(bench_ordinal_operation, power, Operation::Power, seed_offset(Operation::Power));
BENCHMARK(BM_NaturalPower)->Arg(1000)->Arg(10000)->Arg(60000);
BENCHMARK(BM_CalculateTower);
BENCHMARK(BM_Simplify)->Arg(8)->Arg(20)->Arg(60);

BENCHMARK_MAIN();
