// SPDX-License-Identifier: MIT
/**
 * @file root_finders_benchmark.cc
 * @brief Cost of each scalar root finder on the reference problems
 *
 * Bracketing and secant methods solve x^3 - x - 1 = 0 on [1, 2];
 * fixed-point methods solve x = cos(x) from x0 = 0.5.
 * Iteration counts are exported as counters next to the timings.
 *
 * Run with: ./build/root_finders_benchmark
 */

#include "src/math/root_finders.hpp"
#include <benchmark/benchmark.h>
#include <cmath>

using namespace rootfind;

namespace {

double cubic(double x) { return x * x * x - x - 1.0; }
double cosine(double x) { return std::cos(x); }
double cosine_residual(double x) { return std::cos(x) - x; }

void report(benchmark::State& state, const RootFindingResult& result) {
    if (!result) {
        state.SkipWithError("root finder failed");
        return;
    }
    state.counters["iterations"] = static_cast<double>(result->iterations);
}

}  // namespace

static void BM_Bisection(benchmark::State& state) {
    const RootFindingConfig config{.tolerance = 1e-10};
    RootFindingResult result;
    for (auto _ : state) {
        result = bisection_find_root(cubic, 1.0, 2.0, config);
        benchmark::DoNotOptimize(result);
    }
    report(state, result);
}
BENCHMARK(BM_Bisection);

static void BM_RegulaFalsi(benchmark::State& state) {
    const RootFindingConfig config{.max_iter = 200, .tolerance = 1e-10};
    RootFindingResult result;
    for (auto _ : state) {
        result = regula_falsi_find_root(cubic, 1.0, 2.0, config);
        benchmark::DoNotOptimize(result);
    }
    report(state, result);
}
BENCHMARK(BM_RegulaFalsi);

static void BM_Secant(benchmark::State& state) {
    const RootFindingConfig config{.max_iter = 200, .tolerance = 1e-10};
    RootFindingResult result;
    for (auto _ : state) {
        result = secant_find_root(cubic, 1.0, 2.0, config);
        benchmark::DoNotOptimize(result);
    }
    report(state, result);
}
BENCHMARK(BM_Secant);

static void BM_Illinois(benchmark::State& state) {
    const RootFindingConfig config{.max_iter = 200, .tolerance = 1e-10};
    RootFindingResult result;
    for (auto _ : state) {
        result = illinois_find_root(cubic, 1.0, 2.0, config);
        benchmark::DoNotOptimize(result);
    }
    report(state, result);
}
BENCHMARK(BM_Illinois);

static void BM_FixedPoint(benchmark::State& state) {
    const RootFindingConfig config{.max_iter = 200, .tolerance = 1e-10};
    RootFindingResult result;
    for (auto _ : state) {
        result = fixed_point_solve(cosine, cosine_residual, 0.5, config);
        benchmark::DoNotOptimize(result);
    }
    report(state, result);
}
BENCHMARK(BM_FixedPoint);

static void BM_Steffensen(benchmark::State& state) {
    const RootFindingConfig config{.max_iter = 200, .tolerance = 1e-10};
    RootFindingResult result;
    for (auto _ : state) {
        result = steffensen_solve(cosine, cosine_residual, 0.5, config);
        benchmark::DoNotOptimize(result);
    }
    report(state, result);
}
BENCHMARK(BM_Steffensen);

BENCHMARK_MAIN();
