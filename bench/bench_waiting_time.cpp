/**
 * @file  bench/bench_waiting_time.cpp
 * @brief Google Benchmark suite for waiting-time sampling and whole runs.
 *
 * Module:  bench/
 *
 * Benchmarks
 * ----------
 *   BM_Wait_Constant        closed form E / r
 *   BM_Wait_Piecewise       exact step inversion, varying segment count
 *   BM_Wait_WeibullClosed   closed-form Weibull
 *   BM_Wait_Numeric         quadrature + root search for a time function
 *   BM_Engine_RunOnce       one unconstrained simulation
 *
 * Build (CMake):
 *   cmake -DDIVSIM_BENCH=ON ..
 *   cmake --build build --target bench_waiting_time
 *   ./build/bench_waiting_time --benchmark_format=json
 */

#include "benchmark/benchmark.h"

#include "divsim/engine.hpp"
#include "divsim/waiting_time.hpp"

#include <cmath>
#include <random>
#include <vector>

using namespace divsim;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Step rate with `n` equal segments on [0, t_max].
static Rate make_steps(std::size_t n, double t_max) {
    std::vector<double> starts(n);
    std::vector<double> levels(n);
    for (std::size_t i = 0; i < n; ++i) {
        starts[i] = t_max * static_cast<double>(i) / static_cast<double>(n);
        levels[i] = 0.05 + 0.01 * static_cast<double>(i % 7);
    }
    return Rate::piecewise(std::move(starts), std::move(levels));
}

// ── Single waits ───────────────────────────────────────────────────────────────

static void BM_Wait_Constant(benchmark::State& state) {
    WaitingTimeSampler sampler;
    const EventClock clock{Rate::constant(0.3), std::nullopt};
    std::mt19937_64 rng(1);
    for (auto _ : state) {
        benchmark::DoNotOptimize(sampler.sample(clock, 0.0, 0.0, 100.0, rng));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Wait_Constant);

static void BM_Wait_Piecewise(benchmark::State& state) {
    WaitingTimeSampler sampler;
    const EventClock clock{make_steps(static_cast<std::size_t>(state.range(0)), 100.0),
                           std::nullopt};
    std::mt19937_64 rng(2);
    for (auto _ : state) {
        benchmark::DoNotOptimize(sampler.sample(clock, 10.0, 0.0, 100.0, rng));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Wait_Piecewise)->RangeMultiplier(4)->Range(2, 512);

static void BM_Wait_WeibullClosed(benchmark::State& state) {
    WaitingTimeSampler sampler;
    const EventClock clock{Rate::constant(5.0), Rate::constant(2.0)};
    std::mt19937_64 rng(3);
    for (auto _ : state) {
        benchmark::DoNotOptimize(sampler.sample(clock, 1.0, 2.0, 100.0, rng));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Wait_WeibullClosed);

static void BM_Wait_Numeric(benchmark::State& state) {
    WaitingTimeSampler sampler;
    const EventClock clock{
        Rate::function([](double t) { return 0.1 + 0.05 * std::sin(t); }), std::nullopt};
    std::mt19937_64 rng(4);
    for (auto _ : state) {
        benchmark::DoNotOptimize(sampler.sample(clock, 0.0, 0.0, 100.0, rng));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Wait_Numeric);

// ── Whole run ──────────────────────────────────────────────────────────────────

static void BM_Engine_RunOnce(benchmark::State& state) {
    SimulationConfig cfg;
    cfg.t_max = static_cast<double>(state.range(0));
    cfg.speciation.spec = ConstantRate{0.3};
    cfg.extinction.spec = ConstantRate{0.1};
    BirthDeathEngine engine(cfg);
    std::mt19937_64 rng(5);

    std::size_t lineages = 0;
    for (auto _ : state) {
        const auto rec = engine.run_once(rng);
        if (rec) lineages += rec->total_count();
        benchmark::DoNotOptimize(rec);
    }
    state.counters["lineages_per_run"] = benchmark::Counter(
        static_cast<double>(lineages) / static_cast<double>(state.iterations()));
}
BENCHMARK(BM_Engine_RunOnce)->Arg(5)->Arg(10)->Arg(15);

BENCHMARK_MAIN();
