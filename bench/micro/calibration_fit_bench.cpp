#include <benchmark/benchmark.h>

#include "calibet/calibration/isotonic.hpp"
#include "calibet/calibration/kfold.hpp"
#include "calibet/calibration/platt.hpp"
#include "calibet/calibration/sigmoid.hpp"

#include <random>
#include <vector>

using namespace calibet::calibration;

namespace {

struct Dataset {
    std::vector<double> p;
    std::vector<double> y;
};

Dataset make_dataset(std::size_t n, std::uint32_t seed = 12345) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> unif(0.0, 1.0);
    Dataset d;
    d.p.resize(n);
    d.y.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
        d.p[i] = unif(rng);
        d.y[i] = unif(rng) < sigmoid(6.0 * d.p[i] - 3.5) ? 1.0 : 0.0;
    }
    return d;
}

} // namespace

static void BM_PlattFit(benchmark::State& state) {
    const auto d = make_dataset(static_cast<std::size_t>(state.range(0)));
    std::uint32_t iterations = 0;
    for (auto _ : state) {
        auto fit = fit_platt(d.p, d.y);
        if (fit) iterations = fit->iterations;
        benchmark::DoNotOptimize(fit);
    }
    state.counters["newton_iters"] = static_cast<double>(iterations);
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

static void BM_IsotonicFit(benchmark::State& state) {
    const auto d = make_dataset(static_cast<std::size_t>(state.range(0)));
    std::size_t knots = 0;
    for (auto _ : state) {
        auto m = fit_isotonic(d.p, d.y);
        if (m) knots = m->size();
        benchmark::DoNotOptimize(m);
    }
    state.counters["knots"] = static_cast<double>(knots);
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

static void BM_IsotonicKFold(benchmark::State& state) {
    const auto d = make_dataset(static_cast<std::size_t>(state.range(0)));
    KFoldParams params;
    params.threads = static_cast<std::size_t>(state.range(1));
    for (auto _ : state) {
        auto e = fit_isotonic_kfold(d.p, d.y, params);
        benchmark::DoNotOptimize(e);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_PlattFit)->Arg(1000)->Arg(10000)->Arg(100000);
BENCHMARK(BM_IsotonicFit)->Arg(1000)->Arg(10000)->Arg(100000);
BENCHMARK(BM_IsotonicKFold)->Args({100000, 1})->Args({100000, 4})->UseRealTime();

BENCHMARK_MAIN();
