/**
 * Canopy Forest Benchmarks
 */

#include <benchmark/benchmark.h>
#include "canopy/forest.hpp"
#include "canopy/purity.hpp"
#include <random>

using namespace canopy;

static void make_regression(Index n_samples, Index n_features, Matrix& X, Vector& y) {
    std::mt19937 rng(321);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    std::normal_distribution<double> noise(0.0, 0.1);

    X.resize(static_cast<Eigen::Index>(n_samples), static_cast<Eigen::Index>(n_features));
    y.resize(n_samples);
    for (Index i = 0; i < n_samples; ++i) {
        for (Index f = 0; f < n_features; ++f) {
            X(i, f) = dist(rng);
        }
        y[i] = 3.0 * X(i, 0) - 2.0 * X(i, 1) + noise(rng);
    }
}

// Benchmark parallel forest training, one task per tree
static void BM_ForestTrain(benchmark::State& state) {
    Matrix X;
    Vector y;
    make_regression(1000, 16, X, y);

    ForestConfig config = ForestConfig::regression();
    config.tree_count = static_cast<uint32_t>(state.range(0));
    config.max_depth = 12;

    for (auto _ : state) {
        Forest forest(config, purity::stdev);
        forest.train(X, y);
        benchmark::DoNotOptimize(forest.n_trees());
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ForestTrain)->Arg(8)->Arg(32)->Unit(benchmark::kMillisecond);

// Benchmark parallel forest prediction, one task per row
static void BM_ForestPredict(benchmark::State& state) {
    Index n_samples = state.range(0);
    Matrix X;
    Vector y;
    make_regression(n_samples, 16, X, y);

    ForestConfig config = ForestConfig::regression();
    config.tree_count = 32;
    config.max_depth = 12;
    Forest forest(config, purity::stdev);
    forest.train(X, y);

    for (auto _ : state) {
        Vector predictions = forest.predict(X);
        benchmark::DoNotOptimize(predictions);
    }

    state.SetItemsProcessed(state.iterations() * n_samples);
}
BENCHMARK(BM_ForestPredict)->Range(256, 4096)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
