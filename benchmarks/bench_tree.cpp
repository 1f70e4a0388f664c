/**
 * Canopy Tree Benchmarks
 */

#include <benchmark/benchmark.h>
#include "canopy/tree.hpp"
#include "canopy/purity.hpp"
#include <random>

using namespace canopy;

static void make_data(Index n_samples, Index n_features, Matrix& X, Vector& y) {
    std::mt19937 rng(123);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);

    X.resize(static_cast<Eigen::Index>(n_samples), static_cast<Eigen::Index>(n_features));
    y.resize(n_samples);
    for (Index i = 0; i < n_samples; ++i) {
        for (Index f = 0; f < n_features; ++f) {
            X(i, f) = dist(rng);
        }
        y[i] = X(i, 0) + 0.5 * X(i, 1) > 0.0 ? 1.0 : 0.0;
    }
}

// Benchmark exhaustive split search during training
static void BM_TreeTrainGini(benchmark::State& state) {
    Index n_samples = state.range(0);
    Matrix X;
    Vector y;
    make_data(n_samples, 10, X, y);

    TreeConfig config = TreeConfig::classification();
    config.max_depth = 8;

    for (auto _ : state) {
        Tree tree(config, purity::gini);
        tree.train(X, y);
        benchmark::DoNotOptimize(tree.n_nodes());
    }

    state.SetItemsProcessed(state.iterations() * n_samples);
}
BENCHMARK(BM_TreeTrainGini)->Range(64, 2048);

// Benchmark single tree prediction
static void BM_TreePredict(benchmark::State& state) {
    Index n_samples = state.range(0);
    Matrix X;
    Vector y;
    make_data(n_samples, 10, X, y);

    Tree tree(TreeConfig::classification(), purity::gini);
    tree.train(X, y);

    for (auto _ : state) {
        Vector predictions = tree.predict(X);
        benchmark::DoNotOptimize(predictions);
    }

    state.SetItemsProcessed(state.iterations() * n_samples);
}
BENCHMARK(BM_TreePredict)->Range(100, 10000);

BENCHMARK_MAIN();
