/**
 * Canopy Split Search Implementation
 */

#include "canopy/split.hpp"
#include "canopy/errors.hpp"
#include <algorithm>
#include <numeric>
#include <utility>

namespace canopy {

SplitFinder::SplitFinder(PurityFn purity) : purity_(std::move(purity)) {
    if (!purity_) {
        throw Error(ErrorKind::InvalidConfig, "purity function must be set");
    }
}

SplitResult SplitFinder::find_best_split(const Vector& values, const Vector& target) const {
    const size_t n = values.size();
    if (n == 0) {
        return {0.0, 0.0};
    }

    // Sort (value, target) pairs by value
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&values](size_t a, size_t b) {
        return values[a] < values[b];
    });

    Vector sorted_values(n);
    Vector sorted_target(n);
    for (size_t i = 0; i < n; ++i) {
        sorted_values[i] = values[order[i]];
        sorted_target[i] = target[order[i]];
    }

    if (sorted_values.front() == sorted_values.back()) {
        // Every row lands on the "no" side
        return {sorted_values.front() - 1.0, 0.0};
    }

    const Double n_total = static_cast<Double>(n);
    const Double purity_all = purity_(sorted_target);

    SplitResult best;
    Vector lhs;
    lhs.reserve(n);

    for (size_t i = 0; i + 1 < n; ++i) {
        lhs.push_back(sorted_target[i]);

        // Only split between distinct values
        if (sorted_values[i] == sorted_values[i + 1]) continue;

        Vector rhs(sorted_target.begin() + static_cast<std::ptrdiff_t>(i + 1), sorted_target.end());
        const Double w_left = static_cast<Double>(lhs.size()) / n_total;
        const Double w_right = static_cast<Double>(rhs.size()) / n_total;
        const Double gain = purity_all - w_left * purity_(lhs) - w_right * purity_(rhs);

        if (gain > best.gain) {
            best.gain = gain;
            best.split = 0.5 * (sorted_values[i] + sorted_values[i + 1]);
        }
    }

    return best;
}

std::vector<ColumnIndex> SplitFinder::candidate_columns(
    ColumnIndex n_columns,
    int32_t random_features,
    Rng& rng
) {
    if (random_features > 0 && static_cast<ColumnIndex>(random_features) < n_columns) {
        std::vector<ColumnIndex> sampled = sample_without_replacement(
            n_columns, static_cast<Index>(random_features), rng);
        std::sort(sampled.begin(), sampled.end());
        return sampled;
    }

    std::vector<ColumnIndex> all(n_columns);
    std::iota(all.begin(), all.end(), ColumnIndex{0});
    return all;
}

MatrixSplit SplitFinder::find_best_split(
    const Matrix& matrix,
    const Vector& target,
    int32_t random_features,
    Rng& rng
) const {
    check_same_length(matrix, target);

    MatrixSplit best;
    if (matrix.rows() == 0 || matrix.cols() == 0) {
        return best;
    }

    const auto columns = candidate_columns(static_cast<ColumnIndex>(matrix.cols()), random_features, rng);
    for (ColumnIndex column : columns) {
        SplitResult result = find_best_split(column_values(matrix, column), target);
        MatrixSplit candidate{column, result.split, result.gain};
        // Strictly greater, so an earlier column keeps a tied gain
        if (candidate > best) {
            best = candidate;
        }
    }

    return best;
}

} // namespace canopy
