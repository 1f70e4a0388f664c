/**
 * Canopy Feature Utilities Implementation
 */

#include "canopy/features.hpp"
#include "canopy/purity.hpp"
#include <algorithm>
#include <numeric>
#include <string>

namespace canopy {

// ============================================================================
// Sampling
// ============================================================================

BootstrapSample bootstrap(const Matrix& matrix, const Vector& target, Rng& rng,
                          bool record_oob) {
    check_same_length(matrix, target);

    const Index n_rows = static_cast<Index>(matrix.rows());
    BootstrapSample sample;
    sample.matrix.resize(matrix.rows(), matrix.cols());
    sample.target.resize(n_rows);

    if (n_rows == 0) {
        return sample;
    }

    std::uniform_int_distribution<Index> dist(0, n_rows - 1);
    std::vector<uint8_t> drawn(record_oob ? n_rows : 0, 0);

    for (Index i = 0; i < n_rows; ++i) {
        Index src = dist(rng);
        sample.matrix.row(i) = matrix.row(src);
        sample.target[i] = target[src];
        if (record_oob) drawn[src] = 1;
    }

    if (record_oob) {
        for (Index i = 0; i < n_rows; ++i) {
            if (!drawn[i]) sample.oob_indices.push_back(i);
        }
    }

    return sample;
}

std::pair<Matrix, Vector> shuffle(const Matrix& matrix, const Vector& target, Rng& rng) {
    check_same_length(matrix, target);

    std::vector<Index> order(target.size());
    std::iota(order.begin(), order.end(), Index{0});
    std::shuffle(order.begin(), order.end(), rng);

    Matrix out_matrix(matrix.rows(), matrix.cols());
    Vector out_target(target.size());
    for (Index i = 0; i < order.size(); ++i) {
        out_matrix.row(i) = matrix.row(order[i]);
        out_target[i] = target[order[i]];
    }
    return {std::move(out_matrix), std::move(out_target)};
}

std::vector<Index> sample_without_replacement(Index n, Index count, Rng& rng) {
    std::vector<Index> pool(n);
    std::iota(pool.begin(), pool.end(), Index{0});
    count = std::min(count, n);

    // Partial Fisher-Yates
    for (Index i = 0; i < count; ++i) {
        std::uniform_int_distribution<Index> dist(i, n - 1);
        std::swap(pool[i], pool[dist(rng)]);
    }
    pool.resize(count);
    return pool;
}

// ============================================================================
// Splitting
// ============================================================================

std::pair<DataSplit, DataSplit> train_test_split(const Matrix& matrix, const Vector& target,
                                                 Double ratio) {
    if (!(ratio > 0.0 && ratio < 1.0)) {
        throw Error(ErrorKind::InvalidConfig, "ratio must be between 0 and 1");
    }
    check_same_length(matrix, target);

    const Double cut_point = static_cast<Double>(target.size() == 0 ? 0 : target.size() - 1) * ratio;
    Filter filter(target.size());
    for (Index i = 0; i < target.size(); ++i) {
        filter[i] = static_cast<Double>(i) <= cut_point;
    }

    auto [train_m, test_m] = split_rows(matrix, filter);
    auto [train_t, test_t] = split_values(target, filter);
    return {DataSplit{std::move(train_m), std::move(train_t)},
            DataSplit{std::move(test_m), std::move(test_t)}};
}

std::pair<Matrix, Matrix> split_rows(const Matrix& matrix, const Filter& filter) {
    if (static_cast<size_t>(matrix.rows()) != filter.size()) {
        throw Error(ErrorKind::ShapeMismatch, messages::kLengthMismatch);
    }

    const Index n_yes = static_cast<Index>(std::count(filter.begin(), filter.end(), true));
    Matrix yes(static_cast<Eigen::Index>(n_yes), matrix.cols());
    Matrix no(matrix.rows() - static_cast<Eigen::Index>(n_yes), matrix.cols());

    Eigen::Index yi = 0, ni = 0;
    for (Index r = 0; r < filter.size(); ++r) {
        if (filter[r]) yes.row(yi++) = matrix.row(r);
        else no.row(ni++) = matrix.row(r);
    }
    return {std::move(yes), std::move(no)};
}

std::pair<Vector, Vector> split_values(const Vector& values, const Filter& filter) {
    if (values.size() != filter.size()) {
        throw Error(ErrorKind::ShapeMismatch, messages::kLengthMismatch);
    }

    Vector yes, no;
    yes.reserve(values.size());
    no.reserve(values.size());
    for (Index i = 0; i < values.size(); ++i) {
        if (filter[i]) yes.push_back(values[i]);
        else no.push_back(values[i]);
    }
    return {std::move(yes), std::move(no)};
}

Filter partition_filter(const Matrix& matrix, ColumnIndex column, Double split) {
    if (column >= static_cast<ColumnIndex>(matrix.cols())) {
        throw Error(ErrorKind::ShapeMismatch, "column " + std::to_string(column) + " out of range");
    }

    Filter filter(static_cast<size_t>(matrix.rows()));
    for (Eigen::Index r = 0; r < matrix.rows(); ++r) {
        filter[r] = matrix(r, column) > split;
    }
    return filter;
}

Vector column_values(const Matrix& matrix, ColumnIndex column) {
    Vector values(static_cast<size_t>(matrix.rows()));
    for (Eigen::Index r = 0; r < matrix.rows(); ++r) {
        values[r] = matrix(r, column);
    }
    return values;
}

// ============================================================================
// Class Proportions
// ============================================================================

std::vector<ClassProportion> class_proportions(const Vector& target) {
    std::vector<ClassProportion> result;
    if (target.empty()) return result;

    const Double total = static_cast<Double>(target.size());
    for (const auto& [label, count] : purity::label_counts(target)) {
        result.push_back({label, count, static_cast<Double>(count) / total});
    }
    return result;
}

// ============================================================================
// K-Fold Cross Validation
// ============================================================================

KFold::KFold(Index size, Index k) : size_(size), k_(k) {
    if (k == 0 || k > size) {
        throw Error(ErrorKind::InvalidConfig, "k must be between 1 and the number of rows");
    }
}

Filter KFold::train_filter(Index fold) const {
    const Index fold_start = fold * fold_size();
    const Index fold_end = fold_start + fold_size();

    Filter filter(size_, true);
    for (Index i = fold_start; i < fold_end && i < size_; ++i) {
        filter[i] = false;
    }
    return filter;
}

} // namespace canopy
