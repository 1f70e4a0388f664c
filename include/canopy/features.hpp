#pragma once

/**
 * Canopy Feature Utilities
 *
 * Row-level operations on a feature matrix and its target vector:
 * - Bootstrap resampling (with out-of-bag tracking)
 * - Shuffling, train/test splitting, k-fold filters
 * - Splitting rows by a boolean filter or a column split point
 *
 * Every function that takes a matrix and a target checks that the row
 * count matches the target length.
 */

#include "types.hpp"
#include "errors.hpp"
#include <random>
#include <tuple>
#include <utility>
#include <vector>

namespace canopy {

// Shared random engine type for sampling
using Rng = std::mt19937_64;

inline void check_same_length(const Matrix& matrix, const Vector& target) {
    if (static_cast<size_t>(matrix.rows()) != target.size()) {
        throw Error(ErrorKind::ShapeMismatch, messages::kLengthMismatch);
    }
}

// ============================================================================
// Sampling
// ============================================================================

struct BootstrapSample {
    Matrix matrix;
    Vector target;
    std::vector<Index> oob_indices;   // Rows never drawn, ascending
};

/**
 * Resample rows with replacement to the same row count.
 * Each output row is a full copy of one input row.
 */
BootstrapSample bootstrap(const Matrix& matrix, const Vector& target, Rng& rng,
                          bool record_oob = false);

/**
 * Shuffle rows, keeping each row paired with its target value
 */
std::pair<Matrix, Vector> shuffle(const Matrix& matrix, const Vector& target, Rng& rng);

/**
 * Sample count distinct values from [0, n) without replacement
 */
std::vector<Index> sample_without_replacement(Index n, Index count, Rng& rng);

// ============================================================================
// Splitting
// ============================================================================

struct DataSplit {
    Matrix matrix;
    Vector target;
};

/**
 * Ordered train/test split: rows with index <= (rows - 1) * ratio train.
 * @param ratio Train fraction, strictly between 0 and 1
 */
std::pair<DataSplit, DataSplit> train_test_split(const Matrix& matrix, const Vector& target,
                                                 Double ratio);

// Rows where the filter is true go to the first matrix
std::pair<Matrix, Matrix> split_rows(const Matrix& matrix, const Filter& filter);

// Values where the filter is true go to the first vector
std::pair<Vector, Vector> split_values(const Vector& values, const Filter& filter);

// true where matrix(row, column) > split
Filter partition_filter(const Matrix& matrix, ColumnIndex column, Double split);

// Copy of a single column
Vector column_values(const Matrix& matrix, ColumnIndex column);

// ============================================================================
// Class Proportions
// ============================================================================

struct ClassProportion {
    Label label;
    size_t count;
    Double proportion;
};

// Sorted by label
std::vector<ClassProportion> class_proportions(const Vector& target);

// ============================================================================
// K-Fold Cross Validation
// ============================================================================

/**
 * Yields one train filter per fold. Fold f marks rows
 * [f * fold_size, (f + 1) * fold_size) as test (false), fold_size = size / k.
 */
class KFold {
public:
    KFold(Index size, Index k);

    class iterator {
    public:
        iterator(const KFold* owner, Index fold) : owner_(owner), fold_(fold) {}

        Filter operator*() const { return owner_->train_filter(fold_); }
        iterator& operator++() { ++fold_; return *this; }
        bool operator!=(const iterator& other) const { return fold_ != other.fold_; }
        bool operator==(const iterator& other) const { return fold_ == other.fold_; }

    private:
        const KFold* owner_;
        Index fold_;
    };

    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, k_); }

    Filter train_filter(Index fold) const;

    Index size() const { return size_; }
    Index n_folds() const { return k_; }
    Index fold_size() const { return size_ / k_; }

private:
    Index size_;
    Index k_;
};

} // namespace canopy
