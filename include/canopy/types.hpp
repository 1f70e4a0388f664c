#pragma once

/**
 * Canopy: Decision Trees and Random Forests
 *
 * Core type definitions:
 * - Dense row-major feature matrix (Eigen)
 * - Target / prediction vectors
 * - Node arena entries for binary decision trees
 */

#include <cstdint>
#include <cstddef>
#include <cmath>
#include <vector>
#include <map>
#include <optional>
#include <variant>
#include <functional>
#include <Eigen/Dense>

namespace canopy {

// ============================================================================
// Basic Types
// ============================================================================

using Double = double;                  // Feature and target values
using Index = size_t;                   // Row and node indices
using ColumnIndex = size_t;             // Feature column index
using Label = double;                   // Class labels are stored as values

// Dense feature matrix (rows x columns, row-major)
using Matrix = Eigen::Matrix<Double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Target and prediction vectors
using Vector = std::vector<Double>;

// Boolean row filter (true routes to the first output)
using Filter = std::vector<bool>;

// Label frequencies, ordered by label
using ClassCounts = std::map<Label, size_t>;
using ClassProbabilities = std::map<Label, Double>;

// Impurity of a slice of target values (0 = perfectly pure)
using PurityFn = std::function<Double(const Vector&)>;

// ============================================================================
// Task Type
// ============================================================================

enum class TaskType : uint8_t {
    Classification = 0,
    Regression = 1
};

// ============================================================================
// Split Information
// ============================================================================

// Best split point within a single column
struct SplitResult {
    Double split = 0.0;
    Double gain = 0.0;
};

// Best split across the columns of a matrix
struct MatrixSplit {
    ColumnIndex column = 0;
    Double split = 0.0;
    Double gain = 0.0;

    bool operator>(const MatrixSplit& other) const {
        return gain > other.gain;
    }
};

// ============================================================================
// Tree Nodes
// ============================================================================

// Internal node: rows with row[column_index] > split_point go to yes_child
struct DecisionNode {
    ColumnIndex column_index = 0;
    Double split_point = 0.0;
    Index yes_child = 0;
    Index no_child = 0;
    Double purity_gain = 0.0;
    Index record_count = 0;
};

// Terminal node. class_counts is only present for classification trees.
struct LeafNode {
    Index record_count = 0;
    Double predicted = 0.0;
    std::optional<ClassCounts> class_counts;
};

using Node = std::variant<DecisionNode, LeafNode>;

inline bool is_leaf(const Node& node) {
    return std::holds_alternative<LeafNode>(node);
}

// ============================================================================
// Prediction Results
// ============================================================================

struct ClassPrediction {
    Label label = 0.0;
    ClassProbabilities probabilities;
};

struct ClassCountPrediction {
    Label label = 0.0;
    ClassCounts counts;
};

} // namespace canopy
