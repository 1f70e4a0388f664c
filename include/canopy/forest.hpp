#pragma once

/**
 * Canopy Random Forest
 *
 * Ensemble of decision trees, each grown on its own bootstrap resample with
 * random column subsampling at every split. Trees are trained concurrently
 * and rows are predicted concurrently; neither phase shares mutable state.
 *
 * Usage:
 * ```cpp
 * canopy::ForestConfig config = canopy::ForestConfig::classification();
 * config.tree_count = 200;
 *
 * canopy::Forest forest(config, canopy::purity::gini);
 * forest.train(X_train, y_train);
 * canopy::Vector predictions = forest.predict(X_test);
 * ```
 */

#include "types.hpp"
#include "config.hpp"
#include "tree.hpp"
#include <vector>

namespace canopy {

class Forest {
public:
    Forest(const ForestConfig& config, PurityFn purity);

    // ========================================================================
    // Training
    // ========================================================================

    /**
     * Replace any existing trees with config.tree_count freshly trained ones.
     * random_features left at 0 resolves to round(sqrt(columns)).
     */
    void train(const Matrix& matrix, const Vector& target);

    // ========================================================================
    // Prediction
    // ========================================================================

    // Mean of tree predictions (regression) or majority vote (classification)
    Vector predict(const Matrix& matrix) const;

    // Classification only: majority vote plus tree-averaged leaf probabilities
    std::vector<ClassPrediction> predict_with_probabilities(const Matrix& matrix) const;

    // Element-wise mean of the trees' purity gains
    Vector purity_gains() const;

    /**
     * Out-of-bag estimate on the training data: each row is predicted only by
     * trees whose bootstrap sample missed it. Accuracy for classification,
     * R squared for regression. Requires record_out_of_bag.
     */
    Double oob_score(const Matrix& matrix, const Vector& target) const;

    // ========================================================================
    // Assembly
    // ========================================================================

    // Wrap already trained trees that share a column count
    static Forest from_trees(const ForestConfig& config, PurityFn purity, std::vector<Tree> trees);

    // ========================================================================
    // Accessors
    // ========================================================================

    const std::vector<Tree>& trees() const { return trees_; }
    const Tree& tree(size_t idx) const { return trees_[idx]; }
    size_t n_trees() const { return trees_.size(); }
    bool is_trained() const { return !trees_.empty(); }

    Index n_columns() const { return n_columns_; }
    Index input_record_count() const { return input_record_count_; }
    const Vector& classes() const { return classes_; }
    int32_t random_features() const { return random_features_; }

    const ForestConfig& config() const { return config_; }
    TaskType mode() const { return config_.mode; }

private:
    ForestConfig config_;
    PurityFn purity_;
    std::vector<Tree> trees_;

    Index n_columns_ = 0;
    Index input_record_count_ = 0;
    Vector classes_;
    int32_t random_features_ = 0;   // Resolved value used by the current trees

    void check_inference_input(const Matrix& matrix) const;

    // Aggregate the given trees' answers for one row
    Double aggregate_row(const Double* row, const std::vector<const Tree*>& members) const;
};

} // namespace canopy
