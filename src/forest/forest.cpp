/**
 * Canopy Random Forest Implementation
 *
 * Training fans out one task per tree; prediction fans out one task per
 * row. Each task writes only its own tree or its own result slot.
 */

#include "canopy/forest.hpp"
#include "canopy/metrics.hpp"
#include "canopy/threading.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <numeric>
#include <set>
#include <utility>

namespace canopy {

namespace {

const Double* row_ptr(const Matrix& matrix, Eigen::Index row) {
    return matrix.data() + row * matrix.cols();
}

// Most voted label; the lowest label wins a tie
Label majority_vote(const ClassCounts& votes) {
    Label best_label = 0.0;
    size_t best_count = 0;
    for (const auto& [label, count] : votes) {
        if (count > best_count) {
            best_count = count;
            best_label = label;
        }
    }
    return best_label;
}

double elapsed_seconds(std::chrono::high_resolution_clock::time_point start) {
    auto now = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double>(now - start).count();
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Forest::Forest(const ForestConfig& config, PurityFn purity)
    : config_(config), purity_(std::move(purity)) {
    config_.validate();
    if (!purity_) {
        throw Error(ErrorKind::InvalidConfig, "purity function must be set");
    }
}

// ============================================================================
// Training
// ============================================================================

void Forest::train(const Matrix& matrix, const Vector& target) {
    if (matrix.rows() == 0 || matrix.cols() == 0 || target.empty()) {
        throw Error(ErrorKind::EmptyInput, messages::kEmptyInput);
    }
    check_same_length(matrix, target);

    auto start_time = std::chrono::high_resolution_clock::now();

    const Index n_columns = static_cast<Index>(matrix.cols());
    const Index input_record_count = static_cast<Index>(matrix.rows());

    Vector classes;
    if (config_.mode == TaskType::Classification) {
        std::set<Double> distinct(target.begin(), target.end());
        classes.assign(distinct.begin(), distinct.end());
    }

    const int32_t random_features = config_.random_features == 0
        ? static_cast<int32_t>(std::lround(std::sqrt(static_cast<double>(n_columns))))
        : config_.random_features;

    // Members are trained off to the side and committed only when all succeed
    std::vector<Tree> trees;
    trees.reserve(config_.tree_count);
    for (uint32_t i = 0; i < config_.tree_count; ++i) {
        TreeConfig tree_config = config_.tree_config(i);
        tree_config.random_features = random_features;
        trees.emplace_back(tree_config, purity_);
    }

    if (config_.verbosity > 0) {
        std::printf("[Forest] train() started, n_rows=%zu, n_columns=%zu, n_trees=%u, random_features=%d\n",
                    input_record_count, n_columns, config_.tree_count, random_features);
        std::fflush(stdout);
    }

    // Inputs are validated once here, not per tree
    threading::parallel_for(0, trees.size(), [&](size_t i) {
        trees[i].train(matrix, target, true);
    }, config_.n_threads);

    trees_.swap(trees);
    classes_.swap(classes);
    n_columns_ = n_columns;
    input_record_count_ = input_record_count;
    random_features_ = random_features;

    if (config_.verbosity > 0) {
        size_t capped = std::count_if(trees_.begin(), trees_.end(),
                                      [](const Tree& t) { return t.cap_reached(); });
        std::printf("Training completed in %.2fs with %zu trees\n",
                    elapsed_seconds(start_time), trees_.size());
        if (capped > 0) {
            std::printf("[Forest] %zu trees stopped growing at the recursion or split cap\n", capped);
        }
        std::fflush(stdout);
    }
}

// ============================================================================
// Prediction
// ============================================================================

void Forest::check_inference_input(const Matrix& matrix) const {
    if (trees_.empty()) {
        throw Error(ErrorKind::Untrained, messages::kUntrained);
    }
    if (static_cast<Index>(matrix.cols()) != n_columns_) {
        throw Error(ErrorKind::ShapeMismatch, messages::kColumnMismatch);
    }
    if (matrix.rows() == 0) {
        throw Error(ErrorKind::EmptyInput, messages::kEmptyInput);
    }
}

Double Forest::aggregate_row(const Double* row, const std::vector<const Tree*>& members) const {
    if (config_.mode == TaskType::Regression) {
        Double sum = 0.0;
        for (const Tree* tree : members) {
            sum += tree->find_leaf(row).predicted;
        }
        return sum / static_cast<Double>(members.size());
    }

    ClassCounts votes;
    for (const Tree* tree : members) {
        votes[tree->find_leaf(row).predicted] += 1;
    }
    return majority_vote(votes);
}

Vector Forest::predict(const Matrix& matrix) const {
    check_inference_input(matrix);

    auto start_time = std::chrono::high_resolution_clock::now();

    std::vector<const Tree*> members;
    members.reserve(trees_.size());
    for (const Tree& tree : trees_) members.push_back(&tree);

    Vector result(static_cast<size_t>(matrix.rows()));
    threading::parallel_for(0, result.size(), [&](size_t i) {
        result[i] = aggregate_row(row_ptr(matrix, static_cast<Eigen::Index>(i)), members);
    }, config_.n_threads);

    if (config_.verbosity > 0) {
        std::printf("[Forest] predict: n_rows=%zu, n_trees=%zu, threads=%d (%.3fs)\n",
                    result.size(), trees_.size(),
                    config_.n_threads > 0 ? config_.n_threads : threading::get_max_threads(),
                    elapsed_seconds(start_time));
        std::fflush(stdout);
    }
    return result;
}

std::vector<ClassPrediction> Forest::predict_with_probabilities(const Matrix& matrix) const {
    if (config_.mode != TaskType::Classification) {
        throw Error(ErrorKind::ModeMismatch,
                    std::string("predict_with_probabilities: ") + messages::kModeMismatch);
    }
    check_inference_input(matrix);

    std::vector<ClassPrediction> result(static_cast<size_t>(matrix.rows()));
    threading::parallel_for(0, result.size(), [&](size_t i) {
        const Double* row = row_ptr(matrix, static_cast<Eigen::Index>(i));

        ClassCounts votes;
        ClassProbabilities summed;
        for (const Tree& tree : trees_) {
            const LeafNode& leaf = tree.find_leaf(row);
            votes[leaf.predicted] += 1;
            if (!leaf.class_counts || leaf.record_count == 0) continue;
            for (const auto& [label, count] : *leaf.class_counts) {
                summed[label] += static_cast<Double>(count) / static_cast<Double>(leaf.record_count);
            }
        }

        Double mass = 0.0;
        for (const auto& entry : summed) mass += entry.second;
        if (mass > 0.0) {
            for (auto& entry : summed) entry.second /= mass;
        }

        result[i].label = majority_vote(votes);
        result[i].probabilities = std::move(summed);
    }, config_.n_threads);

    return result;
}

// ============================================================================
// Feature Importance
// ============================================================================

Vector Forest::purity_gains() const {
    if (trees_.empty()) {
        throw Error(ErrorKind::Untrained, messages::kUntrained);
    }

    Vector result(n_columns_, 0.0);
    for (const Tree& tree : trees_) {
        Vector gains = tree.purity_gains();
        for (Index c = 0; c < n_columns_; ++c) {
            result[c] += gains[c];
        }
    }
    for (Double& g : result) {
        g /= static_cast<Double>(trees_.size());
    }
    return result;
}

// ============================================================================
// Out-of-bag Evaluation
// ============================================================================

Double Forest::oob_score(const Matrix& matrix, const Vector& target) const {
    if (trees_.empty()) {
        throw Error(ErrorKind::Untrained, messages::kUntrained);
    }
    if (!config_.record_out_of_bag) {
        throw Error(ErrorKind::InvalidConfig, "oob_score requires record_out_of_bag");
    }
    check_same_length(matrix, target);
    if (static_cast<Index>(matrix.rows()) != input_record_count_ ||
        static_cast<Index>(matrix.cols()) != n_columns_) {
        throw Error(ErrorKind::ShapeMismatch, "oob_score needs the training matrix");
    }

    const size_t n_rows = target.size();
    Vector predictions(n_rows, 0.0);
    std::vector<uint8_t> scored(n_rows, 0);

    threading::parallel_for(0, n_rows, [&](size_t i) {
        std::vector<const Tree*> members;
        for (const Tree& tree : trees_) {
            const auto& oob = tree.oob_indices();
            if (std::binary_search(oob.begin(), oob.end(), i)) {
                members.push_back(&tree);
            }
        }
        if (members.empty()) return;
        predictions[i] = aggregate_row(row_ptr(matrix, static_cast<Eigen::Index>(i)), members);
        scored[i] = 1;
    }, config_.n_threads);

    Vector actual_scored, predicted_scored;
    for (size_t i = 0; i < n_rows; ++i) {
        if (!scored[i]) continue;
        actual_scored.push_back(target[i]);
        predicted_scored.push_back(predictions[i]);
    }
    if (actual_scored.empty()) {
        throw Error(ErrorKind::EmptyInput, "no row was out of bag for any tree");
    }

    if (config_.verbosity > 0) {
        std::printf("[Forest] oob_score over %zu of %zu rows\n", actual_scored.size(), n_rows);
        std::fflush(stdout);
    }

    if (config_.mode == TaskType::Classification) {
        return metrics::accuracy(actual_scored, predicted_scored);
    }
    return metrics::r_squared(actual_scored, predicted_scored).r_squared;
}

// ============================================================================
// Assembly
// ============================================================================

Forest Forest::from_trees(const ForestConfig& config, PurityFn purity, std::vector<Tree> trees) {
    Forest forest(config, std::move(purity));
    if (trees.empty()) {
        throw Error(ErrorKind::EmptyInput, "forest needs at least one tree");
    }

    const Index n_columns = trees.front().n_columns();
    std::set<Double> labels;
    for (const Tree& tree : trees) {
        if (!tree.is_trained()) {
            throw Error(ErrorKind::Untrained, messages::kUntrained);
        }
        if (tree.n_columns() != n_columns) {
            throw Error(ErrorKind::ShapeMismatch, "trees were trained on different column counts");
        }
        if (tree.mode() != config.mode) {
            throw Error(ErrorKind::ModeMismatch, "tree mode differs from forest mode");
        }
        labels.insert(tree.classes().begin(), tree.classes().end());
    }

    forest.n_columns_ = n_columns;
    forest.input_record_count_ = trees.front().input_record_count();
    forest.random_features_ = trees.front().config().random_features;
    forest.classes_.assign(labels.begin(), labels.end());
    forest.trees_ = std::move(trees);
    return forest;
}

} // namespace canopy
