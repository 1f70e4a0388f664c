/**
 * Canopy Tree Implementation
 */

#include "canopy/tree.hpp"
#include "canopy/purity.hpp"
#include <algorithm>
#include <cstdio>
#include <numeric>
#include <set>
#include <string>
#include <utility>

namespace canopy {

namespace {

const Double* row_ptr(const Matrix& matrix, Eigen::Index row) {
    return matrix.data() + row * matrix.cols();
}

bool all_equal(const Vector& target) {
    return std::all_of(target.begin(), target.end(),
                       [&target](Double v) { return v == target.front(); });
}

// Most frequent label; the lowest label wins a tie
Label majority_label(const ClassCounts& counts) {
    Label best_label = 0.0;
    size_t best_count = 0;
    for (const auto& [label, count] : counts) {
        if (count > best_count) {
            best_count = count;
            best_label = label;
        }
    }
    return best_label;
}

ClassProbabilities to_probabilities(const LeafNode& leaf) {
    ClassProbabilities probs;
    if (!leaf.class_counts) return probs;

    size_t total = leaf.record_count;
    if (total == 0) {
        for (const auto& [label, count] : *leaf.class_counts) total += count;
    }
    for (const auto& [label, count] : *leaf.class_counts) {
        probs[label] = total > 0 ? static_cast<Double>(count) / static_cast<Double>(total) : 0.0;
    }
    return probs;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Tree::Tree(const TreeConfig& config, PurityFn purity)
    : config_(config), finder_(std::move(purity)) {
    config_.validate();
}

// ============================================================================
// Training
// ============================================================================

void Tree::train(const Matrix& matrix, const Vector& target, bool skip_checks) {
    if (!skip_checks) {
        if (matrix.rows() == 0 || matrix.cols() == 0 || target.empty()) {
            throw Error(ErrorKind::EmptyInput, messages::kEmptyInput);
        }
        check_same_length(matrix, target);
    }

    Vector classes;
    if (config_.mode == TaskType::Classification) {
        std::set<Double> distinct(target.begin(), target.end());
        classes.assign(distinct.begin(), distinct.end());
    }

    // Grow into a scratch arena; the previous model survives a failed train
    GrowContext ctx(config_.seed);
    std::vector<Index> oob_indices;

    if (config_.bootstrap_sample_data) {
        BootstrapSample sample = bootstrap(matrix, target, ctx.rng, config_.record_out_of_bag);
        oob_indices = std::move(sample.oob_indices);
        grow(std::move(sample.matrix), std::move(sample.target), 0, ctx);
    } else {
        grow(matrix, target, 0, ctx);
    }

    nodes_.swap(ctx.nodes);
    oob_indices_.swap(oob_indices);
    classes_.swap(classes);
    n_columns_ = static_cast<Index>(matrix.cols());
    input_record_count_ = static_cast<Index>(matrix.rows());
    depth_ = ctx.max_depth_seen;
    cap_reached_ = ctx.cap_reached;

    if (config_.verbosity > 0) {
        std::printf("[Tree] trained: rows=%zu, nodes=%zu, leaves=%zu, depth=%u, splits=%u\n",
                    input_record_count_, nodes_.size(), n_leaves(), depth_, ctx.splits);
        if (cap_reached_) {
            std::printf("[Tree] growth stopped early: recursion or split cap reached\n");
        }
        std::fflush(stdout);
    }
}

Index Tree::grow(Matrix matrix, Vector target, uint32_t parent_depth, GrowContext& ctx) {
    ctx.recursions += 1;
    const uint32_t depth = parent_depth + 1;
    ctx.max_depth_seen = std::max(ctx.max_depth_seen, depth);
    const Index record_count = target.size();

    const bool caps_exhausted =
        ctx.recursions > config_.max_recursions ||
        ctx.splits > config_.max_splits;
    if (caps_exhausted) {
        ctx.cap_reached = true;
    }

    bool should_stop =
        caps_exhausted ||
        depth > config_.max_depth ||
        record_count < config_.min_rows_per_node ||
        all_equal(target);

    if (should_stop) {
        return add_leaf(target, ctx);
    }

    MatrixSplit best = finder_.find_best_split(matrix, target, config_.random_features, ctx.rng);
    if (best.gain <= 0.0) {
        return add_leaf(target, ctx);
    }

    Filter filter = partition_filter(matrix, best.column, best.split);
    auto [yes_matrix, no_matrix] = split_rows(matrix, filter);
    auto [yes_target, no_target] = split_values(target, filter);

    if (yes_target.empty() || no_target.empty() ||
        yes_target.size() < config_.min_rows_per_node ||
        no_target.size() < config_.min_rows_per_node) {
        return add_leaf(target, ctx);
    }

    // Release the parent's working set before descending
    matrix.resize(0, 0);
    Vector().swap(target);

    ctx.splits += 1;
    const Index node_idx = ctx.nodes.size();
    DecisionNode decision;
    decision.column_index = best.column;
    decision.split_point = best.split;
    decision.purity_gain = best.gain;
    decision.record_count = record_count;
    ctx.nodes.emplace_back(decision);

    const Index yes_idx = grow(std::move(yes_matrix), std::move(yes_target), depth, ctx);
    const Index no_idx = grow(std::move(no_matrix), std::move(no_target), depth, ctx);

    // The arena may have reallocated during recursion
    auto& node = std::get<DecisionNode>(ctx.nodes[node_idx]);
    node.yes_child = yes_idx;
    node.no_child = no_idx;
    return node_idx;
}

Index Tree::add_leaf(const Vector& target, GrowContext& ctx) {
    LeafNode leaf;
    leaf.record_count = target.size();

    if (config_.mode == TaskType::Classification) {
        ClassCounts counts = purity::label_counts(target);
        leaf.predicted = majority_label(counts);
        leaf.class_counts = std::move(counts);
    } else {
        leaf.predicted = target.empty()
            ? 0.0
            : std::accumulate(target.begin(), target.end(), 0.0) / static_cast<Double>(target.size());
    }

    const Index idx = ctx.nodes.size();
    ctx.nodes.emplace_back(std::move(leaf));
    return idx;
}

// ============================================================================
// Inference
// ============================================================================

void Tree::check_inference_input(const Matrix& matrix) const {
    if (nodes_.empty()) {
        throw Error(ErrorKind::Untrained, messages::kUntrained);
    }
    if (matrix.rows() == 0) {
        throw Error(ErrorKind::EmptyInput, messages::kEmptyInput);
    }
    if (static_cast<Index>(matrix.cols()) != n_columns_) {
        throw Error(ErrorKind::ShapeMismatch, messages::kColumnMismatch);
    }
}

void Tree::check_classification(const char* method) const {
    if (config_.mode != TaskType::Classification) {
        throw Error(ErrorKind::ModeMismatch, std::string(method) + ": " + messages::kModeMismatch);
    }
}

const LeafNode& Tree::find_leaf(const Double* row) const {
    Index idx = 0;
    for (uint32_t step = 0; step <= config_.max_recursions; ++step) {
        if (idx >= nodes_.size()) {
            throw Error(ErrorKind::InternalConsistency,
                        "node index " + std::to_string(idx) + " outside arena");
        }
        const Node& node = nodes_[idx];
        if (const auto* leaf = std::get_if<LeafNode>(&node)) {
            return *leaf;
        }
        const auto& decision = std::get<DecisionNode>(node);
        idx = row[decision.column_index] > decision.split_point
            ? decision.yes_child
            : decision.no_child;
    }
    throw Error(ErrorKind::InternalConsistency, messages::kTraversalExceeded);
}

Vector Tree::predict(const Matrix& matrix, bool skip_checks) const {
    if (!skip_checks) {
        check_inference_input(matrix);
    }

    Vector result(static_cast<size_t>(matrix.rows()));
    for (Eigen::Index r = 0; r < matrix.rows(); ++r) {
        result[r] = find_leaf(row_ptr(matrix, r)).predicted;
    }
    return result;
}

std::vector<ClassPrediction> Tree::predict_with_probabilities(
    const Matrix& matrix, bool skip_checks) const {
    check_classification("predict_with_probabilities");
    if (!skip_checks) {
        check_inference_input(matrix);
    }

    std::vector<ClassPrediction> result(static_cast<size_t>(matrix.rows()));
    for (Eigen::Index r = 0; r < matrix.rows(); ++r) {
        const LeafNode& leaf = find_leaf(row_ptr(matrix, r));
        result[r].label = leaf.predicted;
        result[r].probabilities = to_probabilities(leaf);
    }
    return result;
}

std::vector<ClassCountPrediction> Tree::predict_with_class_counts(
    const Matrix& matrix, bool skip_checks) const {
    check_classification("predict_with_class_counts");
    if (!skip_checks) {
        check_inference_input(matrix);
    }

    std::vector<ClassCountPrediction> result(static_cast<size_t>(matrix.rows()));
    for (Eigen::Index r = 0; r < matrix.rows(); ++r) {
        const LeafNode& leaf = find_leaf(row_ptr(matrix, r));
        result[r].label = leaf.predicted;
        if (leaf.class_counts) {
            result[r].counts = *leaf.class_counts;
        }
    }
    return result;
}

// ============================================================================
// Feature Importance
// ============================================================================

Vector Tree::purity_gains() const {
    if (nodes_.empty()) {
        throw Error(ErrorKind::Untrained, messages::kUntrained);
    }

    Vector gains(n_columns_, 0.0);
    if (input_record_count_ == 0) {
        return gains;
    }

    const Double total = static_cast<Double>(input_record_count_);
    for (const Node& node : nodes_) {
        if (const auto* decision = std::get_if<DecisionNode>(&node)) {
            gains[decision->column_index] +=
                decision->purity_gain * static_cast<Double>(decision->record_count) / total;
        }
    }
    return gains;
}

Index Tree::n_leaves() const {
    return static_cast<Index>(std::count_if(nodes_.begin(), nodes_.end(),
                                            [](const Node& node) { return is_leaf(node); }));
}

// ============================================================================
// Assembly
// ============================================================================

Tree Tree::from_nodes(
    const TreeConfig& config,
    PurityFn purity,
    std::vector<Node> nodes,
    Index n_columns,
    Index input_record_count
) {
    Tree tree(config, std::move(purity));
    tree.nodes_ = std::move(nodes);
    tree.n_columns_ = n_columns;
    tree.input_record_count_ = input_record_count;
    tree.check_arena();

    std::set<Double> labels;
    uint32_t deepest = 0;
    std::vector<uint32_t> level(tree.nodes_.size(), 1);
    for (Index i = 0; i < tree.nodes_.size(); ++i) {
        deepest = std::max(deepest, level[i]);
        if (const auto* decision = std::get_if<DecisionNode>(&tree.nodes_[i])) {
            level[decision->yes_child] = level[i] + 1;
            level[decision->no_child] = level[i] + 1;
        } else {
            const auto& leaf = std::get<LeafNode>(tree.nodes_[i]);
            if (leaf.class_counts) {
                for (const auto& entry : *leaf.class_counts) labels.insert(entry.first);
            }
        }
    }
    tree.classes_.assign(labels.begin(), labels.end());
    tree.depth_ = deepest;
    return tree;
}

void Tree::check_arena() const {
    if (nodes_.empty()) {
        throw Error(ErrorKind::InternalConsistency, "node arena is empty");
    }
    if (input_record_count_ == 0) {
        throw Error(ErrorKind::InternalConsistency, "input_record_count must be positive");
    }

    const bool classify = config_.mode == TaskType::Classification;
    for (Index i = 0; i < nodes_.size(); ++i) {
        if (const auto* decision = std::get_if<DecisionNode>(&nodes_[i])) {
            if (decision->yes_child <= i || decision->no_child <= i ||
                decision->yes_child >= nodes_.size() || decision->no_child >= nodes_.size()) {
                throw Error(ErrorKind::InternalConsistency,
                            "node " + std::to_string(i) + " has an invalid child index");
            }
            if (decision->column_index >= n_columns_) {
                throw Error(ErrorKind::InternalConsistency,
                            "node " + std::to_string(i) + " splits on a missing column");
            }
        } else {
            const auto& leaf = std::get<LeafNode>(nodes_[i]);
            if (leaf.class_counts.has_value() != classify) {
                throw Error(ErrorKind::InternalConsistency,
                            "leaf " + std::to_string(i) + " class counts do not match the tree mode");
            }
        }
    }
}

} // namespace canopy
