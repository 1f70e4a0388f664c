#pragma once

/**
 * Canopy Decision Tree
 *
 * Binary decision tree for classification and regression, grown by
 * recursive exhaustive split search. Nodes live in an append-only arena
 * (std::vector<Node>) and reference children by index; node 0 is the root
 * and every child index is greater than its parent's.
 *
 * Growth stops at a node when any of these hold:
 * - depth exceeds max_depth
 * - fewer than min_rows_per_node rows remain
 * - all target values are equal
 * - no split improves purity, or a side of the split is too small
 * - the recursion or split caps are exhausted (safety net)
 */

#include "types.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "features.hpp"
#include "split.hpp"
#include <vector>

namespace canopy {

class Tree {
public:
    Tree(const TreeConfig& config, PurityFn purity);

    // ========================================================================
    // Training
    // ========================================================================

    /**
     * Grow the tree, replacing any previous arena. If growth throws, the
     * previous model (or the untrained state) is left untouched.
     * @param skip_checks Skip input validation already done by the caller
     */
    void train(const Matrix& matrix, const Vector& target, bool skip_checks = false);

    // ========================================================================
    // Inference
    // ========================================================================

    // One prediction per row: majority label or mean target of the leaf
    Vector predict(const Matrix& matrix, bool skip_checks = false) const;

    // Classification only: leaf label plus count / record_count per label
    std::vector<ClassPrediction> predict_with_probabilities(
        const Matrix& matrix, bool skip_checks = false) const;

    // Classification only: leaf label plus raw label counts
    std::vector<ClassCountPrediction> predict_with_class_counts(
        const Matrix& matrix, bool skip_checks = false) const;

    /**
     * Per-column importance: sum of purity_gain * record_count / input rows
     * over the decision nodes splitting on that column
     */
    Vector purity_gains() const;

    // Walk from the root to the leaf reached by one row
    const LeafNode& find_leaf(const Double* row) const;

    // ========================================================================
    // Assembly from an existing arena
    // ========================================================================

    /**
     * Build a tree around a prepared node arena.
     * Throws InternalConsistency when the arena breaks the index ordering,
     * references a missing column, or its leaves do not match the mode.
     */
    static Tree from_nodes(
        const TreeConfig& config,
        PurityFn purity,
        std::vector<Node> nodes,
        Index n_columns,
        Index input_record_count
    );

    // ========================================================================
    // Access tree structure
    // ========================================================================

    const std::vector<Node>& nodes() const { return nodes_; }
    Index n_nodes() const { return nodes_.size(); }
    Index n_leaves() const;
    uint32_t depth() const { return depth_; }
    bool is_trained() const { return !nodes_.empty(); }
    bool cap_reached() const { return cap_reached_; }

    Index n_columns() const { return n_columns_; }
    Index input_record_count() const { return input_record_count_; }
    const Vector& classes() const { return classes_; }
    const std::vector<Index>& oob_indices() const { return oob_indices_; }

    const TreeConfig& config() const { return config_; }
    TaskType mode() const { return config_.mode; }
    const PurityFn& purity() const { return finder_.purity(); }

private:
    // Growth bookkeeping threaded through the recursion
    struct GrowContext {
        uint32_t recursions = 0;
        uint32_t splits = 0;
        uint32_t max_depth_seen = 0;
        bool cap_reached = false;
        std::vector<Node> nodes;
        Rng rng;

        explicit GrowContext(uint64_t seed) : rng(seed) {}
    };

    TreeConfig config_;
    SplitFinder finder_;
    std::vector<Node> nodes_;

    Index n_columns_ = 0;
    Index input_record_count_ = 0;
    Vector classes_;
    std::vector<Index> oob_indices_;
    uint32_t depth_ = 0;
    bool cap_reached_ = false;

    Index grow(Matrix matrix, Vector target, uint32_t parent_depth, GrowContext& ctx);
    Index add_leaf(const Vector& target, GrowContext& ctx);

    void check_inference_input(const Matrix& matrix) const;
    void check_classification(const char* method) const;
    void check_arena() const;
};

} // namespace canopy
