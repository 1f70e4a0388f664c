#pragma once

/**
 * Canopy Configuration
 *
 * Hyperparameters for single decision trees and random forests.
 * A lone tree defaults to a shallow, deterministic model; a forest defaults
 * to deep bootstrapped trees with sqrt(columns) random features per split.
 */

#include "types.hpp"
#include "errors.hpp"
#include <cstdint>
#include <string>

namespace canopy {

// Hard caps on growth and traversal, guaranteeing termination
constexpr uint32_t DEFAULT_MAX_RECURSIONS = 10000;
constexpr uint32_t DEFAULT_MAX_SPLITS = 10000;

// ============================================================================
// Task Type Parsing
// ============================================================================

inline TaskType parse_task_type(const std::string& name) {
    if (name == "classify" || name == "classification") {
        return TaskType::Classification;
    }
    if (name == "regress" || name == "regression") {
        return TaskType::Regression;
    }
    throw Error(ErrorKind::InvalidConfig, "Mode must be 'classify' or 'regress', got '" + name + "'");
}

inline const char* task_type_name(TaskType task) {
    switch (task) {
        case TaskType::Classification: return "classify";
        case TaskType::Regression: return "regress";
    }
    return "unknown";
}

// Narrow a signed count from an outer interface, rejecting negative values
inline uint32_t checked_count(long long value, const char* name) {
    if (value < 0 || value > static_cast<long long>(UINT32_MAX)) {
        throw Error(ErrorKind::InvalidConfig,
                    std::string(name) + " must be between 0 and 4294967295, got " + std::to_string(value));
    }
    return static_cast<uint32_t>(value);
}

inline void validate_task_type(TaskType task) {
    if (task != TaskType::Classification && task != TaskType::Regression) {
        throw Error(ErrorKind::InvalidConfig, "Mode must be 'classify' or 'regress'");
    }
}

// ============================================================================
// Tree Configuration
// ============================================================================

struct TreeConfig {
    TaskType mode = TaskType::Classification;

    // Stopping conditions
    uint32_t max_depth = 15;                   // Deepest level a decision node may sit on
    uint32_t min_rows_per_node = 3;            // Fewer rows than this makes a leaf
    uint32_t max_recursions = DEFAULT_MAX_RECURSIONS;
    uint32_t max_splits = DEFAULT_MAX_SPLITS;

    // Randomisation
    int32_t random_features = -1;              // Columns sampled per split (<= 0 = all)
    bool bootstrap_sample_data = false;        // Resample rows with replacement before growing
    bool record_out_of_bag = false;            // Keep indices of rows never drawn
    uint64_t seed = 42;

    int32_t verbosity = 0;                     // 0=silent, 1=progress, 2=debug

    static TreeConfig classification() {
        TreeConfig cfg;
        cfg.mode = TaskType::Classification;
        return cfg;
    }

    static TreeConfig regression() {
        TreeConfig cfg;
        cfg.mode = TaskType::Regression;
        return cfg;
    }

    void validate() const {
        validate_task_type(mode);
        if (max_depth == 0) {
            throw Error(ErrorKind::InvalidConfig, "max_depth must be at least 1");
        }
        if (min_rows_per_node == 0) {
            throw Error(ErrorKind::InvalidConfig, "min_rows_per_node must be at least 1");
        }
        if (max_recursions == 0 || max_splits == 0) {
            throw Error(ErrorKind::InvalidConfig, "max_recursions and max_splits must be positive");
        }
    }
};

// ============================================================================
// Forest Configuration
// ============================================================================

struct ForestConfig {
    TaskType mode = TaskType::Classification;

    // Ensemble
    uint32_t tree_count = 103;                 // Odd count avoids binary vote ties

    // Per-tree settings
    uint32_t max_depth = 1000;
    uint32_t min_rows_per_node = 3;
    int32_t random_features = 0;               // 0 = round(sqrt(columns)) at train time
    bool bootstrap_sample_data = true;
    bool record_out_of_bag = false;

    // Execution
    int32_t n_threads = -1;                    // -1 = all available cores
    uint64_t seed = 42;                        // Tree i is seeded with seed + i
    int32_t verbosity = 0;

    static ForestConfig classification() {
        ForestConfig cfg;
        cfg.mode = TaskType::Classification;
        return cfg;
    }

    static ForestConfig regression() {
        ForestConfig cfg;
        cfg.mode = TaskType::Regression;
        return cfg;
    }

    // Settings handed to each member tree
    TreeConfig tree_config(size_t tree_index) const {
        TreeConfig cfg;
        cfg.mode = mode;
        cfg.max_depth = max_depth;
        cfg.min_rows_per_node = min_rows_per_node;
        cfg.random_features = random_features;
        cfg.bootstrap_sample_data = bootstrap_sample_data;
        cfg.record_out_of_bag = record_out_of_bag;
        cfg.seed = seed + tree_index;
        cfg.verbosity = verbosity > 1 ? verbosity - 1 : 0;
        return cfg;
    }

    void validate() const {
        validate_task_type(mode);
        if (tree_count == 0) {
            throw Error(ErrorKind::InvalidConfig, "tree_count must be at least 1");
        }
        if (max_depth == 0) {
            throw Error(ErrorKind::InvalidConfig, "max_depth must be at least 1");
        }
        if (min_rows_per_node == 0) {
            throw Error(ErrorKind::InvalidConfig, "min_rows_per_node must be at least 1");
        }
        if (random_features < 0) {
            throw Error(ErrorKind::InvalidConfig, "random_features cannot be less than zero");
        }
        if (record_out_of_bag && !bootstrap_sample_data) {
            throw Error(ErrorKind::InvalidConfig, "record_out_of_bag requires bootstrap_sample_data");
        }
    }
};

} // namespace canopy
