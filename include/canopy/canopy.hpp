#pragma once

/**
 * Canopy: Decision Trees and Random Forests
 *
 * CART-style binary decision trees grown by exhaustive split search over a
 * pluggable purity function, and random forests of bootstrapped trees with
 * per-split column subsampling.
 *
 * Usage:
 * ```cpp
 * #include <canopy/canopy.hpp>
 *
 * canopy::Tree tree(canopy::TreeConfig::classification(), canopy::purity::gini);
 * tree.train(X, y);
 * canopy::Vector predictions = tree.predict(X_test);
 * ```
 *
 * Regression forest:
 * ```cpp
 * canopy::Forest forest(canopy::ForestConfig::regression(), canopy::purity::stdev);
 * forest.train(X, y);
 * auto gains = forest.purity_gains();
 * ```
 */

#define CANOPY_VERSION_MAJOR 0
#define CANOPY_VERSION_MINOR 1
#define CANOPY_VERSION_PATCH 0
#define CANOPY_VERSION_STRING "0.1.0"

#include "canopy/types.hpp"
#include "canopy/errors.hpp"
#include "canopy/config.hpp"
#include "canopy/purity.hpp"
#include "canopy/features.hpp"
#include "canopy/split.hpp"
#include "canopy/tree.hpp"
#include "canopy/forest.hpp"
#include "canopy/metrics.hpp"
#include <cstdio>

namespace canopy {

/**
 * Library version information
 */
struct Version {
    static constexpr int major = CANOPY_VERSION_MAJOR;
    static constexpr int minor = CANOPY_VERSION_MINOR;
    static constexpr int patch = CANOPY_VERSION_PATCH;
    static constexpr const char* string = CANOPY_VERSION_STRING;
};

/**
 * Get compile-time feature flags
 */
struct CompileFeatures {
    static constexpr bool has_openmp =
        #ifdef _OPENMP
            true;
        #else
            false;
        #endif
};

/**
 * Print library info
 */
inline void print_info() {
    std::printf("Canopy v%s\n", Version::string);
    std::printf("  OpenMP: %s\n", CompileFeatures::has_openmp ? "Yes" : "No");
    std::printf("  Eigen: %d.%d.%d\n", EIGEN_WORLD_VERSION, EIGEN_MAJOR_VERSION, EIGEN_MINOR_VERSION);
}

} // namespace canopy
