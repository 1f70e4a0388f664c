#pragma once

/**
 * Canopy: Evaluation Metrics
 *
 * Classification:
 * - Accuracy and classification error
 * - Per-label precision and recall
 *
 * Regression:
 * - Sum of squared errors, MSE
 * - R squared with optional adjusted value
 *
 * Every function throws ShapeMismatch when actuals and predictions differ
 * in length.
 */

#include "types.hpp"
#include <map>
#include <optional>

namespace canopy {
namespace metrics {

// ============================================================================
// Per-label Counts
// ============================================================================

struct LabelCounts {
    Index tp = 0;  // True positives
    Index fp = 0;  // False positives
    Index fn = 0;  // False negatives

    Double precision() const {
        return (tp + fp > 0) ? static_cast<Double>(tp) / (tp + fp) : 0.0;
    }

    Double recall() const {
        return (tp + fn > 0) ? static_cast<Double>(tp) / (tp + fn) : 0.0;
    }
};

struct PrecisionRecall {
    Double precision = 0.0;
    Double recall = 0.0;
};

struct RSquared {
    Double r_squared = 0.0;
    Double adjusted = 0.0;   // 0 unless the number of terms was given
};

// ============================================================================
// Classification Metrics
// ============================================================================

// Share of exact matches; 0 for empty input
Double accuracy(const Vector& actuals, const Vector& predictions);

// 1 - accuracy
Double classification_error(const Vector& actuals, const Vector& predictions);

std::map<Label, LabelCounts> label_counts(const Vector& actuals, const Vector& predictions);

/**
 * Precision and recall for every label seen in either input.
 * A label that is never predicted has precision 0.
 */
std::map<Label, PrecisionRecall> precision_recall(const Vector& actuals, const Vector& predictions);

// ============================================================================
// Regression Metrics
// ============================================================================

Double sse(const Vector& actuals, const Vector& predictions);

Double mse(const Vector& actuals, const Vector& predictions);

/**
 * Coefficient of determination.
 * @param n_terms Explanatory terms used by the model; enables the adjusted value
 */
RSquared r_squared(const Vector& actuals, const Vector& predictions,
                   std::optional<Index> n_terms = std::nullopt);

} // namespace metrics
} // namespace canopy
