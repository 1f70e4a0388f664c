#pragma once

/**
 * Canopy Purity Functions
 *
 * Impurity measures over a slice of target values. Any callable matching
 * PurityFn can be injected into a Tree or Forest; these are the stock ones.
 * - gini:     classification, 1 - sum(p_k^2)
 * - entropy:  classification, -sum(p_k * log2(p_k))
 * - stdev:    regression, population standard deviation
 * - variance: regression, population variance
 */

#include "types.hpp"

namespace canopy {
namespace purity {

Double gini(const Vector& values);
Double entropy(const Vector& values);
Double variance(const Vector& values);
Double stdev(const Vector& values);

// Label frequencies of a target slice
ClassCounts label_counts(const Vector& values);

} // namespace purity
} // namespace canopy
