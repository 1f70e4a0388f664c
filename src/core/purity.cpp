/**
 * Canopy Purity Function Implementation
 */

#include "canopy/purity.hpp"
#include <cmath>
#include <numeric>

namespace canopy {
namespace purity {

ClassCounts label_counts(const Vector& values) {
    ClassCounts counts;
    for (Double v : values) {
        counts[v] += 1;
    }
    return counts;
}

Double gini(const Vector& values) {
    if (values.empty()) return 0.0;

    const Double n = static_cast<Double>(values.size());
    Double result = 1.0;
    for (const auto& [label, count] : label_counts(values)) {
        Double p = static_cast<Double>(count) / n;
        result -= p * p;
    }
    return result;
}

Double entropy(const Vector& values) {
    if (values.empty()) return 0.0;

    const Double n = static_cast<Double>(values.size());
    Double result = 0.0;
    for (const auto& [label, count] : label_counts(values)) {
        Double p = static_cast<Double>(count) / n;
        result -= p * std::log2(p);
    }
    return result;
}

Double variance(const Vector& values) {
    if (values.empty()) return 0.0;

    const Double n = static_cast<Double>(values.size());
    Double mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
    Double sum_sq = 0.0;
    for (Double v : values) {
        Double d = v - mean;
        sum_sq += d * d;
    }
    return sum_sq / n;
}

Double stdev(const Vector& values) {
    return std::sqrt(variance(values));
}

} // namespace purity
} // namespace canopy
