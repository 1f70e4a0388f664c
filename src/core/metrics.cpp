/**
 * Canopy Metrics Implementation
 */

#include "canopy/metrics.hpp"
#include "canopy/errors.hpp"
#include <numeric>

namespace canopy {
namespace metrics {

namespace {

void check_lengths(const Vector& actuals, const Vector& predictions) {
    if (actuals.size() != predictions.size()) {
        throw Error(ErrorKind::ShapeMismatch, messages::kLengthMismatch);
    }
}

} // namespace

Double accuracy(const Vector& actuals, const Vector& predictions) {
    check_lengths(actuals, predictions);
    if (actuals.empty()) return 0.0;

    Index correct = 0;
    for (size_t i = 0; i < actuals.size(); ++i) {
        if (actuals[i] == predictions[i]) ++correct;
    }
    return static_cast<Double>(correct) / static_cast<Double>(actuals.size());
}

Double classification_error(const Vector& actuals, const Vector& predictions) {
    return 1.0 - accuracy(actuals, predictions);
}

std::map<Label, LabelCounts> label_counts(const Vector& actuals, const Vector& predictions) {
    check_lengths(actuals, predictions);

    std::map<Label, LabelCounts> counts;
    for (size_t i = 0; i < actuals.size(); ++i) {
        if (actuals[i] == predictions[i]) {
            counts[actuals[i]].tp += 1;
        } else {
            counts[predictions[i]].fp += 1;
            counts[actuals[i]].fn += 1;
        }
    }
    return counts;
}

std::map<Label, PrecisionRecall> precision_recall(const Vector& actuals, const Vector& predictions) {
    std::map<Label, PrecisionRecall> result;
    for (const auto& [label, counts] : label_counts(actuals, predictions)) {
        result[label] = PrecisionRecall{counts.precision(), counts.recall()};
    }
    return result;
}

Double sse(const Vector& actuals, const Vector& predictions) {
    check_lengths(actuals, predictions);

    Double sum = 0.0;
    for (size_t i = 0; i < actuals.size(); ++i) {
        Double diff = actuals[i] - predictions[i];
        sum += diff * diff;
    }
    return sum;
}

Double mse(const Vector& actuals, const Vector& predictions) {
    Double total = sse(actuals, predictions);
    return actuals.empty() ? 0.0 : total / static_cast<Double>(actuals.size());
}

RSquared r_squared(const Vector& actuals, const Vector& predictions, std::optional<Index> n_terms) {
    check_lengths(actuals, predictions);
    if (actuals.empty()) {
        throw Error(ErrorKind::EmptyInput, messages::kEmptyInput);
    }

    const Double n = static_cast<Double>(actuals.size());
    const Double mean = std::accumulate(actuals.begin(), actuals.end(), 0.0) / n;

    Double sst = 0.0;
    for (Double v : actuals) sst += (v - mean) * (v - mean);

    RSquared result;
    result.r_squared = 1.0 - sse(actuals, predictions) / sst;
    if (n_terms) {
        const Double p = static_cast<Double>(*n_terms);
        result.adjusted = 1.0 - (1.0 - result.r_squared) * ((n - 1.0) / (n - p - 1.0));
    }
    return result;
}

} // namespace metrics
} // namespace canopy
