#pragma once

/**
 * Canopy Split Search
 *
 * Exhaustive search for the split point that maximises the weighted purity
 * gain of a target vector:
 *
 *   gain = purity(all) - |L|/n * purity(L) - |R|/n * purity(R)
 *
 * Candidate split points are midpoints between adjacent distinct sorted
 * values. Only strictly positive improvements are kept, so ties resolve to
 * the lowest split point and, across columns, to the lowest column.
 */

#include "types.hpp"
#include "features.hpp"

namespace canopy {

class SplitFinder {
public:
    explicit SplitFinder(PurityFn purity);

    /**
     * Best split for a single column
     * @param values Column values
     * @param target Target values, same length as values (not re-checked)
     * @return {split, gain}; {0, 0} for empty input and
     *         {min(values) - 1, 0} when every value is identical
     */
    SplitResult find_best_split(const Vector& values, const Vector& target) const;

    /**
     * Best split across the columns of a matrix
     * @param random_features Sample this many distinct columns when
     *        0 < random_features < columns, otherwise scan all of them
     * @param rng Generator used for column sampling
     * @return {column, split, gain}; {0, 0, 0} when nothing improves purity
     */
    MatrixSplit find_best_split(
        const Matrix& matrix,
        const Vector& target,
        int32_t random_features,
        Rng& rng
    ) const;

    // Columns considered for one split, ascending
    static std::vector<ColumnIndex> candidate_columns(
        ColumnIndex n_columns,
        int32_t random_features,
        Rng& rng
    );

    const PurityFn& purity() const { return purity_; }

private:
    PurityFn purity_;
};

} // namespace canopy
