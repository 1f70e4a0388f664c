/**
 * Canopy Split Search Tests
 */

#include <gtest/gtest.h>
#include "canopy/split.hpp"
#include "canopy/purity.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <set>

using namespace canopy;

TEST(SplitFinderTest, SingleColumnMidpoint) {
    SplitFinder finder(purity::gini);
    SplitResult result = finder.find_best_split({1, 2, 3, 4}, {0, 0, 1, 1});

    EXPECT_DOUBLE_EQ(result.split, 2.5);
    EXPECT_DOUBLE_EQ(result.gain, 0.5);
}

TEST(SplitFinderTest, UnsortedInput) {
    SplitFinder finder(purity::gini);
    SplitResult result = finder.find_best_split({4, 1, 3, 2}, {1, 0, 1, 0});

    EXPECT_DOUBLE_EQ(result.split, 2.5);
    EXPECT_DOUBLE_EQ(result.gain, 0.5);
}

TEST(SplitFinderTest, EmptyInput) {
    SplitFinder finder(purity::gini);
    SplitResult result = finder.find_best_split(Vector{}, Vector{});

    EXPECT_DOUBLE_EQ(result.split, 0.0);
    EXPECT_DOUBLE_EQ(result.gain, 0.0);
}

TEST(SplitFinderTest, IdenticalValuesFallBelowMinimum) {
    SplitFinder finder(purity::gini);
    SplitResult result = finder.find_best_split({2, 2, 2}, {0, 1, 0});

    EXPECT_DOUBLE_EQ(result.split, 1.0);
    EXPECT_DOUBLE_EQ(result.gain, 0.0);
}

TEST(SplitFinderTest, ConstantTargetHasNoGain) {
    SplitFinder finder(purity::gini);
    Rng rng(1);

    Matrix m(4, 2);
    m << 1, 9,
         2, 8,
         3, 7,
         4, 6;
    MatrixSplit result = finder.find_best_split(m, Vector{5, 5, 5, 5}, -1, rng);

    EXPECT_DOUBLE_EQ(result.gain, 0.0);
}

TEST(SplitFinderTest, RegressionWithStdev) {
    SplitFinder finder(purity::stdev);
    SplitResult result = finder.find_best_split({1, 2, 3, 4, 5, 6}, {1, 1, 1, 10, 10, 10});

    EXPECT_DOUBLE_EQ(result.split, 3.5);
    EXPECT_NEAR(result.gain, 4.5, 1e-12);
}

TEST(SplitFinderTest, MatrixScenarioPicksFirstColumn) {
    SplitFinder finder(purity::gini);
    Rng rng(42);

    MatrixSplit result = finder.find_best_split(
        fixtures::scenario_matrix(), fixtures::scenario_target(), -1, rng);

    EXPECT_EQ(result.column, 0u);
    EXPECT_DOUBLE_EQ(result.split, 0.5);
    EXPECT_NEAR(result.gain, 1.0 / 18.0, 1e-12);
}

TEST(SplitFinderTest, SecondColumnAlone) {
    SplitFinder finder(purity::gini);
    Matrix m = fixtures::scenario_matrix();

    SplitResult result = finder.find_best_split(column_values(m, 1), fixtures::scenario_target());

    // Isolates the single 12.0 row
    EXPECT_DOUBLE_EQ(result.split, 7.5);
    EXPECT_NEAR(result.gain, 1.0 / 22.0, 1e-12);
}

TEST(SplitFinderTest, EqualGainKeepsLowestSplit) {
    SplitFinder finder(purity::gini);

    // 1.5 and 3.5 both isolate a single 0 label
    SplitResult result = finder.find_best_split({1, 2, 3, 4}, {0, 1, 1, 0});

    EXPECT_DOUBLE_EQ(result.split, 1.5);
    EXPECT_NEAR(result.gain, 1.0 / 6.0, 1e-12);
}

TEST(SplitFinderTest, EqualGainKeepsEarliestColumn) {
    SplitFinder finder(purity::gini);
    Rng rng(3);

    Matrix m(4, 3);
    m << 9, 1, 1,
         9, 2, 2,
         9, 3, 3,
         9, 4, 4;

    MatrixSplit result = finder.find_best_split(m, Vector{0, 1, 1, 0}, -1, rng);

    EXPECT_EQ(result.column, 1u);
    EXPECT_DOUBLE_EQ(result.split, 1.5);
    EXPECT_NEAR(result.gain, 1.0 / 6.0, 1e-12);
}

TEST(SplitFinderTest, EmptyMatrix) {
    SplitFinder finder(purity::gini);
    Rng rng(1);

    MatrixSplit result = finder.find_best_split(Matrix(0, 3), Vector{}, -1, rng);

    EXPECT_EQ(result.column, 0u);
    EXPECT_DOUBLE_EQ(result.gain, 0.0);
}

TEST(SplitFinderTest, LengthMismatch) {
    SplitFinder finder(purity::gini);
    Rng rng(1);

    EXPECT_CANOPY_ERROR(finder.find_best_split(fixtures::scenario_matrix(), Vector{0, 1}, -1, rng),
                        ErrorKind::ShapeMismatch);
}

TEST(SplitFinderTest, RequiresPurityFunction) {
    EXPECT_CANOPY_ERROR(SplitFinder(PurityFn{}), ErrorKind::InvalidConfig);
}

TEST(CandidateColumnsTest, RandomSubsetIsSortedAndDistinct) {
    Rng rng(123);
    auto columns = SplitFinder::candidate_columns(10, 4, rng);

    ASSERT_EQ(columns.size(), 4u);
    EXPECT_TRUE(std::is_sorted(columns.begin(), columns.end()));
    EXPECT_EQ(std::set<ColumnIndex>(columns.begin(), columns.end()).size(), 4u);
    EXPECT_LT(columns.back(), 10u);
}

TEST(CandidateColumnsTest, AllColumnsWhenUnsetOrTooLarge) {
    Rng rng(123);

    EXPECT_EQ(SplitFinder::candidate_columns(3, -1, rng), (std::vector<ColumnIndex>{0, 1, 2}));
    EXPECT_EQ(SplitFinder::candidate_columns(3, 0, rng), (std::vector<ColumnIndex>{0, 1, 2}));
    EXPECT_EQ(SplitFinder::candidate_columns(3, 5, rng), (std::vector<ColumnIndex>{0, 1, 2}));
}
