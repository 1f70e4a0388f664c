/**
 * Canopy Purity Function Tests
 */

#include <gtest/gtest.h>
#include "canopy/purity.hpp"
#include <cmath>

using namespace canopy;

TEST(PurityTest, GiniOfPureSliceIsZero) {
    EXPECT_DOUBLE_EQ(purity::gini({3, 3, 3, 3}), 0.0);
}

TEST(PurityTest, GiniTwoBalancedClasses) {
    EXPECT_DOUBLE_EQ(purity::gini({0, 0, 1, 1}), 0.5);
}

TEST(PurityTest, GiniThreeClasses) {
    EXPECT_NEAR(purity::gini({1, 1, 2, 2, 3, 3, 3, 3}), 1.0 - (0.0625 + 0.0625 + 0.25), 1e-12);
}

TEST(PurityTest, EntropyBits) {
    EXPECT_DOUBLE_EQ(purity::entropy({0, 1}), 1.0);
    EXPECT_DOUBLE_EQ(purity::entropy({0, 1, 2, 3}), 2.0);
    EXPECT_DOUBLE_EQ(purity::entropy({5, 5}), 0.0);
}

TEST(PurityTest, VarianceIsPopulationVariance) {
    EXPECT_DOUBLE_EQ(purity::variance({1, 2, 3, 4}), 1.25);
    EXPECT_DOUBLE_EQ(purity::stdev({1, 2, 3, 4}), std::sqrt(1.25));
    EXPECT_DOUBLE_EQ(purity::stdev({7, 7, 7}), 0.0);
}

TEST(PurityTest, EmptyInputIsPure) {
    EXPECT_DOUBLE_EQ(purity::gini({}), 0.0);
    EXPECT_DOUBLE_EQ(purity::entropy({}), 0.0);
    EXPECT_DOUBLE_EQ(purity::stdev({}), 0.0);
}

TEST(PurityTest, LabelCounts) {
    ClassCounts counts = purity::label_counts({2, 1, 2, 2, 5});

    ASSERT_EQ(counts.size(), 3u);
    EXPECT_EQ(counts[1.0], 1u);
    EXPECT_EQ(counts[2.0], 3u);
    EXPECT_EQ(counts[5.0], 1u);
}
