/**
 * Canopy Forest Tests
 */

#include <gtest/gtest.h>
#include "canopy/forest.hpp"
#include "canopy/metrics.hpp"
#include "canopy/purity.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <stdexcept>

using namespace canopy;
using fixtures::class_leaf;
using fixtures::decision;

namespace {

// Column 0 above 10 predicts 5, otherwise 6
Tree two_leaf_tree() {
    std::vector<Node> arena = {
        decision(0, 10.0, 1, 2, 0.25, 40),
        class_leaf(5, {{5, 15}, {6, 5}}),
        class_leaf(6, {{5, 5}, {6, 15}}),
    };
    return Tree::from_nodes(TreeConfig::classification(), purity::gini, std::move(arena), 2, 40);
}

ForestConfig small_forest(TaskType mode) {
    ForestConfig config = mode == TaskType::Classification
        ? ForestConfig::classification()
        : ForestConfig::regression();
    config.tree_count = 25;
    config.n_threads = 2;
    config.seed = 7;
    return config;
}

} // namespace

// ============================================================================
// Manually Constructed Forest
// ============================================================================

TEST(ManualForestTest, AgreesWithSingleTree) {
    Forest forest = Forest::from_trees(
        ForestConfig::classification(), purity::gini,
        {two_leaf_tree(), two_leaf_tree(), two_leaf_tree()});

    Matrix rows(2, 2);
    rows << 11, 11,
            9, 9;

    EXPECT_EQ(forest.n_trees(), 3u);
    EXPECT_EQ(forest.predict(rows), two_leaf_tree().predict(rows));
    EXPECT_EQ(forest.predict(rows), (Vector{5, 6}));
}

TEST(ManualForestTest, RenormalisedProbabilities) {
    Forest forest = Forest::from_trees(
        ForestConfig::classification(), purity::gini,
        {two_leaf_tree(), two_leaf_tree(), two_leaf_tree()});

    Matrix rows(2, 2);
    rows << 11, 11,
            9, 9;
    auto predictions = forest.predict_with_probabilities(rows);
    auto single = two_leaf_tree().predict_with_probabilities(rows);

    ASSERT_EQ(predictions.size(), 2u);
    for (size_t i = 0; i < 2; ++i) {
        EXPECT_DOUBLE_EQ(predictions[i].label, single[i].label);
        ASSERT_EQ(predictions[i].probabilities.size(), 2u);
        for (const auto& [label, p] : single[i].probabilities) {
            EXPECT_NEAR(predictions[i].probabilities.at(label), p, 1e-12);
        }
    }
    EXPECT_NEAR(predictions[0].probabilities.at(5.0), 0.75, 1e-12);
    EXPECT_NEAR(predictions[0].probabilities.at(6.0), 0.25, 1e-12);
}

TEST(ManualForestTest, PurityGainsAreMean) {
    Forest forest = Forest::from_trees(
        ForestConfig::classification(), purity::gini,
        {two_leaf_tree(), two_leaf_tree()});

    Vector gains = forest.purity_gains();
    ASSERT_EQ(gains.size(), 2u);
    EXPECT_DOUBLE_EQ(gains[0], 0.25);
    EXPECT_DOUBLE_EQ(gains[1], 0.0);
}

TEST(ManualForestTest, RejectsMismatchedTrees) {
    std::vector<Node> wide = {
        decision(2, 1.0, 1, 2, 0.1, 10),
        class_leaf(5, {{5, 5}}),
        class_leaf(6, {{6, 5}}),
    };
    Tree wide_tree = Tree::from_nodes(TreeConfig(), purity::gini, std::move(wide), 3, 10);

    EXPECT_CANOPY_ERROR(Forest::from_trees(ForestConfig(), purity::gini, {two_leaf_tree(), wide_tree}),
                        ErrorKind::ShapeMismatch);
    EXPECT_CANOPY_ERROR(Forest::from_trees(ForestConfig(), purity::gini, {}),
                        ErrorKind::EmptyInput);
    EXPECT_CANOPY_ERROR(Forest::from_trees(ForestConfig::regression(), purity::stdev, {two_leaf_tree()}),
                        ErrorKind::ModeMismatch);
}

TEST(ManualForestTest, VoteTieGoesToLowestLabel) {
    std::vector<Node> flipped = {
        decision(0, 10.0, 1, 2, 0.25, 40),
        class_leaf(6, {{6, 20}}),
        class_leaf(5, {{5, 20}}),
    };
    Tree other = Tree::from_nodes(TreeConfig(), purity::gini, std::move(flipped), 2, 40);
    Forest forest = Forest::from_trees(ForestConfig(), purity::gini, {two_leaf_tree(), other});

    Matrix rows(2, 2);
    rows << 11, 11,
            9, 9;
    EXPECT_EQ(forest.predict(rows), (Vector{5, 5}));
}

// ============================================================================
// Training
// ============================================================================

TEST(ForestTest, ClassifiesSeparableData) {
    Matrix m = fixtures::separable_matrix(60);
    Vector y = fixtures::separable_labels(60);

    Forest forest(small_forest(TaskType::Classification), purity::gini);
    forest.train(m, y);

    EXPECT_EQ(forest.n_trees(), 25u);
    EXPECT_EQ(forest.n_columns(), 3u);
    EXPECT_EQ(forest.input_record_count(), 60u);
    EXPECT_EQ(forest.random_features(), 2);
    EXPECT_EQ(forest.classes(), (Vector{0, 1}));
    EXPECT_GE(metrics::accuracy(y, forest.predict(m)), 0.95);
}

TEST(ForestTest, RegressesLinearTarget) {
    Matrix m = fixtures::separable_matrix(60);
    Vector y(60);
    for (Index i = 0; i < 60; ++i) y[i] = 10.0 * m(i, 0);

    Forest forest(small_forest(TaskType::Regression), purity::stdev);
    forest.train(m, y);

    EXPECT_GT(metrics::r_squared(y, forest.predict(m)).r_squared, 0.8);
}

TEST(ForestTest, ExplicitRandomFeaturesKept) {
    ForestConfig config = small_forest(TaskType::Classification);
    config.random_features = 1;
    Forest forest(config, purity::gini);
    forest.train(fixtures::separable_matrix(30), fixtures::separable_labels(30));

    EXPECT_EQ(forest.random_features(), 1);
    for (const Tree& tree : forest.trees()) {
        EXPECT_EQ(tree.config().random_features, 1);
    }
}

TEST(ForestTest, TreesAreSeededIndividually) {
    Forest forest(small_forest(TaskType::Classification), purity::gini);
    forest.train(fixtures::separable_matrix(40), fixtures::separable_labels(40));

    for (size_t i = 0; i < forest.n_trees(); ++i) {
        EXPECT_EQ(forest.tree(i).config().seed, 7u + i);
    }
}

TEST(ForestTest, FailedTrainLeavesForestUntrained) {
    std::atomic<int> calls{0};
    PurityFn gini_then_fail = [&calls](const Vector& target) {
        if (++calls > 40) {
            throw std::runtime_error("purity failed");
        }
        return purity::gini(target);
    };

    Forest forest(small_forest(TaskType::Classification), gini_then_fail);

    EXPECT_THROW(forest.train(fixtures::separable_matrix(60), fixtures::separable_labels(60)),
                 std::runtime_error);

    EXPECT_FALSE(forest.is_trained());
    EXPECT_EQ(forest.n_trees(), 0u);
    EXPECT_CANOPY_ERROR(forest.predict(fixtures::separable_matrix(5)), ErrorKind::Untrained);
}

TEST(ForestTest, FailedRetrainKeepsPreviousTrees) {
    std::atomic<bool> failing{false};
    PurityFn switchable = [&failing](const Vector& target) {
        if (failing) {
            throw std::runtime_error("purity failed");
        }
        return purity::gini(target);
    };

    Matrix m = fixtures::separable_matrix(60);
    Vector y = fixtures::separable_labels(60);
    Forest forest(small_forest(TaskType::Classification), switchable);
    forest.train(m, y);
    const Vector before = forest.predict(m);

    failing = true;
    EXPECT_THROW(forest.train(fixtures::separable_matrix(30), fixtures::separable_labels(30)),
                 std::runtime_error);

    EXPECT_TRUE(forest.is_trained());
    EXPECT_EQ(forest.n_trees(), 25u);
    EXPECT_EQ(forest.input_record_count(), 60u);
    for (const Tree& tree : forest.trees()) {
        EXPECT_TRUE(tree.is_trained());
    }
    EXPECT_EQ(forest.predict(m), before);
}

TEST(ForestTest, SameSeedSamePredictions) {
    Matrix m = fixtures::separable_matrix(50);
    Vector y = fixtures::separable_labels(50);

    Forest a(small_forest(TaskType::Classification), purity::gini);
    Forest b(small_forest(TaskType::Classification), purity::gini);
    a.train(m, y);
    b.train(m, y);

    EXPECT_EQ(a.predict(m), b.predict(m));
    EXPECT_EQ(a.predict(m), a.predict(m));
}

TEST(ForestTest, PurityGainsEqualTreeMean) {
    Matrix m = fixtures::separable_matrix(40);
    Vector y = fixtures::separable_labels(40);

    Forest forest(small_forest(TaskType::Classification), purity::gini);
    forest.train(m, y);

    Vector expected(3, 0.0);
    for (const Tree& tree : forest.trees()) {
        Vector gains = tree.purity_gains();
        for (size_t c = 0; c < 3; ++c) expected[c] += gains[c];
    }
    Vector gains = forest.purity_gains();
    for (size_t c = 0; c < 3; ++c) {
        EXPECT_NEAR(gains[c], expected[c] / static_cast<Double>(forest.n_trees()), 1e-12);
    }
}

TEST(ForestTest, ProbabilitiesSumToOne) {
    Matrix m = fixtures::separable_matrix(40);
    Forest forest(small_forest(TaskType::Classification), purity::gini);
    forest.train(m, fixtures::separable_labels(40));

    for (const auto& p : forest.predict_with_probabilities(m)) {
        Double total = 0.0;
        for (const auto& entry : p.probabilities) total += entry.second;
        EXPECT_NEAR(total, 1.0, 1e-9);
    }
}

TEST(ForestTest, OutOfBagScore) {
    ForestConfig config = small_forest(TaskType::Classification);
    config.record_out_of_bag = true;
    Matrix m = fixtures::separable_matrix(60);
    Vector y = fixtures::separable_labels(60);

    Forest forest(config, purity::gini);
    forest.train(m, y);

    for (const Tree& tree : forest.trees()) {
        EXPECT_FALSE(tree.oob_indices().empty());
    }
    EXPECT_GT(forest.oob_score(m, y), 0.8);
    EXPECT_CANOPY_ERROR(forest.oob_score(fixtures::separable_matrix(30), fixtures::separable_labels(30)),
                        ErrorKind::ShapeMismatch);
}

// ============================================================================
// Errors
// ============================================================================

TEST(ForestErrorTest, OutOfBagNotRecorded) {
    Matrix m = fixtures::separable_matrix(30);
    Vector y = fixtures::separable_labels(30);
    Forest forest(small_forest(TaskType::Classification), purity::gini);
    forest.train(m, y);

    EXPECT_CANOPY_ERROR(forest.oob_score(m, y), ErrorKind::InvalidConfig);
}

TEST(ForestErrorTest, Untrained) {
    Forest forest(small_forest(TaskType::Classification), purity::gini);

    EXPECT_CANOPY_ERROR(forest.predict(fixtures::scenario_matrix()), ErrorKind::Untrained);
    EXPECT_CANOPY_ERROR(forest.purity_gains(), ErrorKind::Untrained);
}

TEST(ForestErrorTest, InputShape) {
    Forest forest(small_forest(TaskType::Classification), purity::gini);

    EXPECT_CANOPY_ERROR(forest.train(Matrix(0, 2), Vector{}), ErrorKind::EmptyInput);
    EXPECT_CANOPY_ERROR(forest.train(fixtures::scenario_matrix(), Vector{1, 0}),
                        ErrorKind::ShapeMismatch);

    forest.train(fixtures::scenario_matrix(), fixtures::scenario_target());
    EXPECT_CANOPY_ERROR(forest.predict(Matrix::Zero(1, 5)), ErrorKind::ShapeMismatch);
}

TEST(ForestErrorTest, RegressionHasNoProbabilities) {
    Forest forest(small_forest(TaskType::Regression), purity::stdev);
    forest.train(fixtures::scenario_matrix(), fixtures::scenario_target());

    EXPECT_CANOPY_ERROR(forest.predict_with_probabilities(fixtures::scenario_matrix()),
                        ErrorKind::ModeMismatch);
}

TEST(ForestErrorTest, InvalidConfig) {
    ForestConfig config;
    config.tree_count = 0;
    EXPECT_CANOPY_ERROR(Forest(config, purity::gini), ErrorKind::InvalidConfig);
    EXPECT_CANOPY_ERROR(Forest(ForestConfig(), PurityFn{}), ErrorKind::InvalidConfig);
}
