#include <gtest/gtest.h>
#include <traitforge/errors.hpp>
#include <traitforge/feasibility.hpp>
#include "test_helpers.hpp"

using namespace traitforge;
using namespace test_utils;

class FeasibilityTest : public ::testing::Test {
protected:
    FeasibilityEstimator& load(GenerationRequest request, std::size_t budget = 100000) {
        estimator.reset();
        solver.reset();
        catalog = std::make_unique<Catalog>(std::make_shared<const GenerationRequest>(std::move(request)));
        SolverOptions options;
        options.seed = 1;
        solver = std::make_unique<ConstraintSolver>(*catalog, options);
        estimator = std::make_unique<FeasibilityEstimator>(*catalog, *solver, budget);
        return *estimator;
    }

    std::unique_ptr<Catalog> catalog;
    std::unique_ptr<ConstraintSolver> solver;
    std::unique_ptr<FeasibilityEstimator> estimator;
};

TEST_F(FeasibilityTest, CountsEveryPairWithoutRules) {
    auto report = load(two_by_two_request(4)).estimate();
    ASSERT_TRUE(report.ceiling.has_value());
    EXPECT_EQ(*report.ceiling, 4u);
    EXPECT_TRUE(report.exact);
    EXPECT_EQ(report.limiting_group.value(), 1u);
    EXPECT_EQ(report.enumerated, 4u);
}

// One request past the ceiling is refused before any generation happens
TEST_F(FeasibilityTest, RejectsOnePastCeiling) {
    auto& estimator = load(red_forbids_square_request(4));
    EXPECT_EQ(estimator.estimate().ceiling.value(), 3u);

    EXPECT_NO_THROW(estimator.check(3));
    try {
        estimator.check(4);
        FAIL() << "expected FeasibilityError";
    } catch (const FeasibilityError& e) {
        EXPECT_EQ(e.ceiling(), 3u);
        EXPECT_EQ(e.code(), ErrorCode::Feasibility);
        EXPECT_FALSE(e.recoverable());
    }
}

// Tuples that can't extend to a full assignment don't count
TEST_F(FeasibilityTest, RulesOutsideTheGroupCount) {
    auto request = base_request(1);
    request.layers.push_back(make_layer(1, "A", 0, {make_trait(1, "a1"), make_trait(2, "a2"), make_trait(3, "a3")}));
    request.layers.push_back(make_layer(2, "B", 1, {make_ruler(4, "OnlyB", 1, {2})}));
    request.groups.push_back({1, {1}, true});

    EXPECT_EQ(load(std::move(request)).estimate().ceiling.value(), 2u);
}

TEST_F(FeasibilityTest, NoGroupsMeansUnbounded) {
    auto request = two_by_two_request(1);
    request.groups.clear();
    auto& estimator = load(std::move(request));

    EXPECT_FALSE(estimator.estimate().ceiling.has_value());
    EXPECT_NO_THROW(estimator.check(1000000));
}

// Skipping an optional member always frees the group
TEST_F(FeasibilityTest, OptionalLayerUnboundsGroup) {
    auto request = two_by_two_request(1);
    request.layers.push_back(make_layer(3, "Hat", 2, {make_trait(5, "Cap")}, true));
    request.groups[0].layers.push_back(3);

    EXPECT_FALSE(load(std::move(request)).estimate().ceiling.has_value());
}

TEST_F(FeasibilityTest, SmallestGroupLimits) {
    auto request = two_by_two_request(1);
    request.layers[1].traits.push_back(make_trait(6, "Triangle"));
    request.groups.push_back({7, {1}, true});

    auto report = load(std::move(request)).estimate();
    EXPECT_EQ(report.ceiling.value(), 2u);
    EXPECT_EQ(report.limiting_group.value(), 7u);
    EXPECT_FALSE(report.exact);
}

// Over budget the estimate falls back to the domain product
TEST_F(FeasibilityTest, BudgetFallback) {
    auto report = load(red_forbids_square_request(1), 2).estimate();
    EXPECT_EQ(report.ceiling.value(), 4u);
    EXPECT_FALSE(report.exact);
}

TEST_F(FeasibilityTest, UnsatisfiableCatalogHasZeroCeiling) {
    auto request = base_request(1);
    request.layers.push_back(make_layer(1, "A", 0, {make_ruler(1, "Only", 2, {2})}));
    request.layers.push_back(make_layer(2, "B", 1, {make_trait(2, "x")}));
    auto& estimator = load(std::move(request));

    EXPECT_EQ(estimator.estimate().ceiling.value(), 0u);
    EXPECT_NO_THROW(estimator.check(0));
    EXPECT_THROW(estimator.check(1), FeasibilityError);
}

// Arc consistent but without a full solution, and no group to enumerate
TEST_F(FeasibilityTest, ArcConsistentButUnsolvable) {
    auto& estimator = load(all_different_request(1));
    EXPECT_TRUE(solver->root_consistent());
    EXPECT_FALSE(solver->satisfiable({}));

    auto report = estimator.estimate();
    ASSERT_TRUE(report.ceiling.has_value());
    EXPECT_EQ(*report.ceiling, 0u);
    EXPECT_TRUE(report.exact);
    EXPECT_FALSE(report.limiting_group.has_value());
    EXPECT_THROW(estimator.check(1), FeasibilityError);
}

// Dropping one layer makes the same rules solvable again
TEST_F(FeasibilityTest, SolvableRulesStayUnbounded) {
    auto request = all_different_request(1);
    request.layers.pop_back();
    for (auto& trait : request.layers[0].traits) trait.rules.pop_back();
    for (auto& trait : request.layers[1].traits) {
        trait.rules.clear();
        trait.role = TraitRole::Normal;
    }
    auto& estimator = load(std::move(request));

    EXPECT_FALSE(estimator.estimate().ceiling.has_value());
    EXPECT_NO_THROW(estimator.check(50));
}

TEST_F(FeasibilityTest, InactiveGroupIgnored) {
    auto request = two_by_two_request(1);
    request.groups[0].active = false;
    EXPECT_FALSE(load(std::move(request)).estimate().ceiling.has_value());
}
