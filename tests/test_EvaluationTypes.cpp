#include "EvaluationTypes.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <optional>
#include <stdexcept>

static CrossValidationResult makeCv(double accuracy, std::optional<double> fairness)
{
    CrossValidationResult cv;
    cv.accuracy = accuracy;
    cv.fairness = fairness;
    if (fairness)
        cv.tradeoff = accuracy - *fairness * *fairness;
    cv.epoch = 200.0;
    cv.numFolds = 5;
    return cv;
}

TEST(HyperparameterGridResultTest, UndefinedMetricsAreStoredAsNaN)
{
    HyperparameterGridResult grid;
    grid.append(0.1, 0.01, makeCv(0.8, -0.2));
    grid.append(0.01, 0.01, makeCv(0.7, std::nullopt));

    ASSERT_EQ(grid.size(), 2u);
    EXPECT_DOUBLE_EQ(grid.fairness[0], -0.2);
    EXPECT_TRUE(std::isnan(grid.fairness[1]));
    EXPECT_TRUE(std::isnan(grid.tradeoff[1]));
    EXPECT_DOUBLE_EQ(grid.accuracy[1], 0.7);
}

TEST(HyperparameterGridResultTest, BestIndexPerCriterion)
{
    HyperparameterGridResult grid;
    grid.append(0.1, 0.1, makeCv(0.90, -0.40));  // most accurate
    grid.append(0.1, 0.01, makeCv(0.70, 0.05));  // most fair
    grid.append(0.01, 0.1, makeCv(0.85, -0.10)); // best tradeoff
    grid.append(0.01, 0.01, makeCv(0.95, std::nullopt));

    // An undefined fairness does not exclude a trial from the accuracy ranking
    EXPECT_EQ(grid.bestIndex(GridCriterion::MostAccurate), std::optional<size_t>(3));
    EXPECT_EQ(grid.bestIndex(GridCriterion::MostFair), std::optional<size_t>(1));
    EXPECT_EQ(grid.bestIndex(GridCriterion::BestTradeoff), std::optional<size_t>(2));
}

TEST(HyperparameterGridResultTest, TiesKeepTheFirstTrial)
{
    HyperparameterGridResult grid;
    grid.append(0.1, 0.1, makeCv(0.8, 0.1));
    grid.append(0.01, 0.1, makeCv(0.8, -0.1));
    EXPECT_EQ(grid.bestIndex(GridCriterion::MostAccurate), std::optional<size_t>(0));
    EXPECT_EQ(grid.bestIndex(GridCriterion::MostFair), std::optional<size_t>(0));
}

TEST(HyperparameterGridResultTest, NoQualifyingTrial)
{
    HyperparameterGridResult grid;
    EXPECT_FALSE(grid.bestIndex(GridCriterion::MostAccurate).has_value());

    grid.append(0.1, 0.1, makeCv(0.8, std::nullopt));
    EXPECT_FALSE(grid.bestIndex(GridCriterion::MostFair).has_value());
    EXPECT_FALSE(grid.bestIndex(GridCriterion::BestTradeoff).has_value());
}

TEST(HyperparameterGridResultTest, InconsistentSequencesThrow)
{
    HyperparameterGridResult grid;
    grid.append(0.1, 0.1, makeCv(0.8, 0.1));
    grid.epoch.push_back(100.0);
    EXPECT_THROW(grid.checkConsistency(), std::logic_error);
    EXPECT_THROW(grid.size(), std::logic_error);
}
