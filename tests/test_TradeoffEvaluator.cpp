#include "TradeoffEvaluator.hpp"
#include "BinaryLabelDataset.hpp"
#include "EvaluationTypes.hpp"
#include "StratifiedKFold.hpp"
#include "SyntheticData.hpp"
#include "types.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <vector>

static FitOptions makeOptions(double lr, double reg, int epochs)
{
    FitOptions options;
    options.learningRate = lr;
    options.regStrength = reg;
    options.epochs = epochs;
    return options;
}

TEST(TradeoffEvaluatorTest, SeparableDataIsLearnedFairly)
{
    BinaryLabelDataset data = generateSeparableData(1000, 0.5, 7);
    auto [train, test] = data.split(0.7, 16);

    TradeoffEvaluator evaluator("sex");
    FitOutcome outcome = evaluator.fit(train, test, makeOptions(0.1, 0.0, 1000));
    const FitResult &result = outcome.result;

    EXPECT_GE(result.accuracy, 0.95);
    ASSERT_TRUE(result.fairness.has_value());
    EXPECT_LE(std::abs(*result.fairness), 0.05);
    ASSERT_TRUE(result.tradeoff.has_value());
    EXPECT_NEAR(*result.tradeoff, result.accuracy - *result.fairness * *result.fairness, 1e-12);
    EXPECT_GE(result.epoch, 1);
    EXPECT_LE(result.epoch, 1000);

    // The prediction-labelled copy keeps the test rows and groups
    EXPECT_EQ(outcome.testPredictions.numInstances(), test.numInstances());
    EXPECT_TRUE(outcome.testPredictions.protectedAttributeValues("sex").isApprox(test.protectedAttributeValues("sex")));
}

TEST(TradeoffEvaluatorTest, ReweighingReducesEqualOpportunityGap)
{
    BinaryLabelDataset data = generateBiasedData(2000, 0.15, 0.5, 888);
    auto [train, test] = data.split(0.7, 16);

    TradeoffEvaluator evaluator("sex");
    FitOptions options = makeOptions(0.1, 0.0, 5000);
    FitResult standard = evaluator.fit(train, test, options).result;

    options.reweight = true;
    FitResult reweighed = evaluator.fit(train, test, options).result;

    ASSERT_TRUE(standard.fairness.has_value());
    ASSERT_TRUE(reweighed.fairness.has_value());
    EXPECT_GT(std::abs(*standard.fairness), 0.5);
    EXPECT_LT(std::abs(*reweighed.fairness), std::abs(*standard.fairness));
}

TEST(TradeoffEvaluatorTest, TrainingStopsAtACheckpoint)
{
    BinaryLabelDataset data = generateBiasedData(1000, 0.15, 0.5, 888);
    auto [train, test] = data.split(0.7, 16);

    TradeoffEvaluator evaluator("sex");
    FitResult result = evaluator.fit(train, test, makeOptions(0.1, 0.0, 100000)).result;
    EXPECT_LT(result.epoch, 100000);
    EXPECT_EQ(result.epoch % 100, 0);
    EXPECT_GE(result.epoch, 200);
}

TEST(TradeoffEvaluatorTest, BudgetBelowCheckIntervalRunsEveryEpoch)
{
    BinaryLabelDataset data = generateBiasedData(300, 0.15, 0.5, 888);
    auto [train, test] = data.split(0.7, 16);

    TradeoffEvaluator evaluator("sex");
    FitResult result = evaluator.fit(train, test, makeOptions(0.1, 0.0, 50)).result;
    EXPECT_EQ(result.epoch, 50);
}

TEST(TradeoffEvaluatorTest, FitsAreReproducible)
{
    BinaryLabelDataset data = generateBiasedData(400, 0.15, 0.5, 888);
    auto [train, test] = data.split(0.7, 16);

    TradeoffEvaluator evaluator("sex");
    FitOptions options = makeOptions(0.05, 0.01, 500);
    FitResult first = evaluator.fit(train, test, options).result;
    FitResult second = evaluator.fit(train, test, options).result;
    EXPECT_EQ(first.accuracy, second.accuracy);
    EXPECT_EQ(first.fairness, second.fairness);
    EXPECT_EQ(first.epoch, second.epoch);
}

TEST(TradeoffEvaluatorTest, SuppressionRemovesSensitiveColumns)
{
    BinaryLabelDataset data = generateBiasedData(400, 0.15, 0.5, 888);
    auto [train, test] = data.split(0.7, 16);

    TradeoffEvaluator evaluator("sex");
    FitOptions options = makeOptions(0.1, 0.0, 300);
    options.suppressSens = true;

    options.onlySens = true;
    FitOutcome onlySex = evaluator.fit(train, test, options);
    EXPECT_EQ(onlySex.testPredictions.numFeatures(), 2);

    options.onlySens = false;
    FitOutcome allSensitive = evaluator.fit(train, test, options);
    EXPECT_EQ(allSensitive.testPredictions.numFeatures(), 1);

    // Group membership survives suppression, so fairness is still measured
    EXPECT_TRUE(allSensitive.result.fairness.has_value());

    // Combined with reweighing
    options.reweight = true;
    EXPECT_NO_THROW(evaluator.fit(train, test, options));
}

TEST(TradeoffEvaluatorTest, UndefinedFairnessIsEmpty)
{
    BinaryLabelDataset data = generateBiasedData(600, 0.15, 0.5, 888);
    auto [train, test] = data.split(0.7, 16);

    // Keep no truly favorable unprivileged row in the test partition
    Vector sex = test.protectedAttributeValues("sex");
    IndexList rows;
    for (int i = 0; i < static_cast<int>(test.numInstances()); ++i)
    {
        if (!(sex(i) == UNPRIVILEGED_VALUE && test.labels()(i) == FAVORABLE_LABEL))
            rows.push_back(i);
    }

    TradeoffEvaluator evaluator("sex");
    FitResult result = evaluator.fit(train, test.subset(rows), makeOptions(0.1, 0.0, 300)).result;
    EXPECT_FALSE(result.fairness.has_value());
    EXPECT_FALSE(result.tradeoff.has_value());
    EXPECT_GE(result.accuracy, 0.0);
    EXPECT_LE(result.accuracy, 1.0);
}

TEST(TradeoffEvaluatorTest, InvalidSettingsThrow)
{
    BinaryLabelDataset data = generateBiasedData(200, 0.15, 0.5, 888);
    auto [train, test] = data.split(0.7, 16);
    TradeoffEvaluator evaluator("sex");

    EXPECT_THROW(evaluator.fit(train, test, makeOptions(0.0, 0.0, 100)), std::invalid_argument);
    EXPECT_THROW(evaluator.fit(train, test, makeOptions(0.1, -1.0, 100)), std::invalid_argument);
    EXPECT_THROW(evaluator.fit(train, test, makeOptions(0.1, 0.0, 0)), std::invalid_argument);
    EXPECT_THROW(evaluator.crossValidation(train, makeOptions(0.1, 0.0, 100), 1), std::invalid_argument);

    TradeoffEvaluator unknown("age");
    EXPECT_THROW(unknown.fit(train, test, makeOptions(0.1, 0.0, 100)), std::invalid_argument);
    EXPECT_THROW(unknown.crossValidation(train, makeOptions(0.1, 0.0, 100)), std::invalid_argument);
}

TEST(TradeoffEvaluatorTest, ParallelFoldsMatchSequentialRun)
{
    BinaryLabelDataset data = generateBiasedData(500, 0.15, 0.5, 888);
    FitOptions options = makeOptions(0.1, 0.001, 400);

    CrossValidationResult sequential = TradeoffEvaluator("sex", 1).crossValidation(data, options);
    CrossValidationResult parallel = TradeoffEvaluator("sex", 3).crossValidation(data, options);

    EXPECT_EQ(sequential.numFolds, 5);
    EXPECT_EQ(parallel.numFolds, 5);
    EXPECT_EQ(sequential.accuracy, parallel.accuracy);
    EXPECT_EQ(sequential.fairness, parallel.fairness);
    EXPECT_EQ(sequential.tradeoff, parallel.tradeoff);
    EXPECT_EQ(sequential.epoch, parallel.epoch);
    EXPECT_EQ(sequential.numUndefinedFolds, 0);
}

TEST(TradeoffEvaluatorTest, UndefinedFoldsAreExcludedFromTheMean)
{
    // Only two favorable unprivileged rows, so at most two folds can measure the gap
    const int n = 100;
    Matrix X(n, 2);
    Vector y(n);
    for (int i = 0; i < n; ++i)
    {
        bool privileged = i % 2 == 1;
        bool favorable = privileged ? (i % 4 == 1) : (i == 0 || i == 2);
        X(i, 0) = privileged ? PRIVILEGED_VALUE : UNPRIVILEGED_VALUE;
        X(i, 1) = (favorable ? 1.0 : -1.0) + 0.01 * (i % 7);
        y(i) = favorable ? FAVORABLE_LABEL : UNFAVORABLE_LABEL;
    }
    BinaryLabelDataset data(X, y, {"sex", "x"}, {"sex"});

    FitOptions options = makeOptions(0.1, 0.0, 300);
    TradeoffEvaluator evaluator("sex");
    CrossValidationResult cv = evaluator.crossValidation(data, options);
    EXPECT_EQ(cv.numFolds, 5);
    EXPECT_GE(cv.numUndefinedFolds, 3);
    EXPECT_EQ(cv.fairness.has_value(), cv.numUndefinedFolds < cv.numFolds);
    EXPECT_GT(cv.accuracy, 0.9);

    // Refit the same folds: accuracy and epochs average all of them, fairness only the defined ones
    std::vector<FoldIndices> folds = StratifiedKFold(5, TradeoffEvaluator::DEFAULT_SEED).split(data.labels());
    double accuracySum = 0.0, epochSum = 0.0, fairnessSum = 0.0;
    int numDefined = 0;
    for (const FoldIndices &fold : folds)
    {
        FitResult result = evaluator.fit(data.subset(fold.train), data.subset(fold.test), options).result;
        accuracySum += result.accuracy;
        epochSum += result.epoch;
        if (result.fairness)
        {
            fairnessSum += *result.fairness;
            ++numDefined;
        }
    }
    EXPECT_EQ(numDefined, cv.numFolds - cv.numUndefinedFolds);
    EXPECT_DOUBLE_EQ(cv.accuracy, accuracySum / folds.size());
    EXPECT_DOUBLE_EQ(cv.epoch, epochSum / folds.size());
    if (numDefined > 0)
    {
        ASSERT_TRUE(cv.fairness.has_value());
        EXPECT_DOUBLE_EQ(*cv.fairness, fairnessSum / numDefined);
    }
}

TEST(TradeoffEvaluatorTest, GridIsOrderedLearningRateMajor)
{
    BinaryLabelDataset data = generateBiasedData(300, 0.15, 0.5, 888);
    const std::vector<double> learningRates = {0.1, 0.01};
    const std::vector<double> regStrengths = {0.1, 0.01, 0.001};

    TradeoffEvaluator evaluator("sex", 2);
    HyperparameterGridResult grid = evaluator.testHyperparameters(data, learningRates, regStrengths, makeOptions(1.0, 0.0, 200));

    const size_t R = regStrengths.size();
    ASSERT_EQ(grid.size(), learningRates.size() * R);
    for (size_t i = 0; i < learningRates.size(); ++i)
    {
        for (size_t j = 0; j < R; ++j)
        {
            EXPECT_DOUBLE_EQ(grid.learningRate[i * R + j], learningRates[i]);
            EXPECT_DOUBLE_EQ(grid.regStrength[i * R + j], regStrengths[j]);
        }
    }
    for (size_t k = 0; k < grid.size(); ++k)
    {
        EXPECT_GE(grid.accuracy[k], 0.0);
        EXPECT_LE(grid.accuracy[k], 1.0);
        EXPECT_GE(grid.epoch[k], 1.0);
        EXPECT_LE(grid.epoch[k], 200.0);
    }

    // Each cell equals a direct cross-validation with the same settings
    CrossValidationResult cell = evaluator.crossValidation(data, makeOptions(0.01, 0.001, 200));
    EXPECT_EQ(grid.accuracy[1 * R + 2], cell.accuracy);

    EXPECT_THROW(evaluator.testHyperparameters(data, {}, regStrengths, FitOptions()), std::invalid_argument);
}
