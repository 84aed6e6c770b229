#pragma once
#include "types.hpp"
#include "BinaryLabelDataset.hpp"
#include "EvaluationTypes.hpp"
#include "TradeoffEvaluator.hpp"

#include <string>
#include <vector>
#include <optional> // For std::optional

// Function to print the bias report of a dataset (consistency and mean difference)
void printDatasetAnalysis(const std::string &datasetName,
                          const FairnessMetrics &metrics,
                          const BinaryLabelDataset &dataset);

// Function to print one metric of a sweep as a table, one row per regularization strength and one column per learning rate
void printGridTable(const std::string &title,
                    const HyperparameterGridResult &grid,
                    const std::vector<double> &values);

// Function to run a hyperparameter sweep with results printing. Returns std::nullopt if the sweep failed.
std::optional<HyperparameterGridResult> runHyperparameterSweep(
    const std::string &experimentName,
    const TradeoffEvaluator &evaluator,
    const BinaryLabelDataset &train,
    const std::vector<double> &learningRates,
    const std::vector<double> &regStrengths,
    const FitOptions &baseOptions);

// Function to fit once on train, evaluate on test and print the scores. Returns std::nullopt if the fit failed.
std::optional<FitResult> runFit(
    const std::string &experimentName,
    const TradeoffEvaluator &evaluator,
    const BinaryLabelDataset &train,
    const BinaryLabelDataset &test,
    const FitOptions &options);

// Function to refit the most accurate, most fair and best trade-off settings of a sweep on the test split
void runSelectedModels(
    const std::string &experimentName,
    const TradeoffEvaluator &evaluator,
    const BinaryLabelDataset &train,
    const BinaryLabelDataset &test,
    const HyperparameterGridResult &grid,
    const FitOptions &baseOptions);
