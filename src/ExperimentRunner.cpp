#include "ExperimentRunner.hpp"
#include "FairnessMetrics.hpp"
#include "types.hpp"

#include <string>
#include <vector>
#include <iostream>
#include <iomanip>   // For std::setw, std::setprecision
#include <sstream>   // For std::ostringstream
#include <optional>  // For std::optional
#include <stdexcept> // For std::exception
#include <algorithm> // For std::find, std::min
#include <utility>   // For std::pair
#include <cmath>     // For std::isnan

// Formats through a private stream, std::cout state is left alone
static std::string formatOptional(const std::optional<double> &value, int precision)
{
    if (!value)
        return "undefined";
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << *value;
    return out.str();
}

// Distinct values in order of first appearance
static std::vector<double> uniqueInOrder(const std::vector<double> &values)
{
    std::vector<double> unique;
    for (double value : values)
    {
        if (std::find(unique.begin(), unique.end(), value) == unique.end())
            unique.push_back(value);
    }
    return unique;
}

void printDatasetAnalysis(const std::string &datasetName,
                          const FairnessMetrics &metrics,
                          const BinaryLabelDataset &dataset)
{
    std::cout << "\nAnalyzing " << datasetName << " (N=" << dataset.numInstances()
              << ", protected attribute=" << metrics.protectedAttribute() << ")..." << std::endl;
    try
    {
        DatasetBiasReport report = metrics.datasetAnalysis(dataset);
        std::cout << "Consistency: " << formatOptional(report.consistency, 4) << std::endl;
        std::cout << "Mean difference: " << formatOptional(report.meanDifference, 4) << std::endl;
        printVector("Protected attribute values (first rows)",
                    dataset.protectedAttributeValues(metrics.protectedAttribute()).head(std::min<Eigen::Index>(10, dataset.numInstances())));
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error during dataset analysis: " << e.what() << std::endl;
    }
}

void printGridTable(const std::string &title,
                    const HyperparameterGridResult &grid,
                    const std::vector<double> &values)
{
    std::vector<double> learningRates = uniqueInOrder(grid.learningRate);
    std::vector<double> regStrengths = uniqueInOrder(grid.regStrength);

    std::cout << "\n" << title << " (rows: regularization strength, columns: learning rate)" << std::endl;
    std::cout << std::setw(10) << "reg\\lr";
    for (double lr : learningRates)
        std::cout << std::setw(10) << lr;
    std::cout << std::endl;

    for (double reg : regStrengths)
    {
        std::cout << std::setw(10) << reg;
        for (double lr : learningRates)
        {
            std::string cell = "-";
            for (size_t i = 0; i < grid.size(); ++i)
            {
                if (grid.learningRate[i] == lr && grid.regStrength[i] == reg)
                {
                    std::ostringstream out;
                    if (std::isnan(values[i]))
                        out << "nan";
                    else
                        out << std::fixed << std::setprecision(4) << values[i];
                    cell = out.str();
                    break;
                }
            }
            std::cout << std::setw(10) << cell;
        }
        std::cout << std::endl;
    }
}

std::optional<HyperparameterGridResult> runHyperparameterSweep(
    const std::string &experimentName,
    const TradeoffEvaluator &evaluator,
    const BinaryLabelDataset &train,
    const std::vector<double> &learningRates,
    const std::vector<double> &regStrengths,
    const FitOptions &baseOptions)
{
    std::cout << "\nRunning hyperparameter sweep " << experimentName << " ("
              << learningRates.size() << " learning rates x " << regStrengths.size()
              << " regularization strengths, epochs=" << baseOptions.epochs
              << ", reweight=" << (baseOptions.reweight ? "true" : "false")
              << ", suppressSens=" << (baseOptions.suppressSens ? "true" : "false")
              << ", onlySens=" << (baseOptions.onlySens ? "true" : "false") << ")..." << std::endl;

    try
    {
        HyperparameterGridResult grid = evaluator.testHyperparameters(train, learningRates, regStrengths, baseOptions);

        printGridTable(experimentName + " mean accuracy", grid, grid.accuracy);
        printGridTable(experimentName + " mean equal opportunity difference", grid, grid.fairness);
        printGridTable(experimentName + " mean tradeoff", grid, grid.tradeoff);
        printGridTable(experimentName + " mean epochs", grid, grid.epoch);
        return grid;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error during hyperparameter sweep: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<FitResult> runFit(
    const std::string &experimentName,
    const TradeoffEvaluator &evaluator,
    const BinaryLabelDataset &train,
    const BinaryLabelDataset &test,
    const FitOptions &options)
{
    std::cout << "\nFitting " << experimentName << " (lr=" << options.learningRate
              << ", reg=" << options.regStrength << ", epochs=" << options.epochs << ")..." << std::endl;

    try
    {
        FitOutcome outcome = evaluator.fit(train, test, options);
        const FitResult &result = outcome.result;

        std::cout << "Epochs trained: " << result.epoch << std::endl;
        std::cout << "Accuracy: " << formatOptional(100.0 * result.accuracy, 2) << "%" << std::endl;
        std::cout << "Equal opportunity difference: " << formatOptional(result.fairness, 4) << std::endl;
        std::cout << "Tradeoff: " << formatOptional(result.tradeoff, 4) << std::endl;

        ConfusionMatrix cm = FairnessMetrics::confusionMatrix(test.labels(), outcome.testPredictions.labels());
        std::cout << "Confusion matrix (rows: true 0/1, columns: predicted 0/1):" << std::endl;
        std::cout << std::setw(8) << cm.trueNegative << std::setw(8) << cm.falsePositive << std::endl;
        std::cout << std::setw(8) << cm.falseNegative << std::setw(8) << cm.truePositive << std::endl;
        return result;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error during fit: " << e.what() << std::endl;
    }
    return std::nullopt;
}

void runSelectedModels(
    const std::string &experimentName,
    const TradeoffEvaluator &evaluator,
    const BinaryLabelDataset &train,
    const BinaryLabelDataset &test,
    const HyperparameterGridResult &grid,
    const FitOptions &baseOptions)
{
    const std::vector<std::pair<std::string, GridCriterion>> selections = {
        {"accurate", GridCriterion::MostAccurate},
        {"fair", GridCriterion::MostFair},
        {"tradeoff", GridCriterion::BestTradeoff}};

    for (const auto &[label, criterion] : selections)
    {
        std::optional<size_t> best = grid.bestIndex(criterion);
        if (!best)
        {
            std::cerr << "runSelectedModels: Warning: no trial qualifies as the most " << label
                      << " model of " << experimentName << "." << std::endl;
            continue;
        }

        FitOptions options = baseOptions;
        options.learningRate = grid.learningRate[*best];
        options.regStrength = grid.regStrength[*best];
        runFit(experimentName + "_" + label, evaluator, train, test, options);
    }
}
