#include "types.hpp"
#include "BinaryLabelDataset.hpp"
#include "EvaluationTypes.hpp"
#include "ExperimentRunner.hpp"
#include "SyntheticData.hpp"
#include "TradeoffEvaluator.hpp"

#include <string>
#include <vector>
#include <iostream>  // For input/output (std::cout, std::cerr)
#include <stdexcept> // For std::exception
#include <optional>  // For std::optional
#include <algorithm> // For std::max
#include <thread>    // For std::thread::hardware_concurrency
#include <chrono>    // For timing.
#include <utility>   // For std::move

// Parameters shared by every experiment
const size_t NUM_SAMPLES = 3000;
const double FLIP_PROBABILITY = 0.15;
const double SIGNAL_STRENGTH = 0.5;
const unsigned int DATA_SEED = 888;
const unsigned int ALGO_SEED = TradeoffEvaluator::DEFAULT_SEED;
const double TRAIN_FRACTION = 0.7;
const std::string SENSITIVE_FEATURE = "sex";
const std::vector<double> LEARNING_RATES = {1e-1, 1e-2, 1e-3, 1e-4, 1e-5, 1e-6, 1e-7};
const std::vector<double> REG_STRENGTHS = {1e-1, 1e-2, 1e-3, 1e-4, 1e-5, 1e-6, 1e-7};

struct ExperimentContext
{
    BinaryLabelDataset train;
    BinaryLabelDataset test;
    TradeoffEvaluator evaluator;
};

ExperimentContext makeContext()
{
    BinaryLabelDataset data = generateBiasedData(NUM_SAMPLES, FLIP_PROBABILITY, SIGNAL_STRENGTH, DATA_SEED);
    auto [train, test] = data.split(TRAIN_FRACTION, ALGO_SEED);

    const int numThreads = std::max(1u, std::thread::hardware_concurrency() / 2);
    TradeoffEvaluator evaluator(SENSITIVE_FEATURE, numThreads, ALGO_SEED, true);

    std::cout << "Generated " << NUM_SAMPLES << " samples, " << train.numInstances() << " for training and "
              << test.numInstances() << " for testing." << std::endl;

    return ExperimentContext{std::move(train), std::move(test), evaluator};
}

void runAnalysisExperiment(ExperimentContext &context)
{
    std::cout << "Running dataset analysis..." << std::endl;
    const FairnessMetrics &metrics = context.evaluator.metrics();
    printDatasetAnalysis("training split", metrics, context.train);
    printDatasetAnalysis("reweighed training split", metrics, metrics.reweigh(context.train));
    printDatasetAnalysis("test split", metrics, context.test);
}

// Sweep the grid with the given pre-processing, then refit the selected settings on the test split
void runTradeoffExperiment(ExperimentContext &context, const std::string &experimentName, const FitOptions &baseOptions)
{
    std::cout << "Running " << experimentName << " experiment..." << std::endl;

    std::optional<HyperparameterGridResult> grid = runHyperparameterSweep(
        experimentName, context.evaluator, context.train, LEARNING_RATES, REG_STRENGTHS, baseOptions);
    if (!grid)
    {
        std::cerr << "Skipping model selection for " << experimentName << "." << std::endl;
        return;
    }
    runSelectedModels(experimentName, context.evaluator, context.train, context.test, *grid, baseOptions);

    std::cout << "\n" << experimentName << " experiment completed." << std::endl;
}

void runStandardExperiment(ExperimentContext &context)
{
    FitOptions options;
    runTradeoffExperiment(context, "Standard", options);
}

void runReweighExperiment(ExperimentContext &context)
{
    FitOptions options;
    options.reweight = true;
    runTradeoffExperiment(context, "Reweigh", options);
}

void runSuppressExperiment(ExperimentContext &context)
{
    FitOptions options;
    options.suppressSens = true;
    options.onlySens = true;
    runTradeoffExperiment(context, "SuppressSex", options);

    options.onlySens = false;
    runTradeoffExperiment(context, "SuppressAll", options);
}

int main(int argc, char *argv[])
{
    auto start = std::chrono::high_resolution_clock::now();

    if (argc != 2)
    {
        std::cerr << "Usage: " << argv[0] << " <ExperimentName>" << std::endl;
        std::cerr << "Available ExperimentName: Analysis, Standard, Reweigh, Suppress, All" << std::endl;
        return 1;
    }

    std::string experimentName = argv[1];

    try
    {
        if (experimentName != "Analysis" && experimentName != "Standard" && experimentName != "Reweigh" &&
            experimentName != "Suppress" && experimentName != "All")
        {
            std::cerr << "Unknown ExperimentName: " << experimentName << std::endl;
            std::cerr << "Available ExperimentName: Analysis, Standard, Reweigh, Suppress, All" << std::endl;
            return 1;
        }

        ExperimentContext context = makeContext();
        if (experimentName == "Analysis" || experimentName == "All")
            runAnalysisExperiment(context);
        if (experimentName == "Standard" || experimentName == "All")
            runStandardExperiment(context);
        if (experimentName == "Reweigh" || experimentName == "All")
            runReweighExperiment(context);
        if (experimentName == "Suppress" || experimentName == "All")
            runSuppressExperiment(context);
    }
    catch (const std::exception &e)
    {
        std::cerr << "\n!!! An exception occurred during execution: " << e.what() << std::endl;
        return 1;
    }

    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = end - start;
    std::cout << "Experiment " << experimentName << " completed in " << elapsed.count() << " seconds." << std::endl;
    return 0;
}
