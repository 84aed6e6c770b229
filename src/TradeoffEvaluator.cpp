#include "TradeoffEvaluator.hpp"
#include "BinaryLabelDataset.hpp"
#include "BinaryCrossEntropyLoss.hpp"
#include "EarlyStopping.hpp"
#include "EvaluationTypes.hpp"
#include "FairnessMetrics.hpp"
#include "LogisticRegressionModel.hpp"
#include "SGDOptimizer.hpp"
#include "StandardScaler.hpp"
#include "StratifiedKFold.hpp"
#include "types.hpp"

#include <vector>
#include <string>
#include <optional>  // For std::optional
#include <utility>   // For std::pair, std::move
#include <stdexcept> // For std::invalid_argument, std::runtime_error
#include <algorithm> // For std::min, std::max
#include <future>    // For std::async, std::future
#include <cmath>     // For std::isfinite
#include <iostream>  // For progress output and warnings

// Constructor
TradeoffEvaluator::TradeoffEvaluator(const std::string &sensitiveFeature,
                                     int numParallelFits,
                                     unsigned int seed,
                                     bool verbose)
    : _metrics(sensitiveFeature),
      _numParallelFits(std::max(1, numParallelFits)),
      _seed(seed),
      _verbose(verbose)
{
}

void TradeoffEvaluator::_checkOptions(const FitOptions &options)
{
    if (!(options.learningRate > 0.0) || !std::isfinite(options.learningRate))
        throw std::invalid_argument("TradeoffEvaluator: Learning rate must be positive, got " + std::to_string(options.learningRate) + ".");
    if (!(options.regStrength >= 0.0) || !std::isfinite(options.regStrength))
        throw std::invalid_argument("TradeoffEvaluator: Regularization strength must be non-negative, got " + std::to_string(options.regStrength) + ".");
    if (options.epochs <= 0)
        throw std::invalid_argument("TradeoffEvaluator: Number of epochs must be positive, got " + std::to_string(options.epochs) + ".");
}

FitOutcome TradeoffEvaluator::fit(const BinaryLabelDataset &train,
                                  const BinaryLabelDataset &test,
                                  const FitOptions &options) const
{
    _checkOptions(options);
    _metrics.checkDataset(train);
    _metrics.checkDataset(test);

    // Suppress one or all sensitive features before scaling
    BinaryLabelDataset trainData = train.copy();
    BinaryLabelDataset testData = test.copy();
    if (options.suppressSens)
    {
        auto suppressed = _metrics.suppressSensitive(trainData, testData, options.onlySens);
        trainData = std::move(suppressed.first);
        testData = std::move(suppressed.second);
    }

    // Scale with the statistics of the training partition only
    StandardScaler scaler;
    Matrix xTrain = scaler.fitTransform(trainData.features());
    Matrix xTest = scaler.transform(testData.features());
    const Vector &yTrain = trainData.labels();
    const Vector &yTest = testData.labels();

    // Fresh parameters for every fit
    LogisticRegressionModel model(xTrain.cols(), _seed);
    SGDOptimizer optimizer(options.learningRate, options.regStrength);

    // Reweighing only changes the loss that drives the updates
    std::optional<Vector> trainWeights;
    if (options.reweight)
    {
        trainWeights = _metrics.reweigh(trainData).instanceWeights();
    }
    BinaryCrossEntropyLoss trainLoss(trainWeights);
    BinaryCrossEntropyLoss validationLoss;

    EarlyStopping stopping;
    int epoch = 0;
    while (epoch < options.epochs)
    {
        Vector probabilities = model.predictProba(xTrain);
        Vector gradient = model.parameterGradient(xTrain, trainLoss.logitGradient(probabilities, yTrain));
        optimizer.step(model, gradient);
        ++epoch;

        bool converged = stopping.update(epoch, [&]()
                                         { return validationLoss.value(model.predictProba(xTest), yTest); });
        if (converged)
            break;
    }

    if (!model.parameters().allFinite())
    {
        throw std::runtime_error("TradeoffEvaluator::fit: Parameters became non-finite after " + std::to_string(epoch) +
                                 " epochs (learning rate " + std::to_string(options.learningRate) + ").");
    }

    // Score the rounded predictions on the test partition
    Vector predictedLabels = model.predict(xTest);
    FitResult result;
    result.accuracy = FairnessMetrics::accuracyScore(predictedLabels, yTest);

    BinaryLabelDataset testPredictions = testData.withLabels(predictedLabels);
    result.fairness = _metrics.equalOpportunityDifference(testData, testPredictions);
    if (result.fairness)
    {
        result.tradeoff = FairnessMetrics::tradeoffMetric(result.accuracy, *result.fairness);
    }
    result.epoch = epoch;

    return FitOutcome{result, std::move(testPredictions)};
}

FitResult TradeoffEvaluator::_fitFold(const BinaryLabelDataset &data, const FoldIndices &fold, const FitOptions &options) const
{
    BinaryLabelDataset trainFold = data.subset(fold.train);
    BinaryLabelDataset testFold = data.subset(fold.test);
    return fit(trainFold, testFold, options).result;
}

std::vector<FitResult> TradeoffEvaluator::_fitFolds(const BinaryLabelDataset &data,
                                                    const std::vector<FoldIndices> &folds,
                                                    const FitOptions &options) const
{
    int numFolds = static_cast<int>(folds.size());
    int numWorkers = std::min(_numParallelFits, numFolds);
    std::vector<FitResult> results(static_cast<size_t>(numFolds));

    if (numWorkers <= 1)
    {
        for (int f = 0; f < numFolds; ++f)
        {
            results[static_cast<size_t>(f)] = _fitFold(data, folds[static_cast<size_t>(f)], options);
        }
        return results;
    }

    /**
     * Define a lambda function for a single worker
     * Each worker handles folds [startFold, endFold)
     */
    auto taskLambda = [&](int startFold, int endFold) -> std::vector<std::pair<int, FitResult>>
    {
        std::vector<std::pair<int, FitResult>> workerResults;
        workerResults.reserve(static_cast<size_t>(endFold - startFold));
        for (int f = startFold; f < endFold; ++f)
        {
            workerResults.emplace_back(f, _fitFold(data, folds[static_cast<size_t>(f)], options));
        }
        return workerResults;
    }; // End of taskLambda

    std::vector<std::future<std::vector<std::pair<int, FitResult>>>> futures;
    futures.reserve(static_cast<size_t>(numWorkers));

    int tasksPerWorker = numFolds / numWorkers;
    int remainingTasks = numFolds % numWorkers;
    int startIndex = 0;

    // Launch tasks in parallel
    for (int i = 0; i < numWorkers; ++i)
    {
        int batchSize = tasksPerWorker + (i < remainingTasks ? 1 : 0); // Distribute remaining tasks
        int endIndex = startIndex + batchSize;
        futures.push_back(std::async(std::launch::async, taskLambda, startIndex, endIndex));
        startIndex = endIndex;
    }

    // Collect results from all workers into their fold slots, waiting for every worker before rethrowing
    std::string firstError;
    for (auto &future : futures)
    {
        try
        {
            for (auto &indexedResult : future.get())
            {
                results[static_cast<size_t>(indexedResult.first)] = indexedResult.second;
            }
        }
        catch (const std::exception &e)
        {
            if (firstError.empty())
                firstError = e.what();
        }
    }
    if (!firstError.empty())
    {
        throw std::runtime_error("TradeoffEvaluator::_fitFolds: Error while collecting results: " + firstError);
    }
    return results;
}

CrossValidationResult TradeoffEvaluator::crossValidation(const BinaryLabelDataset &train,
                                                         const FitOptions &options,
                                                         int numFolds) const
{
    _checkOptions(options);
    _metrics.checkDataset(train);

    StratifiedKFold kFold(numFolds, _seed, true);
    std::vector<FoldIndices> folds = kFold.split(train.labels());
    std::vector<FitResult> foldResults = _fitFolds(train, folds, options);

    CrossValidationResult cv;
    cv.numFolds = static_cast<int>(foldResults.size());

    double fairnessSum = 0.0, tradeoffSum = 0.0;
    int numDefined = 0;
    for (const FitResult &result : foldResults)
    {
        cv.accuracy += result.accuracy;
        cv.epoch += result.epoch;
        if (result.fairness && result.tradeoff)
        {
            fairnessSum += *result.fairness;
            tradeoffSum += *result.tradeoff;
            ++numDefined;
        }
    }
    cv.accuracy /= cv.numFolds;
    cv.epoch /= cv.numFolds;
    cv.numUndefinedFolds = cv.numFolds - numDefined;
    if (numDefined > 0)
    {
        cv.fairness = fairnessSum / numDefined;
        cv.tradeoff = tradeoffSum / numDefined;
    }

    if (cv.numUndefinedFolds > 0)
    {
        std::cerr << "TradeoffEvaluator::crossValidation: Warning: equal opportunity difference is undefined in "
                  << cv.numUndefinedFolds << " of " << cv.numFolds << " folds, excluded from the mean." << std::endl;
    }
    return cv;
}

HyperparameterGridResult TradeoffEvaluator::testHyperparameters(const BinaryLabelDataset &train,
                                                                const std::vector<double> &learningRates,
                                                                const std::vector<double> &regStrengths,
                                                                const FitOptions &baseOptions,
                                                                int numFolds) const
{
    if (learningRates.empty() || regStrengths.empty())
        throw std::invalid_argument("TradeoffEvaluator::testHyperparameters: Learning rates and regularization strengths cannot be empty.");
    _metrics.checkDataset(train);

    HyperparameterGridResult grid;
    size_t cell = 0;
    size_t numCells = learningRates.size() * regStrengths.size();
    for (double lr : learningRates)
    {
        for (double reg : regStrengths)
        {
            FitOptions options = baseOptions;
            options.learningRate = lr;
            options.regStrength = reg;

            CrossValidationResult cv = crossValidation(train, options, numFolds);
            grid.append(lr, reg, cv);
            ++cell;

            if (_verbose)
            {
                std::cout << "[" << cell << "/" << numCells << "] lr=" << lr << ", reg=" << reg
                          << ": accuracy=" << cv.accuracy
                          << ", fairness=" << (cv.fairness ? std::to_string(*cv.fairness) : "undefined")
                          << ", epoch=" << cv.epoch << std::endl;
            }
        }
    }
    return grid;
}

const FairnessMetrics &TradeoffEvaluator::metrics() const
{
    return _metrics;
}
