#pragma once
#include "types.hpp"
#include "BinaryLabelDataset.hpp"
#include "EvaluationTypes.hpp"
#include "FairnessMetrics.hpp"
#include "StratifiedKFold.hpp"

#include <vector>
#include <string>
#include <utility> // For std::pair

/**
 * Training and evaluation engine: fits the logistic regression classifier, scores
 * it for accuracy, equal opportunity and their trade-off, and repeats this over
 * cross-validation folds and a grid of hyperparameters.
 *
 * Every fit builds its own scaler, model, optimizer and stopping state from the
 * datasets it is given. Nothing is shared between fits, so folds can be fitted on
 * parallel workers; results are always returned in fold order.
 */
class TradeoffEvaluator
{
private:
    FairnessMetrics _metrics;

    // Number of workers used for the folds of one cross-validation run.
    int _numParallelFits;

    // Seed for parameter initialization and fold shuffling.
    unsigned int _seed;

    bool _verbose;

    // Throws std::invalid_argument for out-of-range settings.
    static void _checkOptions(const FitOptions &options);

    // Helper function to fit on one cross-validation round (train/test rows of data).
    FitResult _fitFold(const BinaryLabelDataset &data, const FoldIndices &fold, const FitOptions &options) const;

    /**
     * Helper function to fit every fold, on up to _numParallelFits workers.
     * Each worker handles a contiguous batch of folds and returns (fold index, result)
     * pairs, which are scattered back into fold order.
     */
    std::vector<FitResult> _fitFolds(const BinaryLabelDataset &data,
                                     const std::vector<FoldIndices> &folds,
                                     const FitOptions &options) const;

public:
    static constexpr unsigned int DEFAULT_SEED = 16;

    // Constructor
    TradeoffEvaluator(const std::string &sensitiveFeature,
                      int numParallelFits = 1,
                      unsigned int seed = DEFAULT_SEED,
                      bool verbose = false);

    /**
     * Train on train and evaluate on test.
     * 1. optionally drop sensitive feature columns (options.suppressSens),
     * 2. standardize with statistics of the training partition,
     * 3. run full-batch gradient descent on the (optionally reweighed) cross-entropy,
     *    checking the unweighted test loss every 100 updates and stopping once it
     *    improves by less than 1e-3, or after options.epochs updates,
     * 4. score the rounded test predictions.
     * Returns the scores and the test partition labelled with the predictions.
     */
    FitOutcome fit(const BinaryLabelDataset &train,
                   const BinaryLabelDataset &test,
                   const FitOptions &options) const;

    // Mean scores over numFolds label-stratified folds of train.
    CrossValidationResult crossValidation(const BinaryLabelDataset &train,
                                          const FitOptions &options,
                                          int numFolds = StratifiedKFold::DEFAULT_NUM_SPLITS) const;

    /**
     * Cross-validate every (learning rate, reg strength) pair, learning rates in the
     * outer loop. Entry i * regStrengths.size() + j of the result belongs to
     * (learningRates[i], regStrengths[j]). The learning rate and regularization of
     * baseOptions are ignored; its other settings apply to every trial.
     */
    HyperparameterGridResult testHyperparameters(const BinaryLabelDataset &train,
                                                 const std::vector<double> &learningRates,
                                                 const std::vector<double> &regStrengths,
                                                 const FitOptions &baseOptions,
                                                 int numFolds = StratifiedKFold::DEFAULT_NUM_SPLITS) const;

    const FairnessMetrics &metrics() const;
};
