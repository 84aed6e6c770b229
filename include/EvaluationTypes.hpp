#pragma once
#include "types.hpp"
#include "BinaryLabelDataset.hpp"

#include <vector>
#include <optional> // For std::optional
#include <cstddef>  // For size_t

// Settings of one training run.
struct FitOptions
{
    double learningRate = 0.1;
    double regStrength = 0.0; // L2 weight decay
    int epochs = 100000;      // upper bound on the number of updates

    // Train on reweighed instances (see Reweighing)
    bool reweight = false;

    // Drop sensitive feature columns before scaling; onlySens keeps all but the audited one
    bool suppressSens = false;
    bool onlySens = true;
};

/**
 * Outcome of one fit on a held-out partition.
 * fairness and tradeoff are empty when the equal opportunity difference is undefined
 * on that partition (a group without truly favorable rows).
 */
struct FitResult
{
    double accuracy = 0.0;
    std::optional<double> fairness;
    std::optional<double> tradeoff;
    int epoch = 0; // updates actually performed
};

struct FitOutcome
{
    FitResult result;
    BinaryLabelDataset testPredictions; // test partition with labels replaced by predictions
};

/**
 * Means over the folds of one cross-validation run.
 * accuracy and epoch average every fold. fairness and tradeoff average only the
 * folds where equal opportunity is defined, so when numUndefinedFolds > 0 the two
 * groups of fields describe different sets of folds. Both fairness fields are
 * empty when no fold defines it.
 */
struct CrossValidationResult
{
    double accuracy = 0.0;          // all folds
    std::optional<double> fairness; // defined folds only
    std::optional<double> tradeoff; // defined folds only
    double epoch = 0.0;             // all folds
    int numFolds = 0;
    int numUndefinedFolds = 0;
};

enum class GridCriterion
{
    MostAccurate, // highest accuracy
    MostFair,     // smallest |fairness|
    BestTradeoff  // highest tradeoff
};

/**
 * Results of a hyperparameter sweep as parallel sequences. Entry i of every sequence
 * belongs to the same (learning rate, regularization strength) trial. An undefined
 * mean fairness or tradeoff is stored as NaN.
 */
struct HyperparameterGridResult
{
    std::vector<double> learningRate;
    std::vector<double> regStrength;
    std::vector<double> accuracy;
    std::vector<double> fairness;
    std::vector<double> tradeoff;
    std::vector<double> epoch;

    size_t size() const;

    void append(double lr, double reg, const CrossValidationResult &cv);

    // Throws std::logic_error if the sequences differ in length.
    void checkConsistency() const;

    // Index of the best trial for the criterion, ignoring NaN entries. Empty if none qualifies.
    std::optional<size_t> bestIndex(GridCriterion criterion) const;
};
