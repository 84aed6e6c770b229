#pragma once
#include "types.hpp"
#include "BinaryLabelDataset.hpp"

#include <string>
#include <utility>  // For std::pair
#include <optional> // For std::optional

// Bias found in a labelled dataset before any model is trained.
struct DatasetBiasReport
{
    // Individual fairness: 1 - mean |y_i - mean label of the k nearest neighbours of i|
    double consistency = 0.0;

    // Statistical parity: favorable rate of the unprivileged minus the privileged group.
    // Empty if either group carries no weight.
    std::optional<double> meanDifference;
};

// Counts of true/predicted label combinations (unweighted).
struct ConfusionMatrix
{
    long long trueNegative = 0;
    long long falsePositive = 0;
    long long falseNegative = 0;
    long long truePositive = 0;

    long long total() const { return trueNegative + falsePositive + falseNegative + truePositive; }
};

/**
 * Group fairness metrics for one protected attribute. Privileged rows have value 1,
 * unprivileged rows value 0.
 *
 * Group membership is read from the dataset on every call. Nothing is cached, so a
 * suppressed or reweighed copy is always measured on its own rows and weights.
 */
class FairnessMetrics
{
private:
    std::string _protectedAttribute;

public:
    static constexpr int DEFAULT_NUM_NEIGHBORS = 5;

    explicit FairnessMetrics(const std::string &protectedAttribute);

    const std::string &protectedAttribute() const;

    // Throws std::invalid_argument if the dataset does not know the protected attribute.
    void checkDataset(const BinaryLabelDataset &dataset) const;

    // --- Dataset metrics ---
    DatasetBiasReport datasetAnalysis(const BinaryLabelDataset &dataset,
                                      int numNeighbors = DEFAULT_NUM_NEIGHBORS) const;

    /**
     * Consistency of the labels with the k nearest neighbours in feature space
     * (Euclidean distance, each row counted among its own neighbours).
     */
    static double consistency(const BinaryLabelDataset &dataset, int numNeighbors = DEFAULT_NUM_NEIGHBORS);

    std::optional<double> meanDifference(const BinaryLabelDataset &dataset) const;

    // --- Classification metrics ---
    // Fraction of rows where the predicted label equals the true label.
    static double accuracyScore(const Vector &predicted, const Vector &truth);

    /**
     * Equal opportunity difference: TPR(unprivileged) - TPR(privileged), computed on the
     * rows whose true label is favorable and weighted by the true dataset's instance
     * weights. 0 means no bias, a negative value favours the privileged group and a
     * positive value the unprivileged group.
     * Empty if either group has no truly favorable weight (the rate is undefined).
     */
    std::optional<double> equalOpportunityDifference(const BinaryLabelDataset &truth,
                                                     const BinaryLabelDataset &predicted) const;

    static ConfusionMatrix confusionMatrix(const Vector &truth, const Vector &predicted);

    // accuracy - |fairness|^2; higher is a better balance of accuracy and fairness.
    static double tradeoffMetric(double accuracy, double fairness);

    // --- Pre-processing ---
    // Training copy with reweighed instance weights (see Reweighing).
    BinaryLabelDataset reweigh(const BinaryLabelDataset &train) const;

    /**
     * Remove sensitive feature columns from both partitions. With onlySens the column
     * of this metric's protected attribute is dropped; otherwise the columns of every
     * protected attribute the dataset declares. Group membership is unaffected.
     */
    std::pair<BinaryLabelDataset, BinaryLabelDataset> suppressSensitive(const BinaryLabelDataset &train,
                                                                        const BinaryLabelDataset &test,
                                                                        bool onlySens = true) const;
};
