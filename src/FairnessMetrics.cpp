#include "FairnessMetrics.hpp"
#include "BinaryLabelDataset.hpp"
#include "Reweighing.hpp"
#include "types.hpp"

#include <vector>
#include <string>
#include <algorithm> // For std::min, std::nth_element, std::find
#include <numeric>   // For std::iota
#include <stdexcept> // For std::invalid_argument
#include <cmath>     // For std::abs
#include <utility>   // For std::pair
#include <Eigen/Dense>

// Weighted favorable rate of the rows selected by the mask, empty if they carry no weight
static std::optional<double> weightedRate(const Vector &hits, const Vector &weights, const Eigen::Array<bool, Eigen::Dynamic, 1> &mask)
{
    double numerator = 0.0, denominator = 0.0;
    for (Eigen::Index i = 0; i < mask.size(); ++i)
    {
        if (!mask(i))
            continue;
        denominator += weights(i);
        numerator += weights(i) * hits(i);
    }
    if (denominator <= 0.0)
        return std::nullopt;
    return numerator / denominator;
}

FairnessMetrics::FairnessMetrics(const std::string &protectedAttribute)
    : _protectedAttribute(protectedAttribute)
{
    if (_protectedAttribute.empty())
        throw std::invalid_argument("FairnessMetrics constructor: Protected attribute name cannot be empty.");
}

const std::string &FairnessMetrics::protectedAttribute() const
{
    return _protectedAttribute;
}

void FairnessMetrics::checkDataset(const BinaryLabelDataset &dataset) const
{
    if (!dataset.hasProtectedAttribute(_protectedAttribute))
    {
        throw std::invalid_argument("FairnessMetrics::checkDataset: Protected attribute '" + _protectedAttribute +
                                    "' is not declared by the dataset.");
    }
}

DatasetBiasReport FairnessMetrics::datasetAnalysis(const BinaryLabelDataset &dataset, int numNeighbors) const
{
    checkDataset(dataset);

    DatasetBiasReport report;
    report.consistency = consistency(dataset, numNeighbors);
    report.meanDifference = meanDifference(dataset);
    return report;
}

double FairnessMetrics::consistency(const BinaryLabelDataset &dataset, int numNeighbors)
{
    if (numNeighbors <= 0)
        throw std::invalid_argument("FairnessMetrics::consistency: numNeighbors must be positive.");

    const Matrix &X = dataset.features();
    const Vector &y = dataset.labels();
    int n = static_cast<int>(X.rows());
    int k = std::min(numNeighbors, n);

    // Squared norms for the pairwise distance expansion |a-b|^2 = |a|^2 + |b|^2 - 2ab
    Vector squaredNorms = X.rowwise().squaredNorm();

    double totalDeviation = 0.0;
    IndexList order(n);
    for (int i = 0; i < n; ++i)
    {
        Vector distances = (squaredNorms.array() + squaredNorms(i)).matrix() - 2.0 * (X * X.row(i).transpose());
        distances(i) = -1.0; // a row is always its own nearest neighbour

        std::iota(order.begin(), order.end(), 0);
        std::nth_element(order.begin(), order.begin() + (k - 1), order.end(),
                         [&](int a, int b)
                         { return distances(a) < distances(b) || (distances(a) == distances(b) && a < b); });

        double neighbourMean = 0.0;
        for (int j = 0; j < k; ++j)
            neighbourMean += y(order[j]);
        neighbourMean /= static_cast<double>(k);

        totalDeviation += std::abs(y(i) - neighbourMean);
    }
    return 1.0 - totalDeviation / static_cast<double>(n);
}

std::optional<double> FairnessMetrics::meanDifference(const BinaryLabelDataset &dataset) const
{
    checkDataset(dataset);

    const Vector group = dataset.protectedAttributeValues(_protectedAttribute);
    Vector favorable = (dataset.labels().array() == FAVORABLE_LABEL).cast<double>().matrix();

    auto unprivilegedRate = weightedRate(favorable, dataset.instanceWeights(), group.array() == UNPRIVILEGED_VALUE);
    auto privilegedRate = weightedRate(favorable, dataset.instanceWeights(), group.array() == PRIVILEGED_VALUE);
    if (!unprivilegedRate || !privilegedRate)
        return std::nullopt;
    return *unprivilegedRate - *privilegedRate;
}

double FairnessMetrics::accuracyScore(const Vector &predicted, const Vector &truth)
{
    if (predicted.size() != truth.size() || truth.size() == 0)
    {
        throw std::invalid_argument("FairnessMetrics::accuracyScore: Predictions and labels must be nonempty and of equal size.");
    }
    Eigen::Index matches = (predicted.array() == truth.array()).count();
    return static_cast<double>(matches) / static_cast<double>(truth.size());
}

std::optional<double> FairnessMetrics::equalOpportunityDifference(const BinaryLabelDataset &truth,
                                                                  const BinaryLabelDataset &predicted) const
{
    checkDataset(truth);
    checkDataset(predicted);
    if (truth.numInstances() != predicted.numInstances())
    {
        throw std::invalid_argument("FairnessMetrics::equalOpportunityDifference: Datasets have different numbers of rows (" +
                                    std::to_string(truth.numInstances()) + " vs " + std::to_string(predicted.numInstances()) + ").");
    }

    const Vector group = truth.protectedAttributeValues(_protectedAttribute);
    if (group != predicted.protectedAttributeValues(_protectedAttribute))
    {
        throw std::invalid_argument("FairnessMetrics::equalOpportunityDifference: Datasets disagree on the protected attribute '" +
                                    _protectedAttribute + "'.");
    }

    // Only rows whose true label is favorable enter the true positive rate
    auto truePositive = truth.labels().array() == FAVORABLE_LABEL;
    Vector predictedFavorable = (predicted.labels().array() == FAVORABLE_LABEL).cast<double>().matrix();

    auto unprivilegedTPR = weightedRate(predictedFavorable, truth.instanceWeights(), truePositive && (group.array() == UNPRIVILEGED_VALUE));
    auto privilegedTPR = weightedRate(predictedFavorable, truth.instanceWeights(), truePositive && (group.array() == PRIVILEGED_VALUE));
    if (!unprivilegedTPR || !privilegedTPR)
        return std::nullopt;
    return *unprivilegedTPR - *privilegedTPR;
}

ConfusionMatrix FairnessMetrics::confusionMatrix(const Vector &truth, const Vector &predicted)
{
    if (predicted.size() != truth.size())
    {
        throw std::invalid_argument("FairnessMetrics::confusionMatrix: Predictions and labels must be of equal size.");
    }

    ConfusionMatrix cm;
    for (Eigen::Index i = 0; i < truth.size(); ++i)
    {
        bool actual = truth(i) == FAVORABLE_LABEL;
        bool guess = predicted(i) == FAVORABLE_LABEL;
        if (actual && guess)
            ++cm.truePositive;
        else if (actual)
            ++cm.falseNegative;
        else if (guess)
            ++cm.falsePositive;
        else
            ++cm.trueNegative;
    }
    return cm;
}

double FairnessMetrics::tradeoffMetric(double accuracy, double fairness)
{
    double magnitude = std::abs(fairness);
    return accuracy - magnitude * magnitude;
}

BinaryLabelDataset FairnessMetrics::reweigh(const BinaryLabelDataset &train) const
{
    checkDataset(train);
    Reweighing reweighing(_protectedAttribute);
    return reweighing.fitTransform(train);
}

std::pair<BinaryLabelDataset, BinaryLabelDataset> FairnessMetrics::suppressSensitive(const BinaryLabelDataset &train,
                                                                                     const BinaryLabelDataset &test,
                                                                                     bool onlySens) const
{
    checkDataset(train);
    checkDataset(test);
    if (train.featureNames() != test.featureNames())
    {
        throw std::invalid_argument("FairnessMetrics::suppressSensitive: Train and test partitions have different feature columns.");
    }

    IndexList columns;
    if (onlySens)
    {
        const std::vector<std::string> &names = train.featureNames();
        auto it = std::find(names.begin(), names.end(), _protectedAttribute);
        if (it != names.end())
            columns.push_back(static_cast<int>(it - names.begin()));
    }
    else
    {
        columns = train.protectedFeatureColumns();
    }

    return {train.dropFeatures(columns), test.dropFeatures(columns)};
}
