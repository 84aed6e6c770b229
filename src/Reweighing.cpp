#include "Reweighing.hpp"
#include "BinaryLabelDataset.hpp"
#include "types.hpp"

#include <string>
#include <stdexcept> // For std::invalid_argument, std::logic_error
#include <Eigen/Dense>

// Expected over observed weight of one cell. An empty cell has no rows to reweigh.
static double cellFactor(double groupWeight, double labelWeight, double totalWeight, double cellWeight)
{
    if (cellWeight <= 0.0)
        return 1.0;
    return (groupWeight * labelWeight) / (totalWeight * cellWeight);
}

Reweighing::Reweighing(const std::string &protectedAttribute)
    : _protectedAttribute(protectedAttribute)
{
    if (_protectedAttribute.empty())
        throw std::invalid_argument("Reweighing constructor: Protected attribute name cannot be empty.");
}

void Reweighing::fit(const BinaryLabelDataset &dataset)
{
    const Vector group = dataset.protectedAttributeValues(_protectedAttribute);
    const Vector &labels = dataset.labels();
    const Vector &weights = dataset.instanceWeights();

    double total = weights.sum();
    if (total <= 0.0)
        throw std::invalid_argument("Reweighing::fit: Total instance weight must be positive.");

    double privileged = 0.0, unprivileged = 0.0, favorable = 0.0, unfavorable = 0.0;
    double privFav = 0.0, privUnfav = 0.0, unprivFav = 0.0, unprivUnfav = 0.0;
    for (Eigen::Index i = 0; i < labels.size(); ++i)
    {
        double w = weights(i);
        bool isFavorable = labels(i) == FAVORABLE_LABEL;
        (isFavorable ? favorable : unfavorable) += w;

        if (group(i) == PRIVILEGED_VALUE)
        {
            privileged += w;
            (isFavorable ? privFav : privUnfav) += w;
        }
        else if (group(i) == UNPRIVILEGED_VALUE)
        {
            unprivileged += w;
            (isFavorable ? unprivFav : unprivUnfav) += w;
        }
    }

    ReweighingFactors factors;
    factors.privilegedFavorable = cellFactor(privileged, favorable, total, privFav);
    factors.privilegedUnfavorable = cellFactor(privileged, unfavorable, total, privUnfav);
    factors.unprivilegedFavorable = cellFactor(unprivileged, favorable, total, unprivFav);
    factors.unprivilegedUnfavorable = cellFactor(unprivileged, unfavorable, total, unprivUnfav);
    _factors = factors;
}

BinaryLabelDataset Reweighing::transform(const BinaryLabelDataset &dataset) const
{
    const ReweighingFactors &f = factors();
    const Vector group = dataset.protectedAttributeValues(_protectedAttribute);
    const Vector &labels = dataset.labels();

    Vector newWeights = dataset.instanceWeights();
    for (Eigen::Index i = 0; i < labels.size(); ++i)
    {
        bool isFavorable = labels(i) == FAVORABLE_LABEL;
        if (group(i) == PRIVILEGED_VALUE)
            newWeights(i) *= isFavorable ? f.privilegedFavorable : f.privilegedUnfavorable;
        else if (group(i) == UNPRIVILEGED_VALUE)
            newWeights(i) *= isFavorable ? f.unprivilegedFavorable : f.unprivilegedUnfavorable;
    }
    return dataset.withInstanceWeights(newWeights);
}

BinaryLabelDataset Reweighing::fitTransform(const BinaryLabelDataset &dataset)
{
    fit(dataset);
    return transform(dataset);
}

bool Reweighing::isFitted() const
{
    return _factors.has_value();
}

const ReweighingFactors &Reweighing::factors() const
{
    if (!_factors)
        throw std::logic_error("Reweighing::factors: Reweighing must be fitted first.");
    return *_factors;
}
