#include "BinaryLabelDataset.hpp"
#include "types.hpp"

#include <vector>
#include <string>
#include <algorithm> // For std::find, std::shuffle, std::sort
#include <numeric>   // For std::iota
#include <random>    // For std::mt19937
#include <stdexcept> // For std::invalid_argument
#include <cmath>     // For std::floor, std::isfinite
#include <utility>   // For std::move
#include <Eigen/Dense>

// Private constructor, used when the protected attribute values are already extracted
BinaryLabelDataset::BinaryLabelDataset(Matrix features,
                                       Vector labels,
                                       Vector instanceWeights,
                                       std::vector<std::string> featureNames,
                                       Matrix protectedAttributes,
                                       std::vector<std::string> protectedAttributeNames)
    : _features(std::move(features)),
      _labels(std::move(labels)),
      _instanceWeights(std::move(instanceWeights)),
      _featureNames(std::move(featureNames)),
      _protectedAttributes(std::move(protectedAttributes)),
      _protectedAttributeNames(std::move(protectedAttributeNames))
{
    _validate();
}

BinaryLabelDataset::BinaryLabelDataset(const Matrix &features,
                                       const Vector &labels,
                                       const std::vector<std::string> &featureNames,
                                       const std::vector<std::string> &protectedAttributeNames,
                                       const std::optional<Vector> &instanceWeights)
    : _features(features),
      _labels(labels),
      _instanceWeights(instanceWeights.value_or(Vector::Ones(labels.size()))),
      _featureNames(featureNames),
      _protectedAttributeNames(protectedAttributeNames)
{
    if (static_cast<Eigen::Index>(_featureNames.size()) != _features.cols())
    {
        throw std::invalid_argument("BinaryLabelDataset constructor: Number of feature names (" + std::to_string(_featureNames.size()) +
                                    ") does not match the number of feature columns (" + std::to_string(_features.cols()) + ").");
    }
    if (_protectedAttributeNames.empty())
    {
        throw std::invalid_argument("BinaryLabelDataset constructor: At least one protected attribute is required.");
    }

    // Copy the protected attribute columns out of the feature table
    _protectedAttributes.resize(_features.rows(), static_cast<Eigen::Index>(_protectedAttributeNames.size()));
    for (size_t a = 0; a < _protectedAttributeNames.size(); ++a)
    {
        auto it = std::find(_featureNames.begin(), _featureNames.end(), _protectedAttributeNames[a]);
        if (it == _featureNames.end())
        {
            throw std::invalid_argument("BinaryLabelDataset constructor: Protected attribute '" + _protectedAttributeNames[a] +
                                        "' is not a feature column.");
        }
        _protectedAttributes.col(static_cast<Eigen::Index>(a)) = _features.col(it - _featureNames.begin());
    }

    _validate();
}

void BinaryLabelDataset::_validate() const
{
    if (_features.rows() == 0)
        throw std::invalid_argument("BinaryLabelDataset: Dataset must contain at least one instance.");
    if (_labels.size() != _features.rows())
        throw std::invalid_argument("BinaryLabelDataset: Number of labels (" + std::to_string(_labels.size()) +
                                    ") does not match the number of instances (" + std::to_string(_features.rows()) + ").");
    if (_instanceWeights.size() != _features.rows())
        throw std::invalid_argument("BinaryLabelDataset: Number of instance weights does not match the number of instances.");
    if (_protectedAttributes.rows() != _features.rows())
        throw std::invalid_argument("BinaryLabelDataset: Protected attribute values do not match the number of instances.");

    for (Eigen::Index i = 0; i < _labels.size(); ++i)
    {
        if (_labels(i) != FAVORABLE_LABEL && _labels(i) != UNFAVORABLE_LABEL)
        {
            throw std::invalid_argument("BinaryLabelDataset: Labels must be 0 or 1, found " + std::to_string(_labels(i)) +
                                        " at row " + std::to_string(i) + ".");
        }
        if (!std::isfinite(_instanceWeights(i)) || _instanceWeights(i) < 0.0)
        {
            throw std::invalid_argument("BinaryLabelDataset: Instance weights must be finite and non-negative (row " +
                                        std::to_string(i) + ").");
        }
    }
}

// Accessors
Eigen::Index BinaryLabelDataset::numInstances() const
{
    return _features.rows();
}

Eigen::Index BinaryLabelDataset::numFeatures() const
{
    return _features.cols();
}

const Matrix &BinaryLabelDataset::features() const
{
    return _features;
}

const Vector &BinaryLabelDataset::labels() const
{
    return _labels;
}

const Vector &BinaryLabelDataset::instanceWeights() const
{
    return _instanceWeights;
}

const std::vector<std::string> &BinaryLabelDataset::featureNames() const
{
    return _featureNames;
}

const std::vector<std::string> &BinaryLabelDataset::protectedAttributeNames() const
{
    return _protectedAttributeNames;
}

bool BinaryLabelDataset::hasProtectedAttribute(const std::string &name) const
{
    return std::find(_protectedAttributeNames.begin(), _protectedAttributeNames.end(), name) != _protectedAttributeNames.end();
}

Vector BinaryLabelDataset::protectedAttributeValues(const std::string &name) const
{
    auto it = std::find(_protectedAttributeNames.begin(), _protectedAttributeNames.end(), name);
    if (it == _protectedAttributeNames.end())
    {
        throw std::invalid_argument("BinaryLabelDataset::protectedAttributeValues: Unknown protected attribute '" + name + "'.");
    }
    return _protectedAttributes.col(it - _protectedAttributeNames.begin());
}

IndexList BinaryLabelDataset::protectedFeatureColumns() const
{
    IndexList columns;
    for (const std::string &name : _protectedAttributeNames)
    {
        auto it = std::find(_featureNames.begin(), _featureNames.end(), name);
        if (it != _featureNames.end())
        {
            columns.push_back(static_cast<int>(it - _featureNames.begin()));
        }
    }
    return columns;
}

// Transformations
BinaryLabelDataset BinaryLabelDataset::copy() const
{
    return BinaryLabelDataset(*this);
}

BinaryLabelDataset BinaryLabelDataset::subset(const IndexList &rowIndices) const
{
    if (rowIndices.empty())
        throw std::invalid_argument("BinaryLabelDataset::subset: Row index list cannot be empty.");

    for (int index : rowIndices)
    {
        if (index < 0 || index >= _features.rows())
            throw std::out_of_range("BinaryLabelDataset::subset: Row index " + std::to_string(index) + " out of range.");
    }

    // Select rows using Eigen's indexed view
    Eigen::Map<const Eigen::VectorXi> indicesMap(rowIndices.data(), static_cast<Eigen::Index>(rowIndices.size()));
    return BinaryLabelDataset(_features(indicesMap, Eigen::all),
                              _labels(indicesMap),
                              _instanceWeights(indicesMap),
                              _featureNames,
                              _protectedAttributes(indicesMap, Eigen::all),
                              _protectedAttributeNames);
}

BinaryLabelDataset BinaryLabelDataset::withLabels(const Vector &labels) const
{
    if (labels.size() != _labels.size())
        throw std::invalid_argument("BinaryLabelDataset::withLabels: Number of labels does not match the number of instances.");

    return BinaryLabelDataset(_features, labels, _instanceWeights, _featureNames,
                              _protectedAttributes, _protectedAttributeNames);
}

BinaryLabelDataset BinaryLabelDataset::withInstanceWeights(const Vector &instanceWeights) const
{
    if (instanceWeights.size() != _instanceWeights.size())
        throw std::invalid_argument("BinaryLabelDataset::withInstanceWeights: Number of weights does not match the number of instances.");

    return BinaryLabelDataset(_features, _labels, instanceWeights, _featureNames,
                              _protectedAttributes, _protectedAttributeNames);
}

BinaryLabelDataset BinaryLabelDataset::dropFeatures(const IndexList &columnIndices) const
{
    std::vector<bool> drop(static_cast<size_t>(_features.cols()), false);
    for (int column : columnIndices)
    {
        if (column < 0 || column >= _features.cols())
            throw std::out_of_range("BinaryLabelDataset::dropFeatures: Column index " + std::to_string(column) + " out of range.");
        drop[static_cast<size_t>(column)] = true;
    }

    IndexList keep;
    std::vector<std::string> keptNames;
    for (int c = 0; c < static_cast<int>(_features.cols()); ++c)
    {
        if (!drop[static_cast<size_t>(c)])
        {
            keep.push_back(c);
            keptNames.push_back(_featureNames[static_cast<size_t>(c)]);
        }
    }
    if (keep.empty())
        throw std::invalid_argument("BinaryLabelDataset::dropFeatures: Cannot drop every feature column.");

    return BinaryLabelDataset(_features(Eigen::all, keep), _labels, _instanceWeights, std::move(keptNames),
                              _protectedAttributes, _protectedAttributeNames);
}

std::pair<BinaryLabelDataset, BinaryLabelDataset> BinaryLabelDataset::split(double fraction, unsigned int seed) const
{
    if (!(fraction > 0.0 && fraction < 1.0))
        throw std::invalid_argument("BinaryLabelDataset::split: Fraction must lie strictly between 0 and 1.");

    int n = static_cast<int>(_features.rows());
    int nFirst = static_cast<int>(std::floor(fraction * n));
    if (nFirst <= 0 || nFirst >= n)
        throw std::invalid_argument("BinaryLabelDataset::split: Split leaves one part empty (n = " + std::to_string(n) + ").");

    IndexList order(n);
    std::iota(order.begin(), order.end(), 0); // order = {0, 1, ..., n-1}
    std::mt19937 rng(seed);
    std::shuffle(order.begin(), order.end(), rng);

    IndexList first(order.begin(), order.begin() + nFirst);
    IndexList second(order.begin() + nFirst, order.end());
    return {subset(first), subset(second)};
}
