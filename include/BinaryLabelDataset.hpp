#pragma once
#include "types.hpp"

#include <vector>
#include <string>
#include <utility>  // For std::pair
#include <optional> // For std::optional

/**
 * A tabular dataset with binary labels and one or more protected attributes.
 *
 * The protected attribute values are copied out of the feature table at construction
 * and stored separately. Dropping feature columns (sensitive-feature suppression)
 * therefore never changes which group a row belongs to.
 *
 * All transforming methods return a new dataset; a BinaryLabelDataset is never
 * modified in place after construction.
 */
class BinaryLabelDataset
{
private:
    Matrix _features;
    Vector _labels;
    Vector _instanceWeights;
    std::vector<std::string> _featureNames;

    // One column per protected attribute, one row per instance.
    Matrix _protectedAttributes;
    std::vector<std::string> _protectedAttributeNames;

    // Private constructor used by the transforming methods, no re-validation of names.
    BinaryLabelDataset(Matrix features,
                       Vector labels,
                       Vector instanceWeights,
                       std::vector<std::string> featureNames,
                       Matrix protectedAttributes,
                       std::vector<std::string> protectedAttributeNames);

    // Throws if the sizes, labels or weights break the dataset invariants.
    void _validate() const;

public:
    /**
     * Build a dataset from a feature table and labels.
     * Each name in protectedAttributeNames must name a column of the feature table,
     * otherwise std::invalid_argument is thrown. Labels must be 0 or 1.
     * Instance weights default to 1.0 for every row.
     */
    BinaryLabelDataset(const Matrix &features,
                       const Vector &labels,
                       const std::vector<std::string> &featureNames,
                       const std::vector<std::string> &protectedAttributeNames,
                       const std::optional<Vector> &instanceWeights = std::nullopt);

    // --- Accessors ---
    Eigen::Index numInstances() const;
    Eigen::Index numFeatures() const;
    const Matrix &features() const;
    const Vector &labels() const;
    const Vector &instanceWeights() const;
    const std::vector<std::string> &featureNames() const;
    const std::vector<std::string> &protectedAttributeNames() const;

    // True if the named protected attribute is known to this dataset.
    bool hasProtectedAttribute(const std::string &name) const;

    /**
     * Values of the named protected attribute, one per row.
     * Throws std::invalid_argument if the attribute is unknown.
     */
    Vector protectedAttributeValues(const std::string &name) const;

    /**
     * Feature column indices that still hold protected attributes, in the order of
     * protectedAttributeNames(). Attributes whose column was dropped are skipped.
     */
    IndexList protectedFeatureColumns() const;

    // --- Transformations (each returns an independent copy) ---
    BinaryLabelDataset copy() const;

    // Rows at the given positions, in the given order.
    BinaryLabelDataset subset(const IndexList &rowIndices) const;

    // Same rows with the labels replaced (e.g. by model predictions).
    BinaryLabelDataset withLabels(const Vector &labels) const;

    // Same rows with the instance weights replaced.
    BinaryLabelDataset withInstanceWeights(const Vector &instanceWeights) const;

    // Drop the given feature columns. Protected attribute values are kept.
    BinaryLabelDataset dropFeatures(const IndexList &columnIndices) const;

    /**
     * Shuffle the rows with the given seed and split them into two parts. The first
     * part holds floor(fraction * n) rows.
     */
    std::pair<BinaryLabelDataset, BinaryLabelDataset> split(double fraction, unsigned int seed) const;
};
