#pragma once
#include "types.hpp"

/**
 * Standardize features to zero mean and unit variance.
 * The mean and (population) standard deviation are learned by fit() on training
 * data only and applied unchanged by transform() to any other partition.
 * Columns with zero variance keep a scale of 1 so they map to 0 rather than NaN.
 */
class StandardScaler
{
private:
    RowVector _mean;
    RowVector _scale;
    bool _fitted = false;

public:
    StandardScaler() = default;

    // Learn the per-column mean and scale from the given table.
    void fit(const Matrix &features);

    // Apply the learned transform. Throws if not fitted or the column count differs.
    Matrix transform(const Matrix &features) const;

    Matrix fitTransform(const Matrix &features);

    bool isFitted() const;
    const RowVector &mean() const;
    const RowVector &scale() const;
};
