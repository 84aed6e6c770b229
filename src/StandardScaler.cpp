#include "StandardScaler.hpp"
#include "types.hpp"

#include <stdexcept> // For std::invalid_argument, std::logic_error
#include <string>
#include <limits>    // For std::numeric_limits
#include <algorithm> // For std::max
#include <cmath>     // For std::abs
#include <Eigen/Dense>

void StandardScaler::fit(const Matrix &features)
{
    if (features.rows() == 0 || features.cols() == 0)
    {
        throw std::invalid_argument("StandardScaler::fit: Feature table must be nonempty.");
    }

    _mean = features.colwise().mean();
    Matrix centered = features.rowwise() - _mean;
    // Population variance (divide by n), as in the usual standard scaler
    RowVector variance = (centered.array().square().colwise().sum() / static_cast<double>(features.rows())).matrix();
    _scale = variance.array().sqrt().matrix();

    for (Eigen::Index c = 0; c < _scale.size(); ++c)
    {
        // Constant column (up to rounding of the mean)
        if (_scale(c) <= std::numeric_limits<double>::epsilon() * std::max(1.0, std::abs(_mean(c))))
            _scale(c) = 1.0;
    }
    _fitted = true;
}

Matrix StandardScaler::transform(const Matrix &features) const
{
    if (!_fitted)
    {
        throw std::logic_error("StandardScaler::transform: Scaler must be fitted before transform.");
    }
    if (features.cols() != _mean.size())
    {
        throw std::invalid_argument("StandardScaler::transform: Expected " + std::to_string(_mean.size()) +
                                    " columns, got " + std::to_string(features.cols()) + ".");
    }

    Matrix centered = features.rowwise() - _mean;
    return (centered.array().rowwise() / _scale.array()).matrix();
}

Matrix StandardScaler::fitTransform(const Matrix &features)
{
    fit(features);
    return transform(features);
}

bool StandardScaler::isFitted() const
{
    return _fitted;
}

const RowVector &StandardScaler::mean() const
{
    return _mean;
}

const RowVector &StandardScaler::scale() const
{
    return _scale;
}
