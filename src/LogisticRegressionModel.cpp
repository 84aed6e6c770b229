#include "LogisticRegressionModel.hpp"
#include "types.hpp"

#include <stdexcept>   // For exceptions
#include <random>      // For C++ random number generation
#include <cmath>       // For std::sqrt, std::exp
#include <string>
#include <Eigen/Dense> // For Eigen matrix operations

LogisticRegressionModel::LogisticRegressionModel(Eigen::Index numFeatures, unsigned int seed)
{
    initialize(numFeatures, seed);
}

void LogisticRegressionModel::initialize(Eigen::Index numFeatures, unsigned int seed)
{
    if (numFeatures <= 0 || numFeatures > MAX_REASONABLE_SIZE)
    {
        throw std::invalid_argument("LogisticRegressionModel::initialize: Number of features must be positive, got " +
                                    std::to_string(numFeatures) + ".");
    }

    double bound = 1.0 / std::sqrt(static_cast<double>(numFeatures));
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> initDist(-bound, bound);

    _weights = Vector::NullaryExpr(numFeatures, [&]()
                                   { return initDist(rng); });
    _bias = initDist(rng);
}

Eigen::Index LogisticRegressionModel::numFeatures() const
{
    return _weights.size();
}

Vector LogisticRegressionModel::parameters() const
{
    Vector params(_weights.size() + 1);
    params.head(_weights.size()) = _weights;
    params(_weights.size()) = _bias;
    return params;
}

void LogisticRegressionModel::setParameters(const Vector &parameters)
{
    if (parameters.size() != _weights.size() + 1)
    {
        throw std::invalid_argument("LogisticRegressionModel::setParameters: Expected " + std::to_string(_weights.size() + 1) +
                                    " parameters, got " + std::to_string(parameters.size()) + ".");
    }
    _weights = parameters.head(_weights.size());
    _bias = parameters(_weights.size());
}

Vector LogisticRegressionModel::logits(const Matrix &features) const
{
    if (features.cols() != _weights.size())
    {
        throw std::invalid_argument("LogisticRegressionModel::logits: Expected " + std::to_string(_weights.size()) +
                                    " features, got " + std::to_string(features.cols()) + ".");
    }
    return ((features * _weights).array() + _bias).matrix();
}

Vector LogisticRegressionModel::predictProba(const Matrix &features) const
{
    Vector z = logits(features);
    // Logistic function, written per sign to avoid overflow in exp
    return z.unaryExpr([](double v)
                       {
                           if (v >= 0.0)
                               return 1.0 / (1.0 + std::exp(-v));
                           double e = std::exp(v);
                           return e / (1.0 + e); });
}

Vector LogisticRegressionModel::parameterGradient(const Matrix &features, const Vector &logitGradient) const
{
    if (features.rows() != logitGradient.size())
    {
        throw std::invalid_argument("LogisticRegressionModel::parameterGradient: Gradient size does not match the number of rows.");
    }
    if (features.cols() != _weights.size())
    {
        throw std::invalid_argument("LogisticRegressionModel::parameterGradient: Feature count does not match the model.");
    }

    Vector gradient(_weights.size() + 1);
    gradient.head(_weights.size()) = features.transpose() * logitGradient;
    gradient(_weights.size()) = logitGradient.sum();
    return gradient;
}

const Vector &LogisticRegressionModel::weights() const
{
    return _weights;
}

double LogisticRegressionModel::bias() const
{
    return _bias;
}
