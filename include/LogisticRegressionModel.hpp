#pragma once
#include "BaseClassifier.hpp"
#include "types.hpp"

#include <Eigen/Dense>

// A single linear layer followed by a sigmoid: p(x) = 1 / (1 + exp(-(w.x + b)))
class LogisticRegressionModel : public BaseClassifier
{
private:
    Vector _weights;
    double _bias = 0.0;

public:
    // Constructor
    LogisticRegressionModel() = default;

    // Construct and initialize for numFeatures inputs
    LogisticRegressionModel(Eigen::Index numFeatures, unsigned int seed);

    // Destructor
    ~LogisticRegressionModel() override = default;

    /**
     * Draw weights and bias uniformly from [-1/sqrt(d), 1/sqrt(d)], the default
     * initialization of a linear layer with d inputs. The same seed always gives
     * the same starting point.
     */
    void initialize(Eigen::Index numFeatures, unsigned int seed) override;

    Eigen::Index numFeatures() const override;

    Vector parameters() const override;

    void setParameters(const Vector &parameters) override;

    Vector predictProba(const Matrix &features) const override;

    Vector parameterGradient(const Matrix &features, const Vector &logitGradient) const override;

    // Affine part only, w.x + b for every row
    Vector logits(const Matrix &features) const;

    const Vector &weights() const;
    double bias() const;
};
