#pragma once
#include "types.hpp"

struct BaseClassifier {
    virtual ~BaseClassifier() = default;

    // --- Parameter Lifecycle ---
    // (Re)create the parameters for numFeatures inputs. Called at the start of every fit.
    virtual void initialize(Eigen::Index numFeatures, unsigned int seed) = 0;
    virtual Eigen::Index numFeatures() const = 0;

    // Flat parameter vector, weights followed by the bias.
    virtual Vector parameters() const = 0;
    virtual void setParameters(const Vector& parameters) = 0;

    // --- Prediction ---
    // Probability of the favorable label for every row of features.
    virtual Vector predictProba(const Matrix& features) const = 0;

    // Hard labels in {0, 1}. A probability above 0.5 maps to the favorable label.
    virtual Vector predict(const Matrix& features) const {
        Vector probabilities = predictProba(features);
        return (probabilities.array() > 0.5).cast<double>().matrix();
    }

    // --- Gradient ---
    /**
     * Chain rule through the model: given d(loss)/d(logit) for every row, return
     * d(loss)/d(parameters) in the layout of parameters().
     * Regularization is not part of the model, the optimizer adds it.
     */
    virtual Vector parameterGradient(const Matrix& features, const Vector& logitGradient) const = 0;
};
