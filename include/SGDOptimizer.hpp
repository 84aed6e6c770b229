#pragma once
#include "types.hpp"

// Forward declaration
struct BaseClassifier;

/**
 * Plain (full-batch) gradient descent with L2 weight decay:
 *   theta <- theta - lr * (grad + weightDecay * theta)
 * The decay applies to every parameter, the bias included.
 */
class SGDOptimizer
{
private:
    double _learningRate;
    double _weightDecay;

public:
    SGDOptimizer(double learningRate, double weightDecay = 0.0);

    // Apply one update to the classifier given the gradient of the data loss.
    void step(BaseClassifier &classifier, const Vector &gradient) const;

    double learningRate() const;
    double weightDecay() const;
};
