#include "SGDOptimizer.hpp"
#include "BaseClassifier.hpp"
#include "types.hpp"

#include <stdexcept> // For std::invalid_argument
#include <cmath>     // For std::isfinite
#include <string>

SGDOptimizer::SGDOptimizer(double learningRate, double weightDecay)
    : _learningRate(learningRate), _weightDecay(weightDecay)
{
    if (!(learningRate > 0.0) || !std::isfinite(learningRate))
        throw std::invalid_argument("SGDOptimizer constructor: Learning rate must be positive, got " + std::to_string(learningRate) + ".");
    if (!(weightDecay >= 0.0) || !std::isfinite(weightDecay))
        throw std::invalid_argument("SGDOptimizer constructor: Weight decay must be non-negative, got " + std::to_string(weightDecay) + ".");
}

void SGDOptimizer::step(BaseClassifier &classifier, const Vector &gradient) const
{
    Vector params = classifier.parameters();
    if (gradient.size() != params.size())
    {
        throw std::invalid_argument("SGDOptimizer::step: Gradient has " + std::to_string(gradient.size()) +
                                    " entries, the classifier has " + std::to_string(params.size()) + " parameters.");
    }
    classifier.setParameters(params - _learningRate * (gradient + _weightDecay * params));
}

double SGDOptimizer::learningRate() const
{
    return _learningRate;
}

double SGDOptimizer::weightDecay() const
{
    return _weightDecay;
}
