#include "BinaryCrossEntropyLoss.hpp"
#include "types.hpp"

#include <stdexcept> // For std::invalid_argument
#include <algorithm> // For std::max
#include <cmath>     // For std::log
#include <string>

// Lower bound for log terms
static constexpr double LOG_CLAMP = -100.0;

static double clampedLog(double v)
{
    return v > 0.0 ? std::max(std::log(v), LOG_CLAMP) : LOG_CLAMP;
}

BinaryCrossEntropyLoss::BinaryCrossEntropyLoss(const std::optional<Vector> &weights)
    : _weights(weights)
{
}

bool BinaryCrossEntropyLoss::isWeighted() const
{
    return _weights.has_value();
}

double BinaryCrossEntropyLoss::value(const Vector &probabilities, const Vector &labels) const
{
    if (probabilities.size() != labels.size() || labels.size() == 0)
    {
        throw std::invalid_argument("BinaryCrossEntropyLoss::value: Probabilities and labels must be nonempty and of equal size.");
    }
    if (_weights && _weights->size() != labels.size())
    {
        throw std::invalid_argument("BinaryCrossEntropyLoss::value: Expected " + std::to_string(_weights->size()) +
                                    " rows for the weighted loss, got " + std::to_string(labels.size()) + ".");
    }

    double total = 0.0;
    for (Eigen::Index i = 0; i < labels.size(); ++i)
    {
        double y = labels(i);
        double p = probabilities(i);
        double rowLoss = -(y * clampedLog(p) + (1.0 - y) * clampedLog(1.0 - p));
        total += (_weights ? (*_weights)(i) : 1.0) * rowLoss;
    }
    return total / static_cast<double>(labels.size());
}

Vector BinaryCrossEntropyLoss::logitGradient(const Vector &probabilities, const Vector &labels) const
{
    if (probabilities.size() != labels.size() || labels.size() == 0)
    {
        throw std::invalid_argument("BinaryCrossEntropyLoss::logitGradient: Probabilities and labels must be nonempty and of equal size.");
    }

    Vector gradient = (probabilities - labels) / static_cast<double>(labels.size());
    if (_weights)
    {
        if (_weights->size() != labels.size())
        {
            throw std::invalid_argument("BinaryCrossEntropyLoss::logitGradient: Weight vector size does not match the number of rows.");
        }
        gradient = gradient.cwiseProduct(*_weights);
    }
    return gradient;
}
