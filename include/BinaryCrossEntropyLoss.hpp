#pragma once
#include "types.hpp"

#include <optional> // For std::optional

/**
 * Binary cross-entropy on predicted probabilities, averaged over rows:
 *   L = (1/n) * sum_i w_i * -(y_i log p_i + (1 - y_i) log(1 - p_i))
 * Without weights every w_i is 1. The logarithms are clamped at -100 so a saturated
 * prediction yields a large but finite loss.
 */
class BinaryCrossEntropyLoss
{
private:
    std::optional<Vector> _weights;

public:
    // Unweighted loss
    BinaryCrossEntropyLoss() = default;

    // Weighted loss; one weight per training row
    explicit BinaryCrossEntropyLoss(const std::optional<Vector> &weights);

    bool isWeighted() const;

    double value(const Vector &probabilities, const Vector &labels) const;

    /**
     * Gradient of the loss with respect to the logits of a sigmoid output, i.e.
     * w_i * (p_i - y_i) / n for every row.
     */
    Vector logitGradient(const Vector &probabilities, const Vector &labels) const;
};
