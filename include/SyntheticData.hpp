#pragma once
#include "types.hpp"
#include "BinaryLabelDataset.hpp"

#include <cstddef> // For size_t

/**
 * Linearly separable data without group bias.
 * Features: "sex" ~ Bernoulli(0.5), independent of everything else, and
 * "x" ~ N(0, 1) conditioned on |x| >= margin. Label: x > 0.
 * Protected attributes: {"sex"}.
 */
BinaryLabelDataset generateSeparableData(size_t n, double margin, unsigned int seed);

/**
 * Data whose label is driven by the protected attribute.
 * Label: y = sex, flipped with probability flipProbability.
 * Features: "sex" ~ Bernoulli(0.5), "race" ~ Bernoulli(0.6 if y else 0.4), and
 * "x" ~ N(signalStrength * (2y - 1), 1).
 * Protected attributes: {"sex", "race"}.
 */
BinaryLabelDataset generateBiasedData(size_t n, double flipProbability, double signalStrength, unsigned int seed);
